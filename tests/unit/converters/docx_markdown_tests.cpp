#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QTemporaryDir>

#include "common/TestUtils.h"
#include "converters/docx_markdown.h"
#include "utils/zip_archive.h"

using docshift::test::relationshipsXml;
using docshift::test::wordDocumentXml;
using docshift::test::writeZip;

namespace
{
QString run(const QString &text, const QString &props = QString())
{
    const QString rpr = props.isEmpty() ? QString() : QStringLiteral("<w:rPr>%1</w:rPr>").arg(props);
    return QStringLiteral("<w:r>%1<w:t xml:space=\"preserve\">%2</w:t></w:r>").arg(rpr, text);
}

QString para(const QString &runs, const QString &ppr = QString())
{
    const QString props = ppr.isEmpty() ? QString() : QStringLiteral("<w:pPr>%1</w:pPr>").arg(ppr);
    return QStringLiteral("<w:p>%1%2</w:p>").arg(props, runs);
}

QString listPara(const QString &text, int numId, int level)
{
    return para(run(text), QStringLiteral("<w:numPr><w:ilvl w:val=\"%1\"/><w:numId w:val=\"%2\"/></w:numPr>")
                               .arg(level)
                               .arg(numId));
}

QString cell(const QString &text)
{
    return QStringLiteral("<w:tc><w:tcPr/>%1</w:tc>").arg(para(run(text)));
}

const QByteArray kStyles =
    "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
    "<w:style w:type=\"paragraph\" w:styleId=\"a1\"><w:name w:val=\"heading 2\"/></w:style>"
    "<w:style w:type=\"paragraph\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>"
    "</w:styles>";

const QByteArray kNumbering =
    "<w:numbering xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
    "<w:abstractNum w:abstractNumId=\"10\">"
    "<w:lvl w:ilvl=\"0\"><w:numFmt w:val=\"bullet\"/></w:lvl>"
    "<w:lvl w:ilvl=\"1\"><w:numFmt w:val=\"bullet\"/></w:lvl>"
    "</w:abstractNum>"
    "<w:abstractNum w:abstractNumId=\"20\"><w:lvl w:ilvl=\"0\"><w:numFmt w:val=\"decimal\"/></w:lvl></w:abstractNum>"
    "<w:num w:numId=\"1\"><w:abstractNumId w:val=\"10\"/></w:num>"
    "<w:num w:numId=\"2\"><w:abstractNumId w:val=\"20\"/></w:num>"
    "</w:numbering>";

QString drawing(const QString &relId)
{
    return QStringLiteral("<w:r><w:drawing><wp:inline><wp:extent cx=\"952500\" cy=\"952500\"/>"
                          "<a:graphic><a:graphicData><pic:pic><pic:blipFill><a:blip r:embed=\"%1\"/>"
                          "</pic:blipFill></pic:pic></a:graphicData></a:graphic></wp:inline></w:drawing></w:r>")
        .arg(relId);
}

QString buildPackage(QTemporaryDir &dir, const QString &body, const QByteArray &rels = QByteArray(),
                     const QList<QPair<QString, QByteArray>> &extra = {})
{
    QList<QPair<QString, QByteArray>> entries = {
        {QStringLiteral("[Content_Types].xml"), QByteArrayLiteral("<Types/>")},
        {QStringLiteral("word/document.xml"), wordDocumentXml(body)},
        {QStringLiteral("word/styles.xml"), kStyles},
        {QStringLiteral("word/numbering.xml"), kNumbering},
    };
    if (!rels.isEmpty()) entries.append({QStringLiteral("word/_rels/document.xml.rels"), rels});
    entries += extra;
    const QString path = dir.filePath(QStringLiteral("report.docx"));
    REQUIRE(writeZip(path, entries));
    return path;
}
} // namespace

TEST_CASE("escapeText escapes emphasis characters only")
{
    CHECK(DocxMarkdown::escapeText(QStringLiteral("a*b_c")) == QStringLiteral("a\\*b\\_c"));
    CHECK(DocxMarkdown::escapeText(QStringLiteral("# [x](y)")) == QStringLiteral("# [x](y)"));
}

TEST_CASE("escapeLinkLabel escapes square brackets")
{
    CHECK(DocxMarkdown::escapeLinkLabel(QStringLiteral("see [1] here")) == QStringLiteral("see \\[1\\] here"));
    CHECK(DocxMarkdown::escapeLinkLabel(QStringLiteral("plain")) == QStringLiteral("plain"));
}

TEST_CASE("escapeTableCell keeps cells on one line")
{
    CHECK(DocxMarkdown::escapeTableCell(QStringLiteral(" a|b\r\nc ")) == QStringLiteral("a\\|b<br>c"));
}

TEST_CASE("makeTable pads short rows and adds the divider after the first row")
{
    const QString table = DocxMarkdown::makeTable({{QStringLiteral("h1"), QStringLiteral("h2"), QStringLiteral("h3")},
                                                   {QStringLiteral("x")}});
    CHECK(table == QStringLiteral("| h1 | h2 | h3 |\n| --- | --- | --- |\n| x |  |  |"));
    CHECK(DocxMarkdown::makeTable({}).isEmpty());
}

TEST_CASE("headingLevel recognises ids and display names")
{
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("Heading1"), QString()) == 1);
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("a1"), QStringLiteral("heading 3")) == 3);
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("Title"), QString()) == 1);
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("Subtitle"), QString()) == 2);
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("Heading7"), QString()) == 0);
    CHECK(DocxMarkdown::headingLevel(QStringLiteral("Normal"), QStringLiteral("Normal")) == 0);
}

TEST_CASE("paragraphsToMarkdown separates recovered paragraphs with blank lines")
{
    CHECK(DocxMarkdown::paragraphsToMarkdown({QStringLiteral(" one "), QString(), QStringLiteral("two_2")}) ==
          QStringLiteral("one\n\ntwo\\_2\n"));
    CHECK(DocxMarkdown::paragraphsToMarkdown({}) == QStringLiteral("\n"));
}

TEST_CASE("convertFile renders headings, emphasis, lists and tables")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString body =
        para(run(QStringLiteral("概述")), QStringLiteral("<w:pStyle w:val=\"Heading1\"/>")) +
        para(run(QStringLiteral("小节")), QStringLiteral("<w:pStyle w:val=\"a1\"/>")) +
        para(run(QStringLiteral("Plain ")) + run(QStringLiteral("bold"), QStringLiteral("<w:b/>")) +
             run(QStringLiteral(" and ")) + run(QStringLiteral("it_alic"), QStringLiteral("<w:i/>")) +
             run(QStringLiteral(" 2*3"))) +
        para(run(QStringLiteral("Bold "), QStringLiteral("<w:b/>")) + run(QStringLiteral("next ")) +
             run(QStringLiteral("Hel"), QStringLiteral("<w:b/>")) + run(QStringLiteral("lo"), QStringLiteral("<w:b/>")) +
             run(QStringLiteral(" off"), QStringLiteral("<w:b w:val=\"0\"/>"))) +
        para(QString()) +
        listPara(QStringLiteral("apple"), 1, 0) + listPara(QStringLiteral("banana"), 1, 1) +
        listPara(QStringLiteral("first"), 2, 0) +
        QStringLiteral("<w:tbl><w:tblPr/><w:tr>%1%2</w:tr><w:tr>%3</w:tr></w:tbl>")
            .arg(cell(QStringLiteral("名称")), cell(QStringLiteral("值|x")), cell(QStringLiteral("a")));

    const DocxMarkdown::Result result = DocxMarkdown::convertFile(buildPackage(dir, body), QStringLiteral("report_media"));
    REQUIRE(result.ok);
    CHECK(result.media.isEmpty());
    const QString expected = QStringLiteral("# 概述\n\n"
                                            "## 小节\n\n"
                                            "Plain **bold** and *it\\_alic* 2\\*3\n\n"
                                            "**Bold** next **Hello** off\n\n"
                                            "- apple\n"
                                            "  - banana\n"
                                            "1. first\n\n"
                                            "| 名称 | 值\\|x |\n| --- | --- |\n| a |  |\n");
    CHECK(result.markdown == expected);
}

TEST_CASE("convertFile renders links, pictures, breaks and skips deleted text")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QByteArray rels = relationshipsXml(
        QStringLiteral("<Relationship Id=\"rIdLink\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\""
                       " Target=\"https://example.com/a b\" TargetMode=\"External\"/>"
                       "<Relationship Id=\"rIdImg1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\""
                       " Target=\"media/image1.png\"/>"));
    const QString body =
        para(run(QStringLiteral("see ")) + QStringLiteral("<w:hyperlink r:id=\"rIdLink\">%1</w:hyperlink>").arg(run(QStringLiteral("site"))) +
             run(QStringLiteral(" or ")) +
             QStringLiteral("<w:hyperlink w:anchor=\"sec1\">%1</w:hyperlink>").arg(run(QStringLiteral("jump")))) +
        para(drawing(QStringLiteral("rIdImg1"))) +
        para(QStringLiteral("<mc:AlternateContent><mc:Choice Requires=\"wps\">%1</mc:Choice>"
                            "<mc:Fallback><w:r><w:pict><v:imagedata r:id=\"rIdImg1\"/></w:pict></w:r></mc:Fallback>"
                            "</mc:AlternateContent>")
                 .arg(drawing(QStringLiteral("rIdImg1")))) +
        para(QStringLiteral("<w:r><w:t>line1</w:t><w:br/><w:t>line2</w:t></w:r>")) +
        para(QStringLiteral("<w:hyperlink r:id=\"rIdLink\">%1</w:hyperlink>").arg(run(QStringLiteral("note] [2")))) +
        para(run(QStringLiteral("kept")) + QStringLiteral("<w:del><w:r><w:delText>gone</w:delText></w:r></w:del>"));

    const QString path = buildPackage(dir, body, rels, {{QStringLiteral("word/media/image1.png"), QByteArrayLiteral("PNGDATA")}});
    const DocxMarkdown::Result result = DocxMarkdown::convertFile(path, QStringLiteral("report_media"));
    REQUIRE(result.ok);
    const QString expected = QStringLiteral("see [site](<https://example.com/a b>) or [jump](#sec1)\n\n"
                                            "![](report_media/image1.png)\n\n"
                                            "![](report_media/image1.png)\n\n"
                                            "line1  \nline2\n\n"
                                            "[note\\] \\[2](<https://example.com/a b>)\n\n"
                                            "kept\n");
    CHECK(result.markdown == expected);
    // the same part referenced twice is exported once
    REQUIRE(result.media.size() == 1);
    CHECK(result.media.at(0).name == QStringLiteral("image1.png"));
    CHECK(result.media.at(0).data == QByteArrayLiteral("PNGDATA"));
    CHECK(result.warnings.isEmpty());
}

TEST_CASE("convertFile warns about unresolved pictures")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString body = para(run(QStringLiteral("text"))) + para(drawing(QStringLiteral("rIdMissing")));
    const DocxMarkdown::Result result =
        DocxMarkdown::convertFile(buildPackage(dir, body, relationshipsXml(QString())), QStringLiteral("m"));
    REQUIRE(result.ok);
    CHECK(result.markdown == QStringLiteral("text\n"));
    CHECK(result.warnings.size() == 1);
}

TEST_CASE("convertFile rejects packages without a main document")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("empty.docx"));
    REQUIRE(writeZip(path, {{QStringLiteral("[Content_Types].xml"), QByteArrayLiteral("<Types/>")}}));
    const DocxMarkdown::Result result = DocxMarkdown::convertFile(path, QStringLiteral("m"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.contains(QStringLiteral("word/document.xml")));

    const DocxMarkdown::Result notZip = DocxMarkdown::convertFile(dir.filePath(QStringLiteral("missing.docx")), QStringLiteral("m"));
    CHECK_FALSE(notZip.ok);
    CHECK_FALSE(notZip.error.isEmpty());
}

TEST_CASE("convertPackage of an empty body yields a single newline")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    zip::ArchiveReader archive;
    REQUIRE(archive.open(buildPackage(dir, QString())));
    const DocxMarkdown::Result result = DocxMarkdown::convertPackage(archive, QStringLiteral("m"));
    REQUIRE(result.ok);
    CHECK(result.markdown == QStringLiteral("\n"));
}
