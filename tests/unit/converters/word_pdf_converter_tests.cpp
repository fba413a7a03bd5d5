#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QFileInfo>
#include <QImage>
#include <QTemporaryDir>

#include "common/TestUtils.h"
#include "converters/image_pdf_converter.h"
#include "converters/office_engine.h"
#include "converters/word_pdf_converter.h"
#include "utils/zip_archive.h"

using docshift::test::ensureQtApp;
using docshift::test::simpleTextPdf;
using docshift::test::writeBytes;

namespace
{
QString documentXmlOf(const QString &docx)
{
    zip::ArchiveReader archive;
    REQUIRE(archive.open(docx));
    return QString::fromUtf8(archive.fileData(QStringLiteral("word/document.xml")));
}

#ifndef Q_OS_WIN
ConversionOptions optionsWith(const QString &office, int timeoutMs = 10000)
{
    ConversionOptions options;
    options.officePath = office;
    options.officeTimeoutMs = timeoutMs;
    return options;
}
#endif
} // namespace

TEST_CASE("WordPdfConverter lists its extensions")
{
    CHECK(WordPdfConverter::wordExtensions() == QStringList{QStringLiteral(".docx"), QStringLiteral(".doc")});
    CHECK(WordPdfConverter::pdfExtensions() == QStringList{QStringLiteral(".pdf")});
    CHECK(WordPdfConverter().isPdfToWordAvailable());
}

TEST_CASE("wordToPdf validates the input before looking for an office engine")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const ConversionResult missing = WordPdfConverter().wordToPdf(dir.filePath(QStringLiteral("none.docx")), QString());
    CHECK(missing.code == DocShiftErrorCode::IoInputMissing);
    CHECK(missing.message.contains(QStringLiteral("none.docx")));

    const QString text = dir.filePath(QStringLiteral("notes.txt"));
    REQUIRE(writeBytes(text, QByteArrayLiteral("hello")));
    CHECK(WordPdfConverter().wordToPdf(text, QString()).code == DocShiftErrorCode::InputUnsupported);
}

TEST_CASE("OfficeEngine without an executable reports EngineUnavailable")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString docx = dir.filePath(QStringLiteral("a.docx"));
    REQUIRE(writeBytes(docx, QByteArrayLiteral("PK")));

    OfficeEngine engine(dir.filePath(QStringLiteral("no-soffice")));
    if (!engine.isAvailable())
    {
        const ConversionResult result = engine.convert(docx, dir.path(), QStringLiteral("pdf"));
        CHECK(result.code == DocShiftErrorCode::EngineUnavailable);
    }
    CHECK_FALSE(OfficeEngine::installCandidates().isEmpty());
}

#ifndef Q_OS_WIN
TEST_CASE("wordToPdf runs the configured office binary headless")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString office = docshift::test::fakeOffice(
        dir.path(), QStringLiteral("soffice-ok"),
        QStringLiteral("printf '%%PDF-1.4 from %s' \"$name\" > \"$out/$stem.$fmt\""));
    REQUIRE_FALSE(office.isEmpty());
    const QString input = dir.filePath(QStringLiteral("年度报告.v2.docx"));
    REQUIRE(writeBytes(input, QByteArrayLiteral("PK fake docx")));

    const WordPdfConverter converter(optionsWith(office));
    CHECK(converter.isWordToPdfAvailable());
    CHECK(converter.officeExecutable() == QFileInfo(office).absoluteFilePath());

    const ConversionResult result = converter.wordToPdf(input, dir.filePath(QStringLiteral("pdf")));
    REQUIRE(result.ok);
    CHECK(QFileInfo(result.primaryOutput()).fileName() == QStringLiteral("年度报告.v2.pdf"));
    QFile produced(result.primaryOutput());
    REQUIRE(produced.open(QIODevice::ReadOnly));
    CHECK(produced.readAll().startsWith("%PDF-1.4 from"));
}

TEST_CASE("wordToPdf maps office failures to error codes")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString input = dir.filePath(QStringLiteral("a.doc"));
    REQUIRE(writeBytes(input, QByteArrayLiteral("fake doc")));

    const QString failing = docshift::test::fakeOffice(
        dir.path(), QStringLiteral("soffice-fail"), QStringLiteral("echo 'Error: source file could not be loaded' >&2; exit 3"));
    const ConversionResult failed = WordPdfConverter(optionsWith(failing)).wordToPdf(input, QString());
    CHECK(failed.code == DocShiftErrorCode::EngineFailed);
    CHECK(failed.message.contains(QStringLiteral("source file could not be loaded")));

    const QString silent = docshift::test::fakeOffice(dir.path(), QStringLiteral("soffice-silent"), QStringLiteral("exit 0"));
    const ConversionResult nothing = WordPdfConverter(optionsWith(silent)).wordToPdf(input, QString());
    CHECK(nothing.code == DocShiftErrorCode::OutputMissing);

    const QString slow = docshift::test::fakeOffice(dir.path(), QStringLiteral("soffice-slow"), QStringLiteral("sleep 5"));
    const ConversionResult timedOut = WordPdfConverter(optionsWith(slow, 200)).wordToPdf(input, QString());
    CHECK(timedOut.code == DocShiftErrorCode::EngineTimeout);
}
#endif

TEST_CASE("pdfToWord rebuilds page text as paragraphs")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString pdf = dir.filePath(QStringLiteral("letter.pdf"));
    REQUIRE(writeBytes(pdf, simpleTextPdf({QStringLiteral("Hello docshift"), QStringLiteral("Second page text")})));

    const ConversionResult result = WordPdfConverter().pdfToWord(pdf, dir.filePath(QStringLiteral("docx")));
    REQUIRE(result.ok);
    CHECK(QFileInfo(result.primaryOutput()).fileName() == QStringLiteral("letter.docx"));
    CHECK(result.warnings.isEmpty());

    const QString xml = documentXmlOf(result.primaryOutput());
    const int first = xml.indexOf(QStringLiteral("Hello docshift"));
    const int pageBreak = xml.indexOf(QStringLiteral("w:type=\"page\""));
    const int second = xml.indexOf(QStringLiteral("Second page text"));
    CHECK(first >= 0);
    CHECK(pageBreak > first);
    CHECK(second > pageBreak);
    // 14 pt text -> w:sz 28, US Letter page -> 12240 twips wide
    CHECK(xml.contains(QStringLiteral("w:val=\"28\"")));
    CHECK(xml.contains(QStringLiteral("w:w=\"12240\"")));
}

TEST_CASE("pdfToWord carries pictures over as inline images")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QImage image(120, 80, QImage::Format_RGB32);
    image.fill(Qt::blue);
    const QString png = dir.filePath(QStringLiteral("photo.png"));
    REQUIRE(image.save(png, "PNG"));
    const QString pdf = dir.filePath(QStringLiteral("photo.pdf"));
    REQUIRE(ImagePdfConverter().imagesToPdf({png}, pdf).ok);

    const ConversionResult result = WordPdfConverter().pdfToWord(pdf, QString());
    REQUIRE(result.ok);
    zip::ArchiveReader archive;
    REQUIRE(archive.open(result.primaryOutput()));
    CHECK(QImage::fromData(archive.fileData(QStringLiteral("word/media/image1.png"))).width() == 120);
}

TEST_CASE("pdfToWord rejects files MuPDF cannot open")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString bogus = dir.filePath(QStringLiteral("bogus.pdf"));
    REQUIRE(writeBytes(bogus, QByteArrayLiteral("GIF89a definitely not a pdf")));
    const ConversionResult result = WordPdfConverter().pdfToWord(bogus, QString());
    CHECK_FALSE(result.ok);
    CHECK(result.code == DocShiftErrorCode::InputCorrupt);
    CHECK_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("bogus.docx"))));
}

TEST_CASE("pdfToWord reports password protected files")
{
    ensureQtApp();
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString locked = dir.filePath(QStringLiteral("locked.pdf"));
    REQUIRE(writeBytes(locked, simpleTextPdf({QStringLiteral("secret")}, 612, 792, true)));

    const ConversionResult result = WordPdfConverter().pdfToWord(locked, QString());
    CHECK_FALSE(result.ok);
    CHECK(result.code == DocShiftErrorCode::InputEncrypted);
    CHECK_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("locked.docx"))));
}
