#include "docx_writer.h"

#include <QObject>
#include <QXmlStreamWriter>
#include <QtMath>

#include "utils/zip_archive.h"

namespace
{
const QString kNsW = QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");
const QString kNsR = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships");
const QString kNsWp = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing");
const QString kNsA = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/main");
const QString kNsPic = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/picture");

constexpr double kEmuPerPoint = 12700.0;
constexpr double kTwipsPerPoint = 20.0;

// XML 1.0 forbids most C0 controls; PDF text may carry them.
QString xmlSafe(const QString &text)
{
    QString out;
    out.reserve(text.size());
    for (QChar ch : text)
    {
        const ushort c = ch.unicode();
        if (c == 0x09 || c >= 0x20) out += ch;
    }
    return out;
}

QString imageName(int index) { return QStringLiteral("image%1.png").arg(index + 1); }
QString imageRelId(int index) { return QStringLiteral("rIdImg%1").arg(index + 1); }

void writeRun(QXmlStreamWriter &xml, const DocxRun &run)
{
    xml.writeStartElement(kNsW, QStringLiteral("r"));
    if (run.bold || run.italic || run.halfPoints > 0)
    {
        xml.writeStartElement(kNsW, QStringLiteral("rPr"));
        if (run.bold) xml.writeEmptyElement(kNsW, QStringLiteral("b"));
        if (run.italic) xml.writeEmptyElement(kNsW, QStringLiteral("i"));
        if (run.halfPoints > 0)
        {
            xml.writeEmptyElement(kNsW, QStringLiteral("sz"));
            xml.writeAttribute(kNsW, QStringLiteral("val"), QString::number(run.halfPoints));
        }
        xml.writeEndElement();
    }
    xml.writeStartElement(kNsW, QStringLiteral("t"));
    xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
    xml.writeCharacters(xmlSafe(run.text));
    xml.writeEndElement(); // t
    xml.writeEndElement(); // r
}

void writePicture(QXmlStreamWriter &xml, int image, double widthPt, double heightPt)
{
    const QString cx = QString::number(qMax<qint64>(1, qRound64(widthPt * kEmuPerPoint)));
    const QString cy = QString::number(qMax<qint64>(1, qRound64(heightPt * kEmuPerPoint)));
    const QString id = QString::number(image + 1);

    xml.writeStartElement(kNsW, QStringLiteral("p"));
    xml.writeStartElement(kNsW, QStringLiteral("r"));
    xml.writeStartElement(kNsW, QStringLiteral("drawing"));
    xml.writeStartElement(kNsWp, QStringLiteral("inline"));
    for (const char *side : {"distT", "distB", "distL", "distR"}) xml.writeAttribute(QLatin1String(side), QStringLiteral("0"));
    xml.writeEmptyElement(kNsWp, QStringLiteral("extent"));
    xml.writeAttribute(QStringLiteral("cx"), cx);
    xml.writeAttribute(QStringLiteral("cy"), cy);
    xml.writeEmptyElement(kNsWp, QStringLiteral("docPr"));
    xml.writeAttribute(QStringLiteral("id"), id);
    xml.writeAttribute(QStringLiteral("name"), QStringLiteral("Picture %1").arg(id));

    xml.writeStartElement(kNsA, QStringLiteral("graphic"));
    xml.writeStartElement(kNsA, QStringLiteral("graphicData"));
    xml.writeAttribute(QStringLiteral("uri"), kNsPic);
    xml.writeStartElement(kNsPic, QStringLiteral("pic"));

    xml.writeStartElement(kNsPic, QStringLiteral("nvPicPr"));
    xml.writeEmptyElement(kNsPic, QStringLiteral("cNvPr"));
    xml.writeAttribute(QStringLiteral("id"), id);
    xml.writeAttribute(QStringLiteral("name"), imageName(image));
    xml.writeEmptyElement(kNsPic, QStringLiteral("cNvPicPr"));
    xml.writeEndElement(); // nvPicPr

    xml.writeStartElement(kNsPic, QStringLiteral("blipFill"));
    xml.writeEmptyElement(kNsA, QStringLiteral("blip"));
    xml.writeAttribute(kNsR, QStringLiteral("embed"), imageRelId(image));
    xml.writeStartElement(kNsA, QStringLiteral("stretch"));
    xml.writeEmptyElement(kNsA, QStringLiteral("fillRect"));
    xml.writeEndElement(); // stretch
    xml.writeEndElement(); // blipFill

    xml.writeStartElement(kNsPic, QStringLiteral("spPr"));
    xml.writeStartElement(kNsA, QStringLiteral("xfrm"));
    xml.writeEmptyElement(kNsA, QStringLiteral("off"));
    xml.writeAttribute(QStringLiteral("x"), QStringLiteral("0"));
    xml.writeAttribute(QStringLiteral("y"), QStringLiteral("0"));
    xml.writeEmptyElement(kNsA, QStringLiteral("ext"));
    xml.writeAttribute(QStringLiteral("cx"), cx);
    xml.writeAttribute(QStringLiteral("cy"), cy);
    xml.writeEndElement(); // xfrm
    xml.writeStartElement(kNsA, QStringLiteral("prstGeom"));
    xml.writeAttribute(QStringLiteral("prst"), QStringLiteral("rect"));
    xml.writeEmptyElement(kNsA, QStringLiteral("avLst"));
    xml.writeEndElement(); // prstGeom
    xml.writeEndElement(); // spPr

    xml.writeEndElement(); // pic
    xml.writeEndElement(); // graphicData
    xml.writeEndElement(); // graphic
    xml.writeEndElement(); // inline
    xml.writeEndElement(); // drawing
    xml.writeEndElement(); // r
    xml.writeEndElement(); // p
}
} // namespace

void DocxWriter::setPageSize(double widthPt, double heightPt)
{
    if (widthPt <= 0 || heightPt <= 0) return;
    m_pageWidthPt = widthPt;
    m_pageHeightPt = heightPt;
}

void DocxWriter::addParagraph(const QVector<DocxRun> &runs)
{
    Block block;
    block.kind = Block::Paragraph;
    for (const DocxRun &run : runs)
    {
        if (!run.text.isEmpty()) block.runs.append(run);
    }
    m_blocks.append(block);
}

void DocxWriter::addEmptyParagraph() { m_blocks.append(Block()); }

void DocxWriter::addImage(const QByteArray &png, double widthPt, double heightPt)
{
    if (png.isEmpty()) return;
    Block block;
    block.kind = Block::Picture;
    block.image = m_images.size();
    block.widthPt = widthPt;
    block.heightPt = heightPt;
    m_images.append(png);
    m_blocks.append(block);
}

void DocxWriter::addPageBreak()
{
    Block block;
    block.kind = Block::PageBreak;
    m_blocks.append(block);
}

int DocxWriter::paragraphCount() const
{
    int count = 0;
    for (const Block &block : m_blocks)
    {
        if (block.kind == Block::Paragraph) ++count;
    }
    return count;
}

QByteArray DocxWriter::documentXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.setAutoFormatting(false);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeNamespace(kNsW, QStringLiteral("w"));
    xml.writeNamespace(kNsR, QStringLiteral("r"));
    xml.writeNamespace(kNsWp, QStringLiteral("wp"));
    xml.writeNamespace(kNsA, QStringLiteral("a"));
    xml.writeNamespace(kNsPic, QStringLiteral("pic"));
    xml.writeStartElement(kNsW, QStringLiteral("document"));
    xml.writeStartElement(kNsW, QStringLiteral("body"));

    for (const Block &block : m_blocks)
    {
        switch (block.kind)
        {
        case Block::Paragraph:
            xml.writeStartElement(kNsW, QStringLiteral("p"));
            for (const DocxRun &run : block.runs) writeRun(xml, run);
            xml.writeEndElement();
            break;
        case Block::Picture:
            writePicture(xml, block.image, block.widthPt, block.heightPt);
            break;
        case Block::PageBreak:
            xml.writeStartElement(kNsW, QStringLiteral("p"));
            xml.writeStartElement(kNsW, QStringLiteral("r"));
            xml.writeEmptyElement(kNsW, QStringLiteral("br"));
            xml.writeAttribute(kNsW, QStringLiteral("type"), QStringLiteral("page"));
            xml.writeEndElement();
            xml.writeEndElement();
            break;
        }
    }

    xml.writeStartElement(kNsW, QStringLiteral("sectPr"));
    xml.writeEmptyElement(kNsW, QStringLiteral("pgSz"));
    xml.writeAttribute(kNsW, QStringLiteral("w"), QString::number(qRound(m_pageWidthPt * kTwipsPerPoint)));
    xml.writeAttribute(kNsW, QStringLiteral("h"), QString::number(qRound(m_pageHeightPt * kTwipsPerPoint)));
    xml.writeEmptyElement(kNsW, QStringLiteral("pgMar"));
    for (const char *side : {"top", "right", "bottom", "left"}) xml.writeAttribute(kNsW, QLatin1String(side), QStringLiteral("1134"));
    xml.writeEndElement(); // sectPr

    xml.writeEndElement(); // body
    xml.writeEndElement(); // document
    xml.writeEndDocument();
    return out;
}

QByteArray DocxWriter::contentTypesXml() const
{
    QByteArray out = QByteArrayLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>");
    if (!m_images.isEmpty()) out += "<Default Extension=\"png\" ContentType=\"image/png\"/>";
    out += "<Override PartName=\"/word/document.xml\" "
           "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
           "<Override PartName=\"/word/styles.xml\" "
           "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
           "</Types>";
    return out;
}

QByteArray DocxWriter::documentRelsXml() const
{
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeStartElement(QStringLiteral("Relationships"));
    xml.writeDefaultNamespace(QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships"));
    xml.writeEmptyElement(QStringLiteral("Relationship"));
    xml.writeAttribute(QStringLiteral("Id"), QStringLiteral("rIdStyles"));
    xml.writeAttribute(QStringLiteral("Type"), kNsR + QStringLiteral("/styles"));
    xml.writeAttribute(QStringLiteral("Target"), QStringLiteral("styles.xml"));
    for (int i = 0; i < m_images.size(); ++i)
    {
        xml.writeEmptyElement(QStringLiteral("Relationship"));
        xml.writeAttribute(QStringLiteral("Id"), imageRelId(i));
        xml.writeAttribute(QStringLiteral("Type"), kNsR + QStringLiteral("/image"));
        xml.writeAttribute(QStringLiteral("Target"), QStringLiteral("media/") + imageName(i));
    }
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray DocxWriter::stylesXml() const
{
    return QByteArrayLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
        "<w:docDefaults><w:rPrDefault><w:rPr>"
        "<w:rFonts w:ascii=\"Calibri\" w:hAnsi=\"Calibri\" w:eastAsia=\"SimSun\" w:cs=\"Arial\"/>"
        "<w:sz w:val=\"22\"/></w:rPr></w:rPrDefault>"
        "<w:pPrDefault><w:pPr><w:spacing w:after=\"120\"/></w:pPr></w:pPrDefault></w:docDefaults>"
        "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>"
        "</w:styles>");
}

bool DocxWriter::save(const QString &path, QString *error) const
{
    static const QByteArray rootRels = QByteArrayLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" "
        "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
        "Target=\"word/document.xml\"/></Relationships>");

    zip::ArchiveWriter writer;
    if (!writer.open(path, error)) return false;
    if (!writer.addFile(QStringLiteral("[Content_Types].xml"), contentTypesXml(), error)) return false;
    if (!writer.addFile(QStringLiteral("_rels/.rels"), rootRels, error)) return false;
    if (!writer.addFile(QStringLiteral("word/_rels/document.xml.rels"), documentRelsXml(), error)) return false;
    if (!writer.addFile(QStringLiteral("word/styles.xml"), stylesXml(), error)) return false;
    if (!writer.addFile(QStringLiteral("word/document.xml"), documentXml(), error)) return false;
    for (int i = 0; i < m_images.size(); ++i)
    {
        if (!writer.addFile(QStringLiteral("word/media/") + imageName(i), m_images.at(i), error)) return false;
    }
    return writer.finalize(error);
}
