#include "docx_markdown.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QXmlStreamReader>
#include <algorithm>

#include "utils/zip_archive.h"

namespace
{
struct Relationship
{
    QString target;
    bool external = false;
};

// One piece of a paragraph before it is rendered. Raw segments carry finished
// Markdown (links, images) and are not escaped again.
struct Segment
{
    enum Kind
    {
        Text,
        Break,
        Raw
    };
    Kind kind = Text;
    QString text;
    bool bold = false;
    bool italic = false;
    bool strike = false;

    bool sameFormat(const Segment &o) const { return bold == o.bold && italic == o.italic && strike == o.strike; }
};

struct Paragraph
{
    QString text;
    QString styleId;
    QString numId;
    int level = 0;
};

struct Block
{
    QString text;
    bool listItem = false;
};

struct PackageContext
{
    explicit PackageContext(const zip::ArchiveReader &a) : archive(a) {}

    const zip::ArchiveReader &archive;
    QString mediaPrefix;
    QHash<QString, Relationship> rels;
    QHash<QString, QString> styleNames;                  // styleId -> w:name
    QHash<QString, QString> numToAbstract;               // numId -> abstractNumId
    QHash<QString, QHash<int, QString>> levelFormats;    // abstractNumId -> ilvl -> numFmt
    QHash<QString, QString> exportedByPath;              // zip path -> media name
    QSet<QString> usedNames;
    QVector<DocxMarkdown::MediaFile> media;
    QStringList warnings;

    void warn(const QString &message)
    {
        qWarning().noquote() << "[word2md]" << message;
        if (!warnings.contains(message)) warnings << message;
    }
};

// Attribute by local name, whatever prefix the producer used (w:val, r:id ...).
QString attr(const QXmlStreamReader &xr, const QLatin1String &localName)
{
    const QXmlStreamAttributes attributes = xr.attributes();
    for (const QXmlStreamAttribute &a : attributes)
    {
        if (a.name() == localName) return a.value().toString();
    }
    return QString();
}

// <w:b/> is on, <w:b w:val="0"/> (or false/off) is off
bool toggleOn(const QXmlStreamReader &xr)
{
    const QString val = attr(xr, QLatin1String("val")).toLower();
    return !(val == QLatin1String("0") || val == QLatin1String("false") || val == QLatin1String("off") ||
             val == QLatin1String("none"));
}

QString resolvePartPath(const QString &target)
{
    if (target.startsWith(QLatin1Char('/'))) return target.mid(1);
    return QDir::cleanPath(QStringLiteral("word/") + target);
}

QString linkDestination(const QString &path)
{
    if (path.contains(QLatin1Char(' ')) || path.contains(QLatin1Char('(')) || path.contains(QLatin1Char(')')))
        return QLatin1Char('<') + path + QLatin1Char('>');
    return path;
}

void parseRelationships(const QByteArray &xml, PackageContext &ctx)
{
    QXmlStreamReader xr(xml);
    while (!xr.atEnd())
    {
        if (xr.readNext() != QXmlStreamReader::StartElement || xr.name() != QLatin1String("Relationship")) continue;
        Relationship rel;
        rel.target = attr(xr, QLatin1String("Target"));
        rel.external = attr(xr, QLatin1String("TargetMode")).compare(QLatin1String("External"), Qt::CaseInsensitive) == 0;
        ctx.rels.insert(attr(xr, QLatin1String("Id")), rel);
    }
    if (xr.hasError()) ctx.warn(QObject::tr("document relationships are malformed: %1").arg(xr.errorString()));
}

void parseStyles(const QByteArray &xml, PackageContext &ctx)
{
    QXmlStreamReader xr(xml);
    QString currentId;
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            if (xr.name() == QLatin1String("style"))
                currentId = attr(xr, QLatin1String("styleId"));
            else if (xr.name() == QLatin1String("name") && !currentId.isEmpty())
                ctx.styleNames.insert(currentId, attr(xr, QLatin1String("val")));
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("style"))
        {
            currentId.clear();
        }
    }
}

void parseNumbering(const QByteArray &xml, PackageContext &ctx)
{
    QXmlStreamReader xr(xml);
    QString abstractId;
    QString numId;
    int level = -1;
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            const QStringRef name = xr.name();
            if (name == QLatin1String("abstractNum"))
                abstractId = attr(xr, QLatin1String("abstractNumId"));
            else if (name == QLatin1String("lvl"))
                level = attr(xr, QLatin1String("ilvl")).toInt();
            else if (name == QLatin1String("numFmt") && !abstractId.isEmpty() && level >= 0)
                ctx.levelFormats[abstractId].insert(level, attr(xr, QLatin1String("val")));
            else if (name == QLatin1String("num"))
                numId = attr(xr, QLatin1String("numId"));
            else if (name == QLatin1String("abstractNumId") && !numId.isEmpty())
                ctx.numToAbstract.insert(numId, attr(xr, QLatin1String("val")));
        }
        else if (token == QXmlStreamReader::EndElement)
        {
            if (xr.name() == QLatin1String("abstractNum")) abstractId.clear();
            else if (xr.name() == QLatin1String("lvl")) level = -1;
            else if (xr.name() == QLatin1String("num")) numId.clear();
        }
    }
}

// Copies the picture behind relId into the media list and returns its Markdown.
QString exportImage(PackageContext &ctx, const QString &relId)
{
    if (relId.isEmpty()) return QString();
    const auto it = ctx.rels.constFind(relId);
    if (it == ctx.rels.constEnd())
    {
        ctx.warn(QObject::tr("image relationship %1 not found").arg(relId));
        return QString();
    }
    if (it->external) return QStringLiteral("![](%1)").arg(linkDestination(it->target));

    const QString path = resolvePartPath(it->target);
    QString name = ctx.exportedByPath.value(path);
    if (name.isEmpty())
    {
        const QByteArray data = ctx.archive.fileData(path);
        if (data.isEmpty())
        {
            ctx.warn(QObject::tr("image %1 is missing or unreadable").arg(path));
            return QString();
        }
        const QString base = QFileInfo(path).fileName();
        name = base;
        for (int n = 2; ctx.usedNames.contains(name); ++n) name = QStringLiteral("%1_%2").arg(n).arg(base);
        ctx.usedNames.insert(name);
        ctx.exportedByPath.insert(path, name);
        ctx.media.append(DocxMarkdown::MediaFile{name, data});
    }
    return QStringLiteral("![](%1)").arg(linkDestination(ctx.mediaPrefix + QLatin1Char('/') + name));
}

// drawing / pict / object: only the embedded picture references matter
void readGraphic(QXmlStreamReader &xr, PackageContext &ctx, QVector<Segment> &out)
{
    const QString element = xr.name().toString();
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            QString relId;
            if (xr.name() == QLatin1String("blip"))
                relId = attr(xr, QLatin1String("embed"));
            else if (xr.name() == QLatin1String("imagedata"))
                relId = attr(xr, QLatin1String("id"));
            const QString link = exportImage(ctx, relId);
            if (!link.isEmpty())
            {
                Segment seg;
                seg.kind = Segment::Raw;
                seg.text = link;
                out.append(seg);
            }
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == element)
        {
            break;
        }
    }
}

void readRunProperties(QXmlStreamReader &xr, Segment &format)
{
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            const QStringRef name = xr.name();
            if (name == QLatin1String("b"))
                format.bold = toggleOn(xr);
            else if (name == QLatin1String("i"))
                format.italic = toggleOn(xr);
            else if (name == QLatin1String("strike") || name == QLatin1String("dstrike"))
                format.strike = toggleOn(xr);
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("rPr"))
        {
            break;
        }
    }
}

void readRun(QXmlStreamReader &xr, PackageContext &ctx, QVector<Segment> &out)
{
    Segment format;
    auto appendText = [&](const QString &text) {
        if (text.isEmpty()) return;
        Segment seg = format;
        seg.kind = Segment::Text;
        seg.text = text;
        out.append(seg);
    };

    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            const QStringRef name = xr.name();
            if (name == QLatin1String("rPr"))
            {
                readRunProperties(xr, format);
            }
            else if (name == QLatin1String("t"))
            {
                appendText(xr.readElementText(QXmlStreamReader::IncludeChildElements));
            }
            else if (name == QLatin1String("tab") || name == QLatin1String("ptab"))
            {
                appendText(QStringLiteral(" "));
            }
            else if (name == QLatin1String("noBreakHyphen"))
            {
                appendText(QStringLiteral("-"));
            }
            else if (name == QLatin1String("br") || name == QLatin1String("cr"))
            {
                const QString type = attr(xr, QLatin1String("type"));
                if (type != QLatin1String("page") && type != QLatin1String("column"))
                {
                    Segment seg;
                    seg.kind = Segment::Break;
                    out.append(seg);
                }
            }
            else if (name == QLatin1String("drawing") || name == QLatin1String("pict") || name == QLatin1String("object"))
            {
                readGraphic(xr, ctx, out);
            }
            else if (name == QLatin1String("delText") || name == QLatin1String("instrText") ||
                     name == QLatin1String("Fallback"))
            {
                xr.skipCurrentElement();
            }
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("r"))
        {
            break;
        }
    }
}

// Consecutive text with equal formatting shares one pair of markers; whitespace stays outside them.
QString renderSegments(const QVector<Segment> &segments)
{
    QString out;
    int i = 0;
    while (i < segments.size())
    {
        const Segment &seg = segments.at(i);
        if (seg.kind == Segment::Break)
        {
            out += QStringLiteral("  \n");
            ++i;
            continue;
        }
        if (seg.kind == Segment::Raw)
        {
            out += seg.text;
            ++i;
            continue;
        }

        QString raw;
        int j = i;
        while (j < segments.size() && segments.at(j).kind == Segment::Text && segments.at(j).sameFormat(seg))
        {
            raw += segments.at(j).text;
            ++j;
        }
        i = j;

        const QString escaped = DocxMarkdown::escapeText(raw);
        if (!seg.bold && !seg.italic && !seg.strike)
        {
            out += escaped;
            continue;
        }
        const QString core = escaped.trimmed();
        if (core.isEmpty())
        {
            out += escaped;
            continue;
        }
        const int lead = escaped.indexOf(core);
        const QString before = escaped.left(lead);
        const QString after = escaped.mid(lead + core.size());
        QString open;
        if (seg.strike) open += QStringLiteral("~~");
        if (seg.bold) open += QStringLiteral("**");
        if (seg.italic) open += QStringLiteral("*");
        QString close = open;
        std::reverse(close.begin(), close.end());
        out += before + open + core + close + after;
    }
    return out;
}

void readParagraphProperties(QXmlStreamReader &xr, Paragraph &para)
{
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            const QStringRef name = xr.name();
            if (name == QLatin1String("pStyle"))
                para.styleId = attr(xr, QLatin1String("val"));
            else if (name == QLatin1String("ilvl"))
                para.level = qBound(0, attr(xr, QLatin1String("val")).toInt(), 8);
            else if (name == QLatin1String("numId"))
                para.numId = attr(xr, QLatin1String("val"));
            else if (name == QLatin1String("rPr"))
                xr.skipCurrentElement(); // paragraph mark formatting
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("pPr"))
        {
            break;
        }
    }
}

Paragraph readParagraph(QXmlStreamReader &xr, PackageContext &ctx)
{
    Paragraph para;
    QVector<Segment> body;
    QVector<Segment> link;
    QString linkTarget;
    bool inLink = false;

    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            const QStringRef name = xr.name();
            if (name == QLatin1String("pPr"))
            {
                readParagraphProperties(xr, para);
            }
            else if (name == QLatin1String("r"))
            {
                readRun(xr, ctx, inLink ? link : body);
            }
            else if (name == QLatin1String("hyperlink"))
            {
                inLink = true;
                link.clear();
                linkTarget.clear();
                const QString relId = attr(xr, QLatin1String("id"));
                const QString anchor = attr(xr, QLatin1String("anchor"));
                if (!relId.isEmpty())
                {
                    const auto it = ctx.rels.constFind(relId);
                    if (it != ctx.rels.constEnd())
                        linkTarget = it->target;
                    else
                        ctx.warn(QObject::tr("hyperlink relationship %1 not found").arg(relId));
                }
                if (linkTarget.isEmpty() && !anchor.isEmpty()) linkTarget = QLatin1Char('#') + anchor;
            }
            else if (name == QLatin1String("del") || name == QLatin1String("moveFrom") || name == QLatin1String("Fallback"))
            {
                xr.skipCurrentElement();
            }
        }
        else if (token == QXmlStreamReader::EndElement)
        {
            if (xr.name() == QLatin1String("hyperlink") && inLink)
            {
                inLink = false;
                QVector<Segment> label = link;
                for (Segment &part : label)
                {
                    if (part.kind == Segment::Text) part.text = DocxMarkdown::escapeLinkLabel(part.text);
                }
                const QString text = renderSegments(label).trimmed();
                if (linkTarget.isEmpty() || text.isEmpty())
                {
                    body += link;
                }
                else
                {
                    Segment seg;
                    seg.kind = Segment::Raw;
                    seg.text = QStringLiteral("[%1](%2)").arg(text, linkDestination(linkTarget));
                    body.append(seg);
                }
                link.clear();
            }
            else if (xr.name() == QLatin1String("p"))
            {
                break;
            }
        }
    }
    para.text = renderSegments(body).trimmed();
    return para;
}

QString readTable(QXmlStreamReader &xr, PackageContext &ctx);

QString readTableCell(QXmlStreamReader &xr, PackageContext &ctx)
{
    QStringList fragments;
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement)
        {
            if (xr.name() == QLatin1String("p"))
            {
                const Paragraph para = readParagraph(xr, ctx);
                if (!para.text.isEmpty()) fragments << para.text;
            }
            else if (xr.name() == QLatin1String("tbl"))
            {
                const QString nested = readTable(xr, ctx);
                if (!nested.isEmpty()) fragments << nested;
            }
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("tc"))
        {
            break;
        }
    }
    return fragments.join(QStringLiteral("\n")).trimmed();
}

QStringList readTableRow(QXmlStreamReader &xr, PackageContext &ctx)
{
    QStringList cells;
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement && xr.name() == QLatin1String("tc"))
            cells << readTableCell(xr, ctx);
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("tr"))
            break;
    }
    return cells;
}

QString readTable(QXmlStreamReader &xr, PackageContext &ctx)
{
    QList<QStringList> rows;
    while (!xr.atEnd())
    {
        const auto token = xr.readNext();
        if (token == QXmlStreamReader::StartElement && xr.name() == QLatin1String("tr"))
        {
            const QStringList row = readTableRow(xr, ctx);
            if (!row.isEmpty()) rows.append(row);
        }
        else if (token == QXmlStreamReader::EndElement && xr.name() == QLatin1String("tbl"))
        {
            break;
        }
    }
    return DocxMarkdown::makeTable(rows);
}

Block paragraphBlock(const Paragraph &para, const PackageContext &ctx)
{
    Block block;
    if (para.text.isEmpty()) return block;

    const int heading = DocxMarkdown::headingLevel(para.styleId, ctx.styleNames.value(para.styleId));
    if (heading > 0)
    {
        block.text = QString(heading, QLatin1Char('#')) + QLatin1Char(' ') + para.text;
        return block;
    }
    if (!para.numId.isEmpty() && para.numId != QLatin1String("0"))
    {
        const QString abstractId = ctx.numToAbstract.value(para.numId);
        const QString format = ctx.levelFormats.value(abstractId).value(para.level);
        const bool bullet = format.isEmpty() || format == QLatin1String("bullet") || format == QLatin1String("none");
        block.text = QString(para.level * 2, QLatin1Char(' ')) + (bullet ? QStringLiteral("- ") : QStringLiteral("1. ")) +
                     para.text;
        block.listItem = true;
        return block;
    }
    block.text = para.text;
    return block;
}

QString joinBlocks(const QVector<Block> &blocks)
{
    QString out;
    for (int i = 0; i < blocks.size(); ++i)
    {
        if (i > 0)
            out += (blocks.at(i - 1).listItem && blocks.at(i).listItem) ? QStringLiteral("\n") : QStringLiteral("\n\n");
        out += blocks.at(i).text;
    }
    out += QLatin1Char('\n');
    return out;
}
} // namespace

namespace DocxMarkdown
{
QString escapeText(const QString &text)
{
    QString out;
    out.reserve(text.size() + 8);
    for (QChar ch : text)
    {
        if (ch == QLatin1Char('*') || ch == QLatin1Char('_')) out += QLatin1Char('\\');
        out += ch;
    }
    return out;
}

QString escapeLinkLabel(QString text)
{
    text.replace(QStringLiteral("["), QStringLiteral("\\["));
    text.replace(QStringLiteral("]"), QStringLiteral("\\]"));
    return text;
}

QString escapeTableCell(QString text)
{
    text.replace(QStringLiteral("|"), QStringLiteral("\\|"));
    text.replace(QStringLiteral("\r"), QString());
    text.replace(QStringLiteral("\n"), QStringLiteral("<br>"));
    return text.trimmed();
}

QString makeTable(const QList<QStringList> &rows)
{
    int columnCount = 0;
    for (const QStringList &row : rows) columnCount = std::max(columnCount, static_cast<int>(row.size()));
    if (columnCount == 0) return QString();

    auto formatRow = [&](const QStringList &row) {
        QStringList cells;
        cells.reserve(columnCount);
        for (int i = 0; i < columnCount; ++i) cells << (i < row.size() ? escapeTableCell(row.at(i)) : QString());
        return QStringLiteral("| ") + cells.join(QStringLiteral(" | ")) + QStringLiteral(" |");
    };
    QStringList lines;
    lines << formatRow(rows.first());
    QStringList divider;
    for (int i = 0; i < columnCount; ++i) divider << QStringLiteral("---");
    lines << QStringLiteral("| ") + divider.join(QStringLiteral(" | ")) + QStringLiteral(" |");
    for (int r = 1; r < rows.size(); ++r) lines << formatRow(rows.at(r));
    return lines.join(QStringLiteral("\n"));
}

int headingLevel(const QString &styleId, const QString &styleName)
{
    for (const QString &candidate : {styleId, styleName})
    {
        QString key = candidate.toLower();
        key.remove(QLatin1Char(' '));
        if (key.isEmpty()) continue;
        if (key == QLatin1String("title")) return 1;
        if (key == QLatin1String("subtitle")) return 2;
        if (key.startsWith(QLatin1String("heading")))
        {
            bool ok = false;
            const int level = key.mid(7).toInt(&ok);
            if (ok && level >= 1 && level <= 6) return level;
        }
    }
    return 0;
}

Result convertPackage(const zip::ArchiveReader &archive, const QString &mediaPrefix)
{
    Result result;
    const QByteArray documentXml = archive.fileData(QStringLiteral("word/document.xml"));
    if (documentXml.isEmpty())
    {
        result.error = QObject::tr("word/document.xml is missing; not a Word document");
        return result;
    }

    PackageContext ctx(archive);
    ctx.mediaPrefix = mediaPrefix;
    parseRelationships(archive.fileData(QStringLiteral("word/_rels/document.xml.rels")), ctx);
    const QByteArray styles = archive.fileData(QStringLiteral("word/styles.xml"));
    if (!styles.isEmpty()) parseStyles(styles, ctx);
    const QByteArray numbering = archive.fileData(QStringLiteral("word/numbering.xml"));
    if (!numbering.isEmpty()) parseNumbering(numbering, ctx);

    QVector<Block> blocks;
    QXmlStreamReader xr(documentXml);
    while (!xr.atEnd())
    {
        if (xr.readNext() != QXmlStreamReader::StartElement) continue;
        if (xr.name() == QLatin1String("p"))
        {
            const Block block = paragraphBlock(readParagraph(xr, ctx), ctx);
            if (!block.text.isEmpty()) blocks.append(block);
        }
        else if (xr.name() == QLatin1String("tbl"))
        {
            const QString table = readTable(xr, ctx);
            if (!table.isEmpty()) blocks.append(Block{table, false});
        }
    }
    if (xr.hasError())
    {
        result.error = QObject::tr("word/document.xml is malformed: %1 (line %2)").arg(xr.errorString()).arg(xr.lineNumber());
        return result;
    }

    result.ok = true;
    result.markdown = joinBlocks(blocks);
    result.media = ctx.media;
    result.warnings = ctx.warnings;
    return result;
}

Result convertFile(const QString &path, const QString &mediaPrefix)
{
    zip::ArchiveReader archive;
    QString error;
    if (!archive.open(path, &error))
    {
        Result result;
        result.error = error;
        return result;
    }
    return convertPackage(archive, mediaPrefix);
}

QString paragraphsToMarkdown(const QStringList &paragraphs)
{
    QStringList blocks;
    for (const QString &p : paragraphs)
    {
        const QString text = p.trimmed();
        if (!text.isEmpty()) blocks << escapeText(text);
    }
    return blocks.join(QStringLiteral("\n\n")) + QLatin1Char('\n');
}
} // namespace DocxMarkdown
