#ifndef DOCSHIFT_DOCX_MARKDOWN_H
#define DOCSHIFT_DOCX_MARKDOWN_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVector>

namespace zip
{
class ArchiveReader;
}

// WordprocessingML (.docx) to Markdown.
namespace DocxMarkdown
{
struct MediaFile
{
    QString name; // file name inside the media directory
    QByteArray data;
};

struct Result
{
    bool ok = false;
    QString markdown;
    QVector<MediaFile> media;
    QStringList warnings;
    QString error;
};

// mediaPrefix is the relative directory written in image links ("report_media").
Result convertPackage(const zip::ArchiveReader &archive, const QString &mediaPrefix);
Result convertFile(const QString &path, const QString &mediaPrefix);

// Paragraphs recovered from a legacy .doc as Markdown text blocks.
QString paragraphsToMarkdown(const QStringList &paragraphs);

// Helpers exposed for tests
QString escapeText(const QString &text);
// Square brackets inside [label](target) text.
QString escapeLinkLabel(QString text);
QString escapeTableCell(QString text);
QString makeTable(const QList<QStringList> &rows);
// 1..6 for heading styles, 0 otherwise; styleName is the w:name of the style (may be empty).
int headingLevel(const QString &styleId, const QString &styleName);
} // namespace DocxMarkdown

#endif // DOCSHIFT_DOCX_MARKDOWN_H
