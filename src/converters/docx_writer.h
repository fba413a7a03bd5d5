#ifndef DOCSHIFT_DOCX_WRITER_H
#define DOCSHIFT_DOCX_WRITER_H

#include <QByteArray>
#include <QString>
#include <QVector>

#include "xconfig.h"

// One formatted span of a paragraph.
struct DocxRun
{
    QString text;
    bool bold = false;
    bool italic = false;
    int halfPoints = 0; // w:sz, 0 keeps the style default
};

// Minimal WordprocessingML package builder: paragraphs of runs, inline PNG
// pictures and page breaks, one section. Output opens in Word and LibreOffice.
class DocxWriter
{
public:
    void setPageSize(double widthPt, double heightPt);
    void addParagraph(const QVector<DocxRun> &runs);
    void addText(const QString &text) { addParagraph({DocxRun{text}}); }
    void addEmptyParagraph();
    void addImage(const QByteArray &png, double widthPt, double heightPt);
    void addPageBreak();

    int paragraphCount() const;
    int imageCount() const { return m_images.size(); }

    QByteArray documentXml() const;
    QByteArray contentTypesXml() const;
    QByteArray documentRelsXml() const;
    QByteArray stylesXml() const;

    // Writes the zip package; a failed save leaves no file behind.
    bool save(const QString &path, QString *error = nullptr) const;

private:
    struct Block
    {
        enum Kind
        {
            Paragraph,
            Picture,
            PageBreak
        };
        Kind kind = Paragraph;
        QVector<DocxRun> runs;
        int image = -1;
        double widthPt = 0;
        double heightPt = 0;
    };

    QVector<Block> m_blocks;
    QVector<QByteArray> m_images;
    double m_pageWidthPt = PAGE_A4_WIDTH;
    double m_pageHeightPt = PAGE_A4_HEIGHT;
};

#endif // DOCSHIFT_DOCX_WRITER_H
