#include "word_pdf_converter.h"

#include <QDebug>
#include <QObject>
#include <QtMath>
#include <cstring>

#include "converter_support.h"
#include "docx_writer.h"
#include "mupdf_support.h"
#include "office_engine.h"
#include "utils/pathutil.h"

namespace
{
void appendCodePoint(QString &out, int cp)
{
    if (cp <= 0 || cp > 0x10FFFF) return;
    if (cp > 0xFFFF)
    {
        out += QChar(QChar::highSurrogate(static_cast<uint>(cp)));
        out += QChar(QChar::lowSurrogate(static_cast<uint>(cp)));
    }
    else
    {
        out += QChar(static_cast<ushort>(cp));
    }
}

struct CharStyle
{
    bool bold = false;
    bool italic = false;
    int halfPoints = 0;

    bool operator==(const CharStyle &o) const { return bold == o.bold && italic == o.italic && halfPoints == o.halfPoints; }
    bool operator!=(const CharStyle &o) const { return !(*this == o); }
};

CharStyle styleOf(fz_context *ctx, const fz_stext_char *ch)
{
    CharStyle style;
    if (ch->font)
    {
        style.bold = fz_font_is_bold(ctx, ch->font) != 0;
        style.italic = fz_font_is_italic(ctx, ch->font) != 0;
    }
    style.halfPoints = qRound(ch->size) * 2;
    return style;
}

// Appends text to the last run when the style matches, else opens a new run.
void appendStyled(QVector<DocxRun> &runs, const QString &text, const CharStyle &style)
{
    if (text.isEmpty()) return;
    if (!runs.isEmpty())
    {
        DocxRun &last = runs.last();
        if (last.bold == style.bold && last.italic == style.italic && last.halfPoints == style.halfPoints)
        {
            last.text += text;
            return;
        }
    }
    runs.append(DocxRun{text, style.bold, style.italic, style.halfPoints});
}

// Lines of a block become one paragraph: joined by a space, or directly after a trailing hyphen.
QVector<DocxRun> textBlockRuns(fz_context *ctx, const fz_stext_block *block)
{
    QVector<DocxRun> runs;
    bool firstLine = true;
    for (const fz_stext_line *line = block->u.t.first_line; line; line = line->next)
    {
        if (!firstLine && !runs.isEmpty() && !runs.last().text.endsWith(QLatin1Char('-')) &&
            !runs.last().text.endsWith(QLatin1Char(' ')))
        {
            runs.last().text += QLatin1Char(' ');
        }
        firstLine = false;

        QString pending;
        CharStyle pendingStyle;
        bool hasPending = false;
        for (const fz_stext_char *ch = line->first_char; ch; ch = ch->next)
        {
            const CharStyle style = styleOf(ctx, ch);
            if (hasPending && style != pendingStyle)
            {
                appendStyled(runs, pending, pendingStyle);
                pending.clear();
            }
            pendingStyle = style;
            hasPending = true;
            appendCodePoint(pending, ch->c);
        }
        if (hasPending) appendStyled(runs, pending, pendingStyle);
    }
    if (!runs.isEmpty())
    {
        while (runs.last().text.endsWith(QLatin1Char(' '))) runs.last().text.chop(1);
    }
    return runs;
}

QByteArray imageBlockPng(fz_context *ctx, const fz_stext_block *block, int pageNumber)
{
    fz_buffer *png = nullptr;
    bool failed = false;
    fz_var(png);
    fz_var(failed);
    fz_try(ctx)
    {
        png = fz_new_buffer_from_image_as_png(ctx, block->u.i.image, fz_default_color_params);
    }
    fz_catch(ctx)
    {
        failed = true;
    }
    if (failed)
    {
        qWarning().noquote() << "[pdf2word] page" << pageNumber << "image skipped:" << mupdf::caughtMessage(ctx);
        return QByteArray();
    }
    unsigned char *data = nullptr;
    const size_t len = fz_buffer_storage(ctx, png, &data);
    QByteArray bytes(reinterpret_cast<const char *>(data), static_cast<int>(len));
    fz_drop_buffer(ctx, png);
    return bytes;
}
} // namespace

WordPdfConverter::WordPdfConverter(const ConversionOptions &options) : m_options(options) {}

QStringList WordPdfConverter::wordExtensions() { return {QStringLiteral(".docx"), QStringLiteral(".doc")}; }

QStringList WordPdfConverter::pdfExtensions() { return {QStringLiteral(".pdf")}; }

QString WordPdfConverter::officeExecutable() const { return OfficeEngine::locate(m_options.officePath); }

bool WordPdfConverter::isWordToPdfAvailable() const { return !officeExecutable().isEmpty(); }

ConversionResult WordPdfConverter::wordToPdf(const QString &input, const QString &outDir) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, wordExtensions(), &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;

    const OfficeEngine engine(m_options.officePath, m_options.officeTimeoutMs);
    const ConversionResult produced = engine.convert(input, dir, QStringLiteral("pdf"));
    if (!produced.ok)
    {
        qWarning().noquote() << "[word2pdf]" << produced.errorText();
        return produced;
    }
    qInfo().noquote() << "[word2pdf] wrote" << produced.primaryOutput();
    return ConverterSupport::verifyOutputs(produced.outputs);
}

ConversionResult WordPdfConverter::pdfToWord(const QString &input, const QString &outDir) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, pdfExtensions(), &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;

    mupdf::Context ctx;
    if (!ctx.isValid()) return ConversionResult::failure(DocShiftErrorCode::EngineUnavailable, ctx.error());
    mupdf::Document doc(ctx);
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;
    if (!doc.open(input, &code, &error)) return ConversionResult::failure(code, error);

    fz_context *c = ctx.get();
    DocxWriter writer;
    QStringList warnings;

    for (int i = 0; i < doc.pageCount(); ++i)
    {
        if (i > 0) writer.addPageBreak();

        fz_page *page = nullptr;
        fz_stext_page *text = nullptr;
        fz_rect bounds = fz_empty_rect;
        bool failed = false;
        fz_var(page);
        fz_var(text);
        fz_var(failed);
        fz_try(c)
        {
            page = fz_load_page(c, doc.get(), i);
            bounds = fz_bound_page(c, page);
            fz_stext_options opts;
            memset(&opts, 0, sizeof(opts));
            opts.flags = FZ_STEXT_PRESERVE_IMAGES;
            text = fz_new_stext_page_from_page(c, page, &opts);
        }
        fz_catch(c)
        {
            failed = true;
        }
        if (failed)
        {
            const QString message = QObject::tr("page %1 could not be read: %2").arg(i + 1).arg(mupdf::caughtMessage(c));
            qWarning().noquote() << "[pdf2word]" << message;
            warnings << message;
            if (page) fz_drop_page(c, page);
            writer.addEmptyParagraph();
            continue;
        }

        if (i == 0) writer.setPageSize(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);

        int emitted = 0;
        for (fz_stext_block *block = text->first_block; block; block = block->next)
        {
            if (block->type == FZ_STEXT_BLOCK_TEXT)
            {
                const QVector<DocxRun> runs = textBlockRuns(c, block);
                if (runs.isEmpty()) continue;
                writer.addParagraph(runs);
                ++emitted;
            }
            else if (block->type == FZ_STEXT_BLOCK_IMAGE)
            {
                const QByteArray png = imageBlockPng(c, block, i + 1);
                if (png.isEmpty()) continue;
                writer.addImage(png, block->bbox.x1 - block->bbox.x0, block->bbox.y1 - block->bbox.y0);
                ++emitted;
            }
        }
        if (emitted == 0) writer.addEmptyParagraph();
        qDebug().noquote() << "[pdf2word] page" << (i + 1) << "blocks" << emitted;

        fz_drop_stext_page(c, text);
        fz_drop_page(c, page);
    }

    const QString output = outputFilePath(dir, input, QString(), QStringLiteral("docx"));
    if (!writer.save(output, &error))
    {
        qWarning().noquote() << "[pdf2word]" << error;
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
    }
    qInfo().noquote() << "[pdf2word] wrote" << output << "pages" << doc.pageCount() << "images" << writer.imageCount();
    return ConverterSupport::verifyOutputs({output}, warnings);
}
