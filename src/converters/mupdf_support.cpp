#include "mupdf_support.h"

#include <QDebug>
#include <QObject>

#include "utils/pathutil.h"

namespace mupdf
{
QString caughtMessage(fz_context *ctx)
{
    const char *msg = ctx ? fz_caught_message(ctx) : nullptr;
    return msg ? QString::fromUtf8(msg) : QStringLiteral("unknown MuPDF error");
}

Context::Context()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        m_error = QObject::tr("Cannot create MuPDF context");
        qWarning().noquote() << "[mupdf]" << m_error;
        return;
    }

    bool registered = true;
    fz_try(m_ctx)
    {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx)
    {
        registered = false;
        m_error = caughtMessage(m_ctx);
    }
    if (!registered)
    {
        qWarning().noquote() << "[mupdf] failed to register handlers:" << m_error;
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

Context::~Context()
{
    if (m_ctx) fz_drop_context(m_ctx);
}

Document::~Document()
{
    if (m_doc) fz_drop_document(m_ctx, m_doc);
}

bool Document::open(const QString &path, DocShiftErrorCode *code, QString *error)
{
    if (!m_ctx)
    {
        if (code) *code = DocShiftErrorCode::EngineUnavailable;
        if (error) *error = QObject::tr("MuPDF is not available");
        return false;
    }

    QByteArray bytes;
    QString readError;
    if (!readFileBytes(path, &bytes, &readError))
    {
        if (code) *code = DocShiftErrorCode::IoInputMissing;
        if (error) *error = readError;
        return false;
    }

    fz_buffer *buffer = nullptr;
    fz_stream *stream = nullptr;
    fz_document *doc = nullptr;
    int pages = 0;
    bool needsPassword = false;
    bool failed = false;
    QString message;
    fz_var(buffer);
    fz_var(stream);
    fz_var(doc);
    fz_var(pages);
    fz_var(needsPassword);
    fz_var(failed);

    fz_try(m_ctx)
    {
        buffer = fz_new_buffer_from_copied_data(m_ctx, reinterpret_cast<const unsigned char *>(bytes.constData()),
                                                static_cast<size_t>(bytes.size()));
        stream = fz_open_buffer(m_ctx, buffer);
        doc = fz_open_document_with_stream(m_ctx, "application/pdf", stream);
        needsPassword = fz_needs_password(m_ctx, doc) != 0;
        if (!needsPassword) pages = fz_count_pages(m_ctx, doc);
    }
    fz_always(m_ctx)
    {
        fz_drop_stream(m_ctx, stream);
        fz_drop_buffer(m_ctx, buffer);
    }
    fz_catch(m_ctx)
    {
        failed = true;
    }
    if (failed)
    {
        message = caughtMessage(m_ctx);
        if (doc) fz_drop_document(m_ctx, doc);
        qWarning().noquote() << "[mupdf] cannot open" << path << ":" << message;
        if (code) *code = DocShiftErrorCode::InputCorrupt;
        if (error) *error = QObject::tr("Cannot open PDF %1: %2").arg(path, message);
        return false;
    }
    if (needsPassword)
    {
        fz_drop_document(m_ctx, doc);
        if (code) *code = DocShiftErrorCode::InputEncrypted;
        if (error) *error = QObject::tr("PDF is password protected: %1").arg(path);
        return false;
    }

    if (m_doc) fz_drop_document(m_ctx, m_doc);
    m_doc = doc;
    m_pageCount = pages;
    return true;
}

PdfWriter::PdfWriter(const Context &ctx) : m_ctx(ctx.get())
{
    if (!m_ctx) return;
    pdf_document *doc = nullptr;
    fz_var(doc);
    fz_try(m_ctx)
    {
        doc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx)
    {
        doc = nullptr;
    }
    if (!doc) qWarning().noquote() << "[mupdf] failed to create output PDF:" << caughtMessage(m_ctx);
    m_doc = doc;
}

PdfWriter::~PdfWriter()
{
    if (m_doc) pdf_drop_document(m_ctx, m_doc);
}

int PdfWriter::pageCount() const
{
    if (!m_doc) return 0;
    int count = 0;
    fz_try(m_ctx)
    {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx)
    {
        count = 0;
    }
    return count;
}

bool PdfWriter::addImagePage(const QByteArray &encodedImage, float widthPt, float heightPt, float x, float y, float w,
                             float h, QString *error)
{
    if (!m_doc)
    {
        if (error) *error = QObject::tr("Output PDF is not initialised");
        return false;
    }
    if (encodedImage.isEmpty() || widthPt <= 0 || heightPt <= 0 || w <= 0 || h <= 0)
    {
        if (error) *error = QObject::tr("Invalid page geometry");
        return false;
    }

    // image XObjects are unit squares: scale to w x h, PDF origin is bottom-left
    const float pdfY = heightPt - y - h;
    QByteArray content;
    content += "q\n";
    content += QByteArray::number(w, 'f', 4) + " 0 0 " + QByteArray::number(h, 'f', 4) + ' ';
    content += QByteArray::number(x, 'f', 4) + ' ' + QByteArray::number(pdfY, 'f', 4) + " cm\n";
    content += "/Img0 Do\nQ\n";

    fz_buffer *imageBuffer = nullptr;
    fz_buffer *contentBuffer = nullptr;
    fz_image *image = nullptr;
    pdf_obj *imageObj = nullptr;
    pdf_obj *resources = nullptr;
    pdf_obj *page = nullptr;
    bool failed = false;
    fz_var(imageBuffer);
    fz_var(contentBuffer);
    fz_var(image);
    fz_var(imageObj);
    fz_var(resources);
    fz_var(page);
    fz_var(failed);

    fz_try(m_ctx)
    {
        imageBuffer = fz_new_buffer_from_copied_data(
            m_ctx, reinterpret_cast<const unsigned char *>(encodedImage.constData()), static_cast<size_t>(encodedImage.size()));
        image = fz_new_image_from_buffer(m_ctx, imageBuffer);
        imageObj = pdf_add_image(m_ctx, m_doc, image);

        resources = pdf_new_dict(m_ctx, m_doc, 2);
        pdf_obj *xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 1);
        pdf_dict_puts(m_ctx, xobjects, "Img0", imageObj);

        contentBuffer = fz_new_buffer_from_copied_data(
            m_ctx, reinterpret_cast<const unsigned char *>(content.constData()), static_cast<size_t>(content.size()));
        const fz_rect mediabox = fz_make_rect(0, 0, widthPt, heightPt);
        page = pdf_add_page(m_ctx, m_doc, mediabox, 0, resources, contentBuffer);
        pdf_insert_page(m_ctx, m_doc, -1, page);
    }
    fz_always(m_ctx)
    {
        pdf_drop_obj(m_ctx, page);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, imageObj);
        fz_drop_image(m_ctx, image);
        fz_drop_buffer(m_ctx, contentBuffer);
        fz_drop_buffer(m_ctx, imageBuffer);
    }
    fz_catch(m_ctx)
    {
        failed = true;
    }
    if (failed)
    {
        const QString message = caughtMessage(m_ctx);
        qWarning().noquote() << "[mupdf] failed to add image page:" << message;
        if (error) *error = QObject::tr("Failed to add page: %1").arg(message);
        return false;
    }
    return true;
}

bool PdfWriter::save(const QString &path, QString *error)
{
    if (!m_doc)
    {
        if (error) *error = QObject::tr("Output PDF is not initialised");
        return false;
    }

    fz_buffer *buffer = nullptr;
    fz_output *out = nullptr;
    bool failed = false;
    QByteArray bytes;
    fz_var(buffer);
    fz_var(out);
    fz_var(failed);

    fz_try(m_ctx)
    {
        buffer = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, buffer);
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;
        pdf_write_document(m_ctx, m_doc, out, &opts);
        fz_close_output(m_ctx, out);
    }
    fz_always(m_ctx)
    {
        fz_drop_output(m_ctx, out);
    }
    fz_catch(m_ctx)
    {
        failed = true;
    }
    if (failed)
    {
        const QString message = caughtMessage(m_ctx);
        fz_drop_buffer(m_ctx, buffer);
        qWarning().noquote() << "[mupdf] failed to serialise PDF:" << message;
        if (error) *error = QObject::tr("Failed to write PDF: %1").arg(message);
        return false;
    }

    unsigned char *data = nullptr;
    const size_t len = fz_buffer_storage(m_ctx, buffer, &data);
    bytes = QByteArray(reinterpret_cast<const char *>(data), static_cast<int>(len));
    fz_drop_buffer(m_ctx, buffer);
    return writeFileBytes(path, bytes, error);
}
} // namespace mupdf
