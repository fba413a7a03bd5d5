#ifndef DOCSHIFT_MUPDF_SUPPORT_H
#define DOCSHIFT_MUPDF_SUPPORT_H

#include <QByteArray>
#include <QString>

extern "C"
{
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
}

#include "utils/docshift_error.h"

// Thin RAII layer over MuPDF. Every conversion owns its own context, so the
// objects below are used from one thread at a time and never shared.
namespace mupdf
{
// fz_context with the document handlers registered.
class Context
{
public:
    Context();
    ~Context();
    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    fz_context *get() const { return m_ctx; }
    bool isValid() const { return m_ctx != nullptr; }
    const QString &error() const { return m_error; }

private:
    fz_context *m_ctx = nullptr;
    QString m_error;
};

// A document opened from bytes read through Qt, so any path Qt can read works.
class Document
{
public:
    explicit Document(const Context &ctx) : m_ctx(ctx.get()) {}
    ~Document();
    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;

    // Opens path; on failure fills *code (InputCorrupt/InputEncrypted/IoInputMissing) and *error.
    bool open(const QString &path, DocShiftErrorCode *code, QString *error);

    fz_document *get() const { return m_doc; }
    int pageCount() const { return m_pageCount; }

private:
    fz_context *m_ctx = nullptr;
    fz_document *m_doc = nullptr;
    int m_pageCount = 0;
};

// A new, empty PDF being assembled page by page.
class PdfWriter
{
public:
    explicit PdfWriter(const Context &ctx);
    ~PdfWriter();
    PdfWriter(const PdfWriter &) = delete;
    PdfWriter &operator=(const PdfWriter &) = delete;

    bool isValid() const { return m_doc != nullptr; }
    pdf_document *get() const { return m_doc; }
    int pageCount() const;

    // Append a page of widthPt x heightPt showing the encoded picture (PNG/JPEG bytes)
    // in the rectangle (x, y, w, h), measured in points from the top-left corner.
    bool addImagePage(const QByteArray &encodedImage, float widthPt, float heightPt, float x, float y, float w,
                      float h, QString *error);

    // Serialize with compression and write through QSaveFile.
    bool save(const QString &path, QString *error);

private:
    fz_context *m_ctx = nullptr;
    pdf_document *m_doc = nullptr;
};

// Human readable text of the exception caught by the last fz_catch.
QString caughtMessage(fz_context *ctx);
} // namespace mupdf

#endif // DOCSHIFT_MUPDF_SUPPORT_H
