#ifndef DOCSHIFT_TEST_UTILS_H
#define DOCSHIFT_TEST_UTILS_H

#include <QByteArray>
#include <QCoreApplication>
#include <QFile>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <cstring>

#include <miniz.h>

namespace docshift::test
{

inline QCoreApplication *ensureQtApp()
{
    // 图片插件与 QTextCodec 需要应用实例；静态持有避免退出时析构顺序问题。
    static int argc = 0;
    static char **argv = nullptr;
    static QCoreApplication app(argc, argv);
    return &app;
}

inline bool writeBytes(const QString &path, const QByteArray &data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(data) == data.size();
}

// Writes a zip package with the given entries, in order.
inline bool writeZip(const QString &path, const QList<QPair<QString, QByteArray>> &entries)
{
    mz_zip_archive archive;
    memset(&archive, 0, sizeof(archive));
    const QByteArray target = QFile::encodeName(path);
    if (!mz_zip_writer_init_file(&archive, target.constData(), 0)) return false;
    bool ok = true;
    for (const auto &entry : entries)
    {
        const QByteArray name = entry.first.toUtf8();
        ok = ok && mz_zip_writer_add_mem(&archive, name.constData(), entry.second.constData(),
                                         static_cast<size_t>(entry.second.size()), MZ_DEFAULT_COMPRESSION);
    }
    ok = ok && mz_zip_writer_finalize_archive(&archive);
    mz_zip_writer_end(&archive);
    return ok;
}

// document.xml root with the namespaces Word itself declares for text and pictures.
inline QByteArray wordDocumentXml(const QString &body)
{
    return QStringLiteral(
               "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
               "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\""
               " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""
               " xmlns:wp=\"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing\""
               " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
               " xmlns:pic=\"http://schemas.openxmlformats.org/drawingml/2006/picture\""
               " xmlns:v=\"urn:schemas-microsoft-com:vml\""
               " xmlns:mc=\"http://schemas.openxmlformats.org/markup-compatibility/2006\">"
               "<w:body>%1<w:sectPr/></w:body></w:document>")
        .arg(body)
        .toUtf8();
}

inline QByteArray relationshipsXml(const QString &relationships)
{
    return QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
                          "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">%1"
                          "</Relationships>")
        .arg(relationships)
        .toUtf8();
}

// Minimal uncompressed PDF with one Helvetica text line per page.
// Offsets in the xref table are computed, so MuPDF opens it without repair.
// With passwordProtected the trailer points at a standard RC4 security handler whose
// user password is not empty, so readers ask for one before showing any page.
inline QByteArray simpleTextPdf(const QStringList &pageTexts, int width = 612, int height = 792,
                                bool passwordProtected = false)
{
    QByteArray pdf("%PDF-1.4\n");
    QVector<int> offsets;
    auto addObject = [&](const QByteArray &body) {
        offsets.append(pdf.size());
        pdf += QByteArray::number(offsets.size()) + " 0 obj\n" + body + "\nendobj\n";
    };

    const int pageCount = pageTexts.size();
    // 1 catalog, 2 pages, 3 font, then a page and its content stream per text
    QByteArray kids;
    for (int i = 0; i < pageCount; ++i) kids += QByteArray::number(4 + i * 2) + " 0 R ";
    addObject("<< /Type /Catalog /Pages 2 0 R >>");
    addObject("<< /Type /Pages /Kids [" + kids.trimmed() + "] /Count " + QByteArray::number(pageCount) + " >>");
    addObject("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
    for (int i = 0; i < pageCount; ++i)
    {
        const QByteArray content = "BT /F1 14 Tf 72 " + QByteArray::number(height - 100) + " Td (" +
                                   pageTexts.at(i).toLatin1() + ") Tj ET";
        addObject("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + QByteArray::number(width) + " " +
                  QByteArray::number(height) + "] /Resources << /Font << /F1 3 0 R >> >> /Contents " +
                  QByteArray::number(5 + i * 2) + " 0 R >>");
        addObject("<< /Length " + QByteArray::number(content.size()) + " >>\nstream\n" + content + "\nendstream");
    }

    QByteArray trailerExtra;
    if (passwordProtected)
    {
        addObject("<< /Filter /Standard /V 1 /R 2 /Length 40 /P -44"
                  " /O <" + QByteArray(64, 'a') + "> /U <" + QByteArray(64, '5') + "> >>");
        trailerExtra = " /Encrypt " + QByteArray::number(offsets.size()) + " 0 R /ID [<" + QByteArray(32, '1') +
                       "> <" + QByteArray(32, '1') + ">]";
    }

    const int xref = pdf.size();
    pdf += "xref\n0 " + QByteArray::number(offsets.size() + 1) + "\n0000000000 65535 f \n";
    for (int offset : offsets) pdf += QByteArray::number(offset).rightJustified(10, '0') + " 00000 n \n";
    pdf += "trailer\n<< /Size " + QByteArray::number(offsets.size() + 1) + " /Root 1 0 R" + trailerExtra +
           " >>\nstartxref\n" + QByteArray::number(xref) + "\n%%EOF\n";
    return pdf;
}

#ifndef Q_OS_WIN
// Executable /bin/sh script standing in for soffice. body sees $fmt, $out, $in and $stem.
inline QString fakeOffice(const QString &dir, const QString &name, const QString &body)
{
    const QString path = dir + QLatin1Char('/') + name;
    const QString script = QStringLiteral(
                               "#!/bin/sh\n"
                               "fmt=''; out=''; in=''\n"
                               "while [ $# -gt 0 ]; do\n"
                               "  case \"$1\" in\n"
                               "    --convert-to) fmt=\"$2\"; shift 2 ;;\n"
                               "    --outdir) out=\"$2\"; shift 2 ;;\n"
                               "    -*) shift ;;\n"
                               "    *) in=\"$1\"; shift ;;\n"
                               "  esac\n"
                               "done\n"
                               "name=$(basename \"$in\")\n"
                               "stem=\"${name%.*}\"\n"
                               "%1\n")
                               .arg(body);
    if (!writeBytes(path, script.toUtf8())) return QString();
    QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}
#endif

} // namespace docshift::test

#endif // DOCSHIFT_TEST_UTILS_H
