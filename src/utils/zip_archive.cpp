#include "zip_archive.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <cstring>
#include <limits>

namespace zip
{
ArchiveReader::ArchiveReader() { memset(&m_archive, 0, sizeof(m_archive)); }

ArchiveReader::~ArchiveReader() { close(); }

bool ArchiveReader::open(const QString &path, QString *errorMessage)
{
    close();
    QFileInfo info(path);
    if (!info.exists() || !info.isFile())
    {
        if (errorMessage) *errorMessage = QObject::tr("Archive not found: %1").arg(path);
        return false;
    }
    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to read archive: %1").arg(path);
        return false;
    }
    if (!openData(file.readAll()))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to open archive: %1").arg(path);
        return false;
    }
    return true;
}

bool ArchiveReader::openData(const QByteArray &data)
{
    close();
    m_data = data;
    if (m_data.isEmpty()) return false;
    if (!mz_zip_reader_init_mem(&m_archive, m_data.constData(), static_cast<size_t>(m_data.size()), 0))
    {
        close();
        return false;
    }
    m_open = true;
    return true;
}

void ArchiveReader::close()
{
    if (m_open)
    {
        mz_zip_reader_end(&m_archive);
        m_open = false;
    }
    memset(&m_archive, 0, sizeof(m_archive));
    m_data.clear();
}

QByteArray ArchiveReader::fileData(const QString &name) const
{
    if (!m_open) return {};
    const QByteArray encoded = name.toUtf8();
    const int index = mz_zip_reader_locate_file(&m_archive, encoded.constData(), nullptr, 0);
    if (index < 0) return {};
    size_t outSize = 0;
    void *ptr = mz_zip_reader_extract_to_heap(&m_archive, static_cast<mz_uint>(index), &outSize, 0);
    if (!ptr || outSize == 0 || outSize > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        if (ptr) mz_free(ptr);
        return {};
    }
    QByteArray data(static_cast<const char *>(ptr), static_cast<int>(outSize));
    mz_free(ptr);
    return data;
}

ArchiveWriter::ArchiveWriter() { memset(&m_archive, 0, sizeof(m_archive)); }

ArchiveWriter::~ArchiveWriter()
{
    if (m_open)
    {
        // abandoned without finalize(): release the handle and drop the partial file
        mz_zip_writer_end(&m_archive);
        QFile::remove(m_path);
    }
}

bool ArchiveWriter::open(const QString &path, QString *errorMessage)
{
    if (m_open) return false;
    m_path = QFileInfo(path).absoluteFilePath();
    const QByteArray target = QFile::encodeName(m_path);
    if (!mz_zip_writer_init_file(&m_archive, target.constData(), 0))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to create archive: %1").arg(path);
        qWarning().noquote() << "[zip] init failed:" << path << mz_zip_get_error_string(mz_zip_get_last_error(&m_archive));
        memset(&m_archive, 0, sizeof(m_archive));
        return false;
    }
    m_open = true;
    return true;
}

bool ArchiveWriter::addFile(const QString &name, const QByteArray &data, QString *errorMessage)
{
    if (!m_open) return false;
    const QByteArray entry = name.toUtf8();
    if (!mz_zip_writer_add_mem(&m_archive, entry.constData(), data.constData(), static_cast<size_t>(data.size()),
                               MZ_DEFAULT_COMPRESSION))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to add %1 to archive").arg(name);
        return false;
    }
    return true;
}

bool ArchiveWriter::finalize(QString *errorMessage)
{
    if (!m_open) return false;
    const bool finalized = mz_zip_writer_finalize_archive(&m_archive) != 0;
    const bool ended = mz_zip_writer_end(&m_archive) != 0;
    m_open = false;
    if (!finalized || !ended)
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to finalize archive: %1").arg(m_path);
        QFile::remove(m_path);
        return false;
    }
    return true;
}
} // namespace zip
