#ifndef DOCSHIFT_ZIP_ARCHIVE_H
#define DOCSHIFT_ZIP_ARCHIVE_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <miniz.h>

namespace zip
{
// Read-only view over a zip package (docx, xlsx ...) held in memory.
class ArchiveReader
{
public:
    ArchiveReader();
    ~ArchiveReader();
    ArchiveReader(const ArchiveReader &) = delete;
    ArchiveReader &operator=(const ArchiveReader &) = delete;

    bool open(const QString &path, QString *errorMessage = nullptr);
    bool openData(const QByteArray &data);
    void close();
    bool isOpen() const { return m_open; }

    // Entry content; empty when missing or unreadable.
    QByteArray fileData(const QString &name) const;

private:
    QByteArray m_data;
    mutable mz_zip_archive m_archive;
    bool m_open = false;
};

// Builds a zip package on disk; entries are written in the order they are added.
class ArchiveWriter
{
public:
    ArchiveWriter();
    ~ArchiveWriter();
    ArchiveWriter(const ArchiveWriter &) = delete;
    ArchiveWriter &operator=(const ArchiveWriter &) = delete;

    bool open(const QString &path, QString *errorMessage = nullptr);
    bool addFile(const QString &name, const QByteArray &data, QString *errorMessage = nullptr);
    // Writes the central directory and closes the file. The writer is unusable afterwards.
    bool finalize(QString *errorMessage = nullptr);

private:
    mz_zip_archive m_archive;
    QString m_path;
    bool m_open = false;
};
} // namespace zip

#endif // DOCSHIFT_ZIP_ARCHIVE_H
