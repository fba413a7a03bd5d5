#ifndef DOCSHIFT_COMPOUND_FILE_H
#define DOCSHIFT_COMPOUND_FILE_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include "docshift_error.h"

// Read-only view of an OLE2 compound file, the container of Word 97-2003 documents.
class OleStorage
{
public:
    // Indexes FAT, mini FAT and directory. On failure *error says which structure is broken.
    bool open(const QByteArray &data, QString *error = nullptr);
    bool isOpen() const { return m_open; }

    QStringList streamNames() const;
    // Stream bytes by case-insensitive name; empty when there is no such stream.
    QByteArray stream(const QString &name) const;

private:
    struct Entry
    {
        QString name;
        quint8 objectType = 0; // 1 storage, 2 stream, 5 root
        quint32 firstSector = 0;
        quint64 size = 0;
    };

    qint64 sectorOffset(quint32 sector) const;
    bool appendSectorWords(quint32 sector, int count, QVector<quint32> *words) const;
    // Follows a FAT (or mini FAT) chain; size < 0 reads the whole chain.
    QByteArray readChain(quint32 first, bool mini, qint64 size) const;

    QByteArray m_data;
    int m_sectorSize = 512;
    int m_miniSectorSize = 64;
    quint32 m_miniCutoff = 4096;
    QVector<quint32> m_fat;
    QVector<quint32> m_miniFat;
    QByteArray m_miniStream;
    QVector<Entry> m_entries;
    bool m_open = false;
};

namespace LegacyWord
{
// Main-document text of a .doc file split at paragraph, cell and page marks.
// Field instructions and object anchors are dropped; parts may be blank.
// Errors: IoInputMissing (unreadable), InputCorrupt (not OLE / no piece table / no text),
// InputEncrypted (password protected).
bool readParagraphs(const QString &path, QStringList *paragraphs, DocShiftErrorCode *code = nullptr,
                    QString *error = nullptr);
} // namespace LegacyWord

#endif // DOCSHIFT_COMPOUND_FILE_H
