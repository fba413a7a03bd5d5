#include "compound_file.h"

#include <QDebug>
#include <QFile>
#include <QObject>
#include <QSet>
#include <QTextCodec>
#include <QtEndian>

namespace
{
const QByteArray kOleMagic("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8);
constexpr quint32 kMaxRegularSector = 0xFFFFFFFAu; // above are FREESECT, ENDOFCHAIN, FATSECT ...
constexpr int kHeaderFatSlots = 109;
constexpr int kDirEntrySize = 128;

constexpr quint16 kWordIdent = 0xA5EC;
constexpr quint16 kFibEncrypted = 0x0100;
constexpr quint16 kFibTable1 = 0x0200;
constexpr int kFibCcpTextIndex = 3;  // FibRgLw97.ccpText
constexpr int kFibClxIndex = 33;     // FibRgFcLcb97.fcClx / lcbClx
constexpr quint32 kFcCompressed = 0x40000000u;

template <typename T>
T le(const QByteArray &buf, qint64 offset)
{
    return qFromLittleEndian<T>(buf.constData() + offset);
}

bool fits(const QByteArray &buf, qint64 offset, qint64 length)
{
    return offset >= 0 && length >= 0 && offset + length <= buf.size();
}

// Text of the main document between CP 0 and ccpText, taken piece by piece.
QString decodeMainText(const QByteArray &word, const QByteArray &plcPcd, quint32 ccpText)
{
    const int pieces = (plcPcd.size() - 4) / 12;
    QTextCodec *ansi = QTextCodec::codecForName("Windows-1252");
    QString text;
    for (int i = 0; i < pieces; ++i)
    {
        const quint32 cpFirst = le<quint32>(plcPcd, i * 4);
        const quint32 cpLimit = qMin(le<quint32>(plcPcd, (i + 1) * 4), ccpText);
        if (cpFirst >= cpLimit) continue;
        const quint32 fc = le<quint32>(plcPcd, (pieces + 1) * 4 + i * 8 + 2);
        const int chars = static_cast<int>(cpLimit - cpFirst);
        if (fc & kFcCompressed)
        {
            const qint64 start = (fc & ~kFcCompressed) / 2;
            if (!fits(word, start, chars)) continue;
            const QByteArray raw = word.mid(static_cast<int>(start), chars);
            text += ansi ? ansi->toUnicode(raw) : QString::fromLatin1(raw);
        }
        else
        {
            if (!fits(word, fc, qint64(chars) * 2)) continue;
            for (int c = 0; c < chars; ++c) text += QChar(le<quint16>(word, fc + c * 2));
        }
    }
    return text;
}

// Drops field instructions (0x13 .. 0x14) and anchors; paragraph, cell and page marks become '\n'.
QString visibleText(const QString &raw)
{
    QString out;
    out.reserve(raw.size());
    QVector<bool> fields; // per open field: still in its instruction part
    for (const QChar ch : raw)
    {
        const ushort u = ch.unicode();
        if (u == 0x13)
        {
            fields.append(true);
            continue;
        }
        if (u == 0x14)
        {
            if (!fields.isEmpty()) fields.last() = false;
            continue;
        }
        if (u == 0x15)
        {
            if (!fields.isEmpty()) fields.removeLast();
            continue;
        }
        if (fields.contains(true)) continue;

        switch (u)
        {
        case 0x0D:
        case 0x07:
        case 0x0C: out += QLatin1Char('\n'); break;
        case 0x09:
        case 0x0B:
        case 0xA0: out += QLatin1Char(' '); break;
        case 0x1E: out += QLatin1Char('-'); break;
        default:
            if (u >= 0x20) out += ch;
            break;
        }
    }
    return out;
}

bool fail(DocShiftErrorCode code, const QString &message, DocShiftErrorCode *codeOut, QString *error)
{
    if (codeOut) *codeOut = code;
    if (error) *error = message;
    return false;
}
} // namespace

bool OleStorage::open(const QByteArray &data, QString *error)
{
    m_open = false;
    m_fat.clear();
    m_miniFat.clear();
    m_miniStream.clear();
    m_entries.clear();
    auto broken = [error](const QString &why) {
        if (error) *error = why;
        return false;
    };

    if (data.size() < 512 || !data.startsWith(kOleMagic)) return broken(QObject::tr("not an OLE compound file"));
    m_data = data;
    const quint16 sectorShift = le<quint16>(m_data, 0x1E);
    if (sectorShift != 9 && sectorShift != 12) return broken(QObject::tr("unsupported sector size"));
    m_sectorSize = 1 << sectorShift;
    if (le<quint16>(m_data, 0x20) != 6) return broken(QObject::tr("unsupported mini sector size"));
    m_miniSectorSize = 64;
    m_miniCutoff = le<quint32>(m_data, 0x38);
    const bool version3 = le<quint16>(m_data, 0x1A) == 3;
    const int wordsPerSector = m_sectorSize / 4;

    // FAT sector numbers: the first 109 sit in the header, the others in the DIFAT chain
    QVector<quint32> fatSectors;
    for (int i = 0; i < kHeaderFatSlots; ++i)
    {
        const quint32 sector = le<quint32>(m_data, 0x4C + i * 4);
        if (sector <= kMaxRegularSector) fatSectors.append(sector);
    }
    QSet<quint32> visited;
    for (quint32 difat = le<quint32>(m_data, 0x44); difat <= kMaxRegularSector; )
    {
        if (visited.contains(difat)) return broken(QObject::tr("DIFAT chain loops"));
        visited.insert(difat);
        QVector<quint32> words;
        if (!appendSectorWords(difat, wordsPerSector, &words)) return broken(QObject::tr("DIFAT sector out of range"));
        for (int i = 0; i + 1 < words.size(); ++i)
        {
            if (words.at(i) <= kMaxRegularSector) fatSectors.append(words.at(i));
        }
        difat = words.last();
    }
    for (quint32 sector : fatSectors)
    {
        if (!appendSectorWords(sector, wordsPerSector, &m_fat)) return broken(QObject::tr("FAT sector out of range"));
    }
    if (m_fat.isEmpty()) return broken(QObject::tr("empty FAT"));

    const QByteArray directory = readChain(le<quint32>(m_data, 0x30), false, -1);
    for (int base = 0; base + kDirEntrySize <= directory.size(); base += kDirEntrySize)
    {
        Entry entry;
        entry.objectType = static_cast<quint8>(directory.at(base + 66));
        if (entry.objectType != 1 && entry.objectType != 2 && entry.objectType != 5) continue;
        const int nameChars = qBound(0, le<quint16>(directory, base + 64) / 2 - 1, 31);
        for (int c = 0; c < nameChars; ++c) entry.name += QChar(le<quint16>(directory, base + c * 2));
        entry.firstSector = le<quint32>(directory, base + 116);
        entry.size = version3 ? le<quint32>(directory, base + 120) : le<quint64>(directory, base + 120);
        m_entries.append(entry);
    }
    if (m_entries.isEmpty() || m_entries.first().objectType != 5) return broken(QObject::tr("root entry missing"));

    const QByteArray miniFat = readChain(le<quint32>(m_data, 0x3C), false, -1);
    for (int offset = 0; offset + 4 <= miniFat.size(); offset += 4) m_miniFat.append(le<quint32>(miniFat, offset));
    const Entry &root = m_entries.first();
    m_miniStream = readChain(root.firstSector, false, static_cast<qint64>(root.size));

    m_open = true;
    return true;
}

QStringList OleStorage::streamNames() const
{
    QStringList names;
    for (const Entry &entry : m_entries)
    {
        if (entry.objectType == 2) names << entry.name;
    }
    return names;
}

QByteArray OleStorage::stream(const QString &name) const
{
    for (const Entry &entry : m_entries)
    {
        if (entry.objectType != 2 || entry.name.compare(name, Qt::CaseInsensitive) != 0) continue;
        return readChain(entry.firstSector, entry.size < m_miniCutoff, static_cast<qint64>(entry.size));
    }
    return QByteArray();
}

qint64 OleStorage::sectorOffset(quint32 sector) const
{
    // the header fills sector -1, padded to a full sector in version 4 files
    const qint64 offset = (static_cast<qint64>(sector) + 1) * m_sectorSize;
    return fits(m_data, offset, m_sectorSize) ? offset : -1;
}

bool OleStorage::appendSectorWords(quint32 sector, int count, QVector<quint32> *words) const
{
    const qint64 offset = sectorOffset(sector);
    if (offset < 0) return false;
    for (int i = 0; i < count; ++i) words->append(le<quint32>(m_data, offset + i * 4));
    return true;
}

QByteArray OleStorage::readChain(quint32 first, bool mini, qint64 size) const
{
    const QVector<quint32> &table = mini ? m_miniFat : m_fat;
    const QByteArray &source = mini ? m_miniStream : m_data;
    const int unit = mini ? m_miniSectorSize : m_sectorSize;

    QByteArray out;
    int hops = 0;
    for (quint32 sector = first; sector <= kMaxRegularSector && hops <= table.size(); ++hops)
    {
        const qint64 offset = mini ? static_cast<qint64>(sector) * unit : (static_cast<qint64>(sector) + 1) * unit;
        if (!fits(source, offset, unit)) break;
        out.append(source.constData() + offset, unit);
        if (size >= 0 && out.size() >= size) break;
        if (sector >= static_cast<quint32>(table.size())) break;
        sector = table.at(static_cast<int>(sector));
    }
    if (size >= 0 && out.size() > size) out.truncate(static_cast<int>(size));
    return out;
}

namespace LegacyWord
{
bool readParagraphs(const QString &path, QStringList *paragraphs, DocShiftErrorCode *code, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return fail(DocShiftErrorCode::IoInputMissing, QObject::tr("Cannot read %1").arg(path), code, error);

    OleStorage storage;
    QString why;
    if (!storage.open(file.readAll(), &why))
    {
        return fail(DocShiftErrorCode::InputCorrupt,
                    QObject::tr("Not a Word 97-2003 document: %1 (%2)").arg(path, why), code, error);
    }

    const QByteArray word = storage.stream(QStringLiteral("WordDocument"));
    if (word.size() < 0x200 || le<quint16>(word, 0) != kWordIdent)
        return fail(DocShiftErrorCode::InputCorrupt, QObject::tr("No WordDocument stream in %1").arg(path), code, error);
    const quint16 flags = le<quint16>(word, 0x0A);
    if (flags & kFibEncrypted)
        return fail(DocShiftErrorCode::InputEncrypted, QObject::tr("%1 is password protected").arg(path), code, error);

    // FIB: base (32 bytes), then counted arrays of shorts, longs and fc/lcb pairs
    const qint64 rgLw = 0x22 + 2 * le<quint16>(word, 0x20) + 2;
    const qint64 rgFcLcb = fits(word, rgLw - 2, 2) ? rgLw + 4 * le<quint16>(word, rgLw - 2) + 2 : -1;
    const quint16 pairs = fits(word, rgFcLcb - 2, 2) ? le<quint16>(word, rgFcLcb - 2) : 0;
    const qint64 clxSlot = rgFcLcb + kFibClxIndex * 8;
    if (pairs <= kFibClxIndex || rgFcLcb < rgLw + (kFibCcpTextIndex + 1) * 4 || !fits(word, clxSlot, 8))
        return fail(DocShiftErrorCode::InputCorrupt, QObject::tr("Unsupported Word file header in %1").arg(path), code, error);
    const quint32 ccpText = le<quint32>(word, rgLw + kFibCcpTextIndex * 4);
    const quint32 fcClx = le<quint32>(word, clxSlot);
    const quint32 lcbClx = le<quint32>(word, clxSlot + 4);

    const QByteArray table = storage.stream((flags & kFibTable1) ? QStringLiteral("1Table") : QStringLiteral("0Table"));
    if (!fits(table, fcClx, lcbClx))
        return fail(DocShiftErrorCode::InputCorrupt, QObject::tr("Piece table out of range in %1").arg(path), code, error);

    // Clx: any number of Prc blocks (0x01) followed by one Pcdt (0x02)
    QByteArray plcPcd;
    for (qint64 pos = fcClx, end = qint64(fcClx) + lcbClx; pos < end;)
    {
        const quint8 clxt = static_cast<quint8>(table.at(static_cast<int>(pos)));
        if (clxt == 0x01 && fits(table, pos + 1, 2) && le<qint16>(table, pos + 1) >= 0)
        {
            pos += 3 + le<qint16>(table, pos + 1);
        }
        else if (clxt == 0x02 && fits(table, pos + 1, 4))
        {
            const quint32 lcb = le<quint32>(table, pos + 1);
            if (lcb >= 16 && fits(table, pos + 5, lcb)) plcPcd = table.mid(static_cast<int>(pos + 5), static_cast<int>(lcb));
            break;
        }
        else
        {
            break;
        }
    }
    if (plcPcd.isEmpty())
        return fail(DocShiftErrorCode::InputCorrupt, QObject::tr("No piece table in %1").arg(path), code, error);

    const QString text = visibleText(decodeMainText(word, plcPcd, ccpText));
    if (text.trimmed().isEmpty())
        return fail(DocShiftErrorCode::InputCorrupt, QObject::tr("No text could be recovered from %1").arg(path), code, error);

    qDebug().noquote() << "[doc] recovered" << text.size() << "chars from" << path;
    if (paragraphs) *paragraphs = text.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    return true;
}
} // namespace LegacyWord
