#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QFile>
#include <QTemporaryDir>
#include <QtEndian>

#include "converters/docx_markdown.h"
#include "utils/compound_file.h"

namespace
{
constexpr quint32 kFree = 0xFFFFFFFFu;
constexpr quint32 kEnd = 0xFFFFFFFEu;
constexpr quint32 kFatSect = 0xFFFFFFFDu;
constexpr int kSector = 512;
constexpr int kStreamSize = 4096;

void put16(QByteArray &data, int offset, quint16 value) { qToLittleEndian<quint16>(value, data.data() + offset); }
void put32(QByteArray &data, int offset, quint32 value) { qToLittleEndian<quint32>(value, data.data() + offset); }

void putDirEntry(QByteArray &dir, int index, const QString &name, quint8 type, quint32 start, quint32 size)
{
    const int base = index * 128;
    for (int i = 0; i < name.size(); ++i) put16(dir, base + i * 2, name.at(i).unicode());
    put16(dir, base + 64, static_cast<quint16>((name.size() + 1) * 2));
    dir[base + 66] = static_cast<char>(type);
    put32(dir, base + 68, kFree);
    put32(dir, base + 72, kFree);
    put32(dir, base + 76, kFree);
    put32(dir, base + 116, start);
    put32(dir, base + 120, size);
}

// WordDocument stream whose FIB points at a Clx in 1Table: one Prc block, then a two-piece table.
// Piece one is UTF-16 with a field code, piece two is 8-bit text, a third piece lies past ccpText.
void buildWordStreams(QByteArray *word, QByteArray *table, quint16 fibFlags = 0x0200)
{
    const QString first = QStringLiteral("第一段 Hello ") + QChar(0x13) + QStringLiteral("HYPERLINK \"x\"") + QChar(0x14) +
                          QStringLiteral("World") + QChar(0x15) + QChar(0x0D);
    const QByteArray second = QByteArrayLiteral("Second\tparagraph\r\x07");
    const QByteArray footnote = QByteArrayLiteral("footnote text\r");
    const quint32 ccpText = static_cast<quint32>(first.size() + second.size());

    *word = QByteArray(kStreamSize, '\0');
    put16(*word, 0, 0xA5EC);
    put16(*word, 0x0A, fibFlags);
    put16(*word, 32, 14);       // csw
    put16(*word, 62, 22);       // cslw
    put32(*word, 64 + 3 * 4, ccpText);
    put16(*word, 152, 93);      // cbRgFcLcb
    const int clxSlot = 154 + 33 * 8;

    for (int i = 0; i < first.size(); ++i) put16(*word, 1024 + i * 2, first.at(i).unicode());
    for (int i = 0; i < second.size(); ++i) (*word)[2048 + i] = second.at(i);
    for (int i = 0; i < footnote.size(); ++i) (*word)[3072 + i] = footnote.at(i);

    *table = QByteArray(kStreamSize, '\0');
    const int clx = 100;
    // Prc: clxt 0x01, cbGrpprl 3, three bytes of sprms
    (*table)[clx] = 0x01;
    put16(*table, clx + 1, 3);
    const int pcdt = clx + 6;
    const quint32 lcb = 4 * 4 + 3 * 8;
    (*table)[pcdt] = 0x02;
    put32(*table, pcdt + 1, lcb);
    const int plc = pcdt + 5;
    put32(*table, plc, 0);
    put32(*table, plc + 4, static_cast<quint32>(first.size()));
    put32(*table, plc + 8, ccpText);
    put32(*table, plc + 12, ccpText + static_cast<quint32>(footnote.size()));
    const int pcd = plc + 16;
    put32(*table, pcd + 2, 1024);
    put32(*table, pcd + 8 + 2, (2048u * 2u) | 0x40000000u);
    put32(*table, pcd + 16 + 2, (3072u * 2u) | 0x40000000u);
    put32(*word, clxSlot, clx);
    put32(*word, clxSlot + 4, 6 + 5 + lcb);
}

QString writeDoc(const QTemporaryDir &dir, const QString &name, const QByteArray &data)
{
    const QString path = dir.filePath(name);
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return QString();
    f.write(data);
    return path;
}

QByteArray buildCompoundFile(const QByteArray &word, const QByteArray &table)
{
    const int streamSectors = kStreamSize / kSector;
    const int wordStart = 2;
    const int tableStart = wordStart + streamSectors;
    const int totalSectors = tableStart + streamSectors;

    QByteArray header(kSector, '\0');
    put32(header, 0, 0xE011CFD0u);
    put32(header, 4, 0xE11AB1A1u);
    put16(header, 0x18, 0x003E);
    put16(header, 0x1A, 3);
    put16(header, 0x1C, 0xFFFE);
    put16(header, 0x1E, 9);
    put16(header, 0x20, 6);
    put32(header, 0x2C, 1);
    put32(header, 0x30, 1);
    put32(header, 0x38, 4096);
    put32(header, 0x3C, kEnd);
    put32(header, 0x44, kEnd);
    for (int i = 0; i < 109; ++i) put32(header, 0x4C + i * 4, kFree);
    put32(header, 0x4C, 0);

    QByteArray fat(kSector, '\0');
    for (int i = 0; i < kSector / 4; ++i) put32(fat, i * 4, kFree);
    put32(fat, 0, kFatSect);
    put32(fat, 4, kEnd);
    for (int s = wordStart; s < totalSectors; ++s)
    {
        const bool last = (s == tableStart - 1) || (s == totalSectors - 1);
        put32(fat, s * 4, last ? kEnd : static_cast<quint32>(s + 1));
    }

    QByteArray dir(kSector, '\0');
    putDirEntry(dir, 0, QStringLiteral("Root Entry"), 5, kEnd, 0);
    putDirEntry(dir, 1, QStringLiteral("WordDocument"), 2, wordStart, kStreamSize);
    putDirEntry(dir, 2, QStringLiteral("1Table"), 2, tableStart, kStreamSize);

    return header + fat + dir + word + table;
}
} // namespace

TEST_CASE("OleStorage lists and reads streams")
{
    QByteArray word;
    QByteArray table;
    buildWordStreams(&word, &table);

    OleStorage storage;
    REQUIRE(storage.open(buildCompoundFile(word, table)));
    CHECK(storage.isOpen());
    CHECK(storage.streamNames() == QStringList{QStringLiteral("WordDocument"), QStringLiteral("1Table")});
    CHECK(storage.stream(QStringLiteral("worddocument")) == word);
    CHECK(storage.stream(QStringLiteral("Data")).isEmpty());
}

TEST_CASE("OleStorage rejects non-OLE data")
{
    OleStorage storage;
    QString error;
    CHECK_FALSE(storage.open(QByteArrayLiteral("PK\x03\x04 not an ole file"), &error));
    CHECK_FALSE(error.isEmpty());
    CHECK_FALSE(storage.open(QByteArray(1024, 'x')));
    CHECK_FALSE(storage.isOpen());
    CHECK(storage.stream(QStringLiteral("WordDocument")).isEmpty());
}

TEST_CASE("LegacyWord::readParagraphs recovers main text as markdown paragraphs")
{
    QByteArray word;
    QByteArray table;
    buildWordStreams(&word, &table);
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = writeDoc(dir, QStringLiteral("旧文档.doc"), buildCompoundFile(word, table));
    REQUIRE_FALSE(path.isEmpty());

    QStringList paragraphs;
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;
    REQUIRE(LegacyWord::readParagraphs(path, &paragraphs, &code, &error));
    // field instructions dropped, tab folded, text past ccpText ignored
    CHECK(DocxMarkdown::paragraphsToMarkdown(paragraphs) == QStringLiteral("第一段 Hello World\n\nSecond paragraph\n"));
    CHECK_FALSE(paragraphs.join(QLatin1Char(' ')).contains(QStringLiteral("footnote")));
}

TEST_CASE("LegacyWord::readParagraphs reports why a file cannot be read")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QStringList paragraphs;
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;

    const QString fake = writeDoc(dir, QStringLiteral("fake.doc"), QByteArrayLiteral("plain text pretending to be a doc"));
    CHECK_FALSE(LegacyWord::readParagraphs(fake, &paragraphs, &code, &error));
    CHECK(code == DocShiftErrorCode::InputCorrupt);
    CHECK(error.contains(QStringLiteral("fake.doc")));

    CHECK_FALSE(LegacyWord::readParagraphs(dir.filePath(QStringLiteral("missing.doc")), &paragraphs, &code, &error));
    CHECK(code == DocShiftErrorCode::IoInputMissing);

    QByteArray word;
    QByteArray table;
    buildWordStreams(&word, &table, 0x0200 | 0x0100);
    const QString locked = writeDoc(dir, QStringLiteral("locked.doc"), buildCompoundFile(word, table));
    CHECK_FALSE(LegacyWord::readParagraphs(locked, &paragraphs, &code, &error));
    CHECK(code == DocShiftErrorCode::InputEncrypted);

    // fWhichTblStm cleared: the piece table is looked up in a 0Table that does not exist
    buildWordStreams(&word, &table, 0x0000);
    const QString noTable = writeDoc(dir, QStringLiteral("notable.doc"), buildCompoundFile(word, table));
    CHECK_FALSE(LegacyWord::readParagraphs(noTable, &paragraphs, &code, &error));
    CHECK(code == DocShiftErrorCode::InputCorrupt);
}
