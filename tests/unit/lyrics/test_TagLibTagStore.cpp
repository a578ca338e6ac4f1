#include <taglib/fileref.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>
#include <QTemporaryDir>
#include <QtTest>
#include <cstdint>
#include <fstream>
#include "lyrics/TagLibTagStore.hpp"

using namespace cal::lyrics;

namespace {

void putU16(std::ofstream& out, std::uint16_t v) {
    out.put(static_cast<char>(v & 0xFF));
    out.put(static_cast<char>(v >> 8));
}

void putU32(std::ofstream& out, std::uint32_t v) {
    putU16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    putU16(out, static_cast<std::uint16_t>(v >> 16));
}

// 0.1 s of 8 kHz mono silence, no tags
std::string writeSilentWav(const QTemporaryDir& dir, const char* name) {
    constexpr std::uint32_t kRate = 8000;
    constexpr std::uint32_t kDataBytes = kRate / 10 * 2;

    std::string path = dir.path().toStdString() + "/" + name;
    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    putU32(out, 4 + (8 + 16) + (8 + kDataBytes));
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    putU32(out, 16);
    putU16(out, 1); // PCM
    putU16(out, 1); // mono
    putU32(out, kRate);
    putU32(out, kRate * 2);
    putU16(out, 2);
    putU16(out, 16);

    out.write("data", 4);
    putU32(out, kDataBytes);
    for (std::uint32_t i = 0; i < kDataBytes; ++i)
        out.put('\0');
    return path;
}

TagLib::StringList utf8(const char* s) {
    return TagLib::StringList(TagLib::String(s, TagLib::String::UTF8));
}

} // namespace

class TestTagLibTagStore : public QObject {
    Q_OBJECT

private slots:
    void testMissingFile() {
        TagLibTagStore store;
        auto res = store.read("/nonexistent/dir/song.mp3");
        QVERIFY(res.isErr());
        QVERIFY(!res.error().message.empty());
    }

    void testUnsupportedFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::string path = dir.path().toStdString() + "/notes.txt";
        {
            std::ofstream f(path);
            f << "not audio";
        }

        TagLibTagStore store;
        QVERIFY(store.read(path).isErr());

        TagFields fields;
        fields.lyrics = "la la";
        QVERIFY(store.write(path, fields).isErr());
    }

    void testWriteThenReadBack() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        std::string path = writeSilentWav(dir, "song.wav");

        TagLibTagStore store;
        auto before = store.read(path);
        QVERIFY(before.isOk());
        QVERIFY(!before->lyrics);

        TagFields fields;
        fields.artist = "Sigur R\xC3\xB3s";
        fields.title = "Hopp\xC3\xADpolla";
        fields.lyrics = "First line\nSecond line\n\xC3\xA9t\xC3\xA9";
        auto written = store.write(path, fields);
        QVERIFY2(written.isOk(), written.isErr() ? written.error().message.c_str() : "");

        TagLibTagStore fresh;
        auto after = fresh.read(path);
        QVERIFY(after.isOk());
        QCOMPARE(after->artist.value_or(""), *fields.artist);
        QCOMPARE(after->title.value_or(""), *fields.title);
        QCOMPARE(after->lyrics.value_or(""), *fields.lyrics);
    }

    void testWriteKeepsFieldsNotGiven() {
        QTemporaryDir dir;
        std::string path = writeSilentWav(dir, "keep.wav");

        TagLibTagStore store;
        TagFields first;
        first.artist = "Massive Attack";
        first.title = "Teardrop";
        QVERIFY(store.write(path, first).isOk());

        TagFields second;
        second.lyrics = "Love, love is a verb";
        QVERIFY(store.write(path, second).isOk());

        auto res = store.read(path);
        QVERIFY(res.isOk());
        QCOMPARE(res->artist.value_or(""), std::string("Massive Attack"));
        QCOMPARE(res->title.value_or(""), std::string("Teardrop"));
        QCOMPARE(res->lyrics.value_or(""), std::string("Love, love is a verb"));
    }

    void testUnsyncedLyricsFallback() {
        QTemporaryDir dir;
        std::string path = writeSilentWav(dir, "unsynced.wav");
        {
            TagLib::FileRef f(path.c_str(), false);
            QVERIFY(!f.isNull());
            TagLib::PropertyMap props;
            props.replace("TITLE", utf8("Teardrop"));
            props.replace("UNSYNCEDLYRICS", utf8("Fearless on my breath"));
            f.file()->setProperties(props);
            QVERIFY(f.save());
        }

        TagLibTagStore store;
        auto res = store.read(path);
        QVERIFY(res.isOk());
        QCOMPARE(res->title.value_or(""), std::string("Teardrop"));
        QCOMPARE(res->lyrics.value_or(""), std::string("Fearless on my breath"));
        QVERIFY(!res->artist);
    }

    void testDirectoryIsRejected() {
        QTemporaryDir dir;
        TagLibTagStore store;
        QVERIFY(store.read(dir.path().toStdString()).isErr());
    }
};

int runTestTagLibTagStore(int argc, char** argv) {
    TestTagLibTagStore tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_TagLibTagStore.moc"
