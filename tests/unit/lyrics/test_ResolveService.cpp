#include <QThread>
#include <QtTest>
#include <atomic>
#include <chrono>
#include <semaphore>
#include "../Fakes.hpp"
#include "lyrics/ResolveService.hpp"

using namespace cal;
using namespace cal::lyrics;
using namespace std::chrono_literals;

namespace {

// Holds the first fetch until the test lets it go
class GatedProvider : public LyricsProvider {
public:
    FetchResult fetch(const std::string& artist,
                      const std::string& title) override {
        calls.push_back({artist, title});
        if (calls.size() == 1) {
            entered.release();
            (void)proceed.try_acquire_for(10s);
        }
        return FetchResult::found("la la\nla");
    }
    LyricsSource source() const override {
        return LyricsSource::AZLyrics;
    }
    std::string_view name() const override {
        return "gated";
    }

    std::binary_semaphore entered{0};
    std::binary_semaphore proceed{0};
    std::vector<test::FakeProvider::Call> calls;
};

// Holds every write until the test lets it go
class GatedTagStore : public TagStore {
public:
    Result<TagFields> read(const std::string& filePath) override {
        return Result<TagFields>::err("no tags in " + filePath);
    }
    Result<void> write(const std::string& filePath,
                       const TagFields& fields) override {
        entered.release();
        (void)proceed.try_acquire_for(10s);
        paths.push_back(filePath);
        lyrics = fields.lyrics;
        completed.store(paths.size(), std::memory_order_release);
        return Result<void>::ok();
    }

    std::binary_semaphore entered{0};
    std::binary_semaphore proceed{0};
    std::atomic<size_t> completed{0};
    std::vector<std::string> paths;
    std::optional<std::string> lyrics;
};

struct Seen {
    std::vector<TrackIdentity> ids;
    std::vector<LyricsDocument> docs;

    void connect(ResolveService& service) {
        service.resolved.connect(
                [this](const TrackIdentity& id, const LyricsDocument& doc) {
                    ids.push_back(id);
                    docs.push_back(doc);
                });
    }
};

} // namespace

class TestResolveService : public QObject {
    Q_OBJECT

private slots:
    // Offline keeps the default backend away from the network
    void testResultArrivesOnMainThread() {
        LyricsConfig cfg;
        cfg.offline = true;
        ThreadedResolveService service(cfg);

        std::vector<TrackIdentity> seen;
        LyricsStatus status = LyricsStatus::Pending;
        bool onMainThread = false;
        service.resolved.connect(
                [&](const TrackIdentity& id, const LyricsDocument& doc) {
                    seen.push_back(id);
                    status = doc.status;
                    onMainThread = QThread::currentThread() == thread();
                });

        auto id = test::track("A", "B", "/nonexistent/song.mp3");
        service.request(id, false);

        QTRY_COMPARE(seen.size(), size_t(1));
        QVERIFY(seen[0] == id);
        QVERIFY(status == LyricsStatus::Offline);
        QVERIFY(onMainThread);
    }

    void testNewestRequestReplacesPending() {
        LyricsConfig cfg;
        std::atomic<GatedProvider*> provider{nullptr};
        ThreadedResolveService service(cfg, [&](const LyricsConfig&) {
            ResolveBackend backend;
            backend.tags = std::make_unique<test::FakeTagStore>();
            auto gated = std::make_unique<GatedProvider>();
            provider.store(gated.get());
            backend.provider = std::move(gated);
            return backend;
        });
        Seen seen;
        seen.connect(service);

        auto first = test::track("A", "One", "/a.mp3");
        auto second = test::track("A", "Two", "/b.mp3");
        auto third = test::track("A", "Three", "/c.mp3");

        service.request(first, false);
        // Wait until the worker is busy with the first track
        QTRY_VERIFY(provider.load() != nullptr);
        QVERIFY(provider.load()->entered.try_acquire_for(5s));

        service.request(second, false);
        service.request(third, false);
        provider.load()->proceed.release();

        QTRY_COMPARE(seen.ids.size(), size_t(2));
        QVERIFY(seen.ids[0] == first);
        QVERIFY(seen.ids[1] == third);
        QCOMPARE(provider.load()->calls.size(), size_t(2));
        QCOMPARE(provider.load()->calls[1].title, std::string("Three"));

        QTest::qWait(50);
        QCOMPARE(seen.ids.size(), size_t(2));
    }

    void testRefreshDropsCache() {
        LyricsConfig cfg;
        test::FakeProvider* provider = nullptr;
        ThreadedResolveService service(cfg, [&](const LyricsConfig&) {
            ResolveBackend backend;
            backend.tags = std::make_unique<test::FakeTagStore>();
            auto fake = std::make_unique<test::FakeProvider>();
            fake->result = FetchResult::found("first\nsecond");
            provider = fake.get();
            backend.provider = std::move(fake);
            return backend;
        });
        Seen seen;
        seen.connect(service);

        auto id = test::track("A", "B", "/a.mp3");

        service.request(id, false);
        QTRY_COMPARE(seen.ids.size(), size_t(1));
        service.request(id, false);
        QTRY_COMPARE(seen.ids.size(), size_t(2));
        QCOMPARE(provider->calls.size(), size_t(1));

        service.request(id, true);
        QTRY_COMPARE(seen.ids.size(), size_t(3));
        QCOMPARE(provider->calls.size(), size_t(2));
        QVERIFY(seen.docs[2].status == LyricsStatus::Found);
        QCOMPARE(seen.docs[2].lines.size(), size_t(2));
    }

    void testResultPostedBeforeWriteBack() {
        LyricsConfig cfg;
        cfg.saveTags = true;
        GatedTagStore* store = nullptr;
        ThreadedResolveService service(cfg, [&](const LyricsConfig&) {
            ResolveBackend backend;
            auto gated = std::make_unique<GatedTagStore>();
            store = gated.get();
            backend.tags = std::move(gated);
            auto fake = std::make_unique<test::FakeProvider>();
            fake->result = FetchResult::found("la la\nla");
            backend.provider = std::move(fake);
            return backend;
        });
        Seen seen;
        seen.connect(service);

        auto id = test::track("A", "B", "/song.mp3");
        service.request(id, false);

        // The write is held, yet the result is already on the main thread
        QTRY_COMPARE_WITH_TIMEOUT(seen.ids.size(), size_t(1), 3000);
        QVERIFY(seen.docs[0].status == LyricsStatus::Found);
        QVERIFY(store->entered.try_acquire_for(5s));
        QCOMPARE(store->completed.load(std::memory_order_acquire), size_t(0));

        store->proceed.release();
        QTRY_COMPARE(store->completed.load(std::memory_order_acquire), size_t(1));
        QCOMPARE(store->paths[0], std::string("/song.mp3"));
        QCOMPARE(store->lyrics.value_or(""), std::string("la la\nla"));
    }

    void testProviderTimeoutIsProviderError() {
        LyricsConfig cfg;
        test::FakeHttpClient* http = nullptr;
        ThreadedResolveService service(cfg, [&](const LyricsConfig& config) {
            ResolveBackend backend;
            auto fake = std::make_unique<test::FakeHttpClient>();
            fake->fail(net::HttpError::Timeout, "Request timed out after 10000 ms");
            http = fake.get();
            backend.tags = std::make_unique<test::FakeTagStore>();
            backend.provider = makeProvider(config, *fake);
            backend.http = std::move(fake);
            return backend;
        });
        Seen seen;
        seen.connect(service);

        service.request(test::track("Massive Attack", "Teardrop", "/t.mp3"),
                        false);

        QTRY_COMPARE(seen.ids.size(), size_t(1));
        QVERIFY(seen.docs[0].status == LyricsStatus::ProviderError);
        QVERIFY(seen.docs[0].lines.empty());
        QCOMPARE(http->requests.size(), size_t(1));
    }

    void testNoResultAfterReset() {
        LyricsConfig cfg;
        std::atomic<GatedProvider*> provider{nullptr};
        auto service = std::make_unique<ThreadedResolveService>(
                cfg, [&](const LyricsConfig&) {
                    ResolveBackend backend;
                    backend.tags = std::make_unique<test::FakeTagStore>();
                    auto gated = std::make_unique<GatedProvider>();
                    provider.store(gated.get());
                    backend.provider = std::move(gated);
                    return backend;
                });

        int emitted = 0;
        service->resolved.connect(
                [&](const TrackIdentity&, const LyricsDocument&) { ++emitted; });

        service->request(test::track("A", "B", "/x.mp3"), false);
        QTRY_VERIFY(provider.load() != nullptr);
        QVERIFY(provider.load()->entered.try_acquire_for(5s));
        service->request(test::track("C", "D", "/y.mp3"), true);

        // Whatever the worker posts from here on targets a dead object
        provider.load()->proceed.release();
        service.reset();

        QTest::qWait(100);
        QCOMPARE(emitted, 0);
    }
};

int runTestResolveService(int argc, char** argv) {
    TestResolveService tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ResolveService.moc"
