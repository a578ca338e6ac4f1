/**
 * @file ResolveService.hpp
 * @brief Runs lyrics resolution off the main thread.
 *
 * The session asks for lyrics with request() and gets the answer through the
 * resolved signal, always on the main thread. Only the newest pending request
 * is kept; anything older is dropped before it starts.
 *
 * @section Patterns
 * - Producer-Consumer: the main thread produces requests, one worker
 *   consumes them.
 * - RAII: the worker is a std::jthread joined in the destructor.
 */

#pragma once
#include <QObject>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "core/ConfigData.hpp"
#include "core/Track.hpp"
#include "lyrics/LyricsDocument.hpp"
#include "lyrics/LyricsProvider.hpp"
#include "lyrics/TagStore.hpp"
#include "net/HttpClient.hpp"
#include "util/Signal.hpp"

namespace cal::lyrics {

class ResolveService {
public:
    virtual ~ResolveService() = default;

    // refresh drops the cached document first
    virtual void request(const TrackIdentity& identity, bool refresh) = 0;

    // Emitted on the main thread
    Signal<const TrackIdentity&, const LyricsDocument&> resolved;
};

// Collaborators of the worker. Built on the worker thread, destroyed there
// when it stops. provider may be null (offline); http may be null when the
// provider does not need one.
struct ResolveBackend {
    std::unique_ptr<net::HttpClient> http;
    std::unique_ptr<TagStore> tags;
    std::unique_ptr<LyricsProvider> provider;
};

using BackendFactory = std::function<ResolveBackend(const LyricsConfig&)>;

// QtHttpClient, TagLibTagStore and makeProvider()
ResolveBackend makeDefaultBackend(const LyricsConfig& config);

class ThreadedResolveService : public QObject, public ResolveService {
    Q_OBJECT

public:
    explicit ThreadedResolveService(const LyricsConfig& config,
                                    BackendFactory factory = makeDefaultBackend,
                                    QObject* parent = nullptr);
    ~ThreadedResolveService() override;

    void request(const TrackIdentity& identity, bool refresh) override;

private:
    struct Job {
        TrackIdentity identity;
        bool refresh{false};
    };

    void threadLoop(std::stop_token stopToken);

    const LyricsConfig& config_;
    BackendFactory factory_;

    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::optional<Job> pending_;

    std::jthread thread_;
};

} // namespace cal::lyrics
