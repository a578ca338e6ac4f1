/**
 * @file Session.hpp
 * @brief The coordinating loop: poll, resolve, synchronize, render.
 *
 * Driven by a QTimer tick and, for interactive renderers, a QSocketNotifier
 * on stdin. Owns the notion of the current track and its document; both are
 * touched only on the main thread. Resolution results for a track that is no
 * longer current are dropped.
 *
 * @section Dependencies
 * - PlayerPoller
 * - ResolveService
 * - ScrollSynchronizer
 * - Renderer
 */

#pragma once
#include <QObject>
#include <optional>
#include "core/ConfigData.hpp"
#include "core/Track.hpp"
#include "lyrics/LyricsDocument.hpp"
#include "sync/ScrollSynchronizer.hpp"
#include "ui/Renderer.hpp"
#include "util/Signal.hpp"

class QSocketNotifier;
class QTimer;

namespace cal {

class PlayerPoller;

namespace lyrics {
class ResolveService;
}

class Session : public QObject {
    Q_OBJECT

public:
    Session(const PlayerConfig& player,
            const ScrollConfig& scroll,
            PlayerPoller& poller,
            lyrics::ResolveService& resolver,
            Renderer& renderer,
            QObject* parent = nullptr);
    ~Session() override;

    // Starts the tick timer and input watching, and ticks once right away
    void start();
    void stop();

    void tickOnce();
    void handleInput(const InputEvent& event);

    const TrackIdentity& currentTrack() const {
        return current_;
    }
    const lyrics::LyricsDocument& document() const {
        return document_;
    }
    const ScrollSynchronizer& synchronizer() const {
        return sync_;
    }
    bool playerAvailable() const {
        return playerAvailable_;
    }
    u32 pollIntervalMs() const {
        return intervalMs_;
    }

    static std::string statusText(lyrics::LyricsStatus status);

signals:
    void quitRequested();

private:
    void onResolved(const TrackIdentity& identity,
                    const lyrics::LyricsDocument& doc);
    void beginTrack(const TrackIdentity& identity);
    void requestLyrics(bool refresh);
    void drainInput();
    void setInterval(u32 ms);
    void render();

    const PlayerConfig& player_;
    PlayerPoller& poller_;
    lyrics::ResolveService& resolver_;
    Renderer& renderer_;

    ScrollSynchronizer sync_;
    TrackIdentity current_;
    lyrics::LyricsDocument document_;
    std::optional<PlaybackSample> lastSample_;

    bool playerAvailable_{true};
    u32 consecutiveFailures_{0};
    u32 intervalMs_;

    QTimer* timer_{nullptr};
    QSocketNotifier* input_{nullptr};
    Signal<const TrackIdentity&, const lyrics::LyricsDocument&>::ConnectionId
            resolvedConn_{};
};

} // namespace cal
