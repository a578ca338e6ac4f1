#include "Session.hpp"
#include <QSocketNotifier>
#include <QTimer>
#include <algorithm>
#include <unistd.h>
#include "core/Logger.hpp"
#include "lyrics/ResolveService.hpp"
#include "player/PlayerPoller.hpp"

namespace cal {

using lyrics::LyricsDocument;
using lyrics::LyricsStatus;

Session::Session(const PlayerConfig& player,
                 const ScrollConfig& scroll,
                 PlayerPoller& poller,
                 lyrics::ResolveService& resolver,
                 Renderer& renderer,
                 QObject* parent)
    : QObject(parent),
      player_(player),
      poller_(poller),
      resolver_(resolver),
      renderer_(renderer),
      sync_(scroll.autoScroll),
      document_(LyricsDocument::none(LyricsStatus::NotFound)),
      intervalMs_(player.pollIntervalMs) {
    resolvedConn_ = resolver_.resolved.connect(
            [this](const TrackIdentity& identity, const LyricsDocument& doc) {
                onResolved(identity, doc);
            });
}

Session::~Session() {
    resolver_.resolved.disconnect(resolvedConn_);
}

void Session::start() {
    if (!timer_) {
        timer_ = new QTimer(this);
        connect(timer_, &QTimer::timeout, this, &Session::tickOnce);
    }
    if (renderer_.interactive() && !input_) {
        input_ = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
        connect(input_,
                &QSocketNotifier::activated,
                this,
                &Session::drainInput);
    }

    timer_->start(static_cast<int>(intervalMs_));
    LOG_INFO("Session started (poll every {} ms, auto scroll: {})",
             intervalMs_,
             sync_.mode() == ScrollMode::Auto);
    tickOnce();
}

void Session::stop() {
    if (timer_)
        timer_->stop();
    if (input_)
        input_->setEnabled(false);
}

void Session::tickOnce() {
    // Resize is only reported through the input queue
    if (renderer_.interactive())
        drainInput();

    auto sample = poller_.poll();
    if (!sample) {
        playerAvailable_ = false;
        lastSample_.reset();
        ++consecutiveFailures_;
        u64 backoff = static_cast<u64>(player_.pollIntervalMs)
                      << std::min<u32>(consecutiveFailures_, 16);
        setInterval(static_cast<u32>(
                std::min<u64>(backoff, player_.maxBackoffMs)));
        render();
        return;
    }

    if (!playerAvailable_ || consecutiveFailures_ > 0) {
        playerAvailable_ = true;
        consecutiveFailures_ = 0;
        setInterval(player_.pollIntervalMs);
    }
    lastSample_ = sample;

    if (!sample->hasTrack()) {
        if (!current_.empty()) {
            LOG_INFO("Playback stopped");
            beginTrack(TrackIdentity{});
        }
        render();
        return;
    }

    if (!(sample->track == current_)) {
        LOG_INFO("Track changed: {}", sample->track.describe());
        beginTrack(sample->track);
        requestLyrics(false);
    }

    sync_.tick(*sample);
    render();
}

void Session::handleInput(const InputEvent& event) {
    switch (event.kind) {
    case InputKind::Scroll:
        sync_.manualScroll(event.delta);
        break;
    case InputKind::Refresh:
        if (current_.empty())
            return;
        LOG_INFO("Refreshing lyrics for {}", current_.describe());
        document_ = LyricsDocument::none(LyricsStatus::Pending);
        sync_.setLineCount(0);
        requestLyrics(true);
        break;
    case InputKind::Quit:
        emit quitRequested();
        return;
    case InputKind::Resize:
        break;
    }
    render();
}

std::string Session::statusText(LyricsStatus status) {
    switch (status) {
    case LyricsStatus::Found:
        return {};
    case LyricsStatus::Pending:
        return "Searching lyrics...";
    case LyricsStatus::Offline:
        return "Offline mode: no lyrics tag";
    case LyricsStatus::NoMetadata:
    case LyricsStatus::NotFound:
        return "Lyrics not found";
    case LyricsStatus::ProviderError:
        return "No internet connection";
    }
    return {};
}

void Session::onResolved(const TrackIdentity& identity,
                         const LyricsDocument& doc) {
    if (!(identity == current_)) {
        LOG_DEBUG("Dropping lyrics for {}, no longer playing",
                  identity.describe());
        return;
    }

    document_ = doc;
    sync_.setLineCount(document_.lines.size());
    if (lastSample_)
        sync_.tick(*lastSample_);
    render();
}

void Session::beginTrack(const TrackIdentity& identity) {
    current_ = identity;
    document_ = LyricsDocument::none(identity.empty() ? LyricsStatus::NotFound
                                                      : LyricsStatus::Pending);
    sync_.trackChanged(identity);
    sync_.setLineCount(0);
}

void Session::requestLyrics(bool refresh) {
    resolver_.request(current_, refresh);
}

void Session::drainInput() {
    for (const auto& event : renderer_.readInput())
        handleInput(event);
}

void Session::setInterval(u32 ms) {
    if (ms == intervalMs_)
        return;
    LOG_DEBUG("Poll interval {} -> {} ms", intervalMs_, ms);
    intervalMs_ = ms;
    if (timer_ && timer_->isActive())
        timer_->setInterval(static_cast<int>(ms));
}

void Session::render() {
    RenderFrame frame;
    frame.track = current_;
    frame.mode = sync_.mode();

    if (!playerAvailable_) {
        frame.status = "Player not found";
    } else if (current_.empty()) {
        frame.status = "Not playing";
    } else {
        frame.lines = document_.lines;
        frame.offset = sync_.offset();
        frame.status = statusText(document_.status);
    }
    renderer_.render(frame);
}

} // namespace cal
