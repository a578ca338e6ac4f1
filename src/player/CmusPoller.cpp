#include "CmusPoller.hpp"
#include <QProcess>
#include <QStringList>
#include <charconv>
#include <string>
#include <utility>
#include "core/Logger.hpp"

namespace cal {

namespace {

f64 parseSeconds(std::string_view value) {
    i64 seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(),
                                     value.data() + value.size(),
                                     seconds);
    if (ec != std::errc{} || seconds < 0)
        return 0.0;
    return static_cast<f64>(seconds);
}

// Splits "key rest of line" at the first space
std::pair<std::string_view, std::string_view> splitKey(std::string_view line) {
    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return {line, {}};
    return {line.substr(0, sp), line.substr(sp + 1)};
}

} // namespace

CmusPoller::CmusPoller(const PlayerConfig& config) : config_(config) {
}

std::optional<PlaybackSample> CmusPoller::poll() {
    QProcess proc;
    proc.start(QString::fromStdString(config_.remoteCommand),
               QStringList{QStringLiteral("-Q")});

    std::string failure;
    if (!proc.waitForStarted(static_cast<int>(config_.commandTimeoutMs))) {
        failure = "could not start " + config_.remoteCommand + ": " +
                  proc.errorString().toStdString();
    } else if (!proc.waitForFinished(
                       static_cast<int>(config_.commandTimeoutMs))) {
        proc.kill();
        proc.waitForFinished(100);
        failure = config_.remoteCommand + " timed out";
    } else if (proc.exitStatus() != QProcess::NormalExit ||
               proc.exitCode() != 0) {
        failure = config_.remoteCommand + " exited with code " +
                  std::to_string(proc.exitCode()) + ": " +
                  proc.readAllStandardError().trimmed().toStdString();
    }

    if (!failure.empty()) {
        if (reachable_) {
            LOG_WARN("Player unavailable: {}", failure);
            reachable_ = false;
        } else {
            LOG_DEBUG("Player still unavailable: {}", failure);
        }
        return std::nullopt;
    }

    if (!reachable_) {
        LOG_INFO("Player reachable again");
        reachable_ = true;
    }

    QByteArray out = proc.readAllStandardOutput();
    return parseStatus(std::string_view(out.constData(),
                                        static_cast<usize>(out.size())));
}

PlaybackSample CmusPoller::parseStatus(std::string_view output) {
    PlaybackSample sample;

    while (!output.empty()) {
        auto nl = output.find('\n');
        std::string_view line = output.substr(0, nl);
        output = nl == std::string_view::npos ? std::string_view{}
                                              : output.substr(nl + 1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        auto [key, value] = splitKey(line);
        if (key == "status") {
            if (value == "playing")
                sample.transport = Transport::Playing;
            else if (value == "paused")
                sample.transport = Transport::Paused;
            else
                sample.transport = Transport::Stopped;
        } else if (key == "file") {
            sample.track.filePath = std::string(value);
        } else if (key == "duration") {
            sample.durationSeconds = parseSeconds(value);
        } else if (key == "position") {
            sample.positionSeconds = parseSeconds(value);
        } else if (key == "tag") {
            auto [name, tagValue] = splitKey(value);
            if (tagValue.empty())
                continue;
            if (name == "artist")
                sample.track.artist = std::string(tagValue);
            else if (name == "title")
                sample.track.title = std::string(tagValue);
        }
    }

    if (sample.track.filePath.empty() && !sample.track.hasTags())
        sample.durationSeconds = 0.0;
    return sample;
}

} // namespace cal
