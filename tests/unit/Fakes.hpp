#pragma once
// Fakes.hpp - In-memory stand-ins for the network, tags, player and UI

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "lyrics/LyricsProvider.hpp"
#include "lyrics/ResolveService.hpp"
#include "lyrics/TagStore.hpp"
#include "net/HttpClient.hpp"
#include "player/PlayerPoller.hpp"
#include "ui/Renderer.hpp"

namespace cal::test {

class FakeHttpClient : public net::HttpClient {
public:
    net::HttpResponse get(const net::HttpRequest& request) override {
        requests.push_back(request);
        if (responses.empty())
            return {404, {}, net::HttpError::None, {}};
        auto resp = responses.front();
        responses.pop_front();
        return resp;
    }

    void reply(int status, std::string body = {}) {
        responses.push_back({status, std::move(body), net::HttpError::None, {}});
    }
    void fail(net::HttpError error, std::string message) {
        responses.push_back({0, {}, error, std::move(message)});
    }

    std::deque<net::HttpResponse> responses;
    std::vector<net::HttpRequest> requests;
};

class FakeTagStore : public lyrics::TagStore {
public:
    Result<lyrics::TagFields> read(const std::string& filePath) override {
        ++reads;
        auto it = files.find(filePath);
        if (it == files.end())
            return Result<lyrics::TagFields>::err("no such file: " + filePath);
        return Result<lyrics::TagFields>::ok(it->second);
    }

    Result<void> write(const std::string& filePath,
                       const lyrics::TagFields& fields) override {
        writes.push_back({filePath, fields});
        if (failWrites)
            return Result<void>::err("read-only file");
        auto& stored = files[filePath];
        if (fields.artist)
            stored.artist = fields.artist;
        if (fields.title)
            stored.title = fields.title;
        if (fields.lyrics)
            stored.lyrics = fields.lyrics;
        return Result<void>::ok();
    }

    struct Write {
        std::string path;
        lyrics::TagFields fields;
    };

    std::map<std::string, lyrics::TagFields> files;
    std::vector<Write> writes;
    int reads{0};
    bool failWrites{false};
};

class FakeProvider : public lyrics::LyricsProvider {
public:
    lyrics::FetchResult fetch(const std::string& artist,
                              const std::string& title) override {
        calls.push_back({artist, title});
        return result;
    }
    lyrics::LyricsSource source() const override {
        return lyrics::LyricsSource::AZLyrics;
    }
    std::string_view name() const override {
        return "fake";
    }

    struct Call {
        std::string artist;
        std::string title;
    };

    lyrics::FetchResult result = lyrics::FetchResult::notFound();
    std::vector<Call> calls;
};

class FakePoller : public PlayerPoller {
public:
    std::optional<PlaybackSample> poll() override {
        ++polls;
        if (samples.empty())
            return next;
        next = samples.front();
        samples.pop_front();
        return next;
    }

    // Returned once, then repeated while the queue is empty
    std::deque<std::optional<PlaybackSample>> samples;
    std::optional<PlaybackSample> next;
    int polls{0};
};

class FakeRenderer : public Renderer {
public:
    Result<void> init() override {
        return Result<void>::ok();
    }
    void shutdown() override {
    }
    void render(const RenderFrame& frame) override {
        frames.push_back(frame);
    }
    std::vector<InputEvent> readInput() override {
        auto out = std::move(pending);
        pending.clear();
        return out;
    }
    bool interactive() const override {
        return false;
    }

    const RenderFrame& last() const {
        return frames.back();
    }

    std::vector<RenderFrame> frames;
    std::vector<InputEvent> pending;
};

// Records requests; the test decides when and what to answer
class FakeResolveService : public lyrics::ResolveService {
public:
    void request(const TrackIdentity& identity, bool refresh) override {
        requests.push_back({identity, refresh});
    }

    void answer(const TrackIdentity& identity, const lyrics::LyricsDocument& doc) {
        resolved.emitSignal(identity, doc);
    }

    struct Request {
        TrackIdentity identity;
        bool refresh;
    };

    std::vector<Request> requests;
};

inline TrackIdentity track(std::string artist,
                           std::string title,
                           std::string path) {
    TrackIdentity id;
    id.artist = std::move(artist);
    id.title = std::move(title);
    id.filePath = std::move(path);
    return id;
}

inline PlaybackSample playing(TrackIdentity id, f64 position, f64 duration) {
    PlaybackSample s;
    s.track = std::move(id);
    s.positionSeconds = position;
    s.durationSeconds = duration;
    s.transport = Transport::Playing;
    return s;
}

inline lyrics::LyricsDocument foundDoc(std::vector<std::string> lines) {
    lyrics::LyricsDocument doc;
    doc.lines = std::move(lines);
    doc.source = lyrics::LyricsSource::AZLyrics;
    doc.status = lyrics::LyricsStatus::Found;
    return doc;
}

inline std::vector<std::string> numberedLines(int n) {
    std::vector<std::string> lines;
    for (int i = 0; i < n; ++i)
        lines.push_back("line " + std::to_string(i));
    return lines;
}

} // namespace cal::test
