#include "ResolveService.hpp"
#include "core/Logger.hpp"
#include "lyrics/LyricsResolver.hpp"
#include "lyrics/TagLibTagStore.hpp"

namespace cal::lyrics {

ResolveBackend makeDefaultBackend(const LyricsConfig& config) {
    ResolveBackend backend;
    backend.http = std::make_unique<net::QtHttpClient>();
    backend.tags = std::make_unique<TagLibTagStore>();
    backend.provider = makeProvider(config, *backend.http);
    return backend;
}

ThreadedResolveService::ThreadedResolveService(const LyricsConfig& config,
                                               BackendFactory factory,
                                               QObject* parent)
    : QObject(parent), config_(config), factory_(std::move(factory)) {
    thread_ = std::jthread([this](std::stop_token st) { threadLoop(st); });
}

ThreadedResolveService::~ThreadedResolveService() {
    thread_.request_stop();
    wake_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

void ThreadedResolveService::request(const TrackIdentity& identity,
                                     bool refresh) {
    {
        std::lock_guard lock(mutex_);
        if (pending_) {
            LOG_DEBUG("ResolveService: Superseding request for {}",
                      pending_->identity.describe());
            refresh = refresh || pending_->refresh;
        }
        pending_ = Job{identity, refresh};
    }
    wake_.notify_one();
}

void ThreadedResolveService::threadLoop(std::stop_token stopToken) {
    LOG_DEBUG("Resolve thread started");

    // Built here so the network manager belongs to this thread
    ResolveBackend backend = factory_(config_);
    if (!backend.tags) {
        LOG_ERROR("ResolveService: Backend has no tag store, worker idle");
        return;
    }
    LyricsResolver resolver(config_, *backend.tags, backend.provider.get());

    while (!stopToken.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            if (!wake_.wait(lock, stopToken, [this] {
                    return pending_.has_value();
                })) {
                break;
            }
            job = std::move(*pending_);
            pending_.reset();
        }

        if (job.refresh)
            resolver.invalidate();

        auto resolution = resolver.resolveDeferred(job.identity);

        QMetaObject::invokeMethod(
                this,
                [this, identity = job.identity, doc = resolution.document] {
                    resolved.emitSignal(identity, doc);
                },
                Qt::QueuedConnection);

        if (resolution.writeBack) {
            // Outcome is logged by the resolver; the display is unaffected
            (void)resolver.commitWriteBack(job.identity, *resolution.writeBack);
        }
    }

    LOG_DEBUG("Resolve thread stopped");
}

} // namespace cal::lyrics
