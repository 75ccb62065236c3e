#include <render_cache/render_cache.hpp>
#include <clipper_log/log.hpp>
#include <exception>
#include <string>

namespace render_cache {

RenderCache::RenderCache(std::size_t byte_budget)
    : byte_budget_(byte_budget)
{
}

ArtifactPtr RenderCache::get_or_render(const graph_model::Fingerprint& fingerprint,
    const RenderFn& render,
    std::stop_token stop)
{
    std::shared_ptr<Flight> flight;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = ready_.find(fingerprint); it != ready_.end()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iter);
            ++hits_;
            clipper_log::logger()->debug("cache_hit fp={}", fingerprint.hex());
            return it->second.artifact;
        }
        ++misses_;
        if (auto it = pending_.find(fingerprint); it != pending_.end()) {
            flight = it->second;
        } else {
            flight = std::make_shared<Flight>();
            pending_.emplace(fingerprint, flight);
            leader = true;
            ++renders_;
        }
    }

    clipper_log::logger()->debug("cache_miss fp={} wait={}", fingerprint.hex(), !leader);
    if (!leader) {
        return wait_for(*flight, fingerprint, stop);
    }

    ArtifactPtr artifact;
    std::exception_ptr error;
    try {
        artifact = render();
        if (!artifact) {
            throw std::runtime_error("render produced no artifact");
        }
    } catch (...) {
        // Handed to every caller of this flight below.
        error = std::current_exception();
    }

    std::string store_failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(fingerprint);
        if (!error) {
            // The artifact is still handed out below; it just isn't retained.
            try {
                store_locked(fingerprint, artifact);
            } catch (const std::exception& e) {
                store_failure = e.what();
            }
        }
    }
    if (!store_failure.empty()) {
        clipper_log::logger()->warn("cache_store_failed fp={} error={}", fingerprint.hex(), store_failure);
    }
    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        flight->done = true;
        flight->artifact = artifact;
        flight->error = error;
    }
    flight->cv.notify_all();

    if (error) std::rethrow_exception(error);
    return artifact;
}

ArtifactPtr RenderCache::wait_for(Flight& flight, const graph_model::Fingerprint& fingerprint, std::stop_token stop) {
    std::unique_lock<std::mutex> lock(flight.mutex);
    if (!flight.cv.wait(lock, stop, [&flight] { return flight.done; })) {
        clipper_log::logger()->debug("cache_wait_cancelled fp={}", fingerprint.hex());
        throw WaitCancelledError("wait for in-flight render cancelled: " + fingerprint.hex());
    }
    if (flight.error) std::rethrow_exception(flight.error);
    return flight.artifact;
}

void RenderCache::store_locked(const graph_model::Fingerprint& fingerprint, const ArtifactPtr& artifact) {
    const std::size_t size = artifact->size_bytes();
    if (size > byte_budget_) {
        clipper_log::logger()->info("cache_skip_oversize fp={} bytes={} budget={}",
            fingerprint.hex(), size, byte_budget_);
        return;
    }
    if (auto it = ready_.find(fingerprint); it != ready_.end()) {
        erase_locked(it);
    }

    lru_list_.push_front(fingerprint);
    try {
        ready_.emplace(fingerprint, Entry{ artifact, lru_list_.begin() });
    } catch (...) {
        lru_list_.pop_front();
        throw;
    }
    bytes_ += size;

    while (bytes_ > byte_budget_ && !lru_list_.empty()) {
        auto victim = ready_.find(lru_list_.back());
        clipper_log::logger()->debug("cache_evict fp={} bytes={}",
            victim->first.hex(), victim->second.artifact->size_bytes());
        erase_locked(victim);
        ++evictions_;
    }
}

void RenderCache::erase_locked(
    std::unordered_map<graph_model::Fingerprint, Entry, graph_model::FingerprintHash>::iterator it)
{
    bytes_ -= it->second.artifact->size_bytes();
    lru_list_.erase(it->second.lru_iter);
    ready_.erase(it);
}

bool RenderCache::invalidate(const graph_model::Fingerprint& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ready_.find(fingerprint);
    if (it == ready_.end()) return false;
    erase_locked(it);
    return true;
}

bool RenderCache::contains(const graph_model::Fingerprint& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.count(fingerprint) != 0;
}

bool RenderCache::is_pending(const graph_model::Fingerprint& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(fingerprint) != 0;
}

CacheStats RenderCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.entries = ready_.size();
    s.bytes = bytes_;
    s.hits = hits_;
    s.misses = misses_;
    s.renders = renders_;
    s.evictions = evictions_;
    return s;
}

void RenderCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.clear();
    lru_list_.clear();
    bytes_ = 0;
}

} // namespace render_cache
