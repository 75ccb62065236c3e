#pragma once

#include <render_cache/artifact.hpp>
#include <graph_model/fingerprint.hpp>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace render_cache {

// A caller waiting on another caller's render stopped waiting.
class WaitCancelledError : public std::runtime_error {
public:
    explicit WaitCancelledError(const std::string& what) : std::runtime_error(what) {}
};

struct CacheStats {
    std::size_t entries = 0;
    std::size_t bytes = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t renders = 0;
    std::uint64_t evictions = 0;
};

// Fingerprint-keyed artifact cache with single-flight rendering and a byte budget.
//
// At most one render per fingerprint runs at a time; concurrent callers for the
// same fingerprint wait for it and share its artifact or its exception. The lock
// only guards bookkeeping: the render function always runs without it. Ready
// entries are evicted least-recently-used first once the total artifact size
// exceeds the budget; artifacts larger than the whole budget are returned but
// not retained.
class RenderCache {
public:
    using RenderFn = std::function<ArtifactPtr()>;

    explicit RenderCache(std::size_t byte_budget);

    RenderCache(const RenderCache&) = delete;
    RenderCache& operator=(const RenderCache&) = delete;

    // Returns the cached artifact, or runs `render` (first caller) / waits for the
    // in-flight render (others). Rethrows the render's exception to every caller of
    // that flight; nothing is cached on failure. A waiter whose `stop` is triggered
    // gets WaitCancelledError while the render carries on.
    ArtifactPtr get_or_render(const graph_model::Fingerprint& fingerprint,
        const RenderFn& render,
        std::stop_token stop = {});

    // Drops a Ready entry. Pending renders are unaffected. Returns true if dropped.
    bool invalidate(const graph_model::Fingerprint& fingerprint);

    bool contains(const graph_model::Fingerprint& fingerprint) const;
    bool is_pending(const graph_model::Fingerprint& fingerprint) const;

    CacheStats stats() const;
    // Drops every Ready entry.
    void clear();

    std::size_t byte_budget() const { return byte_budget_; }

private:
    struct Flight {
        std::mutex mutex;
        std::condition_variable_any cv;
        bool done = false;
        ArtifactPtr artifact;
        std::exception_ptr error;
    };

    using LruList = std::list<graph_model::Fingerprint>;

    struct Entry {
        ArtifactPtr artifact;
        LruList::iterator lru_iter;
    };

    ArtifactPtr wait_for(Flight& flight, const graph_model::Fingerprint& fingerprint, std::stop_token stop);
    void store_locked(const graph_model::Fingerprint& fingerprint, const ArtifactPtr& artifact);
    void erase_locked(std::unordered_map<graph_model::Fingerprint, Entry, graph_model::FingerprintHash>::iterator it);

    const std::size_t byte_budget_;

    mutable std::mutex mutex_;
    // Front = most recently used.
    LruList lru_list_;
    std::unordered_map<graph_model::Fingerprint, Entry, graph_model::FingerprintHash> ready_;
    std::unordered_map<graph_model::Fingerprint, std::shared_ptr<Flight>, graph_model::FingerprintHash> pending_;
    std::size_t bytes_ = 0;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
    std::uint64_t renders_ = 0;
    std::uint64_t evictions_ = 0;
};

} // namespace render_cache
