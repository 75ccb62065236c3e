#include <gtest/gtest.h>
#include <render_cache/render_cache.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <new>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

// Lets a test fail exactly one allocation on its own thread.
namespace {
thread_local bool g_fail_next_allocation = false;
} // namespace

void* operator new(std::size_t size) {
    if (g_fail_next_allocation) {
        g_fail_next_allocation = false;
        throw std::bad_alloc();
    }
    if (void* p = std::malloc(size == 0 ? 1 : size)) return p;
    throw std::bad_alloc();
}

void operator delete(void* p) noexcept {
    std::free(p);
}

void operator delete(void* p, std::size_t) noexcept {
    std::free(p);
}

using namespace render_cache;

namespace {

graph_model::Fingerprint fp(std::uint8_t tag) {
    graph_model::Fingerprint f;
    f.digest[0] = tag;
    f.digest[31] = static_cast<std::uint8_t>(tag * 7);
    return f;
}

ArtifactPtr artifact(std::size_t size, std::uint8_t fill = 0) {
    auto a = std::make_shared<RenderArtifact>();
    a->bytes.assign(size, fill);
    a->content_type = "image/svg+xml";
    return a;
}

// Spins until `pred` holds or a generous timeout passes.
template <typename Pred>
bool eventually(Pred pred) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > until) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

TEST(RenderCacheTest, MissThenHit) {
    RenderCache cache(1024);
    int calls = 0;
    auto render = [&] { ++calls; return artifact(10); };

    const auto first = cache.get_or_render(fp(1), render);
    const auto second = cache.get_or_render(fp(1), render);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(cache.contains(fp(1)));

    const auto s = cache.stats();
    EXPECT_EQ(s.entries, 1u);
    EXPECT_EQ(s.bytes, 10u);
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.renders, 1u);
}

TEST(RenderCacheTest, ConcurrentCallersShareOneRender) {
    RenderCache cache(1024);
    constexpr int kCallers = 8;
    std::atomic<int> calls{ 0 };
    auto render = [&] {
        ++calls;
        // Hold the flight open until every caller has registered.
        eventually([&] { return cache.stats().misses >= kCallers; });
        return artifact(16);
    };

    std::vector<std::future<ArtifactPtr>> results;
    for (int i = 0; i < kCallers; ++i) {
        results.push_back(std::async(std::launch::async, [&] { return cache.get_or_render(fp(2), render); }));
    }
    std::vector<ArtifactPtr> got;
    for (auto& r : results) got.push_back(r.get());

    EXPECT_EQ(calls.load(), 1);
    for (const auto& a : got) EXPECT_EQ(a, got.front());
    EXPECT_EQ(cache.stats().renders, 1u);
    EXPECT_FALSE(cache.is_pending(fp(2)));
}

TEST(RenderCacheTest, FailureReachesEveryWaiterAndIsNotCached) {
    RenderCache cache(1024);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto failing = [&]() -> ArtifactPtr {
        released.wait();
        throw std::runtime_error("boom");
    };

    auto leader = std::async(std::launch::async, [&] { return cache.get_or_render(fp(3), failing); });
    ASSERT_TRUE(eventually([&] { return cache.is_pending(fp(3)); }));
    auto follower = std::async(std::launch::async, [&] { return cache.get_or_render(fp(3), failing); });
    ASSERT_TRUE(eventually([&] { return cache.stats().misses >= 2; }));
    release.set_value();

    EXPECT_THROW(leader.get(), std::runtime_error);
    EXPECT_THROW(follower.get(), std::runtime_error);
    EXPECT_FALSE(cache.contains(fp(3)));
    EXPECT_FALSE(cache.is_pending(fp(3)));

    // The next request retries.
    const auto ok = cache.get_or_render(fp(3), [] { return artifact(4); });
    EXPECT_EQ(ok->size_bytes(), 4u);
}

TEST(RenderCacheTest, FailedStoreStillReleasesEveryCaller) {
    RenderCache cache(1024);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto render = [&] {
        auto a = artifact(4);
        released.wait();
        // The cache's own bookkeeping allocation is the next one on this thread.
        g_fail_next_allocation = true;
        return a;
    };

    auto leader = std::async(std::launch::async, [&] { return cache.get_or_render(fp(9), render); });
    ASSERT_TRUE(eventually([&] { return cache.is_pending(fp(9)); }));
    auto follower = std::async(std::launch::async, [&] { return cache.get_or_render(fp(9), render); });
    ASSERT_TRUE(eventually([&] { return cache.stats().misses >= 2; }));
    release.set_value();

    ASSERT_EQ(follower.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    const auto from_leader = leader.get();
    const auto from_follower = follower.get();
    ASSERT_TRUE(from_leader);
    EXPECT_EQ(from_leader, from_follower);
    EXPECT_FALSE(cache.contains(fp(9)));
    EXPECT_FALSE(cache.is_pending(fp(9)));
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.stats().bytes, 0u);

    const auto again = cache.get_or_render(fp(9), [] { return artifact(4); });
    EXPECT_EQ(again->size_bytes(), 4u);
    EXPECT_TRUE(cache.contains(fp(9)));
}

TEST(RenderCacheTest, NullArtifactIsAnError) {
    RenderCache cache(1024);
    EXPECT_THROW(cache.get_or_render(fp(4), [] { return ArtifactPtr{}; }), std::runtime_error);
    EXPECT_FALSE(cache.contains(fp(4)));
}

TEST(RenderCacheTest, CancelledWaiterLeavesRenderRunning) {
    RenderCache cache(1024);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto slow = [&] {
        released.wait();
        return artifact(8);
    };

    auto leader = std::async(std::launch::async, [&] { return cache.get_or_render(fp(5), slow); });
    ASSERT_TRUE(eventually([&] { return cache.is_pending(fp(5)); }));

    std::stop_source stop;
    auto waiter = std::async(std::launch::async, [&] { return cache.get_or_render(fp(5), slow, stop.get_token()); });
    ASSERT_TRUE(eventually([&] { return cache.stats().misses >= 2; }));
    stop.request_stop();
    EXPECT_THROW(waiter.get(), WaitCancelledError);
    EXPECT_TRUE(cache.is_pending(fp(5)));

    release.set_value();
    EXPECT_EQ(leader.get()->size_bytes(), 8u);
    EXPECT_TRUE(cache.contains(fp(5)));
}

TEST(RenderCacheTest, EvictsLeastRecentlyUsed) {
    RenderCache cache(10);
    cache.get_or_render(fp(1), [] { return artifact(4); });
    cache.get_or_render(fp(2), [] { return artifact(4); });
    // Touch 1 so 2 becomes the eviction candidate.
    cache.get_or_render(fp(1), [] { return artifact(4); });
    cache.get_or_render(fp(3), [] { return artifact(4); });

    EXPECT_TRUE(cache.contains(fp(1)));
    EXPECT_FALSE(cache.contains(fp(2)));
    EXPECT_TRUE(cache.contains(fp(3)));
    const auto s = cache.stats();
    EXPECT_EQ(s.bytes, 8u);
    EXPECT_EQ(s.evictions, 1u);
    EXPECT_LE(s.bytes, cache.byte_budget());
}

TEST(RenderCacheTest, OversizeArtifactIsReturnedNotRetained) {
    RenderCache cache(10);
    cache.get_or_render(fp(1), [] { return artifact(4); });
    const auto big = cache.get_or_render(fp(2), [] { return artifact(11); });
    EXPECT_EQ(big->size_bytes(), 11u);
    EXPECT_FALSE(cache.contains(fp(2)));
    EXPECT_TRUE(cache.contains(fp(1)));
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST(RenderCacheTest, InvalidateAndClear) {
    RenderCache cache(100);
    cache.get_or_render(fp(1), [] { return artifact(4); });
    cache.get_or_render(fp(2), [] { return artifact(4); });
    EXPECT_TRUE(cache.invalidate(fp(1)));
    EXPECT_FALSE(cache.invalidate(fp(1)));
    EXPECT_FALSE(cache.contains(fp(1)));
    EXPECT_EQ(cache.stats().bytes, 4u);

    cache.clear();
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.stats().bytes, 0u);
}

TEST(RenderCacheTest, InvalidateDoesNotTouchPendingRender) {
    RenderCache cache(100);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto leader = std::async(std::launch::async, [&] {
        return cache.get_or_render(fp(6), [&] { released.wait(); return artifact(3); });
    });
    ASSERT_TRUE(eventually([&] { return cache.is_pending(fp(6)); }));
    EXPECT_FALSE(cache.invalidate(fp(6)));
    release.set_value();
    leader.get();
    EXPECT_TRUE(cache.contains(fp(6)));
}
