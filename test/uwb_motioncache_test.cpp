// test/uwb_motioncache_test.cpp
//
// MotionCache: first-fix null delta, displacement/elapsed arithmetic,
// overwrite semantics and atomicity of update() under concurrent tasks.

#include <atomic>
#include <cmath>
#include <iostream>
#include <string>

#include "os/rtos.hpp"
#include "apps/uwb/MotionCache.hpp"

static int g_failures = 0;

static void check(bool cond, const std::string& what) {
    if (cond) {
        std::cout << "[TEST] PASS " << what << "\n";
    } else {
        std::cerr << "[TEST] FAIL " << what << "\n";
        ++g_failures;
    }
}

static void testSequence() {
    uwb::MotionCache cache;

    uwb::MotionDelta d = cache.update("7", 0.0, 0.0, 1000000);
    check(!d.has_prior, "first fix has no prior");
    check(cache.size() == 1, "first fix cached");

    d = cache.update("7", 3.0, 4.0, 3700000);
    check(d.has_prior && std::fabs(d.distance - 5.0) < 1e-12, "3-4-5 displacement");
    check(d.elapsed_s == 2, "2.7 s gap floors to 2");

    uwb::MotionCacheEntry e{};
    check(cache.lookup("7", e) && e.x == 3.0 && e.y == 4.0 && e.t_us == 3700000,
          "entry overwritten with the latest fix");

    // Out-of-order timestamp: elapsed clamps to 0, entry still overwritten
    d = cache.update("7", 3.0, 4.0, 1000000);
    check(d.has_prior && d.distance == 0.0 && d.elapsed_s == 0, "negative gap clamps to 0");
    check(cache.lookup("7", e) && e.t_us == 1000000, "last write wins");

    d = cache.update("8", 1.0, 1.0, 0);
    check(!d.has_prior, "tags are independent");
    check(cache.size() == 2, "two tags cached");

    check(!cache.lookup("9", e), "unknown tag not found");

    cache.reset();
    check(cache.size() == 0, "reset empties the cache");
    d = cache.update("7", 10.0, 10.0, 5000000);
    check(!d.has_prior, "after reset the next fix has no prior");
}

static void testElapsedSeconds() {
    check(uwb::MotionCache::elapsedSeconds(0, 0) == 0, "equal timestamps");
    check(uwb::MotionCache::elapsedSeconds(0, 999999) == 0, "under one second");
    check(uwb::MotionCache::elapsedSeconds(0, 1000000) == 1, "exactly one second");
    check(uwb::MotionCache::elapsedSeconds(5000000, 10000000) == 5, "five seconds");
    check(uwb::MotionCache::elapsedSeconds(10000000, 5000000) == 0, "backwards clamps");
}

static void testBatchStaging() {
    uwb::MotionCache cache;
    (void)cache.update("5", 0.0, 0.0, 0);

    {
        uwb::MotionCache::Batch batch(cache);
        uwb::MotionDelta d = batch.update("5", 3.0, 4.0, 2000000);
        check(d.has_prior && std::fabs(d.distance - 5.0) < 1e-12 && d.elapsed_s == 2,
              "batch delta against the cached fix");
        d = batch.update("5", 6.0, 8.0, 3000000);
        check(d.has_prior && std::fabs(d.distance - 5.0) < 1e-12 && d.elapsed_s == 1,
              "second fix chains on the staged one");
        d = batch.update("6", 1.0, 1.0, 0);
        check(!d.has_prior, "new tag in a batch has no prior");
        check(batch.pending() == 2, "two tags staged");
        // dropped without commit
    }

    uwb::MotionCacheEntry e{};
    check(cache.lookup("5", e) && e.x == 0.0 && e.y == 0.0 && e.t_us == 0,
          "uncommitted fixes never reach the cache");
    check(!cache.lookup("6", e) && cache.size() == 1, "uncommitted tag not cached");

    {
        uwb::MotionCache::Batch batch(cache);
        (void)batch.update("5", 3.0, 4.0, 2000000);
        (void)batch.update("5", 6.0, 8.0, 3000000);
        (void)batch.update("6", 1.0, 1.0, 0);
        batch.commit();
        check(batch.pending() == 0, "commit clears the stage");
    }

    check(cache.lookup("5", e) && e.x == 6.0 && e.y == 8.0 && e.t_us == 3000000,
          "commit publishes the last fix per tag");
    check(cache.lookup("6", e) && cache.size() == 2, "committed tag cached");

    const uwb::MotionDelta d = cache.update("5", 6.0, 8.0, 4000000);
    check(d.has_prior && d.distance == 0.0 && d.elapsed_s == 1, "cache usable after a batch");
}

// ---- Concurrency ----
static constexpr int WORKERS = 8;
static constexpr int UPDATES_PER_WORKER = 500;

struct WorkerCtx {
    uwb::MotionCache* cache = nullptr;
    int worker = 0;
    std::atomic<int>* first_fixes = nullptr;
};

static void Worker(void* arg) {
    auto* ctx = static_cast<WorkerCtx*>(arg);
    for (int i = 0; i < UPDATES_PER_WORKER; ++i) {
        const uint64_t t = static_cast<uint64_t>(ctx->worker) * 1000000ull + static_cast<uint64_t>(i);
        const uwb::MotionDelta d = ctx->cache->update("42", double(ctx->worker), double(i), t);
        if (!d.has_prior) ctx->first_fixes->fetch_add(1);
    }
}

static void testConcurrentUpdates() {
    uwb::MotionCache cache;
    std::atomic<int> first_fixes{0};

    WorkerCtx ctx[WORKERS];
    Rtos::Task tasks[WORKERS];
    bool created = true;
    for (int w = 0; w < WORKERS; ++w) {
        ctx[w].cache = &cache;
        ctx[w].worker = w;
        ctx[w].first_fixes = &first_fixes;
        created = tasks[w].Create("MotionWorker", Worker, &ctx[w]) && created;
    }
    for (int w = 0; w < WORKERS; ++w) tasks[w].Join();

    check(created, "worker tasks created");
    check(first_fixes.load() == 1, "exactly one update saw no prior");
    check(cache.size() == 1, "one entry for the shared tag");
}

int main() {
    std::cout << "=== MOTION CACHE TEST ===\n";

    testSequence();
    testElapsedSeconds();
    testBatchStaging();
    testConcurrentUpdates();

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] all checks passed\n";
    return 0;
}
