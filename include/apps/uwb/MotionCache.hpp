#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <unordered_map>

#include "os/rtos.hpp"

namespace uwb {

// Last resolved fix of one tag.
struct MotionCacheEntry {
    double x = 0.0;
    double y = 0.0;
    uint64_t t_us = 0;
};

// Displacement since the previous fix of the same tag.
// has_prior == false on the first fix: distance/elapsed_s are then null.
struct MotionDelta {
    bool     has_prior = false;
    double   distance = 0.0;      // Euclidean, same unit as x/y
    int64_t  elapsed_s = 0;       // whole seconds, never negative
};

// ---------------------------------------------------------------------------
//  MotionCache
// ---------------------------------------------------------------------------
// Process-lifetime odometry per tag. Never persisted: a restart (or reset())
// starts every tag over with a null delta.
//
// update() is one critical section: concurrent fixes of the same tag cannot
// both read the same prior and lose an update.
class MotionCache {
public:
    // Fixes of one storage transaction. Holds the cache lock for its lifetime;
    // deltas chain on fixes staged earlier in the same batch, and nothing reaches
    // the cache unless commit() is called.
    class Batch {
    public:
        explicit Batch(MotionCache& cache);
        ~Batch();

        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;

        MotionDelta update(const std::string& tag_id, double x, double y, uint64_t t_us);

        // Publish the staged fixes (last fix per tag wins).
        void commit();

        std::size_t pending() const { return m_staged.size(); }

    private:
        MotionCache& m_cache;
        std::unordered_map<std::string, MotionCacheEntry> m_staged;
    };

    MotionCache() = default;

    MotionCache(const MotionCache&) = delete;
    MotionCache& operator=(const MotionCache&) = delete;

    // Compute the delta against the stored fix, then overwrite it (last write wins).
    MotionDelta update(const std::string& tag_id, double x, double y, uint64_t t_us);

    bool lookup(const std::string& tag_id, MotionCacheEntry& out) const;
    std::size_t size() const;
    void reset();

    // elapsed = max(0, floor((t_us - prior_us) / 1e6))
    static int64_t elapsedSeconds(uint64_t prior_us, uint64_t t_us);

private:
    static MotionDelta deltaFrom(const MotionCacheEntry& prev, double x, double y, uint64_t t_us);

    mutable Rtos::Mutex m_lock;
    std::unordered_map<std::string, MotionCacheEntry> m_entries;
};

} // namespace uwb
