#include "apps/uwb/MotionCache.hpp"

#include <cmath>
#include <mutex>

namespace uwb {

int64_t MotionCache::elapsedSeconds(uint64_t prior_us, uint64_t t_us) {
    // Reordered or skewed clocks clamp to zero
    if (t_us <= prior_us) return 0;
    return static_cast<int64_t>((t_us - prior_us) / 1000000ull);
}

MotionDelta MotionCache::deltaFrom(const MotionCacheEntry& prev, double x, double y, uint64_t t_us) {
    MotionDelta delta{};
    delta.has_prior = true;
    delta.distance  = std::hypot(x - prev.x, y - prev.y);
    delta.elapsed_s = elapsedSeconds(prev.t_us, t_us);
    return delta;
}

MotionDelta MotionCache::update(const std::string& tag_id, double x, double y, uint64_t t_us) {
    MotionDelta delta{};

    std::lock_guard<Rtos::Mutex> guard(m_lock);

    auto it = m_entries.find(tag_id);
    if (it != m_entries.end()) delta = deltaFrom(it->second, x, y, t_us);

    m_entries[tag_id] = MotionCacheEntry{x, y, t_us};
    return delta;
}

// === Batch ===

MotionCache::Batch::Batch(MotionCache& cache)
    : m_cache(cache) {
    m_cache.m_lock.lock();
}

MotionCache::Batch::~Batch() {
    m_cache.m_lock.unlock();
}

MotionDelta MotionCache::Batch::update(const std::string& tag_id, double x, double y, uint64_t t_us) {
    MotionDelta delta{};

    auto staged = m_staged.find(tag_id);
    if (staged != m_staged.end()) {
        delta = deltaFrom(staged->second, x, y, t_us);
    } else {
        auto it = m_cache.m_entries.find(tag_id);
        if (it != m_cache.m_entries.end()) delta = deltaFrom(it->second, x, y, t_us);
    }

    m_staged[tag_id] = MotionCacheEntry{x, y, t_us};
    return delta;
}

void MotionCache::Batch::commit() {
    for (const auto& kv : m_staged) m_cache.m_entries[kv.first] = kv.second;
    m_staged.clear();
}

bool MotionCache::lookup(const std::string& tag_id, MotionCacheEntry& out) const {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    auto it = m_entries.find(tag_id);
    if (it == m_entries.end()) return false;
    out = it->second;
    return true;
}

std::size_t MotionCache::size() const {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    return m_entries.size();
}

void MotionCache::reset() {
    std::lock_guard<Rtos::Mutex> guard(m_lock);
    m_entries.clear();
}

} // namespace uwb
