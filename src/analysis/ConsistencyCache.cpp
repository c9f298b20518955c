#include "skintone/analysis/ConsistencyCache.hpp"
#include "skintone/core/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <deque>
#include <mutex>

namespace skintone {
namespace analysis {

class ConsistencyCache::Impl {
public:
    std::deque<CacheEntry> entries;
    CacheConfig config;
    mutable std::mutex mutex;

    explicit Impl(const CacheConfig& cfg)
        : config(cfg) {
    }
};

ConsistencyCache::ConsistencyCache(const CacheConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

ConsistencyCache::~ConsistencyCache() = default;

std::optional<AnalysisResult> ConsistencyCache::lookup(const FaceSignature& signature) const {
    if (signature.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (size_t i = 0; i < impl_->entries.size(); ++i) {
        const CacheEntry& entry = impl_->entries[i];
        const float score = similarity(signature, entry.signature, impl_->config.similarity_scale);
        if (score > impl_->config.similarity_threshold) {
            SKINTONE_LOG_DEBUG("ConsistencyCache")
                << "hit on entry " << i << " (similarity " << score << ")";
            return entry.result;
        }
    }
    return std::nullopt;
}

void ConsistencyCache::record(const FaceSignature& signature, const AnalysisResult& result) {
    if (signature.empty() || impl_->config.capacity == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->entries.size() >= impl_->config.capacity) {
        impl_->entries.pop_front();  // Oldest
    }
    impl_->entries.push_back(CacheEntry{signature, result});
}

size_t ConsistencyCache::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

size_t ConsistencyCache::capacity() const {
    return impl_->config.capacity;
}

bool ConsistencyCache::empty() const {
    return size() == 0;
}

void ConsistencyCache::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->entries.clear();
}

std::vector<CacheEntry> ConsistencyCache::entries() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return std::vector<CacheEntry>(impl_->entries.begin(), impl_->entries.end());
}

float ConsistencyCache::similarity(const FaceSignature& a, const FaceSignature& b, float scale) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double total = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        total += std::abs(a[i] - b[i]);
    }
    const double mean_diff = total / static_cast<double>(a.size());
    return static_cast<float>(std::max(0.0, 100.0 - mean_diff * scale));
}

} // namespace analysis
} // namespace skintone
