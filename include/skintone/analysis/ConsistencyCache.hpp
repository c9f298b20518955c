#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace skintone {
namespace analysis {

/**
 * @brief Cached (signature, result) pair
 */
struct CacheEntry {
    FaceSignature signature;
    AnalysisResult result;
};

/**
 * @brief Bounded FIFO of recent analyses keyed by face signature
 *
 * Returns a previously computed result when a new signature is similar
 * enough to a stored one, so that re-analyzing the same face in slightly
 * different conditions gives the same answer.
 *
 * Lookup scans oldest to newest and returns the first entry whose
 * similarity is strictly above the threshold. When full, recording evicts
 * the oldest entry.
 *
 * Thread-safety: all member functions are safe to call concurrently.
 */
class ConsistencyCache {
public:
    explicit ConsistencyCache(const CacheConfig& config = CacheConfig());
    ~ConsistencyCache();

    ConsistencyCache(const ConsistencyCache&) = delete;
    ConsistencyCache& operator=(const ConsistencyCache&) = delete;

    /**
     * @brief Find a cached result for a similar signature
     * @return Copy of the cached result, or nullopt on miss or empty signature
     */
    std::optional<AnalysisResult> lookup(const FaceSignature& signature) const;

    /**
     * @brief Store a result, evicting the oldest entry when full
     *
     * Empty signatures are ignored.
     */
    void record(const FaceSignature& signature, const AnalysisResult& result);

    size_t size() const;
    size_t capacity() const;
    bool empty() const;
    void clear();

    /// Snapshot of the entries, oldest first
    std::vector<CacheEntry> entries() const;

    /**
     * @brief Similarity score in [0, 100]
     *
     * 100 - mean(|a_i - b_i|) * scale, floored at 0. Signatures of different
     * length or empty signatures score 0.
     */
    static float similarity(const FaceSignature& a, const FaceSignature& b, float scale = 0.4f);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace analysis
} // namespace skintone
