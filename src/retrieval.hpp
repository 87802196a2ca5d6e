#pragma once
#include "config.hpp"
#include "embedder.hpp"
#include "memory.hpp"
#include "memory/sqlite_store.hpp"
#include "memory/vector_store.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace engram {

struct RrfParams {
    double fts_weight = 0.4;
    double vector_weight = 0.6;
    uint32_t k = 60;
};

// Contribution of the item at 0-indexed `rank`: weight / (k + rank + 1).
inline double rrf_contribution(double weight, uint32_t k, size_t rank) {
    return weight / (static_cast<double>(k) + static_cast<double>(rank) + 1.0);
}

using MemoryLookup = std::function<std::optional<Memory>(int64_t)>;

// Reciprocal Rank Fusion of a keyword list and a vector list.
// Items in both lists are tagged Hybrid, otherwise Fts or Vector.
// Vector-only ids are resolved through `lookup` and dropped when missing or
// rejected by `filters`. Weights are clamped to [0, 1]. Sorted by fused score
// (stable), truncated to limit.
std::vector<SearchResult> rrf_merge(const std::vector<SearchResult>& fts,
                                    const std::vector<VectorHit>& vector,
                                    const RrfParams& params, uint32_t limit,
                                    const MemoryLookup& lookup,
                                    const SearchFilters& filters);

// Hybrid retrieval over the record store and the vector index.
class Retrieval {
public:
    static constexpr uint32_t kMaxLimit = 50;

    // embedder may be nullptr (keyword-only). It must outlive this object.
    Retrieval(SqliteStore& store, VectorStore& vectors, Embedder* embedder,
              const RetrievalConfig& config);
    ~Retrieval();

    Retrieval(const Retrieval&) = delete;
    Retrieval& operator=(const Retrieval&) = delete;

    // Never throws for vector-side failures; those degrade to keyword results.
    std::vector<SearchResult> search(const SearchOptions& options);

    // Passthrough accessors (no fusion)
    std::vector<Memory> get_recent(uint32_t limit, const std::vector<MemoryType>& types) const;
    std::vector<Memory> get_by_concepts(const std::vector<std::string>& concepts,
                                        uint32_t limit) const;
    std::vector<Memory> get_by_phase(const std::string& phase, uint32_t limit) const;
    std::vector<Memory> get_by_session(const std::string& session_id) const;

private:
    struct VectorBranch {
        std::vector<VectorHit> hits;
        Embedding query;
    };

    VectorBranch run_vector_branch(const std::string& query, uint32_t k);
    void rerank(std::vector<SearchResult>& results, const Embedding& query) const;
    void park(std::future<VectorBranch> pending);

    SqliteStore& store_;
    VectorStore& vectors_;
    Embedder* embedder_;
    RetrievalConfig config_;

    // Timed-out vector branches still running; joined on destruction.
    std::mutex stragglers_mutex_;
    std::vector<std::future<VectorBranch>> stragglers_;
};

} // namespace engram
