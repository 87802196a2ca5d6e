#include "retrieval.hpp"
#include "util.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

namespace engram {

// Negative or NaN weights would let a better rank lower the fused score.
static double fusion_weight(double w) {
    if (!(w > 0.0)) return 0.0;
    return std::min(w, 1.0);
}

std::vector<SearchResult> rrf_merge(const std::vector<SearchResult>& fts,
                                    const std::vector<VectorHit>& vector,
                                    const RrfParams& params, uint32_t limit,
                                    const MemoryLookup& lookup,
                                    const SearchFilters& filters) {
    struct Candidate {
        std::optional<SearchResult> result;  // set for keyword hits
        int64_t id = 0;
        double score = 0.0;
        bool in_fts = false;
        bool in_vector = false;
    };

    std::vector<Candidate> candidates;
    std::unordered_map<int64_t, size_t> index;

    for (size_t i = 0; i < fts.size(); ++i) {
        int64_t id = fts[i].memory.id;
        auto [it, inserted] = index.emplace(id, candidates.size());
        if (inserted) {
            Candidate c;
            c.id = id;
            c.result = fts[i];
            candidates.push_back(std::move(c));
        }
        auto& c = candidates[it->second];
        if (c.in_fts) continue;  // duplicate id in one list counts once
        c.in_fts = true;
        c.score += rrf_contribution(fusion_weight(params.fts_weight), params.k, i);
    }

    for (size_t i = 0; i < vector.size(); ++i) {
        int64_t id = vector[i].memory_id;
        auto [it, inserted] = index.emplace(id, candidates.size());
        if (inserted) {
            Candidate c;
            c.id = id;
            candidates.push_back(std::move(c));
        }
        auto& c = candidates[it->second];
        if (c.in_vector) continue;
        c.in_vector = true;
        c.score += rrf_contribution(fusion_weight(params.vector_weight), params.k, i);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    std::vector<SearchResult> merged;
    for (auto& c : candidates) {
        if (merged.size() >= limit) break;

        SearchResult r;
        if (c.result) {
            r = std::move(*c.result);
        } else {
            // Vector-only: the index stores ids, the record lives in primary storage
            auto memory = lookup ? lookup(c.id) : std::nullopt;
            if (!memory || !filters.matches(*memory)) continue;
            r.memory = std::move(*memory);
        }
        r.score = c.score;
        if (c.in_fts && c.in_vector) {
            r.match_type = MatchType::Hybrid;
        } else if (c.in_vector) {
            r.match_type = MatchType::Vector;
        } else {
            r.match_type = MatchType::Fts;
        }
        merged.push_back(std::move(r));
    }
    return merged;
}

Retrieval::Retrieval(SqliteStore& store, VectorStore& vectors, Embedder* embedder,
                     const RetrievalConfig& config)
    : store_(store)
    , vectors_(vectors)
    , embedder_(embedder)
    , config_(config)
{}

Retrieval::~Retrieval() {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    for (auto& f : stragglers_) {
        if (f.valid()) f.wait();
    }
}

void Retrieval::park(std::future<VectorBranch> pending) {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    // Drop branches that have since finished
    stragglers_.erase(
        std::remove_if(stragglers_.begin(), stragglers_.end(),
                       [](std::future<VectorBranch>& f) {
                           return !f.valid() || f.wait_for(std::chrono::seconds(0)) ==
                                                    std::future_status::ready;
                       }),
        stragglers_.end());
    stragglers_.push_back(std::move(pending));
}

Retrieval::VectorBranch Retrieval::run_vector_branch(const std::string& query, uint32_t k) {
    VectorBranch branch;
    branch.query = embedder_->embed(query);
    if (branch.query.empty()) {
        throw std::runtime_error("embedder returned no vector");
    }
    branch.hits = vectors_.search_similar(branch.query, k);
    return branch;
}

void Retrieval::rerank(std::vector<SearchResult>& results, const Embedding& query) const {
    for (auto& r : results) {
        double cosine = 0.0;
        if (auto emb = vectors_.get_embedding(r.memory.id)) {
            cosine = cosine_similarity(query, *emb);
        }
        r.score = 0.7 * r.score + 0.3 * cosine;
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.score > b.score;
                     });
}

std::vector<SearchResult> Retrieval::search(const SearchOptions& options) {
    if (trim(options.query).empty()) return {};

    uint32_t limit = std::clamp<uint32_t>(options.limit, 1, kMaxLimit);
    uint32_t fetch = limit * 2;
    SearchFilters filters = filters_from_options(options);

    RrfParams params;
    params.k = config_.rrf_k;
    params.fts_weight = options.hybrid_weight ? options.hybrid_weight->fts : config_.fts_weight;
    params.vector_weight = options.hybrid_weight ? options.hybrid_weight->vector
                                                 : config_.vector_weight;
    if (fusion_weight(params.fts_weight) != params.fts_weight ||
        fusion_weight(params.vector_weight) != params.vector_weight) {
        std::cerr << "[retrieval] Hybrid weights (" << params.fts_weight << ", "
                  << params.vector_weight << ") clamped to [0, 1]\n";
    }

    // Fan out: vector branch on a worker, keyword search on this thread
    std::future<VectorBranch> pending;
    if (embedder_ && vectors_.available()) {
        try {
            pending = std::async(std::launch::async, [this, query = options.query, fetch]() {
                return run_vector_branch(query, fetch);
            });
        } catch (const std::system_error& e) {
            std::cerr << "[retrieval] Could not start vector search: " << e.what() << "\n";
        }
    }

    auto fts = store_.search_fts(options.query, fetch, filters);

    // Fan in: bounded wait on the vector branch
    std::optional<VectorBranch> branch;
    if (pending.valid()) {
        auto timeout = std::chrono::milliseconds(config_.vector_timeout_ms);
        if (pending.wait_for(timeout) == std::future_status::ready) {
            try {
                branch = pending.get();
            } catch (const std::exception& e) {
                std::cerr << "[retrieval] Vector search failed, using keyword results: "
                          << e.what() << "\n";
            }
        } else {
            std::cerr << "[retrieval] Vector search timed out after "
                      << config_.vector_timeout_ms << "ms, using keyword results\n";
            park(std::move(pending));
        }
    }

    static const std::vector<VectorHit> kNoHits;
    auto lookup = [this](int64_t id) { return store_.fetch(id); };
    auto results = rrf_merge(fts, branch ? branch->hits : kNoHits, params, limit,
                             lookup, filters);

    if (config_.reranking && branch) {
        rerank(results, branch->query);
    }

    std::vector<int64_t> ids;
    ids.reserve(results.size());
    for (const auto& r : results) ids.push_back(r.memory.id);
    store_.touch(ids);

    return results;
}

std::vector<Memory> Retrieval::get_recent(uint32_t limit,
                                          const std::vector<MemoryType>& types) const {
    return store_.get_recent(limit, types);
}

std::vector<Memory> Retrieval::get_by_concepts(const std::vector<std::string>& concepts,
                                               uint32_t limit) const {
    return store_.get_by_concepts(concepts, limit);
}

std::vector<Memory> Retrieval::get_by_phase(const std::string& phase, uint32_t limit) const {
    return store_.get_by_phase(phase, limit);
}

std::vector<Memory> Retrieval::get_by_session(const std::string& session_id) const {
    return store_.get_by_session(session_id);
}

} // namespace engram
