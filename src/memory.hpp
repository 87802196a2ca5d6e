#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace engram {

enum class MemoryType { Observation, Decision, SessionSummary, UserPrompt, Note, Todo };

enum class Visibility { Public, Private };

enum class MatchType { Fts, Vector, Hybrid };

// Pre-persistence record produced by the distiller or a direct save.
struct MemoryInput {
    MemoryType type = MemoryType::Observation;
    std::string title;
    std::string content;
    std::vector<std::string> facts;
    std::vector<std::string> concepts;
    std::vector<std::string> source_files;
    double importance = 0.5;
    Visibility visibility = Visibility::Public;
    std::optional<std::string> phase;
    std::optional<std::string> session_id;
};

// Persisted record. id is assigned by storage and never changes.
struct Memory {
    int64_t id = 0;
    MemoryType type = MemoryType::Observation;
    std::string title;
    std::string content;
    std::vector<std::string> facts;
    std::vector<std::string> concepts;
    std::vector<std::string> source_files;
    double importance = 0.5;            // canonical 0-1 scale
    Visibility visibility = Visibility::Public;
    std::optional<std::string> phase;
    std::optional<std::string> session_id;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    uint64_t accessed_at = 0;
    uint32_t access_count = 0;
};

// Partial update. Unset fields are left untouched.
struct MemoryUpdate {
    std::optional<MemoryType> type;
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::vector<std::string>> facts;
    std::optional<std::vector<std::string>> concepts;
    std::optional<std::vector<std::string>> source_files;
    std::optional<double> importance;
    std::optional<Visibility> visibility;
    std::optional<std::string> phase;

    bool changes_text() const {
        return title || content || facts || concepts;
    }
};

struct SearchResult {
    Memory memory;
    double score = 0.0;
    MatchType match_type = MatchType::Fts;
    std::string highlighted;
};

struct HybridWeight {
    double fts = 0.4;
    double vector = 0.6;
};

struct SearchOptions {
    std::string query;
    uint32_t limit = 10;
    std::vector<MemoryType> types;          // empty = all types
    std::optional<double> min_importance;   // either scale, canonicalized on use
    bool include_private = false;
    std::optional<std::string> phase;
    std::optional<HybridWeight> hybrid_weight;
};

// Row filters shared by FTS search and vector-hit post-filtering.
struct SearchFilters {
    std::vector<MemoryType> types;
    std::optional<double> min_importance;
    bool include_private = false;
    std::optional<std::string> phase;

    bool matches(const Memory& m) const;
};

SearchFilters filters_from_options(const SearchOptions& options);

std::string memory_type_to_string(MemoryType type);
std::optional<MemoryType> memory_type_from_string(const std::string& s);
std::string visibility_to_string(Visibility v);
Visibility visibility_from_string(const std::string& s);
std::string match_type_to_string(MatchType m);

// Clamp importance onto the canonical 0-1 scale. Values above 1 are read as
// the 1-10 human scale. NaN maps to 0.5.
double canonicalize_importance(double importance);

// Text fed to the embedder for a memory: title, content, facts, concepts.
std::string combine_for_embedding(const Memory& memory);

// Abstract in-process memory interface consumed by the context builder and hosts.
class MemoryManager {
public:
    virtual ~MemoryManager() = default;

    // Persist a record. Input is sanitized and truncated, never rejected.
    virtual Memory save(const MemoryInput& input) = 0;

    // Hybrid search; degrades to keyword-only when vectors are unavailable.
    virtual std::vector<SearchResult> search(const SearchOptions& options) = 0;

    // Point lookup. Bumps access statistics.
    virtual std::optional<Memory> get_by_id(int64_t id) = 0;

    // Most recent first.
    virtual std::vector<Memory> get_recent(uint32_t limit,
                                           const std::vector<MemoryType>& types) = 0;

    // Returns std::nullopt when the id does not exist.
    virtual std::optional<Memory> update(int64_t id, const MemoryUpdate& changes) = 0;

    // Returns false when the id does not exist.
    virtual bool remove(int64_t id) = 0;
};

} // namespace engram
