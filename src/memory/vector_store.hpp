#pragma once
#include "../embedder.hpp"
#include "database.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace engram {

// Vector whose length differs from the deployment-wide dimension.
class DimensionMismatchError : public std::invalid_argument {
public:
    DimensionMismatchError(uint32_t expected, size_t actual);

    uint32_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    uint32_t expected_;
    size_t actual_;
};

// Raw float32 bytes, host byte order, as kept in memory_vectors.embedding.
std::string encode_embedding(const Embedding& v);

// Empty when `bytes` is zero or not a whole number of floats.
Embedding decode_embedding(const void* data, size_t bytes);

// 1 - cosine similarity, in [0, 2]. Zero-magnitude input gives 1.
double cosine_distance(const Embedding& a, const Embedding& b);

struct VectorHit {
    int64_t memory_id = 0;
    double distance = 0.0;   // cosine distance, lower is closer
};

// Embedding index keyed by memory id, stored beside the memories table.
// Availability is detected at construction; when unavailable every
// operation is a no-op that reports nothing stored.
class VectorStore {
public:
    // dimensions == 0 disables the store.
    VectorStore(Database& db, uint32_t dimensions);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    bool available() const { return available_; }
    uint32_t dimensions() const { return dimensions_; }

    // Upsert (delete-then-insert). Throws DimensionMismatchError.
    void store_embedding(int64_t memory_id, const Embedding& embedding);

    // Store several embeddings in one transaction. Throws DimensionMismatchError
    // before writing anything when any vector has the wrong length.
    void store_batch(const std::vector<std::pair<int64_t, Embedding>>& items);

    // k nearest by cosine distance, ascending (ties by id).
    // Throws DimensionMismatchError.
    std::vector<VectorHit> search_similar(const Embedding& query, uint32_t k) const;

    std::optional<Embedding> get_embedding(int64_t memory_id) const;
    bool remove(int64_t memory_id);
    bool has_embedding(int64_t memory_id) const;
    uint32_t count() const;

    // Drop vectors whose memory no longer exists. Returns rows removed.
    uint32_t clean_orphans();

    // Memory ids without a stored vector, oldest first.
    std::vector<int64_t> find_missing(uint32_t limit) const;

private:
    void check_dimensions(size_t actual) const;

    Database& db_;
    uint32_t dimensions_;
    bool available_ = false;
};

} // namespace engram
