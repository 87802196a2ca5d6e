#pragma once
#include "../embedder.hpp"
#include <string>

namespace engram {

// Offline embedder: FNV-1a feature hashing of lowercase alphanumeric tokens
// into a fixed number of signed buckets, L2-normalized. Deterministic, so
// identical text always maps to the identical vector.
class HashEmbedder : public Embedder {
public:
    explicit HashEmbedder(uint32_t dims = 384);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dims_; }
    std::string embedder_name() const override { return "local"; }

private:
    uint32_t dims_;
};

} // namespace engram
