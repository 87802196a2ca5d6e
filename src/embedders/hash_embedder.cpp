#include "hash_embedder.hpp"
#include <cctype>

namespace engram {

static constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
static constexpr uint64_t kFnvPrime = 1099511628211ULL;

static std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char ch : text) {
        if (std::isalnum(ch)) {
            current.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

static uint64_t hash_token(const std::string& token) {
    uint64_t hash = kFnvOffset;
    for (unsigned char ch : token) {
        hash ^= static_cast<uint64_t>(ch);
        hash *= kFnvPrime;
    }
    return hash;
}

HashEmbedder::HashEmbedder(uint32_t dims) : dims_(dims == 0 ? 384 : dims) {}

Embedding HashEmbedder::embed(const std::string& text) {
    Embedding embedding(dims_, 0.0f);

    for (const auto& token : tokenize(text)) {
        uint64_t hash = hash_token(token);
        auto index = static_cast<size_t>(hash % dims_);
        float sign = (hash >> 63U) != 0U ? -1.0f : 1.0f;
        embedding[index] += sign;
    }

    l2_normalize(embedding);
    return embedding;
}

} // namespace engram
