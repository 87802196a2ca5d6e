#include "embedder.hpp"
#include "embedders/hash_embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <cmath>
#include <iostream>

namespace engram {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double aa = 0.0;
    double bb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot += x * y;
        aa += x * x;
        bb += y * y;
    }

    double denom = std::sqrt(aa) * std::sqrt(bb);
    if (denom < 1e-12) return 0.0;
    return dot / denom;
}

void l2_normalize(Embedding& v) {
    double sum_sq = 0.0;
    for (float x : v) sum_sq += static_cast<double>(x) * static_cast<double>(x);
    if (sum_sq <= 0.0) return;

    double inv = 1.0 / std::sqrt(sum_sq);
    for (auto& x : v) x = static_cast<float>(x * inv);
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;

    if (emb.provider.empty() || emb.provider == "none") return nullptr;
    if (emb.provider == "local") return std::make_unique<HashEmbedder>(emb.dimensions);

    if (emb.provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] openai selected but no API key is set; "
                         "search will be keyword-only\n";
            return nullptr;
        }
        return create_openai_embedder(emb, http);
    }
    if (emb.provider == "ollama") return create_ollama_embedder(emb, http);

    std::cerr << "[embedder] Unknown embedding provider '" << emb.provider << "'\n";
    return nullptr;
}

} // namespace engram
