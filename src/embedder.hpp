#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace engram {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct Config;    // forward declare

// Turns text into a fixed-length vector. Every embedder in one deployment
// must report the same dimensions().
class Embedder {
public:
    virtual ~Embedder() = default;

    // Empty on failure. Implementations may also throw.
    virtual Embedding embed(const std::string& text) = 0;

    virtual uint32_t dimensions() const = 0;

    // "local", "openai", "ollama"
    virtual std::string embedder_name() const = 0;
};

// Cosine similarity in [-1, 1]. 0.0 when either vector is empty or
// zero-magnitude, or when the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

// Scale to unit length in place. A zero vector is left as is.
void l2_normalize(Embedding& v);

// Embedder for config.embeddings.provider. Returns nullptr for "none",
// for a remote provider without credentials, and for unknown providers.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace engram
