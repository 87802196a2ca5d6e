#pragma once
#include "../config.hpp"
#include "../embedder.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace engram {

// Embedder backed by a remote JSON API. One instance talks to one endpoint;
// the profile decides the URL, auth, request shape and where the vector sits
// in the response.
class HttpEmbedder : public Embedder {
public:
    struct Profile {
        std::string name;              // "openai", "ollama"
        std::string url;               // full endpoint URL
        std::string model;
        std::string api_key;           // empty = no Authorization header
        std::string vector_path;       // JSON pointer to the float array
        uint32_t dims = 0;
        bool send_dimensions = false;  // ask the provider for `dims` outputs
        long timeout_seconds = 30;
    };

    HttpEmbedder(Profile profile, HttpClient& http);

    // Empty on transport errors, non-200 replies, malformed bodies, and
    // vectors whose length differs from the profile's dimension.
    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return profile_.dims; }
    std::string embedder_name() const override { return profile_.name; }

    const Profile& profile() const { return profile_; }

private:
    nlohmann::json request_body(const std::string& text) const;
    Embedding parse_vector(const std::string& body) const;

    Profile profile_;
    HttpClient& http_;
};

// OpenAI-compatible /embeddings. Defaults: api.openai.com, text-embedding-3-small.
std::unique_ptr<Embedder> create_openai_embedder(const EmbeddingsConfig& config,
                                                 HttpClient& http);

// Ollama /api/embed. Defaults: localhost:11434, nomic-embed-text.
std::unique_ptr<Embedder> create_ollama_embedder(const EmbeddingsConfig& config,
                                                 HttpClient& http);

} // namespace engram
