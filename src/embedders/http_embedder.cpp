#include "http_embedder.hpp"
#include <iostream>

namespace engram {

static std::string without_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

HttpEmbedder::HttpEmbedder(Profile profile, HttpClient& http)
    : profile_(std::move(profile)), http_(http) {}

nlohmann::json HttpEmbedder::request_body(const std::string& text) const {
    nlohmann::json body = {{"model", profile_.model}, {"input", text}};
    if (profile_.send_dimensions && profile_.dims > 0) body["dimensions"] = profile_.dims;
    return body;
}

Embedding HttpEmbedder::parse_vector(const std::string& body) const {
    auto j = nlohmann::json::parse(body);
    const auto& values = j.at(nlohmann::json::json_pointer(profile_.vector_path));

    Embedding vec;
    vec.reserve(values.size());
    for (const auto& v : values) vec.push_back(v.get<float>());
    return vec;
}

Embedding HttpEmbedder::embed(const std::string& text) {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!profile_.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + profile_.api_key);
    }

    auto response = http_.post(profile_.url, request_body(text).dump(), headers,
                               profile_.timeout_seconds);
    if (response.status_code != 200) {
        std::cerr << "[embedder] " << profile_.name << " request failed (HTTP "
                  << response.status_code << ")\n";
        return {};
    }

    Embedding vec;
    try {
        vec = parse_vector(response.body);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[embedder] " << profile_.name << " sent an unreadable reply: "
                  << e.what() << "\n";
        return {};
    }

    if (profile_.dims > 0 && vec.size() != profile_.dims) {
        std::cerr << "[embedder] " << profile_.name << " returned " << vec.size()
                  << " values, expected " << profile_.dims << "\n";
        return {};
    }
    return vec;
}

std::unique_ptr<Embedder> create_openai_embedder(const EmbeddingsConfig& config,
                                                 HttpClient& http) {
    HttpEmbedder::Profile p;
    p.name = "openai";
    p.url = without_trailing_slash(config.base_url.empty() ? "https://api.openai.com/v1"
                                                           : config.base_url) +
            "/embeddings";
    p.model = config.model.empty() ? "text-embedding-3-small" : config.model;
    p.api_key = config.api_key;
    p.vector_path = "/data/0/embedding";
    p.dims = config.dimensions;
    p.send_dimensions = true;
    return std::make_unique<HttpEmbedder>(std::move(p), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(const EmbeddingsConfig& config,
                                                 HttpClient& http) {
    HttpEmbedder::Profile p;
    p.name = "ollama";
    p.url = without_trailing_slash(config.base_url.empty() ? "http://localhost:11434"
                                                           : config.base_url) +
            "/api/embed";
    p.model = config.model.empty() ? "nomic-embed-text" : config.model;
    p.vector_path = "/embeddings/0";
    p.dims = config.dimensions;
    return std::make_unique<HttpEmbedder>(std::move(p), http);
}

} // namespace engram
