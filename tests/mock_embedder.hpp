#pragma once
#include "embedder.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

namespace engram {

// Deterministic embedder: keywords map to directions, so "cat" and
// "kitten" land close together while "dog" points elsewhere.
class SemanticMockEmbedder : public Embedder {
public:
    Embedding embed(const std::string& text) override {
        embed_count++;
        Embedding emb(4, 0.0f);

        if (text.find("cat") != std::string::npos ||
            text.find("kitten") != std::string::npos ||
            text.find("feline") != std::string::npos) {
            emb[0] = 0.9f;
            emb[1] = 0.1f;
        }
        if (text.find("dog") != std::string::npos ||
            text.find("puppy") != std::string::npos ||
            text.find("canine") != std::string::npos) {
            emb[1] = 0.9f;
            emb[0] = 0.1f;
        }
        if (text.find("python") != std::string::npos ||
            text.find("programming") != std::string::npos ||
            text.find("code") != std::string::npos) {
            emb[2] = 0.9f;
        }
        if (text.find("food") != std::string::npos ||
            text.find("cooking") != std::string::npos ||
            text.find("recipe") != std::string::npos) {
            emb[3] = 0.9f;
        }

        bool all_zero = true;
        for (float v : emb) {
            if (v != 0.0f) { all_zero = false; break; }
        }
        if (all_zero) emb = {0.1f, 0.1f, 0.1f, 0.1f};
        return emb;
    }

    uint32_t dimensions() const override { return 4; }
    std::string embedder_name() const override { return "semantic_mock"; }

    std::atomic<int> embed_count{0};
};

// Always fails the way a broken provider client would.
class ThrowingEmbedder : public Embedder {
public:
    Embedding embed(const std::string& /*text*/) override {
        throw std::runtime_error("embedding provider unreachable");
    }
    uint32_t dimensions() const override { return 4; }
    std::string embedder_name() const override { return "throwing"; }
};

// Provider that reports failure with an empty vector.
class EmptyEmbedder : public Embedder {
public:
    Embedding embed(const std::string& /*text*/) override { return {}; }
    uint32_t dimensions() const override { return 4; }
    std::string embedder_name() const override { return "empty"; }
};

// Answers correctly, but only after `delay_ms`.
class SlowEmbedder : public Embedder {
public:
    explicit SlowEmbedder(int delay_ms) : delay_ms_(delay_ms) {}

    Embedding embed(const std::string& text) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return inner_.embed(text);
    }
    uint32_t dimensions() const override { return 4; }
    std::string embedder_name() const override { return "slow"; }

private:
    int delay_ms_;
    SemanticMockEmbedder inner_;
};

// Claims one dimension but produces another.
class WrongSizeEmbedder : public Embedder {
public:
    Embedding embed(const std::string& /*text*/) override { return {1.0f, 0.0f}; }
    uint32_t dimensions() const override { return 4; }
    std::string embedder_name() const override { return "wrong_size"; }
};

} // namespace engram
