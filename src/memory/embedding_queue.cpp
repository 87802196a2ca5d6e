#include "embedding_queue.hpp"
#include <chrono>
#include <iostream>

namespace engram {

EmbeddingQueue::EmbeddingQueue(SqliteStore& store, VectorStore& vectors, Embedder& embedder)
    : store_(store), vectors_(vectors), embedder_(embedder) {
    running_.store(true);
    thread_ = std::thread([this]() { worker_loop(); });
}

EmbeddingQueue::~EmbeddingQueue() {
    stop();
}

void EmbeddingQueue::enqueue(int64_t memory_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return;
        queue_.push_back(memory_id);
    }
    work_cv_.notify_one();
}

bool EmbeddingQueue::wait_idle(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this]() { return queue_.empty() && !busy_; });
}

void EmbeddingQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) return;
        queue_.clear();
    }
    work_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    idle_cv_.notify_all();
}

size_t EmbeddingQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

void EmbeddingQueue::worker_loop() {
    while (true) {
        int64_t id = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(); });
            if (!running_.load()) break;
            id = queue_.front();
            queue_.pop_front();
            busy_ = true;
        }

        process(id);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    busy_ = false;
    idle_cv_.notify_all();
}

void EmbeddingQueue::process(int64_t memory_id) {
    try {
        auto memory = store_.fetch(memory_id);
        if (!memory) return; // deleted before we got to it

        auto embedding = embedder_.embed(combine_for_embedding(*memory));
        if (embedding.empty()) {
            std::cerr << "[embedding-queue] No embedding for memory " << memory_id
                      << " (" << embedder_.embedder_name() << ")\n";
            return;
        }
        vectors_.store_embedding(memory_id, embedding);
    } catch (const DimensionMismatchError& e) {
        std::cerr << "[embedding-queue] Memory " << memory_id << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[embedding-queue] Failed to embed memory " << memory_id << ": " << e.what() << "\n";
    }
}

} // namespace engram
