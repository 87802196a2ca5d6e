#pragma once
#include "../embedder.hpp"
#include "sqlite_store.hpp"
#include "vector_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace engram {

// Background worker that embeds saved memories and writes their vectors.
// Failures are logged and the memory stays keyword-searchable.
class EmbeddingQueue {
public:
    EmbeddingQueue(SqliteStore& store, VectorStore& vectors, Embedder& embedder);
    ~EmbeddingQueue();

    EmbeddingQueue(const EmbeddingQueue&) = delete;
    EmbeddingQueue& operator=(const EmbeddingQueue&) = delete;

    void enqueue(int64_t memory_id);

    // Block until the queue is drained or timeout_ms elapses.
    // Returns true when drained.
    bool wait_idle(uint32_t timeout_ms);

    // Signal the worker to stop and join it. Pending ids are dropped.
    void stop();

    size_t pending() const;

private:
    void worker_loop();
    void process(int64_t memory_id);

    SqliteStore& store_;
    VectorStore& vectors_;
    Embedder& embedder_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<int64_t> queue_;
    bool busy_ = false;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace engram
