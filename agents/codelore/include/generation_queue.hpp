#pragma once
#include "../../../shared/cpp/lore_core/include/entity.hpp"
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct GenerationJob {
    std::uint64_t id{0};    // assigned by enqueue
    ParsedEntity entity;
    std::string priority;   // "high": stale record refresh, "low": never described
};

struct QueueSnapshot {
    std::vector<GenerationJob> high;
    std::vector<GenerationJob> low;
    std::vector<GenerationJob> inflight;
    std::size_t succeeded{0};
    std::size_t failed{0};
};

// Two-lane work queue drained by the generation workers.
class GenerationQueue {
public:
    GenerationJob enqueue(GenerationJob job);
    // Non-blocking; high lane first, FIFO within a lane.
    std::optional<GenerationJob> dequeue();
    void complete(std::uint64_t id, bool ok);
    QueueSnapshot snapshot();
    std::size_t cancel_queued();
    std::size_t queued();

private:
    std::mutex mtx_;
    std::deque<GenerationJob> high_;
    std::deque<GenerationJob> low_;
    std::unordered_map<std::uint64_t, GenerationJob> inflight_;
    std::uint64_t next_id_{1};
    std::size_t succeeded_{0};
    std::size_t failed_{0};
};
