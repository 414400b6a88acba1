#include "../include/generation_queue.hpp"
#include <utility>

GenerationJob GenerationQueue::enqueue(GenerationJob job) {
    std::lock_guard<std::mutex> lock(mtx_);
    job.id = next_id_++;
    if (job.priority == "high") {
        high_.push_back(job);
    } else {
        job.priority = "low";
        low_.push_back(job);
    }
    return job;
}

std::optional<GenerationJob> GenerationQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mtx_);
    auto pop_from = [&](std::deque<GenerationJob>& q) -> std::optional<GenerationJob> {
        if (q.empty()) return std::nullopt;
        GenerationJob j = std::move(q.front());
        q.pop_front();
        inflight_.emplace(j.id, j);
        return j;
    };
    if (auto j = pop_from(high_)) return j;
    if (auto j = pop_from(low_)) return j;
    return std::nullopt;
}

void GenerationQueue::complete(std::uint64_t id, bool ok) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (inflight_.erase(id) == 0) return;
    if (ok) ++succeeded_;
    else ++failed_;
}

QueueSnapshot GenerationQueue::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    QueueSnapshot s;
    s.high.assign(high_.begin(), high_.end());
    s.low.assign(low_.begin(), low_.end());
    s.inflight.reserve(inflight_.size());
    for (const auto& kv : inflight_) s.inflight.push_back(kv.second);
    s.succeeded = succeeded_;
    s.failed = failed_;
    return s;
}

std::size_t GenerationQueue::cancel_queued() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = high_.size() + low_.size();
    high_.clear();
    low_.clear();
    return removed;
}

std::size_t GenerationQueue::queued() {
    std::lock_guard<std::mutex> lock(mtx_);
    return high_.size() + low_.size();
}
