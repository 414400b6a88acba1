#include "../include/generation_queue.hpp"
#include <gtest/gtest.h>

namespace {

GenerationJob job(const std::string& name, const std::string& priority) {
    GenerationJob j;
    j.entity.name = name;
    j.priority = priority;
    return j;
}

} // namespace

TEST(GenerationQueueTest, HighLaneFirstThenFifo) {
    GenerationQueue q;
    q.enqueue(job("new1", "low"));
    q.enqueue(job("stale1", "high"));
    q.enqueue(job("new2", "low"));
    q.enqueue(job("stale2", "high"));
    EXPECT_EQ(q.queued(), 4u);

    std::vector<std::string> order;
    while (auto j = q.dequeue()) order.push_back(j->entity.name);
    EXPECT_EQ(order, (std::vector<std::string>{"stale1", "stale2", "new1", "new2"}));
    EXPECT_FALSE(q.dequeue());
}

TEST(GenerationQueueTest, IdsAssignedAndUnknownPriorityIsLow) {
    GenerationQueue q;
    auto a = q.enqueue(job("a", "urgent"));
    auto b = q.enqueue(job("b", "high"));
    EXPECT_EQ(a.priority, "low");
    EXPECT_NE(a.id, 0u);
    EXPECT_NE(a.id, b.id);
}

TEST(GenerationQueueTest, CompletionCounts) {
    GenerationQueue q;
    q.enqueue(job("a", "low"));
    q.enqueue(job("b", "low"));
    q.enqueue(job("c", "high"));

    auto first = q.dequeue();
    auto second = q.dequeue();
    ASSERT_TRUE(first && second);
    auto snap = q.snapshot();
    EXPECT_EQ(snap.inflight.size(), 2u);
    EXPECT_EQ(snap.low.size(), 1u);
    EXPECT_TRUE(snap.high.empty());

    q.complete(first->id, true);
    q.complete(second->id, false);
    q.complete(second->id, true);   // already settled
    q.complete(999, true);

    snap = q.snapshot();
    EXPECT_EQ(snap.succeeded, 1u);
    EXPECT_EQ(snap.failed, 1u);
    EXPECT_TRUE(snap.inflight.empty());
}

TEST(GenerationQueueTest, CancelDropsQueuedOnly) {
    GenerationQueue q;
    q.enqueue(job("a", "high"));
    q.enqueue(job("b", "low"));
    q.enqueue(job("c", "low"));
    auto running = q.dequeue();
    ASSERT_TRUE(running);

    EXPECT_EQ(q.cancel_queued(), 2u);
    EXPECT_EQ(q.queued(), 0u);
    EXPECT_EQ(q.snapshot().inflight.size(), 1u);
    q.complete(running->id, true);
    EXPECT_EQ(q.snapshot().succeeded, 1u);
}
