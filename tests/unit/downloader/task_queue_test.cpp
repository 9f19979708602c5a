#include <gtest/gtest.h>

#include <civdl/downloader/task_queue.h>

#include <string>
#include <vector>

using namespace civdl::downloader;

namespace {

std::vector<std::string> drain(TaskQueue& q) {
    std::vector<std::string> out;
    while (auto id = q.next())
        out.push_back(*id);
    return out;
}

} // namespace

TEST(TaskQueueTest, OrdersByPriorityAscending) {
    TaskQueue q;
    q.add("p5", 5);
    q.add("p1", 1);
    q.add("p3", 3);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(drain(q), (std::vector<std::string>{"p1", "p3", "p5"}));
    EXPECT_TRUE(q.empty());
}

TEST(TaskQueueTest, TiesAreFifo) {
    TaskQueue q;
    q.add("a", 0);
    q.add("b", 0);
    q.add("urgent", -1);
    q.add("c", 0);
    EXPECT_EQ(drain(q), (std::vector<std::string>{"urgent", "a", "b", "c"}));
}

TEST(TaskQueueTest, AcceptsTasks) {
    TaskQueue q;
    DownloadTask low;
    low.id = "low";
    low.priority = 10;
    DownloadTask high;
    high.id = "high";
    high.priority = 0;
    q.add(low);
    q.add(high);
    EXPECT_EQ(q.next().value_or(""), "high");
}

TEST(TaskQueueTest, RemoveSkipsEntry) {
    TaskQueue q;
    q.add("a", 1);
    q.add("b", 2);
    q.add("c", 3);
    EXPECT_TRUE(q.remove("b"));
    EXPECT_FALSE(q.remove("b"));
    EXPECT_FALSE(q.remove("unknown"));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_FALSE(q.contains("b"));
    EXPECT_EQ(drain(q), (std::vector<std::string>{"a", "c"}));
}

TEST(TaskQueueTest, ReAddAfterRemoveUsesFreshEntry) {
    TaskQueue q;
    q.add("x", 1);
    q.add("y", 5);
    EXPECT_TRUE(q.remove("x"));
    q.add("x", 9);
    // The stale priority-1 entry must not come back.
    EXPECT_EQ(drain(q), (std::vector<std::string>{"y", "x"}));
}

TEST(TaskQueueTest, NextOnEmptyIsNullopt) {
    TaskQueue q;
    EXPECT_FALSE(q.next().has_value());
    q.add("only", 0);
    q.remove("only");
    EXPECT_FALSE(q.next().has_value());
    EXPECT_TRUE(q.empty());
}
