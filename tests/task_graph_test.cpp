#include "task_graph.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using quickpack::TaskGraph;
using quickpack::TaskKey;

TEST(TaskGraphTest, ComputesOnceAndCaches) {
    TaskGraph graph;
    int calls = 0;
    auto compute = [&] {
        ++calls;
        return std::string("value");
    };

    auto first = graph.run<std::string>({"op", "a"}, compute);
    auto second = graph.run<std::string>({"op", "a"}, compute);

    EXPECT_EQ(*first, "value");
    EXPECT_EQ(first, second);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(graph.executions(), 1u);

    graph.run<std::string>({"op", "b"}, compute);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(graph.keys_for("op").size(), 2u);
}

TEST(TaskGraphTest, ConcurrentCallersShareOneExecution) {
    TaskGraph graph;
    std::atomic<int> calls{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    std::vector<TaskGraph::Ref<int>> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            while (!go) {
                std::this_thread::yield();
            }
            results[i] = graph.run<int>({"slow", "x"}, [&] {
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return 42;
            });
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 1);
    for (const auto& result : results) {
        ASSERT_NE(result, nullptr);
        EXPECT_EQ(result, results[0]);
        EXPECT_EQ(*result, 42);
    }
}

TEST(TaskGraphTest, RecordsDependencyEdges) {
    TaskGraph graph;
    graph.run<int>({"outer", "1"}, [&] {
        EXPECT_EQ(graph.current_task(), (TaskKey{"outer", "1"}));
        return *graph.run<int>({"inner", "1"}, [] { return 1; }) + 1;
    });

    auto dependents = graph.dependents_of({"inner", "1"});
    ASSERT_EQ(dependents.size(), 1u);
    EXPECT_EQ(dependents[0], (TaskKey{"outer", "1"}));
    EXPECT_FALSE(graph.current_task().has_value());
}

TEST(TaskGraphTest, InvalidationIsTransitive) {
    TaskGraph graph;
    int input = 1;
    int top_calls = 0;

    auto read_top = [&] {
        return *graph.run<int>({"top", ""}, [&] {
            ++top_calls;
            return *graph.run<int>({"middle", ""}, [&] {
                return *graph.run<int>({"leaf", ""}, [&] { return input; }) * 10;
            });
        });
    };

    EXPECT_EQ(read_top(), 10);
    EXPECT_EQ(graph.size(), 3u);

    // Unrelated keys survive
    graph.run<int>({"other", ""}, [] { return 0; });

    input = 2;
    EXPECT_EQ(graph.invalidate({"leaf", ""}), 3u);
    EXPECT_TRUE(graph.contains({"other", ""}));
    EXPECT_FALSE(graph.contains({"top", ""}));

    EXPECT_EQ(read_top(), 20);
    EXPECT_EQ(top_calls, 2);
}

TEST(TaskGraphTest, FailuresAreCachedUntilInvalidated) {
    TaskGraph graph;
    int calls = 0;
    bool fail = true;
    auto compute = [&]() -> int {
        ++calls;
        if (fail) {
            throw std::runtime_error("boom");
        }
        return 7;
    };

    EXPECT_THROW(graph.run<int>({"flaky", ""}, compute), std::runtime_error);
    EXPECT_THROW(graph.run<int>({"flaky", ""}, compute), std::runtime_error);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(graph.peek<int>({"flaky", ""}), nullptr);

    fail = false;
    graph.invalidate({"flaky", ""});
    EXPECT_EQ(*graph.run<int>({"flaky", ""}, compute), 7);
    EXPECT_EQ(calls, 2);
}

TEST(TaskGraphTest, InFlightInvalidationDiscardsResult) {
    TaskGraph graph;
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    std::thread worker([&] {
        auto value = graph.run<int>({"slow", ""}, [&] {
            started = true;
            while (!release) {
                std::this_thread::yield();
            }
            return 1;
        });
        EXPECT_EQ(*value, 1);
    });

    while (!started) {
        std::this_thread::yield();
    }
    EXPECT_EQ(graph.invalidate({"slow", ""}), 1u);
    release = true;
    worker.join();

    // The stale result was not kept
    EXPECT_FALSE(graph.contains({"slow", ""}));
    EXPECT_EQ(*graph.run<int>({"slow", ""}, [] { return 2; }), 2);
}

TEST(TaskGraphTest, SelfDependencyIsReported) {
    TaskGraph graph;
    EXPECT_THROW(graph.run<int>({"loop", ""},
                                [&] { return *graph.run<int>({"loop", ""}, [] { return 0; }); }),
                 std::logic_error);
}
