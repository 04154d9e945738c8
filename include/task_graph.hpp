#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quickpack {

// Identifies one memoized computation: the operation and its normalized argument.
// An operation name must always be used with the same result type.
struct TaskKey {
    std::string operation;
    std::string argument;

    bool operator==(const TaskKey&) const = default;

    [[nodiscard]] std::string to_string() const { return operation + ":" + argument; }
};

struct TaskKeyHash {
    size_t operator()(const TaskKey& key) const noexcept;
};

// Memo table of pure computations.
//
// At most one execution is in flight per key; concurrent callers of the same
// key wait on the same shared future and observe the same value (or the same
// exception). Calls made while a task is executing on the current thread are
// recorded as dependency edges, so invalidating an input also invalidates
// every cached result that read it.
class TaskGraph {
public:
    template <typename T>
    using Ref = std::shared_ptr<const T>;

    TaskGraph() = default;

    TaskGraph(const TaskGraph&) = delete;
    TaskGraph& operator=(const TaskGraph&) = delete;

    // Returns the cached value for key, computing it with compute() if absent.
    // compute must return a T.
    template <typename T, typename F>
    Ref<T> run(const TaskKey& key, F&& compute);

    // Returns the completed value for key without computing or recording a dependency.
    template <typename T>
    [[nodiscard]] Ref<T> peek(const TaskKey& key) const;

    // Drops key and, transitively, everything that read it. In-flight tasks
    // still complete for their current waiters but their results are discarded.
    // Returns the number of entries removed.
    size_t invalidate(const TaskKey& key);

    void clear();

    [[nodiscard]] bool contains(const TaskKey& key) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<TaskKey> keys_for(std::string_view operation) const;
    [[nodiscard]] std::vector<TaskKey> dependents_of(const TaskKey& key) const;

    // Number of computations executed since construction
    [[nodiscard]] uint64_t executions() const noexcept { return executions_.load(); }

    // Key of the task executing on this thread, if any.
    [[nodiscard]] std::optional<TaskKey> current_task() const;

private:
    using Value = std::shared_ptr<const void>;

    struct Entry {
        std::shared_future<Value> future;
        std::thread::id owner;
        uint64_t generation = 0;
        bool done = false;
    };

    Value run_erased(const TaskKey& key, const std::function<Value()>& compute);
    [[nodiscard]] Value peek_erased(const TaskKey& key) const;
    void mark_done(const TaskKey& key, uint64_t generation);

    mutable std::mutex mutex_;
    std::unordered_map<TaskKey, Entry, TaskKeyHash> entries_;
    // child -> tasks that read it
    std::unordered_map<TaskKey, std::unordered_set<TaskKey, TaskKeyHash>, TaskKeyHash> dependents_;
    uint64_t next_generation_ = 0;
    std::atomic<uint64_t> executions_{0};
};

template <typename T, typename F>
TaskGraph::Ref<T> TaskGraph::run(const TaskKey& key, F&& compute) {
    Value value = run_erased(key, [&compute]() -> Value {
        return std::shared_ptr<const T>(std::make_shared<T>(compute()));
    });
    return std::static_pointer_cast<const T>(value);
}

template <typename T>
TaskGraph::Ref<T> TaskGraph::peek(const TaskKey& key) const {
    return std::static_pointer_cast<const T>(peek_erased(key));
}

}  // namespace quickpack
