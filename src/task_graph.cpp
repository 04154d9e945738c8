#include "task_graph.hpp"

#include <stdexcept>

namespace quickpack {

namespace {

struct ActiveTask {
    const TaskGraph* graph;
    TaskKey key;
};

// Tasks executing on this thread, innermost last
thread_local std::vector<ActiveTask> t_active_tasks;

class ActiveTaskGuard {
public:
    ActiveTaskGuard(const TaskGraph* graph, const TaskKey& key) {
        t_active_tasks.push_back({graph, key});
    }
    ~ActiveTaskGuard() { t_active_tasks.pop_back(); }

    ActiveTaskGuard(const ActiveTaskGuard&) = delete;
    ActiveTaskGuard& operator=(const ActiveTaskGuard&) = delete;
};

}  // namespace

size_t TaskKeyHash::operator()(const TaskKey& key) const noexcept {
    const size_t h1 = std::hash<std::string>{}(key.operation);
    const size_t h2 = std::hash<std::string>{}(key.argument);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

std::optional<TaskKey> TaskGraph::current_task() const {
    if (t_active_tasks.empty() || t_active_tasks.back().graph != this) {
        return std::nullopt;
    }
    return t_active_tasks.back().key;
}

TaskGraph::Value TaskGraph::run_erased(const TaskKey& key, const std::function<Value()>& compute) {
    std::shared_future<Value> future;
    std::shared_ptr<std::promise<Value>> promise;
    uint64_t generation = 0;

    {
        std::unique_lock lock(mutex_);

        // Record the edge before waiting so an invalidation racing with this
        // read still reaches the reader.
        if (auto parent = current_task()) {
            if (*parent == key) {
                throw std::logic_error("task depends on itself: " + key.to_string());
            }
            dependents_[key].insert(std::move(*parent));
        }

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (!it->second.done && it->second.owner == std::this_thread::get_id()) {
                throw std::logic_error("cycle detected while computing " + key.to_string());
            }
            future = it->second.future;
        } else {
            promise = std::make_shared<std::promise<Value>>();
            Entry entry;
            entry.future = promise->get_future().share();
            entry.owner = std::this_thread::get_id();
            entry.generation = ++next_generation_;
            generation = entry.generation;
            future = entry.future;
            entries_.emplace(key, std::move(entry));
        }
    }

    if (promise) {
        executions_.fetch_add(1);
        try {
            ActiveTaskGuard guard(this, key);
            promise->set_value(compute());
        } catch (...) {
            // Failures are memoized like values until the key is invalidated
            promise->set_exception(std::current_exception());
        }
        mark_done(key, generation);
    }

    return future.get();
}

void TaskGraph::mark_done(const TaskKey& key, uint64_t generation) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    // A different generation means the entry was invalidated while in flight
    if (it != entries_.end() && it->second.generation == generation) {
        it->second.done = true;
    }
}

TaskGraph::Value TaskGraph::peek_erased(const TaskKey& key) const {
    std::shared_future<Value> future;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || !it->second.done) {
            return nullptr;
        }
        future = it->second.future;
    }
    try {
        return future.get();
    } catch (const std::exception&) {
        return nullptr;
    }
}

size_t TaskGraph::invalidate(const TaskKey& key) {
    std::unique_lock lock(mutex_);

    size_t removed = 0;
    std::vector<TaskKey> pending{key};
    std::unordered_set<TaskKey, TaskKeyHash> seen;

    while (!pending.empty()) {
        TaskKey current = std::move(pending.back());
        pending.pop_back();
        if (!seen.insert(current).second) {
            continue;
        }

        removed += entries_.erase(current);

        auto deps = dependents_.find(current);
        if (deps != dependents_.end()) {
            for (const auto& dependent : deps->second) {
                pending.push_back(dependent);
            }
            dependents_.erase(deps);
        }
    }

    return removed;
}

void TaskGraph::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    dependents_.clear();
}

bool TaskGraph::contains(const TaskKey& key) const {
    std::unique_lock lock(mutex_);
    return entries_.find(key) != entries_.end();
}

size_t TaskGraph::size() const {
    std::unique_lock lock(mutex_);
    return entries_.size();
}

std::vector<TaskKey> TaskGraph::keys_for(std::string_view operation) const {
    std::unique_lock lock(mutex_);
    std::vector<TaskKey> keys;
    for (const auto& [key, entry] : entries_) {
        if (key.operation == operation) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::vector<TaskKey> TaskGraph::dependents_of(const TaskKey& key) const {
    std::unique_lock lock(mutex_);
    std::vector<TaskKey> result;
    auto it = dependents_.find(key);
    if (it != dependents_.end()) {
        result.assign(it->second.begin(), it->second.end());
    }
    return result;
}

}  // namespace quickpack
