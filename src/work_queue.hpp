#pragma once

// Internal header — not installed.
// Minimal std::jthread-based FIFO work queue. With one worker, tasks run
// strictly in submission order (audit trail, serializer continuation).

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace issuehub_cpp::detail {

class WorkQueue {
public:
    explicit WorkQueue(unsigned int num_threads = 1)
        : num_threads_{num_threads} {
        workers_.reserve(num_threads);
        for (unsigned int i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
        }
    }

    ~WorkQueue() {
        {
            auto lock = std::scoped_lock{mutex_};
            stopping_ = true;
        }
        cv_.notify_all();
        // Workers drain the remaining tasks, then std::jthread joins them.
        workers_.clear();
    }

    WorkQueue(const WorkQueue&) = delete;
    auto operator=(const WorkQueue&) -> WorkQueue& = delete;
    WorkQueue(WorkQueue&&) = delete;
    auto operator=(WorkQueue&&) -> WorkQueue& = delete;

    /// Enqueue a task. Never blocks on running tasks.
    void submit(std::function<void()> task) {
        {
            auto lock = std::scoped_lock{mutex_};
            tasks_.push_back(std::move(task));
            ++outstanding_;
        }
        cv_.notify_one();
    }

    /// Block until every task submitted so far has finished.
    void wait_idle() {
        auto lock = std::unique_lock{mutex_};
        idle_cv_.wait(lock, [&] { return outstanding_ == 0; });
    }

    /// Number of tasks queued or running.
    auto outstanding() const -> std::size_t {
        auto lock = std::scoped_lock{mutex_};
        return outstanding_;
    }

    auto size() const -> unsigned int { return num_threads_; }

private:
    void worker_loop(std::stop_token st) {
        while (true) {
            auto task = std::function<void()>{};
            {
                auto lock = std::unique_lock{mutex_};
                cv_.wait(lock, [&] {
                    return !tasks_.empty() || stopping_ || st.stop_requested();
                });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
            {
                auto lock = std::scoped_lock{mutex_};
                --outstanding_;
            }
            idle_cv_.notify_all();
        }
    }

    unsigned int num_threads_;
    std::deque<std::function<void()>> tasks_;
    std::size_t outstanding_{0};
    bool stopping_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::vector<std::jthread> workers_;
};

}  // namespace issuehub_cpp::detail
