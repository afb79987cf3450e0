#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

// Serial executor: tasks run one at a time on a dedicated thread, in order of
// their due time (FIFO for equal times). Delayed tasks can be cancelled.
class TaskQueue {
public:
    using Task = std::function<void()>;
    using TaskId = uint64_t;
    using Clock = std::chrono::steady_clock;

    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    TaskId post(Task task);
    TaskId post_after(std::chrono::milliseconds delay, Task task);

    // Returns true if the task had not started yet and will not run.
    bool cancel(TaskId id);

    // Discards pending tasks and joins the thread. A task already running
    // finishes first. Must not be called from the queue's own thread.
    void stop();

    bool on_queue_thread() const;

    // Runs fn on the queue and waits for its result. Runs inline when called
    // from the queue thread.
    template <typename Fn>
    auto invoke(Fn&& fn) -> std::invoke_result_t<Fn> {
        using R = std::invoke_result_t<Fn>;
        if (on_queue_thread()) return fn();

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto result = task->get_future();
        post([task] { (*task)(); });
        return result.get();
    }

    const std::string& name() const { return name_; }

private:
    void run(std::stop_token st);

    std::string name_;
    std::mutex mu_;
    std::condition_variable_any cv_;
    std::map<std::pair<Clock::time_point, TaskId>, Task> tasks_;
    TaskId next_id_ = 1;
    bool stopped_ = false;
    std::jthread thread_;
};
