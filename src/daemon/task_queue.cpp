#include "task_queue.hpp"

#include <algorithm>
#include <print>

TaskQueue::TaskQueue(std::string name)
    : name_(std::move(name)),
      thread_([this](std::stop_token st) { run(st); }) {}

TaskQueue::~TaskQueue() {
    stop();
}

TaskQueue::TaskId TaskQueue::post(Task task) {
    return post_after(std::chrono::milliseconds(0), std::move(task));
}

TaskQueue::TaskId TaskQueue::post_after(std::chrono::milliseconds delay, Task task) {
    std::lock_guard lock(mu_);
    if (stopped_) return 0;
    TaskId id = next_id_++;
    tasks_.emplace(std::make_pair(Clock::now() + delay, id), std::move(task));
    cv_.notify_one();
    return id;
}

bool TaskQueue::cancel(TaskId id) {
    std::lock_guard lock(mu_);
    auto it = std::ranges::find_if(tasks_, [id](const auto& kv) { return kv.first.second == id; });
    if (it == tasks_.end()) return false;
    tasks_.erase(it);
    return true;
}

void TaskQueue::stop() {
    {
        std::lock_guard lock(mu_);
        if (stopped_) return;
        stopped_ = true;
        tasks_.clear();
    }
    if (on_queue_thread()) {
        std::println(stderr, "{}: stop() called from own thread", name_);
        thread_.request_stop();
        thread_.detach();
        return;
    }
    thread_.request_stop();
    if (thread_.joinable()) thread_.join();
}

bool TaskQueue::on_queue_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void TaskQueue::run(std::stop_token st) {
    std::unique_lock lock(mu_);
    while (!st.stop_requested()) {
        if (tasks_.empty()) {
            cv_.wait(lock, st, [this] { return !tasks_.empty(); });
            continue;
        }

        auto due = tasks_.begin()->first.first;
        if (Clock::now() < due) {
            cv_.wait_until(lock, st, due, [this, due] {
                return !tasks_.empty() && tasks_.begin()->first.first < due;
            });
            continue;
        }

        auto node = tasks_.extract(tasks_.begin());
        lock.unlock();
        node.mapped()();
        lock.lock();
    }
}
