#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voice_bridge::utils {

class TaskQueue {
public:
    using Task = std::function<void()>;

    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    bool post(Task task);
    void stop();
    bool stopped() const;
    bool on_worker_thread() const;
    const std::string& name() const { return name_; }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Task> tasks;
        bool stopping{false};
    };

    static void worker_loop(std::shared_ptr<State> state, std::string name);

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread worker_;
    std::thread::id worker_id_;
    std::mutex stop_mutex_;
};

}
