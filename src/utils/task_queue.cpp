#include "voice_bridge/utils/task_queue.hpp"

#include <exception>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

TaskQueue::TaskQueue(std::string name)
    : name_(std::move(name)),
      state_(std::make_shared<State>()) {
    worker_ = std::thread([state = state_, name = name_]() { worker_loop(state, name); });
    worker_id_ = worker_.get_id();
}

TaskQueue::~TaskQueue() {
    stop();
}

bool TaskQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return false;
        }
        state_->tasks.push_back(std::move(task));
    }
    state_->cv.notify_one();
    return true;
}

void TaskQueue::stop() {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
    }
    state_->cv.notify_one();
    if (!worker_.joinable()) {
        return;
    }
    if (std::this_thread::get_id() == worker_id_) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool TaskQueue::stopped() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->stopping;
}

bool TaskQueue::on_worker_thread() const {
    return std::this_thread::get_id() == worker_id_;
}

void TaskQueue::worker_loop(std::shared_ptr<State> state, std::string name) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state]() { return state->stopping || !state->tasks.empty(); });
            if (state->stopping && state->tasks.empty()) {
                break;
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }
        if (!task) {
            continue;
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Queued task failed",
                           {kv("queue", name), kv("error", ex.what())});
        }
    }
}

}
