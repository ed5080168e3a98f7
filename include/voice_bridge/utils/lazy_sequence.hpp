#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace voice_bridge::utils {

template <typename T>
class LazySequence {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || canceled_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_all();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void fail(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                error_ = std::move(error);
                closed_ = true;
            }
        }
        cv_.notify_all();
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            canceled_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool canceled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return canceled_;
    }

    std::optional<T> next() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return canceled_ || closed_ || !items_.empty(); });
        if (canceled_) {
            return std::nullopt;
        }
        if (!items_.empty()) {
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }
        if (error_) {
            auto error = error_;
            error_ = nullptr;
            std::rethrow_exception(error);
        }
        return std::nullopt;
    }

    // Non-blocking next(): nullopt when nothing is buffered yet.
    std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (canceled_) {
            return std::nullopt;
        }
        if (!items_.empty()) {
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }
        if (closed_ && error_) {
            auto error = error_;
            error_ = nullptr;
            std::rethrow_exception(error);
        }
        return std::nullopt;
    }

    bool exhausted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return canceled_ || (closed_ && items_.empty() && !error_);
    }

    static std::shared_ptr<LazySequence<T>> of(std::vector<T> items) {
        auto sequence = std::make_shared<LazySequence<T>>();
        for (auto& item : items) {
            sequence->push(std::move(item));
        }
        sequence->close();
        return sequence;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::exception_ptr error_;
    bool closed_{false};
    bool canceled_{false};
};

}
