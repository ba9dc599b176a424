#include "concurrency.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <chrono>
#include <thread>

namespace {
    // Blocked acquisitions re-check their token at this interval.
    constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(20);
}

bool CancellationToken::is_cancelled() const {
    return cancelled_.load() || (parent_ && parent_->is_cancelled());
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError(get_string("error.cancelled"));
    }
}

WeightedSemaphore::WeightedSemaphore(std::int64_t capacity) : capacity_(capacity) {
    if (capacity_ <= 0) {
        throw MandumpException(string_format("error.semaphore_capacity", capacity_));
    }
}

void WeightedSemaphore::acquire(std::int64_t n, const CancellationToken& token) {
    if (n > capacity_) {
        throw MandumpException(string_format("error.semaphore_weight", n, capacity_));
    }

    std::unique_lock<std::mutex> lock(mtx);
    while (used_ + n > capacity_) {
        token.throw_if_cancelled();
        cv.wait_for(lock, CANCEL_POLL_INTERVAL);
    }
    token.throw_if_cancelled();
    used_ += n;
}

bool WeightedSemaphore::try_acquire(std::int64_t n) {
    std::lock_guard<std::mutex> lock(mtx);
    if (used_ + n > capacity_) return false;
    used_ += n;
    return true;
}

void WeightedSemaphore::release(std::int64_t n) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        used_ -= n;
        if (used_ < 0) used_ = 0;
    }
    cv.notify_all();
}

std::int64_t WeightedSemaphore::available() const {
    std::lock_guard<std::mutex> lock(mtx);
    return capacity_ - used_;
}

TaskGroup::~TaskGroup() {
    wait_idle();
}

void TaskGroup::spawn(std::function<void(const CancellationToken&)> task) {
    std::lock_guard<std::mutex> lock(mtx);
    threads_.emplace_back([this, task = std::move(task)]() {
        try {
            task(token_);
        } catch (...) {
            fail(std::current_exception());
        }
    });
}

void TaskGroup::fail(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!first_error_) {
        first_error_ = error;
        token_.cancel();
    }
}

void TaskGroup::wait_idle() {
    while (true) {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mtx);
            threads.swap(threads_);
        }
        if (threads.empty()) return;
        for (auto& t : threads) {
            t.join();
        }
    }
}

void TaskGroup::wait() {
    wait_idle();
    std::lock_guard<std::mutex> lock(mtx);
    if (first_error_) {
        std::rethrow_exception(first_error_);
    }
}
