#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// A cancellable flag. A token with a parent is cancelled when its parent is.
class CancellationToken {
public:
    explicit CancellationToken(const CancellationToken* parent = nullptr) : parent_(parent) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_ = true; }
    bool is_cancelled() const;

    // Throws CancelledError if the token has been cancelled.
    void throw_if_cancelled() const;

private:
    const CancellationToken* parent_;
    std::atomic<bool> cancelled_{false};
};

// Counting semaphore where each acquisition takes a weight. Bounds the number of open file
// handles across all package workers.
class WeightedSemaphore {
public:
    explicit WeightedSemaphore(std::int64_t capacity);

    WeightedSemaphore(const WeightedSemaphore&) = delete;
    WeightedSemaphore& operator=(const WeightedSemaphore&) = delete;

    // Blocks until n units are free. Throws CancelledError if token is cancelled first and
    // MandumpException if n exceeds the capacity.
    void acquire(std::int64_t n, const CancellationToken& token);
    bool try_acquire(std::int64_t n);
    void release(std::int64_t n);

    std::int64_t capacity() const { return capacity_; }
    std::int64_t available() const;

private:
    const std::int64_t capacity_;
    std::int64_t used_ = 0;
    mutable std::mutex mtx;
    std::condition_variable cv;
};

// Releases semaphore units when leaving scope.
class SemaphoreGuard {
public:
    SemaphoreGuard(WeightedSemaphore& sema, std::int64_t n) : sema_(&sema), n_(n) {}
    ~SemaphoreGuard() { if (sema_) sema_->release(n_); }

    SemaphoreGuard(SemaphoreGuard&& other) noexcept : sema_(other.sema_), n_(other.n_) { other.sema_ = nullptr; }
    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(SemaphoreGuard&&) = delete;

private:
    WeightedSemaphore* sema_;
    std::int64_t n_;
};

// Runs tasks on their own threads, joined by wait() and the destructor. The first task to
// throw cancels the group's token and its exception is rethrown by wait(); later failures
// are dropped. Tasks are spawned from the owning thread only.
class TaskGroup {
public:
    explicit TaskGroup(const CancellationToken* parent = nullptr) : token_(parent) {}
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void(const CancellationToken&)> task);

    // Waits for every spawned task, then rethrows the first failure if any.
    void wait();

    const CancellationToken& token() const { return token_; }

private:
    void wait_idle();
    void fail(std::exception_ptr error);

    CancellationToken token_;
    std::mutex mtx;
    std::vector<std::thread> threads_;
    std::exception_ptr first_error_;
};
