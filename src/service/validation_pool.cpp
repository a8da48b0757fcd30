/*
 * dircat C++ - Validation Pool Implementation
 */
#include <dircat/service/validation_pool.hpp>
#include <dircat/security/input_validator.hpp>
#include <dircat/core/logger.hpp>

namespace dircat {

ValidationPool::ValidationPool(size_t workers, size_t max_pending)
    : max_pending_(max_pending > 0 ? max_pending : 1)
    , stopping_(false)
{
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i) {
        threads_.push_back(std::thread(&ValidationPool::worker_loop, this, i));
    }
    LOG_DEBUG("[Pool] Started %zu validation workers (backlog %zu)", workers, max_pending_);
}

ValidationPool::~ValidationPool() {
    shutdown();
}

bool ValidationPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return false;
        }
        if (queue_.size() >= max_pending_) {
            LOG_WARN("[Pool] Backlog full (%zu pending), refusing work", queue_.size());
            return false;
        }
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void ValidationPool::worker_loop(size_t index) {
    Logger::set_thread_tag("pool-" + std::to_string(index));
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_.load() || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

ValidationOutcome ValidationPool::validate(const std::string& input,
                                           const SafeModeConfig& config,
                                           int64_t timeout_ms) {
    SafeModeConfig snapshot = config;
    std::string owned_input = input;
    std::function<ValidationOutcome()> task = [snapshot, owned_input]() {
        return validate_input(owned_input, snapshot);
    };

    ValidationOutcome outcome;
    PoolWait wait = PoolWait::Rejected;
    try {
        wait = run(task, timeout_ms, outcome);
    } catch (const std::exception& e) {
        LOG_ERROR("[Pool] Validation task failed: %s", e.what());
        return ValidationOutcome::fail(SecurityErrorKind::IoOther, "Validation failed.");
    }

    switch (wait) {
        case PoolWait::Done:
            return outcome;
        case PoolWait::TimedOut:
            LOG_WARN("[Pool] Validation exceeded %lld ms, abandoning", static_cast<long long>(timeout_ms));
            return ValidationOutcome::fail(SecurityErrorKind::Timeout, "Validation timed out.");
        case PoolWait::Rejected:
            return ValidationOutcome::fail(SecurityErrorKind::Timeout, "Validation backlog is full.");
        case PoolWait::Stopped:
            return ValidationOutcome::fail(SecurityErrorKind::Timeout, "Validation service is shutting down.");
    }
    return ValidationOutcome::fail(SecurityErrorKind::IoOther, "Validation failed.");
}

size_t ValidationPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ValidationPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load() && threads_.empty()) {
            return;
        }
        stopping_.store(true);
    }
    cv_.notify_all();
    for (size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
    }
    threads_.clear();
}

} // namespace dircat
