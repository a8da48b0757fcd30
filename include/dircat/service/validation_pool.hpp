/*
 * dircat C++ - Validation Pool
 *
 * Fixed set of worker threads for blocking validation work (DNS lookups,
 * realpath). The caller waits with a deadline; work that misses it is
 * abandoned and its result dropped when it eventually finishes. A full
 * backlog is refused immediately.
 */
#ifndef dircat_SERVICE_VALIDATION_POOL_HPP
#define dircat_SERVICE_VALIDATION_POOL_HPP

#include <dircat/security/safe_mode.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace dircat {

enum class PoolWait {
    Done,
    TimedOut,
    Rejected,    // backlog full
    Stopped      // shutdown() already called
};

class ValidationPool {
public:
    ValidationPool(size_t workers, size_t max_pending);
    ~ValidationPool();

    // Queue a job. False when the backlog is full or the pool is stopping.
    bool submit(std::function<void()> job);

    // Run `task` on a worker and wait at most timeout_ms for its result.
    template <typename Result>
    PoolWait run(std::function<Result()> task, int64_t timeout_ms, Result& out) {
        std::shared_ptr<std::promise<Result> > promise = std::make_shared<std::promise<Result> >();
        std::future<Result> future = promise->get_future();

        bool queued = submit([promise, task]() {
            try {
                promise->set_value(task());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        if (!queued) {
            return stopping_.load() ? PoolWait::Stopped : PoolWait::Rejected;
        }

        if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            return PoolWait::TimedOut;
        }
        out = future.get();
        return PoolWait::Done;
    }

    // validate_input() on a worker; Timeout when the deadline or backlog is hit,
    // or when the pool is already stopped.
    // The config is copied so abandoned work never touches caller state.
    ValidationOutcome validate(const std::string& input, const SafeModeConfig& config, int64_t timeout_ms);

    size_t pending() const;
    size_t workers() const { return threads_.size(); }
    size_t max_pending() const { return max_pending_; }

    // Stop accepting work, finish what is queued, join the workers
    void shutdown();

private:
    ValidationPool(const ValidationPool&);
    ValidationPool& operator=(const ValidationPool&);

    void worker_loop(size_t index);

    size_t max_pending_;
    std::vector<std::thread> threads_;
    std::deque<std::function<void()> > queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopping_;
};

} // namespace dircat

#endif // dircat_SERVICE_VALIDATION_POOL_HPP
