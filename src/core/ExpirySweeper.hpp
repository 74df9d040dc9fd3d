#ifndef EXPIRYSWEEPER_HPP
#define EXPIRYSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

enum class SweeperState {
    Idle,       // Constructed, timer not started
    Armed,      // Waiting for the interval to elapse
    Sweeping,   // Running a pass over the known keys
    Terminated  // Stopped for good
};

enum class SweepMode {
    Sequential, // Checks run one after another on the timer thread
    Concurrent  // Each check is posted to a worker pool and not awaited
};

// Periodically runs an existence check over every known key so entries that
// are written once and never read again still get evicted. Eviction itself is
// the side effect of the check; the sweeper only drives it.
class ExpirySweeper {
public:
    using KeySource = std::function<std::vector<std::string>()>;
    using KeyCheck = std::function<bool(const std::string&)>;

    ExpirySweeper(std::chrono::milliseconds interval,
                  SweepMode mode,
                  KeySource key_source,
                  KeyCheck key_check,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client,
                  size_t worker_threads = 2);
    ~ExpirySweeper();

    void start();
    // Cancels the timer and joins the timer thread and the worker pool.
    // Idempotent. Must not be called from inside a key check.
    void stop();

    SweeperState state() const { return state_.load(); }
    std::uint64_t completedPasses() const { return completed_passes_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void arm();
    void sweep();

    const std::chrono::milliseconds interval_;
    const SweepMode mode_;
    KeySource key_source_;
    KeyCheck key_check_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_;
    std::unique_ptr<boost::asio::thread_pool> workers_; // Concurrent mode only
    std::thread timer_thread_;

    std::atomic<SweeperState> state_;
    std::atomic<std::uint64_t> completed_passes_;
    std::mutex lifecycle_mutex_;

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;
};

#endif // EXPIRYSWEEPER_HPP
