#include "ExpirySweeper.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "../config/CacheConfig.hpp"

namespace {

// Passes run at least this often, which keeps the timer's deadline representable.
constexpr std::chrono::hours MAX_TIMER_WAIT(24);

} // namespace

ExpirySweeper::ExpirySweeper(std::chrono::milliseconds interval,
                             SweepMode mode,
                             KeySource key_source,
                             KeyCheck key_check,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client,
                             size_t worker_threads)
    : interval_(interval),
      mode_(mode),
      key_source_(std::move(key_source)),
      key_check_(std::move(key_check)),
      logger_(logger),
      statsd_client_(statsd_client),
      timer_(ioc_),
      state_(SweeperState::Idle),
      completed_passes_(0) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("ExpirySweeper interval must be positive");
    }
    if (!key_source_ || !key_check_) {
        throw std::invalid_argument("ExpirySweeper requires a key source and a key check");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ExpirySweeper");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for ExpirySweeper");
    }
    if (mode_ == SweepMode::Concurrent) {
        workers_ = std::make_unique<boost::asio::thread_pool>(worker_threads > 0 ? worker_threads : 1);
    }
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.load() != SweeperState::Idle) {
        return;
    }
    arm();
    timer_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in expiry sweeper thread: " + std::string(e.what()));
        }
    });
    logger_->debug("Expiry sweeper started, interval " + std::to_string(interval_.count()) + "ms");
}

void ExpirySweeper::arm() {
    state_.store(SweeperState::Armed);
    timer_.expires_after(std::min<std::chrono::milliseconds>(interval_, MAX_TIMER_WAIT));
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        SweeperState expected = SweeperState::Armed;
        if (!state_.compare_exchange_strong(expected, SweeperState::Sweeping)) {
            return; // Stopped while the timer was pending
        }

        auto started = std::chrono::steady_clock::now();
        sweep();
        completed_passes_.fetch_add(1);
        statsd_client_->increment(MetricsDefinitions::SWEEP_PASS);
        statsd_client_->timing(MetricsDefinitions::SWEEP_DURATION,
                               std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - started));

        expected = SweeperState::Sweeping;
        if (state_.compare_exchange_strong(expected, SweeperState::Armed)) {
            arm();
        }
    });
}

void ExpirySweeper::sweep() {
    std::vector<std::string> keys;
    try {
        keys = key_source_();
    } catch (const std::exception& e) {
        logger_->debug("Expiry sweep skipped, listing keys failed: " + std::string(e.what()));
        return;
    }

    for (const auto& key : keys) {
        if (state_.load() == SweeperState::Terminated) {
            return;
        }
        if (mode_ == SweepMode::Concurrent) {
            boost::asio::post(*workers_, [this, key]() {
                try {
                    key_check_(key);
                } catch (const std::exception& e) {
                    logger_->debug("Expiry check failed for key '" + key + "': " + e.what());
                }
            });
        } else {
            try {
                key_check_(key);
            } catch (const std::exception& e) {
                logger_->debug("Expiry check failed for key '" + key + "': " + e.what());
            }
        }
    }
}

void ExpirySweeper::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.exchange(SweeperState::Terminated) == SweeperState::Terminated) {
        return;
    }

    // A pass in progress finishes before run() returns.
    ioc_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    if (workers_) {
        workers_->join();
    }
    logger_->debug("Expiry sweeper terminated after " + std::to_string(completed_passes_.load()) + " passes");
}
