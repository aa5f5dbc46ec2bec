#pragma once

#include <tbb/global_control.h>
#include <atomic>
#include <memory>
#include <mutex>
#include "logging/logger.hpp"

/**
 * @brief Bounds the oneTBB worker parallelism used by verification runs
 *
 * Wraps a process-wide tbb::global_control. Runs started after a resize observe the new limit.
 */
class ThreadPoolManager
{
public:
    /**
     * @brief Initialize the analysis thread limit
     * @param num_threads Maximum parallelism; invalid values fall back to 4
     */
    static void initialize(size_t num_threads);

    /**
     * @brief Release the parallelism limit
     */
    static void shutdown();

    /**
     * @brief Change the parallelism limit
     * @return true if resize was successful, false otherwise
     */
    static bool resizeThreadPool(size_t new_num_threads);

    static size_t getCurrentThreadCount();
    static bool isInitialized() { return initialized_.load(); }

    static constexpr size_t kMaxThreadCount = 64;

private:
    static std::unique_ptr<tbb::global_control> global_control_;
    static std::atomic<bool> initialized_;
    static std::atomic<size_t> current_thread_count_;
    static std::mutex resize_mutex_;

    static bool validateThreadCount(size_t thread_count);
};
