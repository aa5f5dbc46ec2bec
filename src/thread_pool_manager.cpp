#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"

// Static member initialization
std::unique_ptr<tbb::global_control> ThreadPoolManager::global_control_;
std::atomic<bool> ThreadPoolManager::initialized_{false};
std::atomic<size_t> ThreadPoolManager::current_thread_count_{0};
std::mutex ThreadPoolManager::resize_mutex_;

void ThreadPoolManager::initialize(size_t num_threads)
{
    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (initialized_.load())
    {
        Logger::debug("Thread pool manager already initialized with " +
                      std::to_string(current_thread_count_.load()) + " threads");
        return;
    }

    if (!validateThreadCount(num_threads))
    {
        Logger::error("Invalid thread count: " + std::to_string(num_threads) + ". Using default: 4");
        num_threads = 4;
    }
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, num_threads);
    current_thread_count_.store(num_threads);
    initialized_.store(true);
    Logger::info("Thread pool manager initialized with " + std::to_string(num_threads) + " threads");
}

void ThreadPoolManager::shutdown()
{
    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (initialized_.load())
    {
        global_control_.reset();
        current_thread_count_.store(0);
        initialized_.store(false);
        Logger::info("Thread pool manager shutdown");
    }
}

bool ThreadPoolManager::resizeThreadPool(size_t new_num_threads)
{
    if (!initialized_.load())
    {
        Logger::error("Cannot resize thread pool - not initialized");
        return false;
    }

    if (!validateThreadCount(new_num_threads))
    {
        Logger::error("Invalid thread count for resize: " + std::to_string(new_num_threads));
        return false;
    }

    std::lock_guard<std::mutex> lock(resize_mutex_);

    if (new_num_threads == current_thread_count_.load())
    {
        Logger::debug("Thread pool already at requested size: " + std::to_string(new_num_threads));
        return true;
    }

    Logger::info("Resizing thread pool from " + std::to_string(current_thread_count_.load()) +
                 " to " + std::to_string(new_num_threads) + " threads");
    global_control_.reset();
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, new_num_threads);
    current_thread_count_.store(new_num_threads);
    return true;
}

size_t ThreadPoolManager::getCurrentThreadCount()
{
    return current_thread_count_.load();
}

bool ThreadPoolManager::validateThreadCount(size_t thread_count)
{
    return thread_count >= 1 && thread_count <= kMaxThreadCount;
}
