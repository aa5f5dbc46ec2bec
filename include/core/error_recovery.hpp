#pragma once
#include <functional>
#include <chrono>
#include <thread>
#include <atomic>
#include <mutex>
#include <string>
#include "core/call_context.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Retry with exponential backoff: base, 2*base, 4*base...
    // Non-retryable errors and cancellation are rethrown immediately.
    template <typename Func, typename Retryable>
    static auto retryWithBackoff(Func func, int max_attempts, const std::string &operation_name,
                                 Retryable is_retryable, const CancellationToken &token, int base_delay_ms = 100)
        -> decltype(func(0))
    {
        if (max_attempts < 1)
        {
            max_attempts = 1;
        }

        for (int attempt = 0; attempt < max_attempts; ++attempt)
        {
            token.throwIfCancelled(operation_name);
            try
            {
                return func(attempt);
            }
            catch (const OperationCancelledError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                if (!is_retryable(e))
                {
                    Logger::warn("Operation '" + operation_name + "' failed with non-retryable error: " + e.what());
                    throw;
                }
                if (attempt == max_attempts - 1)
                {
                    Logger::error("External call failed after " + std::to_string(max_attempts) +
                                  " attempts for operation: " + operation_name + " - " + e.what());
                    throw;
                }

                int delay_ms = (1 << attempt) * base_delay_ms;
                Logger::warn("External call failed for operation '" + operation_name +
                             "', retrying in " + std::to_string(delay_ms) + "ms (attempt " +
                             std::to_string(attempt + 1) + "/" + std::to_string(max_attempts) +
                             "): " + e.what());

                sleepCancellable(delay_ms, token, operation_name);
            }
        }
        throw std::runtime_error("All retry attempts failed for operation: " + operation_name);
    }

    template <typename Func>
    static auto retryWithBackoff(Func func, int max_attempts, const std::string &operation_name)
        -> decltype(func(0))
    {
        return retryWithBackoff(
            func, max_attempts, operation_name, [](const std::exception &)
            { return true; },
            CancellationToken());
    }

    // Circuit breaker for remote capability calls
    class CircuitBreaker
    {
    private:
        std::atomic<bool> is_open_{false};
        std::atomic<int> failure_count_{0};
        std::chrono::steady_clock::time_point last_failure_time_;
        mutable std::mutex time_mutex_;
        const int failure_threshold_;
        const std::chrono::milliseconds open_duration_;
        std::string operation_name_;

    public:
        CircuitBreaker(const std::string &operation_name, int threshold = 5, int open_duration_ms = 60000)
            : failure_threshold_(threshold), open_duration_(open_duration_ms), operation_name_(operation_name) {}

        // While open, throws OpenError without invoking func
        template <typename OpenError, typename Func>
        auto call(Func func) -> decltype(func())
        {
            if (is_open_.load())
            {
                std::chrono::steady_clock::time_point opened_at;
                {
                    std::lock_guard<std::mutex> lock(time_mutex_);
                    opened_at = last_failure_time_;
                }
                if (std::chrono::steady_clock::now() - opened_at > open_duration_)
                {
                    is_open_.store(false);
                    failure_count_.store(0);
                    Logger::info("Circuit breaker closed for operation '" + operation_name_ +
                                 "', retrying remote calls");
                }
                else
                {
                    throw OpenError("Circuit breaker is open for operation '" + operation_name_ +
                                    "' - remote calls are blocked");
                }
            }

            try
            {
                auto result = func();
                failure_count_.store(0);
                return result;
            }
            catch (const OperationCancelledError &)
            {
                throw;
            }
            catch (const std::exception &)
            {
                if (failure_count_.fetch_add(1) + 1 >= failure_threshold_ && !is_open_.load())
                {
                    {
                        std::lock_guard<std::mutex> lock(time_mutex_);
                        last_failure_time_ = std::chrono::steady_clock::now();
                    }
                    is_open_.store(true);
                    Logger::error("Circuit breaker opened for operation '" + operation_name_ +
                                  "' due to repeated failures");
                }
                throw;
            }
        }

        bool isOpen() const
        {
            return is_open_.load();
        }
        int getFailureCount() const
        {
            return failure_count_.load();
        }
        std::string getOperationName() const
        {
            return operation_name_;
        }
    };

    // Graceful degradation for non-critical operations
    template <typename Func, typename FallbackFunc>
    static auto callWithFallback(Func primary_func, FallbackFunc fallback_func, const std::string &operation_name)
        -> decltype(primary_func())
    {
        try
        {
            return primary_func();
        }
        catch (const OperationCancelledError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            Logger::warn("Primary operation '" + operation_name + "' failed, using fallback: " + e.what());
            try
            {
                return fallback_func(e);
            }
            catch (const std::exception &fallback_e)
            {
                Logger::error("Both primary and fallback operations failed for '" + operation_name +
                              "': " + fallback_e.what());
                throw;
            }
        }
    }

private:
    static void sleepCancellable(int delay_ms, const CancellationToken &token, const std::string &operation_name)
    {
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        while (std::chrono::steady_clock::now() < until)
        {
            token.throwIfCancelled(operation_name);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
};
