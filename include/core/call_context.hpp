#pragma once

#include "core/verification_errors.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

/**
 * @brief Shared cancellation flag. Copies observe the same flag.
 */
class CancellationToken
{
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

    void throwIfCancelled(const std::string &operation) const
    {
        if (isCancelled())
        {
            throw OperationCancelledError("Operation cancelled: " + operation);
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Deadline and cancellation token handed to every external capability call
 */
struct CallContext
{
    std::chrono::steady_clock::time_point deadline;
    CancellationToken cancel_token;

    static CallContext withTimeout(int timeout_ms, const CancellationToken &token = CancellationToken())
    {
        CallContext ctx;
        ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        ctx.cancel_token = token;
        return ctx;
    }

    bool expired() const
    {
        return std::chrono::steady_clock::now() >= deadline;
    }

    int remainingMs() const
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    }

    /**
     * @brief Sleep for up to duration_ms in short slices, stopping early on cancellation or deadline.
     * @return true if the full duration elapsed, false if the deadline passed first
     * @throws OperationCancelledError if the token is cancelled while waiting
     */
    bool waitFor(int duration_ms, const std::string &operation) const
    {
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
        while (std::chrono::steady_clock::now() < until)
        {
            cancel_token.throwIfCancelled(operation);
            if (expired())
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        cancel_token.throwIfCancelled(operation);
        return true;
    }
};
