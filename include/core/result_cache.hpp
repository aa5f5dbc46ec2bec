#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/call_context.hpp"
#include "logging/logger.hpp"

/**
 * @brief Bounded get-or-compute cache with single-flight semantics.
 *
 * Concurrent callers for the same missing key wait on the first caller's computation instead of starting
 * their own. The map lock is never held while a computation runs. Failures propagate to every waiter and
 * are not cached. A cancellation only ends the cancelled caller's request. Eviction is first-in first-out
 * once capacity is reached.
 */
template <typename Value>
class ResultCache
{
public:
    using ShouldCache = std::function<bool(const Value &)>;

    explicit ResultCache(size_t capacity = 1024) : capacity_(capacity) {}

    ResultCache(const ResultCache &) = delete;
    ResultCache &operator=(const ResultCache &) = delete;

    template <typename Compute>
    Value getOrCompute(const std::string &key, Compute compute, ShouldCache should_cache = nullptr)
    {
        return getOrCompute(key, CancellationToken(), compute, should_cache);
    }

    /**
     * @brief Get-or-compute on behalf of a caller that may be cancelled
     *
     * A waiter whose leader was cancelled retries the lookup and computes with its own closure unless its own
     * token is cancelled too. Waiting stops as soon as the caller's token is cancelled.
     * @throws OperationCancelledError if token is cancelled
     */
    template <typename Compute>
    Value getOrCompute(const std::string &key, const CancellationToken &token, Compute compute,
                       ShouldCache should_cache = nullptr)
    {
        while (true)
        {
            std::promise<Value> promise;
            std::shared_future<Value> shared;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto found = entries_.find(key);
                if (found != entries_.end())
                {
                    hits_++;
                    return found->second;
                }

                auto pending = in_flight_.find(key);
                if (pending != in_flight_.end())
                {
                    shared = pending->second;
                    coalesced_++;
                }
                else
                {
                    misses_++;
                    in_flight_.emplace(key, promise.get_future().share());
                }
            }

            if (!shared.valid())
            {
                return computeAsLeader(key, promise, compute, should_cache);
            }

            Logger::trace("Waiting on in-flight computation for cache key: " + key);
            while (shared.wait_for(std::chrono::milliseconds(5)) != std::future_status::ready)
            {
                token.throwIfCancelled("wait for " + key);
            }
            try
            {
                return shared.get();
            }
            catch (const OperationCancelledError &)
            {
                token.throwIfCancelled("wait for " + key);
                Logger::debug("In-flight computation for cache key " + key + " was cancelled by its caller, retrying");
            }
        }
    }

    std::optional<Value> get(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = entries_.find(key);
        if (found == entries_.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t hits() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t coalesced() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return coalesced_;
    }

    size_t misses() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

private:
    template <typename Compute>
    Value computeAsLeader(const std::string &key, std::promise<Value> &promise, Compute &compute,
                          const ShouldCache &should_cache)
    {
        try
        {
            Value value = compute();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
                if (!should_cache || should_cache(value))
                {
                    insertLocked(key, value);
                }
            }
            promise.set_value(value);
            return value;
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    void insertLocked(const std::string &key, const Value &value)
    {
        if (capacity_ == 0)
        {
            return;
        }
        if (entries_.find(key) == entries_.end())
        {
            while (entries_.size() >= capacity_ && !insertion_order_.empty())
            {
                entries_.erase(insertion_order_.front());
                insertion_order_.pop_front();
            }
            insertion_order_.push_back(key);
        }
        entries_[key] = value;
    }

    size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> entries_;
    std::deque<std::string> insertion_order_;
    std::unordered_map<std::string, std::shared_future<Value>> in_flight_;
    size_t hits_ = 0;
    size_t coalesced_ = 0;
    size_t misses_ = 0;
};
