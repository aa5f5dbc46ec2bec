#include "database/database_access_queue.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

DatabaseAccessQueue::DatabaseAccessQueue(DatabaseManager &dbMan)
    : db_manager_(dbMan)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

size_t DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    size_t operation_id = next_operation_id_.fetch_add(1);
    pending_write_operations_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(std::make_pair(std::move(operation), operation_id));
    }
    queue_cv_.notify_one();
    Logger::trace("Enqueued database write operation " + std::to_string(operation_id));
    return operation_id;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(std::make_pair(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();

    return future;
}

WriteOperationResult DatabaseAccessQueue::waitForOperation(size_t operation_id)
{
    std::unique_lock<std::mutex> lock(results_mutex_);
    results_cv_.wait(lock, [this, operation_id]
                     { return operation_results_.count(operation_id) > 0; });
    WriteOperationResult result = operation_results_[operation_id];
    operation_results_.erase(operation_id);
    return result;
}

void DatabaseAccessQueue::wait_for_completion(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto done = [this]
    { return operation_queue_.empty() && pending_write_operations_.load() == 0; };

    if (!queue_cv_.wait_for(lock, timeout, done))
    {
        Logger::warn("Database access queue wait_for_completion exceeded " + std::to_string(timeout.count()) +
                     "ms - continuing to wait for operations to complete");
        queue_cv_.wait(lock, done);
    }
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        std::variant<std::pair<WriteOperation, size_t>, std::pair<ReadOperation, std::promise<std::any>>> operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (should_stop_ && operation_queue_.empty())
            {
                break;
            }

            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
        }

        if (std::holds_alternative<std::pair<WriteOperation, size_t>>(operation))
        {
            auto [write_op, operation_id] = std::get<std::pair<WriteOperation, size_t>>(std::move(operation));
            WriteOperationResult result;
            try
            {
                result = write_op(db_manager_);
            }
            catch (const std::exception &e)
            {
                Logger::error("Database write operation " + std::to_string(operation_id) + " failed: " + std::string(e.what()));
                result = WriteOperationResult::Failure(e.what());
            }
            {
                std::lock_guard<std::mutex> lock(results_mutex_);
                operation_results_[operation_id] = result;
            }
            results_cv_.notify_all();
            pending_write_operations_.fetch_sub(1);
        }
        else
        {
            auto [read_op, promise] = std::get<std::pair<ReadOperation, std::promise<std::any>>>(std::move(operation));
            try
            {
                promise.set_value(read_op(db_manager_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database read operation failed: " + std::string(e.what()));
                promise.set_exception(std::current_exception());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
        }
        queue_cv_.notify_all();
    }
}
