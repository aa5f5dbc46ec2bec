#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <variant>

class DatabaseManager;

struct WriteOperationResult
{
    bool success;
    std::string error_message;

    WriteOperationResult(bool s = true, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(DatabaseManager &)>;
using ReadOperation = std::function<std::any(DatabaseManager &)>;

/**
 * @brief Serializes every SQLite statement onto a single worker thread
 *
 * Writes are tracked by operation id; reads deliver their result (or exception) through a future.
 */
class DatabaseAccessQueue
{
public:
    /**
     * @brief Constructor
     * @param dbMan Reference to the DatabaseManager instance
     */
    explicit DatabaseAccessQueue(DatabaseManager &dbMan);
    ~DatabaseAccessQueue();

    size_t enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);

    /**
     * @brief Block until the given write has run, then remove and return its result
     */
    WriteOperationResult waitForOperation(size_t operation_id);

    // Wait for all pending operations to complete
    void wait_for_completion(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Stop the access queue; queued operations still run before the worker exits
    void stop();

private:
    void access_thread_worker();

    DatabaseManager &db_manager_;
    std::queue<std::variant<std::pair<WriteOperation, size_t>, std::pair<ReadOperation, std::promise<std::any>>>> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_{false};

    // Track operation results by ID
    std::mutex results_mutex_;
    std::condition_variable results_cv_;
    std::map<size_t, WriteOperationResult> operation_results_;
    std::atomic<size_t> next_operation_id_{0};
    std::atomic<size_t> pending_write_operations_{0};
};
