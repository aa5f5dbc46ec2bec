#pragma once

#include "database/database_access_queue.hpp"
#include "database/persistent_store.hpp"
#include "core/verification_errors.hpp"
#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief SQLite store for complaints, proofs, verification results, review decisions and artifacts
 *
 * Every statement runs on the single DatabaseAccessQueue worker thread.
 */
class DatabaseManager : public PersistentStore
{
public:
    static DatabaseManager &getInstance(const std::string &db_path = "");
    static void resetForTesting(); // For test isolation
    static void shutdown();        // For proper cleanup
    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;
    DatabaseManager(DatabaseManager &&) = delete;
    DatabaseManager &operator=(DatabaseManager &&) = delete;

    /**
     * @brief Destructor - closes database connection
     */
    ~DatabaseManager() override;

    /**
     * @brief Store a complaint. Re-saving an existing id refreshes its decoded metadata only.
     * @return DBOpResult with success flag and error message
     */
    DBOpResult save(const ComplaintRecord &record) override;

    /**
     * @brief Store a proof. The complaint must already exist.
     * @return DBOpResult with success flag and error message
     */
    DBOpResult save(const ProofRecord &record) override;

    DBOpResult save(const VerificationRecord &record) override;
    DBOpResult save(const ArtifactRecord &record) override;

    /**
     * @brief Store a reviewer decision and move the result to REVIEWED in one transaction
     * @return DBOpResult; fails for an unknown result id or a decision other than VERIFIED/REJECTED
     */
    DBOpResult save(const ReviewDecision &decision) override;

    std::optional<ComplaintRecord> getComplaintById(const std::string &complaint_id) override;
    std::optional<ProofRecord> getProofById(const std::string &proof_id) override;
    std::optional<VerificationRecord> getVerificationResultById(const std::string &result_id) override;
    std::optional<ArtifactRecord> getArtifactById(const std::string &artifact_id) override;
    std::vector<ReviewDecision> getReviewDecisions(const std::string &result_id) override;
    std::vector<VerificationRecord> listPendingReview() override;
    std::vector<ProofHashEntry> listProofHashes() override;

    /**
     * @brief Wait for all pending database writes to complete
     */
    void waitForWrites();

    /**
     * @brief Whether the connection was opened successfully
     */
    bool isOpen() const { return open_; }

    const std::string &getDatabasePath() const { return db_path_; }

private:
    explicit DatabaseManager(const std::string &db_path);

    /**
     * @brief Initialize database tables
     */
    void initialize();

    bool createComplaintsTable();
    bool createProofsTable();
    bool createVerificationResultsTable();
    bool createReviewDecisionsTable();
    bool createArtifactsTable();

    /**
     * @brief Execute a SQL statement that returns no rows
     */
    DBOpResult executeStatement(const std::string &sql);

    /**
     * @brief Enqueue a write and block until the worker has run it
     */
    DBOpResult runWrite(const std::string &op_name, WriteOperation operation);

    /**
     * @brief Enqueue a read and block for its value
     * @throws StorageReadError when the database is unavailable or the query fails
     */
    template <typename T>
    T runRead(const std::string &op_name, std::function<T(DatabaseManager &)> operation)
    {
        if (!open_)
        {
            throw StorageReadError(op_name + " failed: database not initialized");
        }
        auto future = access_queue_->enqueueRead([operation](DatabaseManager &dbMan) -> std::any
                                                 { return std::any(operation(dbMan)); });
        try
        {
            return std::any_cast<T>(future.get());
        }
        catch (const StorageReadError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw StorageReadError(op_name + " failed: " + std::string(e.what()));
        }
    }

    sqlite3 *db_;
    std::string db_path_;
    bool open_ = false;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;

    static std::unique_ptr<DatabaseManager> instance_;
    static std::mutex instance_mutex_;
};
