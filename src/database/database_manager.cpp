#include "database/database_manager.hpp"
#include "database/database_access_queue.hpp"
#include "logging/logger.hpp"
#include <sqlite3.h>
#include <stdexcept>

std::unique_ptr<DatabaseManager> DatabaseManager::instance_ = nullptr;
std::mutex DatabaseManager::instance_mutex_;

namespace
{
    void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
    {
        sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    // Empty strings are stored as NULL
    void bindNullableText(sqlite3_stmt *stmt, int index, const std::string &value)
    {
        if (value.empty())
            sqlite3_bind_null(stmt, index);
        else
            sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
    {
        if (value)
            sqlite3_bind_double(stmt, index, *value);
        else
            sqlite3_bind_null(stmt, index);
    }

    void bindBlob(sqlite3_stmt *stmt, int index, const std::vector<uint8_t> &data)
    {
        if (data.empty())
            sqlite3_bind_null(stmt, index);
        else
            sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
    }

    std::string columnText(sqlite3_stmt *stmt, int index)
    {
        const unsigned char *text = sqlite3_column_text(stmt, index);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
    {
        if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
            return std::nullopt;
        return sqlite3_column_double(stmt, index);
    }

    std::vector<uint8_t> columnBlob(sqlite3_stmt *stmt, int index)
    {
        const void *blob = sqlite3_column_blob(stmt, index);
        int size = sqlite3_column_bytes(stmt, index);
        if (!blob || size <= 0)
            return {};
        const uint8_t *bytes = static_cast<const uint8_t *>(blob);
        return std::vector<uint8_t>(bytes, bytes + size);
    }

    sqlite3_stmt *prepareOrThrow(sqlite3 *db, const std::string &sql)
    {
        if (!db)
        {
            throw StorageReadError("Database not initialized");
        }
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            throw StorageReadError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
        return stmt;
    }

    VerificationRecord readVerificationRow(sqlite3_stmt *stmt)
    {
        VerificationRecord record;
        record.result_id = columnText(stmt, 0);
        record.complaint_id = columnText(stmt, 1);
        record.proof_id = columnText(stmt, 2);
        record.composite_score = sqlite3_column_double(stmt, 3);
        record.recommendation = columnText(stmt, 4);
        record.status = columnText(stmt, 5);
        record.result_json = columnText(stmt, 6);
        record.created_at = columnText(stmt, 7);
        return record;
    }
}

DatabaseManager &DatabaseManager::getInstance(const std::string &db_path)
{
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_)
    {
        if (db_path.empty())
        {
            throw std::runtime_error("DatabaseManager::getInstance called with empty db_path for first initialization");
        }
        instance_ = std::unique_ptr<DatabaseManager>(new DatabaseManager(db_path));
    }
    else if (!db_path.empty() && instance_->db_path_ != db_path)
    {
        Logger::warn("DatabaseManager singleton already initialized with different path: " +
                     instance_->db_path_ + " vs " + db_path);
    }
    return *instance_;
}

void DatabaseManager::resetForTesting()
{
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (instance_)
    {
        instance_->waitForWrites(); // Ensure all writes complete
        instance_.reset();
    }
}

void DatabaseManager::shutdown()
{
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (instance_)
    {
        instance_->waitForWrites(); // Ensure all writes complete
        instance_.reset();
    }
}

DatabaseManager::DatabaseManager(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    Logger::info("DatabaseManager constructor called for: " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    // Enqueue the open operation and wait for it to complete
    auto open_future = access_queue_->enqueueRead([db_path](DatabaseManager &dbMan)
                                                  {
        int rc = sqlite3_open(db_path.c_str(), &dbMan.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(dbMan.db_)));
            sqlite3_close(dbMan.db_);
            dbMan.db_ = nullptr;
            return false;
        }
        Logger::info("Database opened successfully: " + db_path);
        rc = sqlite3_exec(dbMan.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        sqlite3_exec(dbMan.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_busy_timeout(dbMan.db_, 5000);

        rc = sqlite3_exec(dbMan.db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable foreign keys: " + std::string(sqlite3_errmsg(dbMan.db_)));
        }
        return true; });

    try
    {
        open_ = std::any_cast<bool>(open_future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Database open failed in access queue: " + std::string(e.what()));
        open_ = false;
    }
    if (!open_)
    {
        Logger::error("Database open failed: " + db_path);
        return;
    }
    initialize();
    Logger::info("DatabaseManager initialization completed");
}

DatabaseManager::~DatabaseManager()
{
    Logger::info("DatabaseManager destructor called");
    if (access_queue_)
    {
        auto close_future = access_queue_->enqueueRead([](DatabaseManager &dbMan)
                                                       {
            if (dbMan.db_)
            {
                sqlite3_close(dbMan.db_);
                dbMan.db_ = nullptr;
                Logger::info("Database connection closed");
            }
            return true; });
        try
        {
            close_future.get();
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to close database: " + std::string(e.what()));
        }
        access_queue_->stop();
    }
}

void DatabaseManager::waitForWrites()
{
    if (access_queue_)
    {
        Logger::debug("Waiting for database writes to complete");
        access_queue_->wait_for_completion();
        Logger::debug("Database writes completed");
    }
}

void DatabaseManager::initialize()
{
    Logger::info("Initializing database tables");
    if (!createComplaintsTable())
        Logger::error("Failed to create complaints table");
    if (!createProofsTable())
        Logger::error("Failed to create proofs table");
    if (!createVerificationResultsTable())
        Logger::error("Failed to create verification_results table");
    if (!createReviewDecisionsTable())
        Logger::error("Failed to create review_decisions table");
    if (!createArtifactsTable())
        Logger::error("Failed to create artifacts table");
    Logger::info("Database tables initialization completed");
}

bool DatabaseManager::createComplaintsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS complaints (
            complaint_id TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL,
            description TEXT,
            issue_type TEXT,
            latitude REAL,
            longitude REAL,
            reported_at TEXT,
            phash TEXT,                   -- 16 hex digit perceptual hash of the normalized image
            width INTEGER,
            height INTEGER,
            image BLOB,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        )
    )";
    return executeStatement(sql).success;
}

bool DatabaseManager::createProofsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS proofs (
            proof_id TEXT PRIMARY KEY,
            complaint_id TEXT NOT NULL,
            content_hash TEXT NOT NULL,
            worker_id TEXT,
            latitude REAL,
            longitude REAL,
            submitted_at TEXT,
            phash TEXT,
            image BLOB,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            FOREIGN KEY (complaint_id) REFERENCES complaints(complaint_id) ON DELETE CASCADE
        )
    )";
    if (!executeStatement(sql).success)
        return false;
    return executeStatement("CREATE INDEX IF NOT EXISTS idx_proofs_phash ON proofs(phash)").success;
}

bool DatabaseManager::createVerificationResultsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS verification_results (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            result_id TEXT NOT NULL UNIQUE,
            complaint_id TEXT NOT NULL,
            proof_id TEXT NOT NULL,
            composite_score REAL NOT NULL,
            recommendation TEXT NOT NULL,
            status TEXT NOT NULL,
            result_json TEXT NOT NULL,
            created_at TEXT NOT NULL
        )
    )";
    if (!executeStatement(sql).success)
        return false;
    return executeStatement("CREATE INDEX IF NOT EXISTS idx_results_status ON verification_results(status, created_at)").success;
}

bool DatabaseManager::createReviewDecisionsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS review_decisions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            result_id TEXT NOT NULL,
            decision TEXT NOT NULL CHECK (decision IN ('VERIFIED', 'REJECTED')),
            reviewer_id TEXT,
            notes TEXT,
            decided_at TEXT NOT NULL,
            FOREIGN KEY (result_id) REFERENCES verification_results(result_id) ON DELETE CASCADE
        )
    )";
    return executeStatement(sql).success;
}

bool DatabaseManager::createArtifactsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS artifacts (
            artifact_id TEXT PRIMARY KEY,
            owner_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            content_type TEXT NOT NULL,
            data BLOB,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        )
    )";
    return executeStatement(sql).success;
}

DBOpResult DatabaseManager::executeStatement(const std::string &sql)
{
    return runWrite("executeStatement", [sql](DatabaseManager &dbMan)
                    {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(dbMan.db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string error = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            return WriteOperationResult::Failure("SQL error: " + error);
        }
        return WriteOperationResult(); });
}

DBOpResult DatabaseManager::runWrite(const std::string &op_name, WriteOperation operation)
{
    if (!open_ || !access_queue_)
    {
        Logger::error(op_name + " failed: database not initialized");
        return DBOpResult(false, "Database not initialized");
    }

    size_t operation_id = access_queue_->enqueueWrite([operation](DatabaseManager &dbMan)
                                                      {
        if (!dbMan.db_)
        {
            return WriteOperationResult::Failure("Database not initialized");
        }
        return operation(dbMan); });

    WriteOperationResult result = access_queue_->waitForOperation(operation_id);
    if (!result.success)
    {
        Logger::error(op_name + " failed: " + result.error_message);
        return DBOpResult(false, result.error_message);
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::save(const ComplaintRecord &record)
{
    Logger::debug("Storing complaint: " + record.complaint_id);
    return runWrite("save(complaint)", [record](DatabaseManager &dbMan)
                    {
        const std::string sql = R"(
            INSERT INTO complaints (complaint_id, content_hash, description, issue_type, latitude, longitude,
                                    reported_at, phash, width, height, image)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(complaint_id) DO UPDATE SET
                content_hash = excluded.content_hash,
                description = excluded.description,
                issue_type = excluded.issue_type,
                latitude = excluded.latitude,
                longitude = excluded.longitude,
                reported_at = excluded.reported_at,
                image = excluded.image,
                phash = COALESCE(excluded.phash, complaints.phash),
                width = excluded.width,
                height = excluded.height
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, record.complaint_id);
        bindText(stmt, 2, record.content_hash);
        bindNullableText(stmt, 3, record.description);
        bindNullableText(stmt, 4, record.issue_type);
        bindOptionalDouble(stmt, 5, record.latitude);
        bindOptionalDouble(stmt, 6, record.longitude);
        bindNullableText(stmt, 7, record.reported_at);
        bindNullableText(stmt, 8, record.phash);
        sqlite3_bind_int(stmt, 9, record.width);
        sqlite3_bind_int(stmt, 10, record.height);
        bindBlob(stmt, 11, record.image_bytes);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure(std::string("Failed to store complaint: ") + sqlite3_errmsg(dbMan.db_));
        }
        return WriteOperationResult(); });
}

DBOpResult DatabaseManager::save(const ProofRecord &record)
{
    Logger::debug("Storing proof: " + record.proof_id + " for complaint " + record.complaint_id);
    return runWrite("save(proof)", [record](DatabaseManager &dbMan)
                    {
        const std::string sql = R"(
            INSERT INTO proofs (proof_id, complaint_id, content_hash, worker_id, latitude, longitude,
                                submitted_at, phash, image)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(proof_id) DO UPDATE SET
                complaint_id = excluded.complaint_id,
                content_hash = excluded.content_hash,
                worker_id = excluded.worker_id,
                latitude = excluded.latitude,
                longitude = excluded.longitude,
                submitted_at = excluded.submitted_at,
                image = excluded.image,
                phash = COALESCE(excluded.phash, proofs.phash)
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, record.proof_id);
        bindText(stmt, 2, record.complaint_id);
        bindText(stmt, 3, record.content_hash);
        bindNullableText(stmt, 4, record.worker_id);
        bindOptionalDouble(stmt, 5, record.latitude);
        bindOptionalDouble(stmt, 6, record.longitude);
        bindNullableText(stmt, 7, record.submitted_at);
        bindNullableText(stmt, 8, record.phash);
        bindBlob(stmt, 9, record.image_bytes);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure(std::string("Failed to store proof: ") + sqlite3_errmsg(dbMan.db_));
        }
        return WriteOperationResult(); });
}

DBOpResult DatabaseManager::save(const VerificationRecord &record)
{
    Logger::debug("Storing verification result: " + record.result_id + " (" + record.status + ")");
    return runWrite("save(verification_result)", [record](DatabaseManager &dbMan)
                    {
        const std::string sql = R"(
            INSERT INTO verification_results (result_id, complaint_id, proof_id, composite_score, recommendation,
                                              status, result_json, created_at)
            VALUES (?, ?, ?, ?, ?, ?, ?, COALESCE(?, strftime('%Y-%m-%dT%H:%M:%fZ', 'now')))
            ON CONFLICT(result_id) DO UPDATE SET
                composite_score = excluded.composite_score,
                recommendation = excluded.recommendation,
                status = excluded.status,
                result_json = excluded.result_json
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, record.result_id);
        bindText(stmt, 2, record.complaint_id);
        bindText(stmt, 3, record.proof_id);
        sqlite3_bind_double(stmt, 4, record.composite_score);
        bindText(stmt, 5, record.recommendation);
        bindText(stmt, 6, record.status);
        bindText(stmt, 7, record.result_json);
        bindNullableText(stmt, 8, record.created_at);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure(std::string("Failed to store verification result: ") + sqlite3_errmsg(dbMan.db_));
        }
        return WriteOperationResult(); });
}

DBOpResult DatabaseManager::save(const ArtifactRecord &record)
{
    Logger::debug("Storing artifact: " + record.artifact_id + " (" + std::to_string(record.data.size()) + " bytes)");
    return runWrite("save(artifact)", [record](DatabaseManager &dbMan)
                    {
        const std::string sql = R"(
            INSERT INTO artifacts (artifact_id, owner_id, kind, content_type, data)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(artifact_id) DO UPDATE SET
                kind = excluded.kind,
                content_type = excluded.content_type,
                data = excluded.data
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(dbMan.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, record.artifact_id);
        bindText(stmt, 2, record.owner_id);
        bindText(stmt, 3, record.kind);
        bindText(stmt, 4, record.content_type);
        bindBlob(stmt, 5, record.data);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure(std::string("Failed to store artifact: ") + sqlite3_errmsg(dbMan.db_));
        }
        return WriteOperationResult(); });
}

DBOpResult DatabaseManager::save(const ReviewDecision &decision)
{
    if (decision.decision != "VERIFIED" && decision.decision != "REJECTED")
    {
        return DBOpResult(false, "Invalid review decision: " + decision.decision);
    }
    Logger::info("Recording review decision " + decision.decision + " for result " + decision.result_id);
    return runWrite("save(review_decision)", [decision](DatabaseManager &dbMan)
                    {
        if (sqlite3_exec(dbMan.db_, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to begin transaction: ") + sqlite3_errmsg(dbMan.db_));
        }
        auto rollback = [&dbMan](const std::string &msg)
        {
            sqlite3_exec(dbMan.db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            return WriteOperationResult::Failure(msg);
        };

        sqlite3_stmt *stmt = nullptr;
        const std::string update_sql = "UPDATE verification_results SET status = ? WHERE result_id = ?";
        if (sqlite3_prepare_v2(dbMan.db_, update_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return rollback(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, ReviewStatus::REVIEWED);
        bindText(stmt, 2, decision.result_id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return rollback(std::string("Failed to update result status: ") + sqlite3_errmsg(dbMan.db_));
        }
        if (sqlite3_changes(dbMan.db_) == 0)
        {
            return rollback("Unknown verification result: " + decision.result_id);
        }

        const std::string insert_sql = R"(
            INSERT INTO review_decisions (result_id, decision, reviewer_id, notes, decided_at)
            VALUES (?, ?, ?, ?, COALESCE(?, strftime('%Y-%m-%dT%H:%M:%fZ', 'now')))
        )";
        if (sqlite3_prepare_v2(dbMan.db_, insert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return rollback(std::string("Failed to prepare statement: ") + sqlite3_errmsg(dbMan.db_));
        }
        bindText(stmt, 1, decision.result_id);
        bindText(stmt, 2, decision.decision);
        bindNullableText(stmt, 3, decision.reviewer_id);
        bindNullableText(stmt, 4, decision.notes);
        bindNullableText(stmt, 5, decision.decided_at);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return rollback(std::string("Failed to store review decision: ") + sqlite3_errmsg(dbMan.db_));
        }

        if (sqlite3_exec(dbMan.db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            return rollback(std::string("Failed to commit review decision: ") + sqlite3_errmsg(dbMan.db_));
        }
        return WriteOperationResult(); });
}

std::optional<ComplaintRecord> DatabaseManager::getComplaintById(const std::string &complaint_id)
{
    return runRead<std::optional<ComplaintRecord>>("getComplaintById", [complaint_id](DatabaseManager &dbMan)
                                                   {
        const std::string sql = R"(
            SELECT complaint_id, content_hash, description, issue_type, latitude, longitude, reported_at,
                   phash, width, height, image
            FROM complaints WHERE complaint_id = ?
        )";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, complaint_id);
        std::optional<ComplaintRecord> result;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            ComplaintRecord record;
            record.complaint_id = columnText(stmt, 0);
            record.content_hash = columnText(stmt, 1);
            record.description = columnText(stmt, 2);
            record.issue_type = columnText(stmt, 3);
            record.latitude = columnOptionalDouble(stmt, 4);
            record.longitude = columnOptionalDouble(stmt, 5);
            record.reported_at = columnText(stmt, 6);
            record.phash = columnText(stmt, 7);
            record.width = sqlite3_column_int(stmt, 8);
            record.height = sqlite3_column_int(stmt, 9);
            record.image_bytes = columnBlob(stmt, 10);
            result = std::move(record);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to read complaint: ") + sqlite3_errmsg(dbMan.db_));
        }
        return result; });
}

std::optional<ProofRecord> DatabaseManager::getProofById(const std::string &proof_id)
{
    return runRead<std::optional<ProofRecord>>("getProofById", [proof_id](DatabaseManager &dbMan)
                                               {
        const std::string sql = R"(
            SELECT proof_id, complaint_id, content_hash, worker_id, latitude, longitude, submitted_at, phash, image
            FROM proofs WHERE proof_id = ?
        )";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, proof_id);
        std::optional<ProofRecord> result;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            ProofRecord record;
            record.proof_id = columnText(stmt, 0);
            record.complaint_id = columnText(stmt, 1);
            record.content_hash = columnText(stmt, 2);
            record.worker_id = columnText(stmt, 3);
            record.latitude = columnOptionalDouble(stmt, 4);
            record.longitude = columnOptionalDouble(stmt, 5);
            record.submitted_at = columnText(stmt, 6);
            record.phash = columnText(stmt, 7);
            record.image_bytes = columnBlob(stmt, 8);
            result = std::move(record);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to read proof: ") + sqlite3_errmsg(dbMan.db_));
        }
        return result; });
}

std::optional<VerificationRecord> DatabaseManager::getVerificationResultById(const std::string &result_id)
{
    return runRead<std::optional<VerificationRecord>>("getVerificationResultById", [result_id](DatabaseManager &dbMan)
                                                      {
        const std::string sql = R"(
            SELECT result_id, complaint_id, proof_id, composite_score, recommendation, status, result_json, created_at
            FROM verification_results WHERE result_id = ?
        )";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, result_id);
        std::optional<VerificationRecord> result;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            result = readVerificationRow(stmt);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to read verification result: ") + sqlite3_errmsg(dbMan.db_));
        }
        return result; });
}

std::optional<ArtifactRecord> DatabaseManager::getArtifactById(const std::string &artifact_id)
{
    return runRead<std::optional<ArtifactRecord>>("getArtifactById", [artifact_id](DatabaseManager &dbMan)
                                                  {
        const std::string sql = "SELECT artifact_id, owner_id, kind, content_type, data FROM artifacts WHERE artifact_id = ?";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, artifact_id);
        std::optional<ArtifactRecord> result;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            ArtifactRecord record;
            record.artifact_id = columnText(stmt, 0);
            record.owner_id = columnText(stmt, 1);
            record.kind = columnText(stmt, 2);
            record.content_type = columnText(stmt, 3);
            record.data = columnBlob(stmt, 4);
            result = std::move(record);
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to read artifact: ") + sqlite3_errmsg(dbMan.db_));
        }
        return result; });
}

std::vector<ReviewDecision> DatabaseManager::getReviewDecisions(const std::string &result_id)
{
    return runRead<std::vector<ReviewDecision>>("getReviewDecisions", [result_id](DatabaseManager &dbMan)
                                                {
        const std::string sql = R"(
            SELECT result_id, decision, reviewer_id, notes, decided_at
            FROM review_decisions WHERE result_id = ? ORDER BY id
        )";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, result_id);
        std::vector<ReviewDecision> decisions;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ReviewDecision decision;
            decision.result_id = columnText(stmt, 0);
            decision.decision = columnText(stmt, 1);
            decision.reviewer_id = columnText(stmt, 2);
            decision.notes = columnText(stmt, 3);
            decision.decided_at = columnText(stmt, 4);
            decisions.push_back(std::move(decision));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to read review decisions: ") + sqlite3_errmsg(dbMan.db_));
        }
        return decisions; });
}

std::vector<VerificationRecord> DatabaseManager::listPendingReview()
{
    return runRead<std::vector<VerificationRecord>>("listPendingReview", [](DatabaseManager &dbMan)
                                                    {
        const std::string sql = R"(
            SELECT result_id, complaint_id, proof_id, composite_score, recommendation, status, result_json, created_at
            FROM verification_results WHERE status = ?
            ORDER BY created_at DESC, id DESC
        )";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        bindText(stmt, 1, ReviewStatus::PENDING_REVIEW);
        std::vector<VerificationRecord> records;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            records.push_back(readVerificationRow(stmt));
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to list pending reviews: ") + sqlite3_errmsg(dbMan.db_));
        }
        return records; });
}

std::vector<ProofHashEntry> DatabaseManager::listProofHashes()
{
    return runRead<std::vector<ProofHashEntry>>("listProofHashes", [](DatabaseManager &dbMan)
                                                {
        const std::string sql = "SELECT proof_id, complaint_id, phash FROM proofs WHERE phash IS NOT NULL";
        sqlite3_stmt *stmt = prepareOrThrow(dbMan.db_, sql);
        std::vector<ProofHashEntry> entries;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            entries.push_back(ProofHashEntry{columnText(stmt, 0), columnText(stmt, 1), columnText(stmt, 2)});
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw StorageReadError(std::string("Failed to list proof hashes: ") + sqlite3_errmsg(dbMan.db_));
        }
        return entries; });
}
