#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include "core/verification_errors.hpp"
#include "database/persistent_store.hpp"

/**
 * @brief PersistentStore test double with switchable write and read failures
 */
class InMemoryStore : public PersistentStore
{
public:
    std::atomic<bool> fail_result_writes{false};
    std::atomic<bool> fail_artifact_writes{false};
    std::atomic<bool> fail_asset_writes{false};
    std::atomic<bool> fail_hash_listing{false};

    DBOpResult save(const ComplaintRecord &record) override
    {
        if (fail_asset_writes)
            return DBOpResult(false, "disk full");
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = complaints_.find(record.complaint_id);
        std::string previous_phash = existing != complaints_.end() ? existing->second.phash : std::string();
        complaints_[record.complaint_id] = record;
        if (record.phash.empty())
            complaints_[record.complaint_id].phash = previous_phash;
        return DBOpResult();
    }

    DBOpResult save(const ProofRecord &record) override
    {
        if (fail_asset_writes)
            return DBOpResult(false, "disk full");
        std::lock_guard<std::mutex> lock(mutex_);
        if (complaints_.find(record.complaint_id) == complaints_.end())
            return DBOpResult(false, "FOREIGN KEY constraint failed");
        auto existing = proofs_.find(record.proof_id);
        std::string previous_phash = existing != proofs_.end() ? existing->second.phash : std::string();
        proofs_[record.proof_id] = record;
        if (record.phash.empty())
            proofs_[record.proof_id].phash = previous_phash;
        return DBOpResult();
    }

    DBOpResult save(const VerificationRecord &record) override
    {
        if (fail_result_writes)
            return DBOpResult(false, "database is locked");
        std::lock_guard<std::mutex> lock(mutex_);
        results_[record.result_id] = record;
        return DBOpResult();
    }

    DBOpResult save(const ArtifactRecord &record) override
    {
        if (fail_artifact_writes)
            return DBOpResult(false, "database is locked");
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_[record.artifact_id] = record;
        return DBOpResult();
    }

    DBOpResult save(const ReviewDecision &decision) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = results_.find(decision.result_id);
        if (result == results_.end())
            return DBOpResult(false, "Unknown verification result: " + decision.result_id);
        result->second.status = ReviewStatus::REVIEWED;
        decisions_[decision.result_id].push_back(decision);
        return DBOpResult();
    }

    std::optional<ComplaintRecord> getComplaintById(const std::string &complaint_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = complaints_.find(complaint_id);
        if (found == complaints_.end())
            return std::nullopt;
        return found->second;
    }

    std::optional<ProofRecord> getProofById(const std::string &proof_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = proofs_.find(proof_id);
        if (found == proofs_.end())
            return std::nullopt;
        return found->second;
    }

    std::optional<VerificationRecord> getVerificationResultById(const std::string &result_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = results_.find(result_id);
        if (found == results_.end())
            return std::nullopt;
        return found->second;
    }

    std::optional<ArtifactRecord> getArtifactById(const std::string &artifact_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = artifacts_.find(artifact_id);
        if (found == artifacts_.end())
            return std::nullopt;
        return found->second;
    }

    std::vector<ReviewDecision> getReviewDecisions(const std::string &result_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = decisions_.find(result_id);
        if (found == decisions_.end())
            return {};
        return found->second;
    }

    std::vector<VerificationRecord> listPendingReview() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<VerificationRecord> pending;
        for (const auto &entry : results_)
        {
            if (entry.second.status == ReviewStatus::PENDING_REVIEW)
                pending.push_back(entry.second);
        }
        return pending;
    }

    std::vector<ProofHashEntry> listProofHashes() override
    {
        if (fail_hash_listing)
            throw StorageReadError("no such table: proofs");
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProofHashEntry> hashes;
        for (const auto &entry : proofs_)
        {
            if (!entry.second.phash.empty())
                hashes.push_back(ProofHashEntry{entry.second.proof_id, entry.second.complaint_id, entry.second.phash});
        }
        return hashes;
    }

    size_t resultCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return results_.size();
    }

private:
    std::mutex mutex_;
    std::map<std::string, ComplaintRecord> complaints_;
    std::map<std::string, ProofRecord> proofs_;
    std::map<std::string, VerificationRecord> results_;
    std::map<std::string, ArtifactRecord> artifacts_;
    std::map<std::string, std::vector<ReviewDecision>> decisions_;
};
