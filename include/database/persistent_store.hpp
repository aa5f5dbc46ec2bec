#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

struct ComplaintRecord
{
    std::string complaint_id;
    std::string content_hash;
    std::string description;
    std::string issue_type;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string reported_at;
    std::string phash; // 16 hex digits; empty until decoded
    int width = 0;
    int height = 0;
    std::vector<uint8_t> image_bytes;
};

struct ProofRecord
{
    std::string proof_id;
    std::string complaint_id;
    std::string content_hash;
    std::string worker_id;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string submitted_at;
    std::string phash; // Filled in by the first verification run
    std::vector<uint8_t> image_bytes;
};

/// Review queue status of a stored verification result
namespace ReviewStatus
{
    constexpr const char *AUTO_APPROVED = "AUTO_APPROVED";
    constexpr const char *AUTO_REJECTED = "AUTO_REJECTED";
    constexpr const char *PENDING_REVIEW = "PENDING_REVIEW";
    constexpr const char *REVIEWED = "REVIEWED";
}

struct VerificationRecord
{
    std::string result_id;
    std::string complaint_id;
    std::string proof_id;
    double composite_score = 0.0;
    std::string recommendation;
    std::string status;
    std::string result_json;
    std::string created_at;
};

struct ReviewDecision
{
    std::string result_id;
    std::string decision; // VERIFIED or REJECTED
    std::string reviewer_id;
    std::string notes;
    std::string decided_at;
};

struct ArtifactRecord
{
    std::string artifact_id;
    std::string owner_id;
    std::string kind;
    std::string content_type;
    std::vector<uint8_t> data;
};

struct ProofHashEntry
{
    std::string proof_id;
    std::string complaint_id;
    std::string phash;
};

/**
 * @brief Durable record storage used by the verification pipeline
 *
 * Writes report failure through DBOpResult and never throw. Reads throw StorageReadError when the backing
 * store cannot be queried; a missing record is std::nullopt.
 */
class PersistentStore
{
public:
    virtual ~PersistentStore() = default;

    virtual DBOpResult save(const ComplaintRecord &record) = 0;
    virtual DBOpResult save(const ProofRecord &record) = 0;
    virtual DBOpResult save(const VerificationRecord &record) = 0;
    virtual DBOpResult save(const ArtifactRecord &record) = 0;

    /// Stores the decision and marks the result REVIEWED. Fails for unknown result ids.
    virtual DBOpResult save(const ReviewDecision &decision) = 0;

    virtual std::optional<ComplaintRecord> getComplaintById(const std::string &complaint_id) = 0;
    virtual std::optional<ProofRecord> getProofById(const std::string &proof_id) = 0;
    virtual std::optional<VerificationRecord> getVerificationResultById(const std::string &result_id) = 0;
    virtual std::optional<ArtifactRecord> getArtifactById(const std::string &artifact_id) = 0;
    virtual std::vector<ReviewDecision> getReviewDecisions(const std::string &result_id) = 0;

    /// Results with status PENDING_REVIEW, newest first.
    virtual std::vector<VerificationRecord> listPendingReview() = 0;

    /// Perceptual hashes of every proof that has been through a verification run.
    virtual std::vector<ProofHashEntry> listProofHashes() = 0;
};
