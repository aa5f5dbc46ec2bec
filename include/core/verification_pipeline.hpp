#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/call_context.hpp"
#include "core/embedding_generator.hpp"
#include "core/image_processor.hpp"
#include "core/manipulation_detector.hpp"
#include "core/result_cache.hpp"
#include "core/scoring_engine.hpp"
#include "core/semantic_verifier.hpp"
#include "core/verification_result.hpp"
#include "database/persistent_store.hpp"
#include "database/vector_index.hpp"

struct PipelinePolicy
{
    GridShape grid;
    ImageCodecLimits limits;
    int recycled_max_distance = 6; // Hamming bits; 6/64 is similarity >= 0.90
    double max_location_distance_m = 50.0;
    size_t normalized_cache_capacity = 32; // Decoded images, up to max_edge^2 * 3 bytes each
};

struct ComplaintMetadata
{
    std::string description;
    std::string issue_type;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string reported_at;
};

struct ProofMetadata
{
    std::string worker_id;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string submitted_at;
};

/**
 * @brief Orchestrates one before/after verification
 *
 * Runs embeddings, manipulation analysis and the semantic judgment concurrently on oneTBB, fuses them
 * through the ScoringEngine and persists the result. Only decode failures, missing assets, store read
 * failures and cancellation abort a run; every other failure becomes a caveat on the result.
 */
class VerificationPipeline
{
public:
    VerificationPipeline(std::shared_ptr<EmbeddingGenerator> embeddings,
                         std::shared_ptr<ManipulationDetector> detector,
                         std::shared_ptr<SemanticVerifier> verifier,
                         std::shared_ptr<ScoringEngine> scoring,
                         PersistentStore &store,
                         VectorIndex &index,
                         const PipelinePolicy &policy = PipelinePolicy());

    /**
     * @brief Validate, decode and store a complaint photo; index its embedding best effort
     * @throws DecodeError if the photo cannot be decoded
     */
    AssetRef ingestComplaint(const std::vector<uint8_t> &image_bytes, const ComplaintMetadata &metadata,
                             const CancellationToken &token = CancellationToken());

    /**
     * @brief Store a proof photo against a complaint. Decoding is deferred to the verification run.
     * @throws DecodeError on empty or oversized input
     */
    AssetRef ingestProof(const std::vector<uint8_t> &image_bytes, const AssetRef &complaint,
                         const ProofMetadata &metadata);

    /**
     * @brief Verify a proof against its complaint
     * @throws DecodeError, AssetNotFoundError, StorageReadError, OperationCancelledError
     * @throws std::invalid_argument if the proof belongs to a different complaint
     */
    CompositeVerificationResult runVerification(const AssetRef &complaint, const AssetRef &proof,
                                                const CancellationToken &token = CancellationToken());

    std::vector<VerificationRecord> listPendingReview();

    /// Fails for unknown results and decisions other than VERIFIED or REJECTED.
    DBOpResult recordReviewDecision(const ReviewDecision &decision);

    /**
     * @brief Nearest stored complaints to a new photo by whole-image embedding
     * @throws DecodeError, EmbeddingUnavailableError, EmbeddingTimeoutError
     */
    std::vector<VectorMatch> findSimilarComplaints(const std::vector<uint8_t> &image_bytes, size_t top_k,
                                                   const CancellationToken &token = CancellationToken());

    /// Great-circle distance in meters.
    static double haversineMeters(double lat1, double lon1, double lat2, double lon2);

    const PipelinePolicy &policy() const { return policy_; }
    size_t normalizedCacheSize() const { return normalized_cache_.size(); }

private:
    NormalizedImage normalize(const std::vector<uint8_t> &bytes);

    void checkRecycled(const std::string &complaint_id, const std::string &proof_id, const PerceptualHash &hash,
                       CompositeVerificationResult &result);

    void persist(VerificationRun &run, const ProofRecord &proof, CompositeVerificationResult &result);

    void indexProof(const std::string &run_id, const std::string &proof_id, const std::string &complaint_id,
                    const std::optional<EmbeddingVector> &embedding,
                    const std::vector<EmbeddingVector> &chunk_embeddings, const std::vector<Chunk> &chunks,
                    std::vector<std::string> &caveats);

    std::shared_ptr<EmbeddingGenerator> embeddings_;
    std::shared_ptr<ManipulationDetector> detector_;
    std::shared_ptr<SemanticVerifier> verifier_;
    std::shared_ptr<ScoringEngine> scoring_;
    PersistentStore &store_;
    VectorIndex &index_;
    PipelinePolicy policy_;
    ResultCache<NormalizedImage> normalized_cache_;
};
