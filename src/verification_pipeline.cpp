#include "core/verification_pipeline.hpp"
#include "core/verification_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <tbb/task_group.h>
#include <cmath>
#include <stdexcept>

namespace
{
    constexpr double kEarthRadiusMeters = 6371000.0;
    constexpr double kPi = 3.14159265358979323846;

    // Outcome of one concurrent analysis task
    struct TaskOutcome
    {
        bool cancelled = false;
        std::string caveat;
    };

    template <typename Func>
    void runGuarded(const std::string &label, TaskOutcome &outcome, Func func)
    {
        try
        {
            func();
        }
        catch (const OperationCancelledError &)
        {
            outcome.cancelled = true;
        }
        catch (const VerificationError &e)
        {
            outcome.caveat = label + ": " + e.what();
        }
        catch (const cv::Exception &e)
        {
            outcome.caveat = label + ": OpenCV error: " + e.what();
        }
        catch (const std::exception &e)
        {
            outcome.caveat = label + ": " + e.what();
        }
    }
}

VerificationPipeline::VerificationPipeline(std::shared_ptr<EmbeddingGenerator> embeddings,
                                           std::shared_ptr<ManipulationDetector> detector,
                                           std::shared_ptr<SemanticVerifier> verifier,
                                           std::shared_ptr<ScoringEngine> scoring,
                                           PersistentStore &store,
                                           VectorIndex &index,
                                           const PipelinePolicy &policy)
    : embeddings_(std::move(embeddings)),
      detector_(std::move(detector)),
      verifier_(std::move(verifier)),
      scoring_(std::move(scoring)),
      store_(store),
      index_(index),
      policy_(policy),
      normalized_cache_(policy.normalized_cache_capacity)
{
    if (!embeddings_ || !detector_ || !verifier_ || !scoring_)
    {
        throw std::invalid_argument("VerificationPipeline requires embedding, manipulation, semantic and scoring components");
    }
    if (policy_.grid.rows < 1 || policy_.grid.cols < 1)
    {
        throw std::invalid_argument("Chunk grid must be at least 1x1");
    }
}

double VerificationPipeline::haversineMeters(double lat1, double lon1, double lat2, double lon2)
{
    const double to_rad = kPi / 180.0;
    double dlat = (lat2 - lat1) * to_rad;
    double dlon = (lon2 - lon1) * to_rad;
    double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1 * to_rad) * std::cos(lat2 * to_rad) * std::sin(dlon / 2) * std::sin(dlon / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return kEarthRadiusMeters * c;
}

NormalizedImage VerificationPipeline::normalize(const std::vector<uint8_t> &bytes)
{
    if (bytes.empty())
    {
        throw DecodeError("Empty image payload");
    }
    const std::string key = ImageProcessor::generateHash(bytes);
    return normalized_cache_.getOrCompute(key, [&]()
                                          { return ImageProcessor::decodeAndNormalize(bytes, policy_.limits); });
}

AssetRef VerificationPipeline::ingestComplaint(const std::vector<uint8_t> &image_bytes, const ComplaintMetadata &metadata,
                                               const CancellationToken &token)
{
    NormalizedImage image = normalize(image_bytes);
    PerceptualHash hash = ImageProcessor::perceptualHash(image);

    ComplaintRecord record;
    record.complaint_id = "complaint-" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    record.content_hash = image.content_hash;
    record.description = metadata.description;
    record.issue_type = metadata.issue_type;
    record.latitude = metadata.latitude;
    record.longitude = metadata.longitude;
    record.reported_at = metadata.reported_at.empty() ? VerificationRun::currentTimestamp() : metadata.reported_at;
    record.phash = hash.toHex();
    record.width = image.width();
    record.height = image.height();
    record.image_bytes = image_bytes;

    AssetRef ref{record.complaint_id, record.content_hash, "complaint", true};
    DBOpResult stored = store_.save(record);
    if (!stored.success)
    {
        Logger::warn("Complaint " + ref.id + " was not persisted: " + stored.error_message);
        ref.durable = false;
    }

    token.throwIfCancelled("complaint indexing");
    try
    {
        EmbeddingVector vector = embeddings_->embed(image, token);
        nlohmann::json meta = {{"complaint_id", ref.id}, {"issue_type", metadata.issue_type}, {"phash", record.phash}};
        DBOpResult indexed = index_.upsert(VectorNamespace::COMPLAINTS, ref.id, vector, meta);
        if (!indexed.success)
        {
            Logger::warn("Complaint " + ref.id + " was not indexed: " + indexed.error_message);
        }
    }
    catch (const OperationCancelledError &)
    {
        throw;
    }
    catch (const VerificationError &e)
    {
        Logger::warn("Complaint " + ref.id + " embedding unavailable, skipping similarity index: " + e.what());
    }

    Logger::info("Ingested complaint " + ref.id + " (" + std::to_string(image.width()) + "x" +
                 std::to_string(image.height()) + ", phash " + record.phash + ")");
    return ref;
}

AssetRef VerificationPipeline::ingestProof(const std::vector<uint8_t> &image_bytes, const AssetRef &complaint,
                                           const ProofMetadata &metadata)
{
    if (image_bytes.empty())
    {
        throw DecodeError("Empty image payload");
    }
    if (image_bytes.size() > policy_.limits.max_bytes)
    {
        throw DecodeError("Image payload of " + std::to_string(image_bytes.size()) + " bytes exceeds limit of " +
                          std::to_string(policy_.limits.max_bytes));
    }
    if (complaint.id.empty())
    {
        throw std::invalid_argument("Proof must reference a complaint");
    }

    ProofRecord record;
    record.content_hash = ImageProcessor::generateHash(image_bytes);
    record.proof_id = "proof-" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    record.complaint_id = complaint.id;
    record.worker_id = metadata.worker_id;
    record.latitude = metadata.latitude;
    record.longitude = metadata.longitude;
    record.submitted_at = metadata.submitted_at.empty() ? VerificationRun::currentTimestamp() : metadata.submitted_at;
    record.image_bytes = image_bytes;

    AssetRef ref{record.proof_id, record.content_hash, "proof", true};
    DBOpResult stored = store_.save(record);
    if (!stored.success)
    {
        Logger::warn("Proof " + ref.id + " was not persisted: " + stored.error_message);
        ref.durable = false;
    }
    Logger::info("Ingested proof " + ref.id + " for complaint " + complaint.id);
    return ref;
}

void VerificationPipeline::checkRecycled(const std::string &complaint_id, const std::string &proof_id,
                                         const PerceptualHash &hash, CompositeVerificationResult &result)
{
    std::vector<ProofHashEntry> entries;
    try
    {
        entries = store_.listProofHashes();
    }
    catch (const StorageReadError &e)
    {
        result.caveats.push_back(std::string("recycled-photo check skipped: ") + e.what());
        return;
    }

    for (const auto &entry : entries)
    {
        if (entry.complaint_id == complaint_id || entry.proof_id == proof_id)
        {
            continue;
        }
        PerceptualHash other;
        try
        {
            other = PerceptualHash::fromHex(entry.phash);
        }
        catch (const std::invalid_argument &)
        {
            Logger::warn("Skipping proof " + entry.proof_id + " with malformed perceptual hash");
            continue;
        }
        int distance = hash.distance(other);
        if (distance <= policy_.recycled_max_distance &&
            (!result.recycled_distance || distance < *result.recycled_distance))
        {
            result.recycled = true;
            result.recycled_distance = distance;
            result.recycled_match_proof_id = entry.proof_id;
        }
    }
    if (result.recycled)
    {
        Logger::warn("Proof " + proof_id + " matches proof " + result.recycled_match_proof_id +
                     " of another complaint (distance " + std::to_string(*result.recycled_distance) + ")");
    }
}

CompositeVerificationResult VerificationPipeline::runVerification(const AssetRef &complaint, const AssetRef &proof,
                                                                  const CancellationToken &token)
{
    const std::string run_id = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
    VerificationRun run(run_id, complaint.id, proof.id);

    CompositeVerificationResult result;
    result.run_id = run_id;
    result.complaint_id = complaint.id;
    result.proof_id = proof.id;
    result.created_at = VerificationRun::currentTimestamp();
    result.embedding_model_version = embeddings_->modelVersion();

    ProofRecord proof_record;
    try
    {
        token.throwIfCancelled("load assets");
        std::optional<ComplaintRecord> complaint_record = store_.getComplaintById(complaint.id);
        if (!complaint_record)
        {
            throw AssetNotFoundError("Complaint not found: " + complaint.id);
        }
        std::optional<ProofRecord> loaded_proof = store_.getProofById(proof.id);
        if (!loaded_proof)
        {
            throw AssetNotFoundError("Proof not found: " + proof.id);
        }
        proof_record = std::move(*loaded_proof);
        if (proof_record.complaint_id != complaint_record->complaint_id)
        {
            throw std::invalid_argument("Proof " + proof.id + " belongs to complaint " + proof_record.complaint_id +
                                        ", not " + complaint.id);
        }

        // Stage 1: decode, hash, chunk
        token.throwIfCancelled("normalize");
        NormalizedImage before = normalize(complaint_record->image_bytes);
        NormalizedImage after = normalize(proof_record.image_bytes);
        run.advance(RunState::NORMALIZED, std::to_string(before.width()) + "x" + std::to_string(before.height()) +
                                              " / " + std::to_string(after.width()) + "x" + std::to_string(after.height()));

        PerceptualHash before_hash = ImageProcessor::perceptualHash(before);
        PerceptualHash after_hash = ImageProcessor::perceptualHash(after);
        result.before_phash = before_hash.toHex();
        result.after_phash = after_hash.toHex();
        result.perceptual_distance = before_hash.distance(after_hash);
        result.perceptual_similarity = ImageProcessor::computeImageSimilarity(before_hash, after_hash);
        proof_record.phash = result.after_phash;

        std::vector<Chunk> before_chunks;
        std::vector<Chunk> after_chunks;
        try
        {
            before_chunks = ImageProcessor::chunk(before, policy_.grid);
            after_chunks = ImageProcessor::chunk(after, policy_.grid);
        }
        catch (const std::invalid_argument &e)
        {
            before_chunks.clear();
            after_chunks.clear();
            result.caveats.push_back(std::string("chunking unavailable: ") + e.what());
        }

        checkRecycled(complaint.id, proof.id, after_hash, result);

        // Stage 2: concurrent analysis
        token.throwIfCancelled("analysis");
        std::optional<EmbeddingVector> before_embedding;
        std::optional<EmbeddingVector> after_embedding;
        std::vector<EmbeddingVector> before_chunk_embeddings;
        std::vector<EmbeddingVector> after_chunk_embeddings;
        TaskOutcome outcomes[5];

        tbb::task_group analysis;
        analysis.run([&]
                     { runGuarded("before-image embedding", outcomes[0], [&]
                                  {
                                      before_embedding = embeddings_->embed(before, token);
                                      before_chunk_embeddings = embeddings_->embedChunks(before, before_chunks, policy_.grid, token); }); });
        analysis.run([&]
                     { runGuarded("after-image embedding", outcomes[1], [&]
                                  {
                                      after_embedding = embeddings_->embed(after, token);
                                      after_chunk_embeddings = embeddings_->embedChunks(after, after_chunks, policy_.grid, token); }); });
        analysis.run([&]
                     { runGuarded("before-image manipulation", outcomes[2], [&]
                                  { result.before_manipulation = detector_->analyze(before, policy_.grid, token); }); });
        analysis.run([&]
                     { runGuarded("after-image manipulation", outcomes[3], [&]
                                  { result.after_manipulation = detector_->analyze(after, policy_.grid, token); }); });
        analysis.run([&]
                     { runGuarded("semantic judgment", outcomes[4], [&]
                                  { result.semantic = verifier_->judge(before, after, complaint_record->description, token); }); });
        analysis.wait();

        for (const auto &outcome : outcomes)
        {
            if (outcome.cancelled)
            {
                throw OperationCancelledError("Operation cancelled: analysis");
            }
            if (!outcome.caveat.empty())
            {
                Logger::warn("[run " + run_id + "] " + outcome.caveat);
                result.caveats.push_back(outcome.caveat);
            }
        }
        token.throwIfCancelled("analysis");
        for (const ManipulationVerdict *verdict : {&result.before_manipulation, &result.after_manipulation})
        {
            if (!verdict->caveat.empty())
            {
                result.caveats.push_back(verdict->caveat);
            }
        }
        if (result.semantic.outcome == SemanticOutcome::FAILED && !result.semantic.rationale.empty())
        {
            result.caveats.push_back("semantic judgment failed: " + result.semantic.rationale);
        }
        run.advance(RunState::ANALYZED);

        // Stage 3: pairwise signals
        if (before_embedding && after_embedding)
        {
            try
            {
                result.embedding_similarity = EmbeddingGenerator::cosineSimilarity(*before_embedding, *after_embedding);
            }
            catch (const DimensionMismatchError &e)
            {
                result.caveats.push_back(std::string("whole-image embedding comparison skipped: ") + e.what());
            }
        }
        if (!before_chunk_embeddings.empty() && before_chunk_embeddings.size() == after_chunk_embeddings.size())
        {
            try
            {
                for (size_t i = 0; i < before_chunk_embeddings.size(); i++)
                {
                    result.chunk_similarities.push_back(
                        EmbeddingGenerator::cosineSimilarity(before_chunk_embeddings[i], after_chunk_embeddings[i]));
                }
            }
            catch (const DimensionMismatchError &e)
            {
                result.chunk_similarities.clear();
                result.caveats.push_back(std::string("chunk comparison skipped: ") + e.what());
            }
        }

        if (complaint_record->latitude && complaint_record->longitude && proof_record.latitude && proof_record.longitude)
        {
            double distance = haversineMeters(*complaint_record->latitude, *complaint_record->longitude,
                                              *proof_record.latitude, *proof_record.longitude);
            result.location_distance_m = distance;
            if (distance > policy_.max_location_distance_m)
            {
                result.location_mismatch = true;
                result.caveats.push_back("proof location is " + std::to_string(static_cast<long>(std::lround(distance))) +
                                         " m from the complaint location");
            }
        }

        indexProof(run_id, proof.id, complaint.id, after_embedding, after_chunk_embeddings, after_chunks, result.caveats);

        // Stage 4: fuse
        ScoringInputs inputs;
        inputs.perceptual_similarity = result.perceptual_similarity;
        inputs.chunk_similarities = result.chunk_similarities;
        inputs.before_manipulation = result.before_manipulation;
        inputs.after_manipulation = result.after_manipulation;
        inputs.semantic = result.semantic;
        inputs.recycled = result.recycled;
        inputs.location_mismatch = result.location_mismatch;
        inputs.caveats = result.caveats;
        result.score = scoring_->score(inputs);
        result.review_status = reviewStatusFor(result.score.recommendation);
        run.advance(RunState::SCORED, ScoringEngine::recommendationName(result.score.recommendation));
    }
    catch (const std::exception &e)
    {
        run.fail(e.what());
        throw;
    }

    persist(run, proof_record, result);
    return result;
}

void VerificationPipeline::indexProof(const std::string &run_id, const std::string &proof_id,
                                      const std::string &complaint_id, const std::optional<EmbeddingVector> &embedding,
                                      const std::vector<EmbeddingVector> &chunk_embeddings,
                                      const std::vector<Chunk> &chunks, std::vector<std::string> &caveats)
{
    if (embedding)
    {
        DBOpResult indexed = index_.upsert(VectorNamespace::PROOFS, proof_id, *embedding,
                                           {{"proof_id", proof_id}, {"complaint_id", complaint_id}, {"run_id", run_id}});
        if (!indexed.success)
        {
            caveats.push_back("proof embedding not indexed: " + indexed.error_message);
        }
    }
    for (size_t i = 0; i < chunk_embeddings.size() && i < chunks.size(); i++)
    {
        const Chunk &c = chunks[i];
        nlohmann::json meta = {
            {"proof_id", proof_id},
            {"chunk_index", c.index},
            {"grid_row", c.grid_row},
            {"grid_col", c.grid_col},
            {"bounds", {{"x", c.bounds.x}, {"y", c.bounds.y}, {"width", c.bounds.width}, {"height", c.bounds.height}}}};
        DBOpResult indexed = index_.upsert(VectorNamespace::CHUNKS, proof_id + "#" + std::to_string(c.index),
                                           chunk_embeddings[i], meta);
        if (!indexed.success)
        {
            caveats.push_back("chunk embeddings not indexed: " + indexed.error_message);
            break;
        }
    }
}

void VerificationPipeline::persist(VerificationRun &run, const ProofRecord &proof, CompositeVerificationResult &result)
{
    std::vector<std::string> failures;

    const std::pair<ManipulationVerdict *, std::string> heatmaps[] = {
        {&result.before_manipulation, "before_ela"},
        {&result.after_manipulation, "after_ela"}};
    for (const auto &[verdict, kind] : heatmaps)
    {
        if (verdict->heatmap_png.empty())
        {
            continue;
        }
        ArtifactRecord artifact{run.runId() + "/" + kind, run.runId(), kind, "image/png", verdict->heatmap_png};
        DBOpResult stored = store_.save(artifact);
        if (stored.success)
        {
            verdict->heatmap_ref = artifact.artifact_id;
        }
        else
        {
            failures.push_back("artifact " + artifact.artifact_id + ": " + stored.error_message);
        }
    }

    DBOpResult proof_stored = store_.save(proof);
    if (!proof_stored.success)
    {
        failures.push_back("proof hash: " + proof_stored.error_message);
    }

    // The stored copy records the state the run ends in if this write succeeds
    RunState target = failures.empty() ? RunState::PERSISTED : RunState::PERSIST_FAILED;
    CompositeVerificationResult stored_copy = result;
    stored_copy.final_state = target;
    stored_copy.state_history = run.history();
    stored_copy.state_history.push_back(RunTransition{target, VerificationRun::currentTimestamp(), ""});
    stored_copy.durability_warning = !failures.empty();

    VerificationRecord record;
    record.result_id = run.runId();
    record.complaint_id = result.complaint_id;
    record.proof_id = result.proof_id;
    record.composite_score = result.score.composite_score;
    record.recommendation = ScoringEngine::recommendationName(result.score.recommendation);
    record.status = result.review_status;
    record.result_json = toJson(stored_copy).dump();
    record.created_at = result.created_at;

    DBOpResult result_stored = store_.save(record);
    if (!result_stored.success)
    {
        failures.push_back("verification result: " + result_stored.error_message);
    }

    if (failures.empty())
    {
        run.advance(RunState::PERSISTED);
    }
    else
    {
        std::string message;
        for (const auto &failure : failures)
        {
            message += (message.empty() ? "" : "; ") + failure;
        }
        run.advance(RunState::PERSIST_FAILED, message);
        result.durability_warning = true;
        result.durability_message = message;
        result.score.explanation += "Durability warning: " + message + "\n";
        Logger::error("[run " + run.runId() + "] result not durably stored: " + message);
    }
    result.final_state = run.state();
    result.state_history = run.history();
}

std::vector<VerificationRecord> VerificationPipeline::listPendingReview()
{
    return store_.listPendingReview();
}

DBOpResult VerificationPipeline::recordReviewDecision(const ReviewDecision &decision)
{
    if (decision.result_id.empty())
    {
        return DBOpResult(false, "Review decision requires a result id");
    }
    if (decision.decision != "VERIFIED" && decision.decision != "REJECTED")
    {
        return DBOpResult(false, "Invalid review decision: " + decision.decision);
    }
    ReviewDecision stamped = decision;
    if (stamped.decided_at.empty())
    {
        stamped.decided_at = VerificationRun::currentTimestamp();
    }
    DBOpResult stored = store_.save(stamped);
    if (stored.success)
    {
        Logger::info("Review decision " + stamped.decision + " recorded for result " + stamped.result_id +
                     (stamped.reviewer_id.empty() ? "" : " by " + stamped.reviewer_id));
    }
    return stored;
}

std::vector<VectorMatch> VerificationPipeline::findSimilarComplaints(const std::vector<uint8_t> &image_bytes, size_t top_k,
                                                                     const CancellationToken &token)
{
    NormalizedImage image = normalize(image_bytes);
    EmbeddingVector vector = embeddings_->embed(image, token);
    return index_.query(VectorNamespace::COMPLAINTS, vector, top_k);
}
