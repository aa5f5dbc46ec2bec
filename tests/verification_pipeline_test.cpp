#include "core/stub_capabilities.hpp"
#include "core/verification_errors.hpp"
#include "core/verification_pipeline.hpp"
#include "database/database_manager.hpp"
#include "in_memory_store.hpp"
#include "test_base.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

namespace
{
    struct Stubs
    {
        std::shared_ptr<StubEmbeddingCapability> embedding = std::make_shared<StubEmbeddingCapability>();
        std::shared_ptr<StubManipulationClassifier> classifier = std::make_shared<StubManipulationClassifier>(0.0);
        std::shared_ptr<StubVlmCapability> vlm = std::make_shared<StubVlmCapability>();
    };

    std::unique_ptr<VerificationPipeline> makePipeline(const Stubs &stubs, PersistentStore &store, VectorIndex &index,
                                                       SemanticPolicy semantic = SemanticPolicy())
    {
        EmbeddingPolicy embedding;
        embedding.backoff_base_ms = 1;
        ManipulationPolicy manipulation;
        manipulation.backoff_base_ms = 1;
        semantic.backoff_base_ms = 1;

        return std::make_unique<VerificationPipeline>(
            std::make_shared<EmbeddingGenerator>(stubs.embedding, embedding),
            std::make_shared<ManipulationDetector>(stubs.classifier, manipulation),
            std::make_shared<SemanticVerifier>(stubs.vlm, semantic),
            std::make_shared<ScoringEngine>(),
            store, index);
    }

    bool hasCaveatContaining(const CompositeVerificationResult &result, const std::string &needle)
    {
        return std::any_of(result.caveats.begin(), result.caveats.end(),
                           [&](const std::string &c)
                           { return c.find(needle) != std::string::npos; });
    }
}

class VerificationPipelineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        pipeline_ = makePipeline(stubs_, store_, index_);
        before_bytes_ = TestImages::scenePng(101);
    }

    ComplaintMetadata complaintMetadata(const std::string &description = "Pothole outside house 14")
    {
        ComplaintMetadata metadata;
        metadata.description = description;
        metadata.issue_type = "road";
        return metadata;
    }

    Stubs stubs_;
    InMemoryStore store_;
    InMemoryVectorIndex index_;
    std::unique_ptr<VerificationPipeline> pipeline_;
    std::vector<uint8_t> before_bytes_;
};

TEST_F(VerificationPipelineTest, CleanResolvedProofIsApproved)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());

    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_EQ(result.recommendation(), Recommendation::APPROVE);
    EXPECT_GT(result.compositeScore(), 0.85);
    EXPECT_LE(result.compositeScore(), 1.0);
    ASSERT_TRUE(result.perceptual_distance.has_value());
    EXPECT_EQ(*result.perceptual_distance, 0);
    ASSERT_EQ(result.chunk_similarities.size(), 16u);
    EXPECT_NEAR(result.chunk_similarities[0], 1.0, 1e-6);
    EXPECT_EQ(result.semantic.outcome, SemanticOutcome::RESOLVED);
    EXPECT_EQ(result.review_status, ReviewStatus::AUTO_APPROVED);
    EXPECT_FALSE(result.recycled);

    EXPECT_EQ(result.final_state, RunState::PERSISTED);
    ASSERT_EQ(result.state_history.size(), 5u);
    EXPECT_FALSE(result.durability_warning);

    auto stored = store_.getVerificationResultById(result.run_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->recommendation, "APPROVE");
    nlohmann::json stored_json = nlohmann::json::parse(stored->result_json);
    EXPECT_EQ(stored_json["run_id"], result.run_id);

    EXPECT_EQ(store_.getProofById(proof.id)->phash, result.after_phash);
}

TEST_F(VerificationPipelineTest, ManipulatedProofIsCapped)
{
    stubs_.classifier->setScore(1.0);
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());

    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_TRUE(result.after_manipulation.is_manipulated);
    EXPECT_LE(result.compositeScore(), 0.4 + 1e-9);
    EXPECT_NE(result.recommendation(), Recommendation::APPROVE);
    ASSERT_TRUE(result.score.ceiling_applied.has_value());
}

TEST_F(VerificationPipelineTest, SemanticTimeoutNeedsReview)
{
    SemanticPolicy semantic;
    semantic.timeout_ms = 30;
    semantic.max_attempts = 1;
    pipeline_ = makePipeline(stubs_, store_, index_, semantic);
    stubs_.vlm->setLatencyMs(2000);

    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());

    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_EQ(result.semantic.outcome, SemanticOutcome::FAILED);
    EXPECT_EQ(result.recommendation(), Recommendation::NEEDS_REVIEW);
    EXPECT_TRUE(result.score.review_floor_applied);
    EXPECT_EQ(result.review_status, ReviewStatus::PENDING_REVIEW);
}

TEST_F(VerificationPipelineTest, CorruptProofFailsWithoutResult)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(TestImages::garbage(), complaint, ProofMetadata());

    EXPECT_THROW(pipeline_->runVerification(complaint, proof), DecodeError);
    EXPECT_EQ(store_.resultCount(), 0u);
}

TEST_F(VerificationPipelineTest, CorruptComplaintIsRejectedAtIngest)
{
    EXPECT_THROW(pipeline_->ingestComplaint(TestImages::garbage(), complaintMetadata()), DecodeError);
    EXPECT_THROW(pipeline_->ingestProof({}, AssetRef{"complaint-x", "", "complaint", true}, ProofMetadata()),
                 DecodeError);
}

TEST_F(VerificationPipelineTest, ResultWriteFailureIsReported)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    store_.fail_result_writes = true;

    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_EQ(result.final_state, RunState::PERSIST_FAILED);
    EXPECT_TRUE(result.durability_warning);
    EXPECT_NE(result.durability_message.find("database is locked"), std::string::npos);
    EXPECT_NE(result.score.explanation.find("Durability warning"), std::string::npos);
    EXPECT_EQ(store_.resultCount(), 0u);

    // Heatmaps were written before the result
    EXPECT_TRUE(store_.getArtifactById(result.run_id + "/after_ela").has_value());
    EXPECT_EQ(result.after_manipulation.heatmap_ref, result.run_id + "/after_ela");
}

TEST_F(VerificationPipelineTest, CancelledRunThrows)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    CancellationToken token;
    token.cancel();

    EXPECT_THROW(pipeline_->runVerification(complaint, proof, token), OperationCancelledError);
    EXPECT_EQ(store_.resultCount(), 0u);
}

TEST_F(VerificationPipelineTest, CancellationDuringExternalCallsStopsRun)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    stubs_.vlm->setLatencyMs(5000);
    stubs_.embedding->setLatencyMs(200);

    CancellationToken token;
    std::thread canceller([token]() mutable
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel(); });

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(pipeline_->runVerification(complaint, proof, token), OperationCancelledError);
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));
    EXPECT_EQ(store_.resultCount(), 0u);
}

TEST_F(VerificationPipelineTest, CancellingOneRunLeavesConcurrentRunIntact)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    stubs_.embedding->setLatencyMs(40);

    CancellationToken cancelled_token;
    std::atomic<bool> cancelled_run_threw{false};
    std::optional<CompositeVerificationResult> survivor;
    std::string survivor_error;

    std::thread cancelled_run([&]()
                              {
        try
        {
            pipeline_->runVerification(complaint, proof, cancelled_token);
        }
        catch (const OperationCancelledError &)
        {
            cancelled_run_threw = true;
        } });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    std::thread surviving_run([&]()
                              {
        try
        {
            survivor = pipeline_->runVerification(complaint, proof);
        }
        catch (const std::exception &e)
        {
            survivor_error = e.what();
        } });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    cancelled_token.cancel();
    cancelled_run.join();
    surviving_run.join();

    EXPECT_TRUE(cancelled_run_threw);
    ASSERT_TRUE(survivor.has_value()) << survivor_error;
    EXPECT_EQ(survivor->final_state, RunState::PERSISTED);
    EXPECT_TRUE(survivor->embedding_similarity.has_value());
    EXPECT_EQ(survivor->chunk_similarities.size(), 16u);
    EXPECT_FALSE(hasCaveatContaining(*survivor, "ancel"));
    EXPECT_EQ(store_.resultCount(), 1u);
}

TEST_F(VerificationPipelineTest, ComplaintsSharingAPhotoKeepTheirOwnDetails)
{
    ComplaintMetadata first_metadata = complaintMetadata("Pothole outside house 14");
    first_metadata.latitude = 51.5;
    first_metadata.longitude = -0.12;
    ComplaintMetadata second_metadata = complaintMetadata("Graffiti on the underpass wall");
    second_metadata.issue_type = "vandalism";
    second_metadata.latitude = 48.85;
    second_metadata.longitude = 2.35;

    AssetRef first = pipeline_->ingestComplaint(before_bytes_, first_metadata);
    AssetRef second = pipeline_->ingestComplaint(before_bytes_, second_metadata);

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(first.content_hash, second.content_hash);

    auto first_stored = store_.getComplaintById(first.id);
    auto second_stored = store_.getComplaintById(second.id);
    ASSERT_TRUE(first_stored.has_value());
    ASSERT_TRUE(second_stored.has_value());
    EXPECT_EQ(first_stored->description, "Pothole outside house 14");
    EXPECT_EQ(second_stored->description, "Graffiti on the underpass wall");
    EXPECT_EQ(second_stored->issue_type, "vandalism");
    ASSERT_TRUE(second_stored->latitude.has_value());
    EXPECT_DOUBLE_EQ(*second_stored->latitude, 48.85);

    AssetRef proof = pipeline_->ingestProof(before_bytes_, second, ProofMetadata());
    CompositeVerificationResult result = pipeline_->runVerification(second, proof);
    EXPECT_EQ(result.complaint_id, second.id);
    EXPECT_NE(stubs_.vlm->lastRequest().prompt.find("Graffiti on the underpass wall"), std::string::npos);
}

TEST_F(VerificationPipelineTest, SwappingBeforeAndAfterGivesSameSimilarities)
{
    std::vector<uint8_t> other_bytes = TestImages::scenePng(102);

    AssetRef forward = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef forward_proof = pipeline_->ingestProof(other_bytes, forward, ProofMetadata());
    AssetRef backward = pipeline_->ingestComplaint(other_bytes, complaintMetadata());
    AssetRef backward_proof = pipeline_->ingestProof(before_bytes_, backward, ProofMetadata());

    CompositeVerificationResult ab = pipeline_->runVerification(forward, forward_proof);
    CompositeVerificationResult ba = pipeline_->runVerification(backward, backward_proof);

    ASSERT_TRUE(ab.perceptual_similarity.has_value());
    ASSERT_TRUE(ba.perceptual_similarity.has_value());
    EXPECT_EQ(*ab.perceptual_similarity, *ba.perceptual_similarity);
    ASSERT_TRUE(ab.embedding_similarity.has_value());
    ASSERT_TRUE(ba.embedding_similarity.has_value());
    EXPECT_EQ(*ab.embedding_similarity, *ba.embedding_similarity);
    EXPECT_EQ(ab.chunk_similarities, ba.chunk_similarities);
}

TEST_F(VerificationPipelineTest, DecodedImageCacheIsBounded)
{
    EXPECT_LE(PipelinePolicy().normalized_cache_capacity, 32u);

    PipelinePolicy policy;
    policy.normalized_cache_capacity = 2;
    VerificationPipeline pipeline(std::make_shared<EmbeddingGenerator>(stubs_.embedding),
                                  std::make_shared<ManipulationDetector>(stubs_.classifier),
                                  std::make_shared<SemanticVerifier>(stubs_.vlm), std::make_shared<ScoringEngine>(),
                                  store_, index_, policy);

    for (int seed = 501; seed < 505; seed++)
    {
        pipeline.ingestComplaint(TestImages::scenePng(seed), complaintMetadata());
    }
    EXPECT_EQ(pipeline.normalizedCacheSize(), 2u);
}

TEST_F(VerificationPipelineTest, RecycledProofIsDetectedAcrossComplaints)
{
    std::vector<uint8_t> reused = TestImages::scenePng(303);

    AssetRef first = pipeline_->ingestComplaint(TestImages::scenePng(301), complaintMetadata("Broken bench"));
    AssetRef first_proof = pipeline_->ingestProof(reused, first, ProofMetadata());
    CompositeVerificationResult first_result = pipeline_->runVerification(first, first_proof);
    EXPECT_FALSE(first_result.recycled);

    AssetRef second = pipeline_->ingestComplaint(TestImages::scenePng(302), complaintMetadata("Fallen tree"));
    AssetRef second_proof = pipeline_->ingestProof(reused, second, ProofMetadata());
    EXPECT_NE(first_proof.id, second_proof.id);

    CompositeVerificationResult result = pipeline_->runVerification(second, second_proof);

    EXPECT_TRUE(result.recycled);
    EXPECT_EQ(result.recycled_match_proof_id, first_proof.id);
    ASSERT_TRUE(result.recycled_distance.has_value());
    EXPECT_EQ(*result.recycled_distance, 0);
    EXPECT_LE(result.compositeScore(), 0.2 + 1e-9);
    EXPECT_NE(result.recommendation(), Recommendation::APPROVE);
}

TEST_F(VerificationPipelineTest, RerunningSameProofIsNotRecycled)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());

    pipeline_->runVerification(complaint, proof);
    CompositeVerificationResult again = pipeline_->runVerification(complaint, proof);

    EXPECT_FALSE(again.recycled);
    EXPECT_EQ(again.recommendation(), Recommendation::APPROVE);
}

TEST_F(VerificationPipelineTest, HashListingFailureBecomesCaveat)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    store_.fail_hash_listing = true;

    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_TRUE(hasCaveatContaining(result, "recycled-photo check skipped"));
    EXPECT_FALSE(result.recycled);
}

TEST_F(VerificationPipelineTest, DistantProofLocationBlocksApproval)
{
    ComplaintMetadata metadata = complaintMetadata();
    metadata.latitude = 12.9716;
    metadata.longitude = 77.5946;
    ProofMetadata proof_metadata;
    proof_metadata.worker_id = "worker-3";
    proof_metadata.latitude = 12.9816;
    proof_metadata.longitude = 77.5946;

    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, metadata);
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, proof_metadata);
    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    ASSERT_TRUE(result.location_distance_m.has_value());
    EXPECT_NEAR(*result.location_distance_m, 1112.0, 5.0);
    EXPECT_TRUE(result.location_mismatch);
    EXPECT_NE(result.recommendation(), Recommendation::APPROVE);
    EXPECT_TRUE(hasCaveatContaining(result, "from the complaint location"));
}

TEST_F(VerificationPipelineTest, HaversineDistance)
{
    EXPECT_NEAR(VerificationPipeline::haversineMeters(0.0, 0.0, 0.0, 0.0), 0.0, 1e-9);
    EXPECT_NEAR(VerificationPipeline::haversineMeters(0.0, 0.0, 1.0, 0.0), 111195.0, 10.0);
}

TEST_F(VerificationPipelineTest, MissingAssetsAndForeignProofsAreRejected)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());

    EXPECT_THROW(pipeline_->runVerification(AssetRef{"complaint-missing", "", "complaint", true}, proof),
                 AssetNotFoundError);
    EXPECT_THROW(pipeline_->runVerification(complaint, AssetRef{"proof-missing", "", "proof", true}),
                 AssetNotFoundError);

    AssetRef other = pipeline_->ingestComplaint(TestImages::scenePng(102), complaintMetadata("Leaking pipe"));
    EXPECT_THROW(pipeline_->runVerification(other, proof), std::invalid_argument);
}

TEST_F(VerificationPipelineTest, UnstoredProofIsNotDurable)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    store_.fail_asset_writes = true;
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    store_.fail_asset_writes = false;

    EXPECT_FALSE(proof.durable);
    EXPECT_THROW(pipeline_->runVerification(complaint, proof), AssetNotFoundError);
}

TEST_F(VerificationPipelineTest, ReviewQueueFlow)
{
    stubs_.vlm->setResponse(R"({"outcome": "AMBIGUOUS", "confidence": 0.4, "rationale": "Angle differs."})");
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);
    ASSERT_EQ(result.recommendation(), Recommendation::NEEDS_REVIEW);

    auto pending = pipeline_->listPendingReview();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].result_id, result.run_id);

    EXPECT_FALSE(pipeline_->recordReviewDecision(ReviewDecision{result.run_id, "MAYBE", "reviewer-1", "", ""}).success);
    EXPECT_FALSE(pipeline_->recordReviewDecision(ReviewDecision{"", "VERIFIED", "reviewer-1", "", ""}).success);
    ASSERT_TRUE(pipeline_->recordReviewDecision(ReviewDecision{result.run_id, "VERIFIED", "reviewer-1", "", ""}).success);

    EXPECT_TRUE(pipeline_->listPendingReview().empty());
    auto decisions = store_.getReviewDecisions(result.run_id);
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_FALSE(decisions[0].decided_at.empty());
}

TEST_F(VerificationPipelineTest, IndexesComplaintsProofsAndChunks)
{
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    pipeline_->ingestComplaint(TestImages::scenePng(102), complaintMetadata("Leaking pipe"));
    EXPECT_EQ(index_.size(VectorNamespace::COMPLAINTS), 2u);

    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    pipeline_->runVerification(complaint, proof);
    EXPECT_EQ(index_.size(VectorNamespace::PROOFS), 1u);
    EXPECT_EQ(index_.size(VectorNamespace::CHUNKS), 16u);

    auto matches = pipeline_->findSimilarComplaints(before_bytes_, 2);
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].id, complaint.id);
    EXPECT_NEAR(matches[0].score, 1.0, 1e-6);
}

TEST_F(VerificationPipelineTest, EmbeddingOutageDegradesToCaveat)
{
    stubs_.embedding->setMode(StubEmbeddingCapability::Mode::UNAVAILABLE);
    AssetRef complaint = pipeline_->ingestComplaint(before_bytes_, complaintMetadata());
    EXPECT_EQ(index_.size(VectorNamespace::COMPLAINTS), 0u);

    AssetRef proof = pipeline_->ingestProof(before_bytes_, complaint, ProofMetadata());
    CompositeVerificationResult result = pipeline_->runVerification(complaint, proof);

    EXPECT_FALSE(result.embedding_similarity.has_value());
    EXPECT_TRUE(result.chunk_similarities.empty());
    EXPECT_TRUE(hasCaveatContaining(result, "embedding"));
    EXPECT_EQ(result.final_state, RunState::PERSISTED);
}

class VerificationPipelineDatabaseTest : public TestBase
{
};

TEST_F(VerificationPipelineDatabaseTest, PersistsRunThroughSqlite)
{
    Stubs stubs;
    InMemoryVectorIndex index;
    auto pipeline = makePipeline(stubs, db(), index);
    std::vector<uint8_t> bytes = TestImages::scenePng(404);

    AssetRef complaint = pipeline->ingestComplaint(bytes, ComplaintMetadata());
    AssetRef proof = pipeline->ingestProof(bytes, complaint, ProofMetadata());
    CompositeVerificationResult result = pipeline->runVerification(complaint, proof);

    EXPECT_EQ(result.final_state, RunState::PERSISTED);
    db().waitForWrites();
    auto stored = db().getVerificationResultById(result.run_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->complaint_id, complaint.id);
    EXPECT_NEAR(stored->composite_score, result.compositeScore(), 1e-9);
    EXPECT_TRUE(db().getArtifactById(result.run_id + "/before_ela").has_value());

    auto hashes = db().listProofHashes();
    ASSERT_EQ(hashes.size(), 1u);
    EXPECT_EQ(hashes[0].phash, result.after_phash);
}
