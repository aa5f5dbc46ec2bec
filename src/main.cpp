#include "core/http_capabilities.hpp"
#include "core/stub_capabilities.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/verification_errors.hpp"
#include "core/verification_pipeline.hpp"
#include "database/database_manager.hpp"
#include "database/vector_index.hpp"
#include "logging/logger.hpp"
#include "poco_config_manager.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitDecode = 2;
    constexpr int kExitFailure = 3;

    struct CliOptions
    {
        std::string before_path;
        std::string after_path;
        std::string complaint_text;
        std::string config_path;
        std::string db_path;
        bool offline = false;
        bool pending = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Proof Verifier - before/after photo verification" << std::endl;
        std::cout << "Usage: " << program << " --before <file> --after <file> [options]" << std::endl;
        std::cout << "       " << program << " --pending [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --before <file>       Photo taken when the complaint was filed" << std::endl;
        std::cout << "  --after <file>        Proof photo submitted after the work" << std::endl;
        std::cout << "  --complaint <text>    Complaint description passed to the semantic judge" << std::endl;
        std::cout << "  --config <json>       Configuration file" << std::endl;
        std::cout << "  --db <path>           SQLite database (overrides database.path)" << std::endl;
        std::cout << "  --offline             Use deterministic stub capabilities" << std::endl;
        std::cout << "  --pending             Print results waiting for manual review" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    bool readFile(const std::string &path, std::vector<uint8_t> &bytes)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.good())
        {
            return false;
        }
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

    std::shared_ptr<EmbeddingCapability> makeEmbeddingCapability(const PocoConfigManager &config, bool offline)
    {
        if (offline || config.getBackend("embedding") == "stub")
        {
            return std::make_shared<StubEmbeddingCapability>();
        }
        return std::make_shared<HttpEmbeddingCapability>(config.getEndpoint("embedding"));
    }

    std::shared_ptr<ManipulationClassifier> makeClassifier(const PocoConfigManager &config, bool offline)
    {
        std::string backend = offline ? "stub" : config.getBackend("manipulation");
        if (backend == "none")
        {
            return nullptr;
        }
        if (backend == "stub")
        {
            return std::make_shared<StubManipulationClassifier>(0.0);
        }
        return std::make_shared<HttpManipulationClassifier>(config.getEndpoint("manipulation"));
    }

    std::shared_ptr<VlmCapability> makeVlm(const PocoConfigManager &config, bool offline)
    {
        std::string backend = offline ? "stub" : config.getBackend("vlm");
        if (backend == "none")
        {
            return nullptr;
        }
        if (backend == "stub")
        {
            return std::make_shared<StubVlmCapability>();
        }
        return std::make_shared<HttpVlmCapability>(config.getEndpoint("vlm"));
    }

    int printPendingReviews(VerificationPipeline &pipeline)
    {
        nlohmann::json pending = nlohmann::json::array();
        for (const auto &record : pipeline.listPendingReview())
        {
            pending.push_back({{"result_id", record.result_id},
                               {"complaint_id", record.complaint_id},
                               {"proof_id", record.proof_id},
                               {"composite_score", record.composite_score},
                               {"recommendation", record.recommendation},
                               {"created_at", record.created_at}});
        }
        std::cout << pending.dump(2) << std::endl;
        return kExitOk;
    }

    int run(const CliOptions &options)
    {
        auto &config = PocoConfigManager::getInstance();
        if (!options.config_path.empty() && !config.load(options.config_path))
        {
            std::cerr << "Error: cannot load configuration from " << options.config_path << std::endl;
            return kExitUsage;
        }
        Logger::setLevel(config.getLogLevel());
        if (!options.db_path.empty())
        {
            config.update({{"database", {{"path", options.db_path}}}});
        }
        if (!config.validateConfig())
        {
            std::cerr << "Error: invalid configuration" << std::endl;
            return kExitUsage;
        }

        ThreadPoolManager::initialize(static_cast<size_t>(config.getMaxAnalysisThreads()));

        auto &db_manager = DatabaseManager::getInstance(config.getDatabasePath());
        if (!db_manager.isOpen())
        {
            std::cerr << "Error: cannot open database " << config.getDatabasePath() << std::endl;
            return kExitFailure;
        }

        auto embeddings = std::make_shared<EmbeddingGenerator>(makeEmbeddingCapability(config, options.offline),
                                                               config.getEmbeddingPolicy());
        auto detector = std::make_shared<ManipulationDetector>(makeClassifier(config, options.offline),
                                                               config.getManipulationPolicy());
        auto verifier = std::make_shared<SemanticVerifier>(makeVlm(config, options.offline), config.getSemanticPolicy());
        auto scoring = std::make_shared<ScoringEngine>(config.getScoringPolicy());
        InMemoryVectorIndex index;
        VerificationPipeline pipeline(embeddings, detector, verifier, scoring, db_manager, index,
                                      config.getPipelinePolicy());

        if (options.pending)
        {
            return printPendingReviews(pipeline);
        }

        std::vector<uint8_t> before_bytes;
        std::vector<uint8_t> after_bytes;
        if (!readFile(options.before_path, before_bytes))
        {
            std::cerr << "Error: cannot read " << options.before_path << std::endl;
            return kExitUsage;
        }
        if (!readFile(options.after_path, after_bytes))
        {
            std::cerr << "Error: cannot read " << options.after_path << std::endl;
            return kExitUsage;
        }

        ComplaintMetadata complaint_meta;
        complaint_meta.description = options.complaint_text;
        AssetRef complaint = pipeline.ingestComplaint(before_bytes, complaint_meta);
        AssetRef proof = pipeline.ingestProof(after_bytes, complaint, ProofMetadata());

        CompositeVerificationResult result = pipeline.runVerification(complaint, proof);
        std::cout << toJson(result).dump(2) << std::endl;
        return kExitOk;
    }
}

int main(int argc, char *argv[])
{
    Logger::init("INFO");

    CliOptions options;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next = [&](std::string &target) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitOk;
        }
        else if (arg == "--offline")
        {
            options.offline = true;
        }
        else if (arg == "--pending")
        {
            options.pending = true;
        }
        else if (arg == "--before" || arg == "--after" || arg == "--complaint" || arg == "--config" || arg == "--db")
        {
            std::string &target = arg == "--before"      ? options.before_path
                                  : arg == "--after"     ? options.after_path
                                  : arg == "--complaint" ? options.complaint_text
                                  : arg == "--config"    ? options.config_path
                                                         : options.db_path;
            if (!next(target))
            {
                return kExitUsage;
            }
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        }
    }

    if (!options.pending && (options.before_path.empty() || options.after_path.empty()))
    {
        std::cerr << "Error: --before and --after are required" << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    }

    int exit_code = kExitFailure;
    try
    {
        exit_code = run(options);
    }
    catch (const DecodeError &e)
    {
        Logger::error("Image could not be decoded: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = kExitDecode;
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error("Invalid configuration or input: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = kExitUsage;
    }
    catch (const std::exception &e)
    {
        Logger::error("Verification failed: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = kExitFailure;
    }

    DatabaseManager::shutdown();
    ThreadPoolManager::shutdown();
    return exit_code;
}
