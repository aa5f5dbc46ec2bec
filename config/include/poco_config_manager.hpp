#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/embedding_generator.hpp"
#include "core/http_capabilities.hpp"
#include "core/image_processor.hpp"
#include "core/manipulation_detector.hpp"
#include "core/scoring_engine.hpp"
#include "core/semantic_verifier.hpp"
#include "core/verification_pipeline.hpp"

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    /// Loads a JSON file over the defaults. Returns false if the file is missing or malformed.
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;
    uint32_t getUInt32(const std::string &key, uint32_t def = 0) const;

    std::string getLogLevel() const;
    std::string getDatabasePath() const;
    int getMaxAnalysisThreads() const;

    // Component policies
    ImageCodecLimits getImageCodecLimits() const;
    GridShape getGridShape() const;
    EmbeddingPolicy getEmbeddingPolicy() const;
    ManipulationPolicy getManipulationPolicy() const;
    SemanticPolicy getSemanticPolicy() const;
    ScoringPolicy getScoringPolicy() const;
    PipelinePolicy getPipelinePolicy() const;

    // Remote capabilities; section is "embedding", "manipulation" or "vlm"
    std::string getBackend(const std::string &section) const;
    HttpEndpoint getEndpoint(const std::string &section) const;

    // Configuration validation
    bool validateConfig() const;

    // Utility methods
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void setDefaultsLocked();
    void applyLocked(const std::string &prefix, const nlohmann::json &node);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
