#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>
#include <cmath>
#include <cstdint>
#include <limits>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *const kCapabilitySections[] = {"embedding", "manipulation", "vlm"};
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Cannot open config file: " + path);
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    nlohmann::json parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        Logger::error("Config file is not a JSON object: " + path);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
    setDefaultsLocked();
    applyLocked("", parsed);
    Logger::info("Loaded configuration from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyLocked("", patch);
}

// Flatten nested objects into dotted keys
void PocoConfigManager::applyLocked(const std::string &prefix, const nlohmann::json &node)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
            applyLocked(key, it.value());
        }
    }
    else if (!node.is_null())
    {
        if (node.is_boolean())
            cfg_->setBool(prefix, node.get<bool>());
        else if (node.is_number_unsigned())
        {
            // Checked before is_number_integer, which is also true for unsigned values
            uint64_t value = node.get<uint64_t>();
            if (value <= static_cast<uint64_t>(std::numeric_limits<int>::max()))
                cfg_->setInt(prefix, static_cast<int>(value));
            else
                cfg_->setUInt64(prefix, value);
        }
        else if (node.is_number_integer())
        {
            int64_t value = node.get<int64_t>();
            if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
                cfg_->setInt(prefix, static_cast<int>(value));
            else
                cfg_->setInt64(prefix, value);
        }
        else if (node.is_number_float())
            cfg_->setDouble(prefix, node.get<double>());
        else if (node.is_string())
            cfg_->setString(prefix, node.get<std::string>());
        else
            cfg_->setString(prefix, node.dump());
    }
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config value " + key + " is not a valid int, using default " + std::to_string(def) + ": " +
                     e.displayText());
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

uint32_t PocoConfigManager::getUInt32(const std::string &key, uint32_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t value = def;
    try
    {
        value = cfg_->getUInt64(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config value " + key + " is not a valid unsigned integer, using default " + std::to_string(def) +
                     ": " + e.displayText());
        return def;
    }
    if (value > std::numeric_limits<uint32_t>::max())
    {
        Logger::warn("Config value " + key + " = " + std::to_string(value) + " is out of range, using default " +
                     std::to_string(def));
        return def;
    }
    return static_cast<uint32_t>(value);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getDatabasePath() const
{
    return getString("database.path", "proof_verifier.db");
}

int PocoConfigManager::getMaxAnalysisThreads() const
{
    return getInt("threading.max_analysis_threads", 8);
}

ImageCodecLimits PocoConfigManager::getImageCodecLimits() const
{
    ImageCodecLimits limits;
    limits.max_bytes = getUInt32("image.max_bytes", static_cast<uint32_t>(limits.max_bytes));
    limits.max_input_dimension = getInt("image.max_input_dimension", limits.max_input_dimension);
    limits.max_edge = getInt("image.max_edge", limits.max_edge);
    limits.min_dimension = getInt("image.min_dimension", limits.min_dimension);
    return limits;
}

GridShape PocoConfigManager::getGridShape() const
{
    GridShape grid;
    grid.rows = getInt("chunking.rows", grid.rows);
    grid.cols = getInt("chunking.cols", grid.cols);
    return grid;
}

EmbeddingPolicy PocoConfigManager::getEmbeddingPolicy() const
{
    EmbeddingPolicy policy;
    policy.timeout_ms = getInt("embedding.timeout_ms", policy.timeout_ms);
    policy.max_attempts = getInt("embedding.max_attempts", policy.max_attempts);
    policy.backoff_base_ms = getInt("embedding.backoff_base_ms", policy.backoff_base_ms);
    policy.cache_capacity = getUInt32("embedding.cache_capacity", static_cast<uint32_t>(policy.cache_capacity));
    return policy;
}

ManipulationPolicy PocoConfigManager::getManipulationPolicy() const
{
    ManipulationPolicy policy;
    policy.ela_jpeg_quality = getInt("manipulation.ela_jpeg_quality", policy.ela_jpeg_quality);
    policy.ela_energy_scale = getDouble("manipulation.ela_energy_scale", policy.ela_energy_scale);
    policy.ela_weight = getDouble("manipulation.ela_weight", policy.ela_weight);
    policy.classifier_weight = getDouble("manipulation.classifier_weight", policy.classifier_weight);
    policy.threshold = getDouble("manipulation.threshold", policy.threshold);
    policy.timeout_ms = getInt("manipulation.timeout_ms", policy.timeout_ms);
    policy.max_attempts = getInt("manipulation.max_attempts", policy.max_attempts);
    return policy;
}

SemanticPolicy PocoConfigManager::getSemanticPolicy() const
{
    SemanticPolicy policy;
    policy.timeout_ms = getInt("vlm.timeout_ms", policy.timeout_ms);
    policy.max_attempts = getInt("vlm.max_attempts", policy.max_attempts);
    policy.backoff_base_ms = getInt("vlm.backoff_base_ms", policy.backoff_base_ms);
    return policy;
}

ScoringPolicy PocoConfigManager::getScoringPolicy() const
{
    ScoringPolicy policy;
    policy.perceptual_weight = getDouble("scoring.perceptual_weight", policy.perceptual_weight);
    policy.chunk_weight = getDouble("scoring.chunk_weight", policy.chunk_weight);
    policy.semantic_weight = getDouble("scoring.semantic_weight", policy.semantic_weight);
    policy.manipulation_penalty_weight = getDouble("scoring.manipulation_penalty_weight", policy.manipulation_penalty_weight);
    policy.manipulation_ceiling = getDouble("scoring.manipulation_ceiling", policy.manipulation_ceiling);
    policy.recycled_ceiling = getDouble("scoring.recycled_ceiling", policy.recycled_ceiling);
    policy.approve_threshold = getDouble("scoring.approve_threshold", policy.approve_threshold);
    policy.reject_threshold = getDouble("scoring.reject_threshold", policy.reject_threshold);
    return policy;
}

PipelinePolicy PocoConfigManager::getPipelinePolicy() const
{
    PipelinePolicy policy;
    policy.grid = getGridShape();
    policy.limits = getImageCodecLimits();
    policy.recycled_max_distance = getInt("recycled.max_distance", policy.recycled_max_distance);
    policy.max_location_distance_m = getDouble("location.max_distance_m", policy.max_location_distance_m);
    policy.normalized_cache_capacity =
        getUInt32("image.normalized_cache_capacity", static_cast<uint32_t>(policy.normalized_cache_capacity));
    return policy;
}

std::string PocoConfigManager::getBackend(const std::string &section) const
{
    return getString(section + ".backend", "stub");
}

HttpEndpoint PocoConfigManager::getEndpoint(const std::string &section) const
{
    HttpEndpoint endpoint;
    endpoint.url = getString(section + ".url");
    endpoint.path = getString(section + ".path", "/");
    endpoint.model = getString(section + ".model");
    endpoint.api_key = getString(section + ".api_key");
    return endpoint;
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    std::vector<std::string> required_fields = {"log_level", "database.path"};
    for (const auto &field : required_fields)
    {
        if (!hasKey(field))
        {
            Logger::error("Missing required config field: " + field);
            return false;
        }
    }

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    if (getDatabasePath().empty())
    {
        Logger::error("database.path must not be empty");
        return false;
    }

    ImageCodecLimits limits = getImageCodecLimits();
    if (limits.max_bytes == 0 || limits.max_input_dimension <= 0 || limits.max_edge <= 0 ||
        limits.min_dimension <= 0 || limits.min_dimension > limits.max_edge)
    {
        Logger::error("Invalid image limits");
        return false;
    }

    GridShape grid = getGridShape();
    if (grid.rows < 1 || grid.cols < 1 || grid.rows > limits.min_dimension || grid.cols > limits.min_dimension)
    {
        Logger::error("Invalid chunk grid " + std::to_string(grid.rows) + "x" + std::to_string(grid.cols) +
                      " for minimum image dimension " + std::to_string(limits.min_dimension));
        return false;
    }

    ManipulationPolicy manipulation = getManipulationPolicy();
    if (std::fabs(manipulation.ela_weight + manipulation.classifier_weight - 1.0) > 1e-6 ||
        manipulation.ela_weight < 0.0 || manipulation.classifier_weight < 0.0)
    {
        Logger::error("manipulation.ela_weight and manipulation.classifier_weight must be non-negative and sum to 1");
        return false;
    }
    if (manipulation.threshold < 0.0 || manipulation.threshold > 1.0)
    {
        Logger::error("Invalid manipulation threshold: " + std::to_string(manipulation.threshold));
        return false;
    }
    if (manipulation.ela_jpeg_quality < 1 || manipulation.ela_jpeg_quality > 100 || manipulation.ela_energy_scale <= 0.0)
    {
        Logger::error("Invalid error-level analysis settings");
        return false;
    }

    std::string scoring_error = getScoringPolicy().validate();
    if (!scoring_error.empty())
    {
        Logger::error("Invalid scoring policy: " + scoring_error);
        return false;
    }

    for (const char *section : kCapabilitySections)
    {
        std::string name(section);
        std::string backend = getBackend(name);
        if (backend != "stub" && backend != "http" && backend != "none")
        {
            Logger::error("Invalid " + name + ".backend: " + backend);
            return false;
        }
        if (backend == "none" && name == "embedding")
        {
            Logger::error("embedding.backend must be 'stub' or 'http'");
            return false;
        }
        if (backend == "http" && getString(name + ".url").empty())
        {
            Logger::error(name + ".url is required for the http backend");
            return false;
        }
        if (getInt(name + ".timeout_ms", 1) <= 0 || getInt(name + ".max_attempts", 1) < 1)
        {
            Logger::error(name + ".timeout_ms and " + name + ".max_attempts must be positive");
            return false;
        }
    }

    int recycled_distance = getInt("recycled.max_distance", 6);
    if (recycled_distance < 0 || recycled_distance > PerceptualHash::kBitLength)
    {
        Logger::error("Invalid recycled.max_distance: " + std::to_string(recycled_distance));
        return false;
    }
    if (getDouble("location.max_distance_m", 50.0) <= 0.0)
    {
        Logger::error("location.max_distance_m must be positive");
        return false;
    }

    int threads = getMaxAnalysisThreads();
    if (threads < 1 || threads > 64)
    {
        Logger::error("Invalid threading.max_analysis_threads: " + std::to_string(threads));
        return false;
    }

    return true;
}

// Utility methods
void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    setDefaultsLocked();
}

void PocoConfigManager::setDefaultsLocked()
{
    cfg_->setString("log_level", "INFO");
    cfg_->setString("database.path", "proof_verifier.db");

    // Image codec defaults
    cfg_->setUInt("image.max_bytes", 20 * 1024 * 1024);
    cfg_->setInt("image.max_input_dimension", 12000);
    cfg_->setInt("image.max_edge", 1024);
    cfg_->setInt("image.min_dimension", 16);
    cfg_->setInt("image.normalized_cache_capacity", 32);

    cfg_->setInt("chunking.rows", 4);
    cfg_->setInt("chunking.cols", 4);

    // Embedding service defaults
    cfg_->setString("embedding.backend", "http");
    cfg_->setString("embedding.url", "http://localhost:8500");
    cfg_->setString("embedding.path", "/v1/embed");
    cfg_->setString("embedding.model", "clip-vit-l-14");
    cfg_->setString("embedding.api_key", "");
    cfg_->setInt("embedding.timeout_ms", 10000);
    cfg_->setInt("embedding.max_attempts", 2);
    cfg_->setInt("embedding.backoff_base_ms", 100);
    cfg_->setUInt("embedding.cache_capacity", 4096);

    // Manipulation detector defaults
    cfg_->setString("manipulation.backend", "http");
    cfg_->setString("manipulation.url", "http://localhost:8501");
    cfg_->setString("manipulation.path", "/v1/classify");
    cfg_->setString("manipulation.model", "ela-classifier-v1");
    cfg_->setInt("manipulation.ela_jpeg_quality", 90);
    cfg_->setDouble("manipulation.ela_energy_scale", 32.0);
    cfg_->setDouble("manipulation.ela_weight", 0.4);
    cfg_->setDouble("manipulation.classifier_weight", 0.6);
    cfg_->setDouble("manipulation.threshold", 0.6);
    cfg_->setInt("manipulation.timeout_ms", 10000);
    cfg_->setInt("manipulation.max_attempts", 2);

    // Vision-language judge defaults
    cfg_->setString("vlm.backend", "http");
    cfg_->setString("vlm.url", "https://api.openai.com");
    cfg_->setString("vlm.path", "/v1/chat/completions");
    cfg_->setString("vlm.model", "gpt-4o");
    cfg_->setString("vlm.api_key", "");
    cfg_->setInt("vlm.timeout_ms", 30000);
    cfg_->setInt("vlm.max_attempts", 2);
    cfg_->setInt("vlm.backoff_base_ms", 100);

    // Scoring defaults
    cfg_->setDouble("scoring.perceptual_weight", 0.25);
    cfg_->setDouble("scoring.chunk_weight", 0.35);
    cfg_->setDouble("scoring.semantic_weight", 0.40);
    cfg_->setDouble("scoring.manipulation_penalty_weight", 0.2);
    cfg_->setDouble("scoring.manipulation_ceiling", 0.4);
    cfg_->setDouble("scoring.recycled_ceiling", 0.2);
    cfg_->setDouble("scoring.approve_threshold", 0.70);
    cfg_->setDouble("scoring.reject_threshold", 0.45);

    cfg_->setInt("recycled.max_distance", 6);
    cfg_->setDouble("location.max_distance_m", 50.0);

    cfg_->setInt("threading.max_analysis_threads", 8);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}
