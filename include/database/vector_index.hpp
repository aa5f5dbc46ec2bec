#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/embedding_generator.hpp"
#include "database/persistent_store.hpp"

/// Well-known index namespaces
namespace VectorNamespace
{
    constexpr const char *COMPLAINTS = "complaints";
    constexpr const char *PROOFS = "proofs";
    constexpr const char *CHUNKS = "chunks";
}

struct VectorMatch
{
    std::string id;
    double score = 0.0; // Cosine similarity
    nlohmann::json metadata;
};

/**
 * @brief Nearest-neighbour index over embedding vectors, partitioned by namespace
 *
 * Queries only compare vectors of the same model version and dimensionality.
 */
class VectorIndex
{
public:
    virtual ~VectorIndex() = default;

    /// Insert or replace the vector stored under (ns, id).
    virtual DBOpResult upsert(const std::string &ns, const std::string &id, const EmbeddingVector &vector,
                              const nlohmann::json &metadata = nlohmann::json::object()) = 0;

    /// Up to top_k matches ordered by descending similarity.
    virtual std::vector<VectorMatch> query(const std::string &ns, const EmbeddingVector &vector, size_t top_k) const = 0;

    virtual size_t size(const std::string &ns) const = 0;
};

/**
 * @brief Brute-force in-process VectorIndex
 */
class InMemoryVectorIndex : public VectorIndex
{
public:
    DBOpResult upsert(const std::string &ns, const std::string &id, const EmbeddingVector &vector,
                      const nlohmann::json &metadata = nlohmann::json::object()) override;
    std::vector<VectorMatch> query(const std::string &ns, const EmbeddingVector &vector, size_t top_k) const override;
    size_t size(const std::string &ns) const override;

private:
    struct Entry
    {
        EmbeddingVector vector;
        nlohmann::json metadata;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::map<std::string, Entry>> namespaces_;
};
