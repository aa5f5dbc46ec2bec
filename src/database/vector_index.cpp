#include "database/vector_index.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>

namespace
{
    bool allFinite(const EmbeddingVector &vector)
    {
        return std::all_of(vector.values.begin(), vector.values.end(), [](float v)
                           { return std::isfinite(v); });
    }
}

DBOpResult InMemoryVectorIndex::upsert(const std::string &ns, const std::string &id, const EmbeddingVector &vector,
                                       const nlohmann::json &metadata)
{
    if (ns.empty() || id.empty())
    {
        return DBOpResult(false, "Vector namespace and id must not be empty");
    }
    if (vector.values.empty())
    {
        return DBOpResult(false, "Refusing to index an empty vector for " + ns + "/" + id);
    }
    if (!allFinite(vector))
    {
        return DBOpResult(false, "Refusing to index a vector with non-finite values for " + ns + "/" + id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    namespaces_[ns][id] = Entry{vector, metadata};
    Logger::trace("Indexed vector " + ns + "/" + id + " (dim " + std::to_string(vector.dimension()) + ")");
    return DBOpResult(true);
}

std::vector<VectorMatch> InMemoryVectorIndex::query(const std::string &ns, const EmbeddingVector &vector, size_t top_k) const
{
    std::vector<VectorMatch> matches;
    if (top_k == 0)
    {
        return matches;
    }
    if (!allFinite(vector))
    {
        Logger::warn("Vector query in " + ns + " has non-finite values, returning no matches");
        return matches;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = namespaces_.find(ns);
    if (it == namespaces_.end())
    {
        return matches;
    }

    size_t skipped = 0;
    for (const auto &[id, entry] : it->second)
    {
        if (entry.vector.dimension() != vector.dimension() || entry.vector.model_version != vector.model_version)
        {
            skipped++;
            continue;
        }
        matches.push_back(VectorMatch{id, EmbeddingGenerator::cosineSimilarity(vector, entry.vector), entry.metadata});
    }
    if (skipped > 0)
    {
        Logger::debug("Vector query in " + ns + " skipped " + std::to_string(skipped) + " incompatible entries");
    }

    std::sort(matches.begin(), matches.end(), [](const VectorMatch &a, const VectorMatch &b)
              { return a.score != b.score ? a.score > b.score : a.id < b.id; });
    if (matches.size() > top_k)
    {
        matches.resize(top_k);
    }
    return matches;
}

size_t InMemoryVectorIndex::size(const std::string &ns) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = namespaces_.find(ns);
    return it == namespaces_.end() ? 0 : it->second.size();
}
