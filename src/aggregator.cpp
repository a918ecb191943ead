#include "longembed/aggregator.hpp"
#include "longembed/errors.hpp"
#include "longembed/pooling.hpp"

#include <cmath>
#include <string>

namespace longembed
{

void validateAggregationPolicy(const AggregationPolicy &policy)
{
    if (!(policy.firstChunkWeight > 0.0) || !(policy.chunkWeight > 0.0) ||
        !std::isfinite(policy.firstChunkWeight) || !std::isfinite(policy.chunkWeight))
    {
        throw InvalidConfigError("Chunk weights must be positive and finite");
    }
}

std::vector<float> aggregateChunkVectors(const std::vector<std::vector<float>> &chunks, const AggregationPolicy &policy)
{
    if (chunks.empty())
    {
        return {};
    }

    validateAggregationPolicy(policy);

    const size_t num_cols = chunks[0].size();
    std::vector<double> weighted(num_cols, 0.0);
    double weight_sum = 0.0;

    for (size_t i = 0; i < chunks.size(); ++i)
    {
        const auto &row = chunks[i];
        if (row.size() != num_cols)
        {
            throw EncodeError("Chunk " + std::to_string(i) + " has " + std::to_string(row.size()) +
                              " dimensions, expected " + std::to_string(num_cols));
        }

        const double weight = (i == 0) ? policy.firstChunkWeight : policy.chunkWeight;
        weight_sum += weight;

        for (size_t j = 0; j < num_cols; ++j)
        {
            weighted[j] += weight * static_cast<double>(row[j]);
        }
    }

    std::vector<float> mean_vector(num_cols);
    for (size_t j = 0; j < num_cols; ++j)
    {
        mean_vector[j] = static_cast<float>(weighted[j] / weight_sum);
    }

    if (policy.normalizeOutput)
    {
        normalizeInPlace(mean_vector);
    }

    return mean_vector;
}

} // namespace longembed
