#pragma once

#include "export.hpp"

#include <vector>

namespace longembed {

// Weight of the opening window; it usually carries the title or lead.
constexpr double kFirstChunkWeight = 1.2;
constexpr double kDefaultChunkWeight = 1.0;

/**
 * @brief How per-window vectors are combined into one document vector.
 */
struct AggregationPolicy {
    double firstChunkWeight = kFirstChunkWeight;
    double chunkWeight      = kDefaultChunkWeight;

    // Off by default: the weighted mean of unit vectors is returned as is
    bool   normalizeOutput  = false;
};

/**
 * @throws InvalidConfigError unless both weights are positive and finite
 */
LONGEMBED_API void validateAggregationPolicy(const AggregationPolicy& policy);

/**
 * @brief Weighted mean of ordered chunk vectors.
 *
 * result[j] = sum_i(w_i * chunks[i][j]) / sum_i(w_i), where w_0 is the first
 * chunk weight and every later chunk gets the regular weight. An empty list
 * yields an empty vector. With normalizeOutput the result is rescaled to unit
 * norm afterwards.
 *
 * @throws EncodeError if the chunk vectors differ in length
 * @throws InvalidConfigError if a weight is not positive
 * @throws DegenerateVectorError if normalizeOutput is set and the mean is zero
 */
LONGEMBED_API std::vector<float> aggregateChunkVectors(const std::vector<std::vector<float>>& chunks,
                                                       const AggregationPolicy& policy = AggregationPolicy());

} // namespace longembed
