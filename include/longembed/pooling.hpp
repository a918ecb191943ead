#pragma once

#include "export.hpp"
#include "inference_interface.h"

#include <vector>

namespace longembed {

/**
 * @brief Mean over the token axis of a (1, n_tokens, hidden_size) tensor.
 *
 * Every token counts with equal weight, special tokens included; no
 * attention mask is applied.
 *
 * @return Vector of length hidden_size
 * @throws EncodeError if batch != 1, n_tokens == 0 or the data size is inconsistent
 */
LONGEMBED_API std::vector<float> meanPool(const HiddenStates& states);

/**
 * @brief Euclidean norm, accumulated in double precision.
 */
LONGEMBED_API double l2Norm(const std::vector<float>& v);

/**
 * @brief Rescales v in place to unit Euclidean norm.
 * @throws DegenerateVectorError if the norm is zero or not finite
 */
LONGEMBED_API void normalizeInPlace(std::vector<float>& v);

/**
 * @brief Returns v rescaled to unit Euclidean norm.
 * @throws DegenerateVectorError if the norm is zero or not finite
 */
LONGEMBED_API std::vector<float> normalizeVector(std::vector<float> v);

} // namespace longembed
