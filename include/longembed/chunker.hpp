#pragma once

#include "export.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace longembed {

/**
 * @brief One window of a token sequence.
 *
 * Holds its offset into the source sequence and a copy of the covered ids.
 */
struct TokenChunk {
    size_t start = 0;
    std::vector<int32_t> tokens;

    size_t length() const { return tokens.size(); }
    size_t end() const { return start + tokens.size(); }
};

/**
 * @brief Default divisor for deriving the overlap from the window length.
 */
constexpr int kDefaultOverlapDivisor = 10;

/**
 * @brief Overlap used for a given window length: maxSeqLen / divisor.
 * @throws InvalidConfigError if divisor is not positive
 */
LONGEMBED_API int overlapForWindow(int maxSeqLen, int divisor = kDefaultOverlapDivisor);

/**
 * @brief Checks that chunking with these parameters terminates.
 * @throws InvalidConfigError if maxSeqLen <= 0, overlap < 0 or overlap >= maxSeqLen
 */
LONGEMBED_API void validateChunkingParameters(int maxSeqLen, int overlap);

/**
 * @brief Splits a token sequence into overlapping windows.
 *
 * Windows are [start, min(start + maxSeqLen, n)) for start = 0, step, 2*step...
 * while start < n, with step = maxSeqLen - overlap. A sequence no longer than
 * maxSeqLen yields exactly one window; an empty sequence yields none.
 *
 * @throws InvalidConfigError before any work if the parameters are invalid
 */
LONGEMBED_API std::vector<TokenChunk> chunkTokens(const std::vector<int32_t>& tokens, int maxSeqLen, int overlap);

} // namespace longembed
