#include "longembed/chunker.hpp"
#include "longembed/errors.hpp"
#include "longembed/logger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace longembed
{

int overlapForWindow(int maxSeqLen, int divisor)
{
    if (divisor <= 0)
    {
        throw InvalidConfigError("Overlap divisor must be positive, got " + std::to_string(divisor));
    }
    return maxSeqLen / divisor;
}

void validateChunkingParameters(int maxSeqLen, int overlap)
{
    if (maxSeqLen <= 0)
    {
        throw InvalidConfigError("Maximum sequence length must be positive, got " + std::to_string(maxSeqLen));
    }

    if (overlap < 0)
    {
        throw InvalidConfigError("Chunk overlap must not be negative, got " + std::to_string(overlap));
    }

    if (overlap >= maxSeqLen)
    {
        throw InvalidConfigError("Chunk overlap (" + std::to_string(overlap) +
                                 ") must be smaller than the maximum sequence length (" +
                                 std::to_string(maxSeqLen) + ")");
    }
}

std::vector<TokenChunk> chunkTokens(const std::vector<int32_t> &tokens, int maxSeqLen, int overlap)
{
    validateChunkingParameters(maxSeqLen, overlap);

    std::vector<TokenChunk> chunks;
    if (tokens.empty())
    {
        return chunks;
    }

    const size_t window = static_cast<size_t>(maxSeqLen);
    const size_t step = static_cast<size_t>(maxSeqLen - overlap);
    chunks.reserve((tokens.size() + step - 1) / step);

    for (size_t start = 0; start < tokens.size(); start += step)
    {
        const size_t end = std::min(start + window, tokens.size());

        TokenChunk chunk;
        chunk.start = start;
        chunk.tokens.assign(tokens.begin() + start, tokens.begin() + end);
        chunks.push_back(std::move(chunk));

        // The last window reaches the end; anything after it would sit inside its overlap
        if (end == tokens.size())
        {
            break;
        }
    }

    Logger::logDebug("Generated %zu chunks from %zu tokens (window %d, overlap %d)",
                     chunks.size(), tokens.size(), maxSeqLen, overlap);
    return chunks;
}

} // namespace longembed
