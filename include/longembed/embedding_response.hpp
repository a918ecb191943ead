#pragma once

#include "embedding_model.hpp"
#include "export.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace longembed {

/**
 * @brief Command-line output for one embedded input.
 *
 * {"model", "revision", "dimensions", "tokens", "chunks", "embedding"}
 */
struct LONGEMBED_API EmbeddingResponse {
    std::string model;
    std::string revision;
    EmbeddingResult result;

    nlohmann::json to_json() const;

    /**
     * @brief Serializes to a single line. Invalid UTF-8 in the strings is
     * replaced with U+FFFD instead of failing.
     */
    std::string dump() const;
};

} // namespace longembed
