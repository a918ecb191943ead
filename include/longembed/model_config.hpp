#pragma once

#include "export.hpp"

#include <string>

namespace longembed {

/**
 * @brief Dimensions of a loaded encoder, read from its config.json.
 */
struct LONGEMBED_API ModelConfig {
#pragma warning(push)
#pragma warning(disable: 4251)
    std::string modelType;   // "model_type", informational only
#pragma warning(pop)
    int maxSeqLen  = 0;      // "max_position_embeddings"
    int hiddenSize = 0;      // "hidden_size"

    ModelConfig() = default;
    ModelConfig(int maxSeqLen, int hiddenSize) : maxSeqLen(maxSeqLen), hiddenSize(hiddenSize) {}

    /**
     * @brief Parses the contents of a config.json file.
     * @throws ModelLoadError on malformed JSON or missing/non-positive fields
     */
    static ModelConfig fromJson(const std::string& contents);

    /**
     * @brief Reads and parses a config.json file.
     * @throws ModelLoadError if the file cannot be read or parsed
     */
    static ModelConfig fromFile(const std::string& path);
};

} // namespace longembed
