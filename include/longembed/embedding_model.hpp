#pragma once

#include "export.hpp"
#include "aggregator.hpp"
#include "chunker.hpp"
#include "model_config.hpp"
#include "inference_interface.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace longembed {

struct EmbedderConfig;

/**
 * @brief Output of one embed() call.
 */
struct EmbeddingResult {
    std::vector<float> embedding;
    size_t tokens_count = 0;
    size_t chunks_count = 0;
};

/**
 * @brief Produces one fixed-size vector for text of any length.
 *
 * The text is tokenized once and split into windows of at most
 * getMaxInputLen() tokens overlapping by max_seq_len / overlap divisor. Each
 * window is encoded, mean-pooled and normalized to unit length; the window
 * vectors are then combined with a weighted mean that favours the first one.
 *
 * Calls on one instance are serialized; separate instances are independent.
 */
class LONGEMBED_API EmbeddingModel {
public:
    /**
     * @brief Loads a model from the hub or a local directory.
     * @param modelId Hub repository id, or path to a directory holding the model files
     * @param revision Branch, tag or commit of the repository
     * @param usePth Read the legacy weights file into memory instead of mapping it
     * @throws ModelLoadError if any file cannot be fetched or parsed, or the
     *         model dimensions are inconsistent
     */
    static std::unique_ptr<EmbeddingModel> create(const std::string& modelId,
                                                  const std::string& revision = "main",
                                                  bool usePth = false);

    /**
     * @brief Loads a model with cache, hub, file-name, thread and pipeline settings.
     * @throws ModelLoadError as above
     * @throws InvalidConfigError if the pipeline settings are invalid
     */
    static std::unique_ptr<EmbeddingModel> create(const EmbedderConfig& config);

    /**
     * @brief Wraps an already loaded tokenizer and encoder.
     * @throws InvalidConfigError if a collaborator is missing, hidden_size is not
     *         positive or the overlap divisor is not positive
     */
    EmbeddingModel(std::shared_ptr<ITokenizer> tokenizer,
                   std::shared_ptr<IEncoder> encoder,
                   const ModelConfig& config,
                   const AggregationPolicy& policy = AggregationPolicy(),
                   int overlapDivisor = kDefaultOverlapDivisor);

    EmbeddingModel(const EmbeddingModel&) = delete;
    EmbeddingModel& operator=(const EmbeddingModel&) = delete;

    /**
     * @brief Embeds text into a vector of length getHiddenSize().
     *
     * Returns an empty vector when the tokenizer produces no tokens.
     *
     * @throws TokenizeError, InvalidConfigError, EncodeError or DegenerateVectorError
     */
    std::vector<float> predict(const std::string& text);

    /**
     * @brief Same pipeline as predict(), also reporting token and window counts.
     */
    EmbeddingResult embed(const std::string& text);

    int getMaxInputLen() const { return config.maxSeqLen; }
    int getHiddenSize() const { return config.hiddenSize; }

    const AggregationPolicy& getAggregationPolicy() const { return policy; }

private:
#pragma warning(push)
#pragma warning(disable: 4251)
    std::shared_ptr<ITokenizer> tokenizer;
    std::shared_ptr<IEncoder> encoder;
    ModelConfig config;
    AggregationPolicy policy;
    int overlapDivisor;
    std::mutex callMutex;
#pragma warning(pop)

    std::vector<float> encodeChunk(const TokenChunk& chunk, size_t index);
};

} // namespace longembed
