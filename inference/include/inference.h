#ifndef INFERENCE_H
#define INFERENCE_H

/**
 * @file inference.h
 * @brief llama.cpp-backed tokenizer and encoder runtime
 *
 * The InferenceEngine loads a GGUF encoder model (BERT family) and exposes it
 * through the ITokenizer and IEncoder interfaces. The context is created with
 * per-token outputs and no built-in pooling, so forward() returns the raw
 * hidden-state tensor of the window.
 *
 * @section usage Basic Usage Example
 * @code
 * InferenceEngine engine;
 *
 * LoadingParameters loadParams;
 * loadParams.n_ctx    = 512;   // Maximum window length
 * loadParams.n_batch  = 512;
 * loadParams.n_ubatch = 512;
 * loadParams.use_mmap = true;
 *
 * if (!engine.loadModel("path/to/model.gguf", loadParams, TokenizerOptions())) {
 *     std::cerr << engine.getLastError() << std::endl;
 *     return -1;
 * }
 *
 * std::vector<int32_t> ids = engine.tokenize("The capital of France is Paris");
 * std::vector<int32_t> types(ids.size(), 0);
 * HiddenStates states = engine.forward(ids, types);
 * @endcode
 *
 * @section threading Thread Safety
 * A loaded engine owns a single llama context. tokenize() and forward() must
 * not be called concurrently on the same engine; callers serialize access.
 *
 * @version 1.0
 */

#include "inference_interface.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Encoder runtime over a llama.cpp model and context.
 */
class INFERENCE_API InferenceEngine : public ITokenizer, public IEncoder {
public:
    explicit InferenceEngine();
    ~InferenceEngine();

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;

    // Model management
    /**
     * @brief Loads a GGUF encoder model.
     * @param modelPath Path to the GGUF model file
     * @param lParams Loading parameters
     * @param tokenizerOptions Tokenizer behaviour, fixed for the engine's lifetime
     * @return true if the model loaded successfully, false otherwise (see getLastError())
     */
    bool loadModel(const char* modelPath, const LoadingParameters lParams,
                   const TokenizerOptions tokenizerOptions = TokenizerOptions());

    // Model information
    int getEmbeddingSize() const;        // Hidden size of the encoder
    int getVocabSize() const;

    /**
     * @brief Gets the message of the last failed load.
     */
    std::string getLastError() const;

    // ITokenizer
    std::vector<int32_t> tokenize(const std::string& text) override;

    // IEncoder
    HiddenStates forward(const std::vector<int32_t>& tokenIds,
                         const std::vector<int32_t>& tokenTypeIds) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
    std::string           lastError;
};

#endif // INFERENCE_H
