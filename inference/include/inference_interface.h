#ifndef INFERENCE_INTERFACE_H
#define INFERENCE_INTERFACE_H

/**
 * @file inference_interface.h
 * @brief Narrow capability interfaces for tokenizers and encoder models
 *
 * This header defines the two collaborator contracts consumed by the
 * embedding pipeline: a tokenizer that turns text into token ids, and an
 * encoder that turns one window of token ids into a per-token hidden-state
 * tensor. Any compliant transformer runtime can be plugged in behind them.
 *
 * @section design Design Pattern
 * Both interfaces are strategies with a single operation each, so test
 * doubles and alternative runtimes can be substituted without inheriting
 * from a model hierarchy.
 *
 * @section usage Usage Pattern
 * 1. Resolve TokenizerOptions and LoadingParameters once
 * 2. Load a runtime (see inference.h) with those values
 * 3. Call tokenize() and forward() from one thread at a time
 *
 * @version 1.0
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
// API Export/Import Macros
// =============================================================================
#ifdef LONGEMBED_STATIC
    // For static library linking, no import/export needed
    #define INFERENCE_API
#elif defined(_WIN32)
    #ifdef INFERENCE_EXPORTS
        #define INFERENCE_API __declspec(dllexport)
    #else
        #define INFERENCE_API __declspec(dllimport)
    #endif
#else
    #ifdef INFERENCE_EXPORTS
        #define INFERENCE_API __attribute__((visibility("default")))
    #else
        #define INFERENCE_API
    #endif
#endif

// =============================================================================
// Parameter Structures
// =============================================================================

/**
 * @brief Tokenizer behaviour, resolved once when a model is loaded.
 *
 * The value is copied into the tokenizer at load time and never changed
 * afterwards, so concurrent readers never observe a reconfiguration.
 */
struct TokenizerOptions {
    bool addSpecialTokens   = true;    // Insert BOS/CLS and EOS/SEP tokens
    bool parseSpecialTokens = false;   // Treat special-token text in the input as plain text
};

/**
 * @brief Parameters for loading an encoder model.
 */
struct LoadingParameters {
    // Context settings
    int  n_ctx              = 512;     // Maximum window length handled per forward pass
    int  n_batch            = 512;     // Logical batch size
    int  n_ubatch           = 512;     // Physical batch size (must hold a whole window)

    // Memory optimization
    bool use_mlock          = false;   // Lock memory pages
    bool use_mmap           = true;    // Use memory mapping

    // Hardware
    int  n_threads          = 4;       // CPU threads
    int  n_gpu_layers       = 0;       // Number of GPU layers

    bool isValid() const;
};

// =============================================================================
// Tensor Structures
// =============================================================================

/**
 * @brief Per-token hidden states of shape (batch, n_tokens, hidden_size).
 *
 * Values are stored row-major: data[(b * n_tokens + t) * hidden_size + h].
 */
struct HiddenStates {
    size_t             batch       = 0;
    size_t             n_tokens    = 0;
    size_t             hidden_size = 0;
    std::vector<float> data;

    HiddenStates() = default;
    HiddenStates(size_t batch, size_t n_tokens, size_t hidden_size)
        : batch(batch), n_tokens(n_tokens), hidden_size(hidden_size),
          data(batch * n_tokens * hidden_size, 0.0f) {}

    float& at(size_t b, size_t t, size_t h) { return data[(b * n_tokens + t) * hidden_size + h]; }
    float  at(size_t b, size_t t, size_t h) const { return data[(b * n_tokens + t) * hidden_size + h]; }

    bool isConsistent() const { return data.size() == batch * n_tokens * hidden_size; }
};

// =============================================================================
// Collaborator Interfaces
// =============================================================================

/**
 * @brief Turns text into an ordered sequence of token ids.
 */
class INFERENCE_API ITokenizer {
public:
    virtual ~ITokenizer() = default;

    /**
     * @brief Tokenizes text according to the options fixed at load time.
     * @param text UTF-8 input text
     * @return Token ids, special tokens included when enabled
     * @throws std::runtime_error if the input cannot be tokenized
     */
    virtual std::vector<int32_t> tokenize(const std::string& text) = 0;
};

/**
 * @brief Runs one forward pass of a transformer encoder.
 */
class INFERENCE_API IEncoder {
public:
    virtual ~IEncoder() = default;

    /**
     * @brief Encodes one window of tokens with batch size 1.
     * @param tokenIds Token ids of the window
     * @param tokenTypeIds Token type ids, same length as tokenIds
     * @return Hidden states of shape (1, tokenIds.size(), hidden_size)
     * @throws std::runtime_error on shape mismatch or backend failure
     */
    virtual HiddenStates forward(const std::vector<int32_t>& tokenIds,
                                 const std::vector<int32_t>& tokenTypeIds) = 0;
};

#endif // INFERENCE_INTERFACE_H
