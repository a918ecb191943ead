#pragma once

#include "export.hpp"

#include <stdexcept>
#include <string>

namespace longembed {

/**
 * @brief Base class of every error raised by model creation and prediction.
 */
class LONGEMBED_API EmbedderError : public std::runtime_error {
public:
    explicit EmbedderError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Configuration, tokenizer or weights could not be fetched or parsed.
 */
class LONGEMBED_API ModelLoadError : public EmbedderError {
public:
    explicit ModelLoadError(const std::string& message) : EmbedderError(message) {}
};

/**
 * @brief The tokenizer rejected the input text.
 */
class LONGEMBED_API TokenizeError : public EmbedderError {
public:
    explicit TokenizeError(const std::string& message) : EmbedderError(message) {}
};

/**
 * @brief Chunking or pipeline parameters are invalid.
 */
class LONGEMBED_API InvalidConfigError : public EmbedderError {
public:
    explicit InvalidConfigError(const std::string& message) : EmbedderError(message) {}
};

/**
 * @brief A pooled chunk vector has zero (or non-finite) norm.
 */
class LONGEMBED_API DegenerateVectorError : public EmbedderError {
public:
    explicit DegenerateVectorError(const std::string& message) : EmbedderError(message) {}
};

/**
 * @brief The encoder failed or returned a tensor of the wrong shape.
 */
class LONGEMBED_API EncodeError : public EmbedderError {
public:
    explicit EncodeError(const std::string& message) : EmbedderError(message) {}
};

} // namespace longembed
