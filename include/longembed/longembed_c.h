#ifndef LONGEMBED_C_H
#define LONGEMBED_C_H

/**
 * @file longembed_c.h
 * @brief C interface to the long-text embedding model
 *
 * Every function returns a status code. On failure the message of the error
 * is kept per thread and can be read with longembed_last_error().
 */

#include "export.hpp"

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct longembed_model longembed_model;

typedef enum longembed_status {
    LONGEMBED_OK                    = 0,
    LONGEMBED_ERR_MODEL_LOAD        = 1,
    LONGEMBED_ERR_TOKENIZE          = 2,
    LONGEMBED_ERR_INVALID_CONFIG    = 3,
    LONGEMBED_ERR_DEGENERATE_VECTOR = 4,
    LONGEMBED_ERR_ENCODE            = 5,
    LONGEMBED_ERR_INVALID_ARGUMENT  = 6,
    LONGEMBED_ERR_BUFFER_TOO_SMALL  = 7,
    LONGEMBED_ERR_INTERNAL          = 8
} longembed_status;

/**
 * @brief Loads a model; revision may be NULL for "main".
 * @param out_model Receives the new handle on success
 */
LONGEMBED_API longembed_status longembed_create(const char* model_id, const char* revision, int use_pth,
                                                longembed_model** out_model);

/**
 * @brief Loads a model from a YAML configuration file.
 */
LONGEMBED_API longembed_status longembed_create_from_config(const char* config_path, longembed_model** out_model);

LONGEMBED_API void longembed_destroy(longembed_model* model);

LONGEMBED_API int longembed_get_max_input_len(const longembed_model* model);
LONGEMBED_API int longembed_get_hidden_size(const longembed_model* model);

/**
 * @brief Embeds a NUL-terminated UTF-8 string into a caller-provided buffer.
 * @param out Buffer of at least longembed_get_hidden_size() floats
 * @param capacity Number of floats available in out
 * @param out_len Receives the number of floats written (0 if the text had no
 *        tokens), or the required size with LONGEMBED_ERR_BUFFER_TOO_SMALL
 */
LONGEMBED_API longembed_status longembed_predict(longembed_model* model, const char* text,
                                                 float* out, size_t capacity, size_t* out_len);

/**
 * @brief Message of the last failed call on this thread, or "" if none.
 */
LONGEMBED_API const char* longembed_last_error(void);

#ifdef __cplusplus
}
#endif

#endif // LONGEMBED_C_H
