#pragma once

#include "embedding_model.hpp"
#include "export.hpp"
#include "longembed_c.h"

#include <memory>

namespace longembed {

/**
 * @brief Hands an already constructed model to the C interface.
 *
 * On success out_model owns the model and must be released with
 * longembed_destroy(). A null model yields LONGEMBED_ERR_INVALID_ARGUMENT.
 */
LONGEMBED_API longembed_status wrapModelHandle(std::unique_ptr<EmbeddingModel> model, longembed_model** out_model);

} // namespace longembed
