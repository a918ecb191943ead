#include "longembed/longembed_c.h"
#include "longembed/c_handle.hpp"
#include "longembed/embedder_config.hpp"
#include "longembed/embedding_model.hpp"
#include "longembed/errors.hpp"

#include <algorithm>
#include <memory>
#include <new>
#include <string>
#include <vector>

struct longembed_model {
    std::unique_ptr<longembed::EmbeddingModel> model;
};

namespace
{
    thread_local std::string lastError;

    longembed_status fail(longembed_status status, const std::string &message)
    {
        lastError = message;
        return status;
    }

    // Most-derived types first; every taxonomy entry gets its own code.
    longembed_status statusFor(const std::exception &e)
    {
        if (dynamic_cast<const longembed::ModelLoadError *>(&e))
            return LONGEMBED_ERR_MODEL_LOAD;
        if (dynamic_cast<const longembed::TokenizeError *>(&e))
            return LONGEMBED_ERR_TOKENIZE;
        if (dynamic_cast<const longembed::InvalidConfigError *>(&e))
            return LONGEMBED_ERR_INVALID_CONFIG;
        if (dynamic_cast<const longembed::DegenerateVectorError *>(&e))
            return LONGEMBED_ERR_DEGENERATE_VECTOR;
        if (dynamic_cast<const longembed::EncodeError *>(&e))
            return LONGEMBED_ERR_ENCODE;
        return LONGEMBED_ERR_INTERNAL;
    }

    longembed_status wrap(std::unique_ptr<longembed::EmbeddingModel> model, longembed_model **out_model)
    {
        auto *handle = new (std::nothrow) longembed_model;
        if (!handle)
        {
            return fail(LONGEMBED_ERR_INTERNAL, "Out of memory");
        }
        handle->model = std::move(model);
        *out_model = handle;
        return LONGEMBED_OK;
    }
}

longembed_status longembed::wrapModelHandle(std::unique_ptr<EmbeddingModel> model, longembed_model **out_model)
{
    lastError.clear();
    if (!model || !out_model)
    {
        return fail(LONGEMBED_ERR_INVALID_ARGUMENT, "model and out_model must not be NULL");
    }
    *out_model = nullptr;
    return wrap(std::move(model), out_model);
}

extern "C" LONGEMBED_API longembed_status longembed_create(const char *model_id, const char *revision, int use_pth,
                                                          longembed_model **out_model)
{
    lastError.clear();
    if (!model_id || !out_model)
    {
        return fail(LONGEMBED_ERR_INVALID_ARGUMENT, "model_id and out_model must not be NULL");
    }
    *out_model = nullptr;

    try
    {
        auto model = longembed::EmbeddingModel::create(model_id, revision ? revision : "main", use_pth != 0);
        return wrap(std::move(model), out_model);
    }
    catch (const std::exception &e)
    {
        return fail(statusFor(e), e.what());
    }
}

extern "C" LONGEMBED_API longembed_status longembed_create_from_config(const char *config_path,
                                                                      longembed_model **out_model)
{
    lastError.clear();
    if (!config_path || !out_model)
    {
        return fail(LONGEMBED_ERR_INVALID_ARGUMENT, "config_path and out_model must not be NULL");
    }
    *out_model = nullptr;

    longembed::EmbedderConfig config;
    if (!config.loadFromFile(config_path))
    {
        return fail(LONGEMBED_ERR_INVALID_CONFIG, std::string("Cannot load configuration from ") + config_path);
    }
    if (!config.validate())
    {
        return fail(LONGEMBED_ERR_INVALID_CONFIG, std::string("Invalid configuration in ") + config_path);
    }

    try
    {
        return wrap(longembed::EmbeddingModel::create(config), out_model);
    }
    catch (const std::exception &e)
    {
        return fail(statusFor(e), e.what());
    }
}

extern "C" LONGEMBED_API void longembed_destroy(longembed_model *model)
{
    delete model;
}

extern "C" LONGEMBED_API int longembed_get_max_input_len(const longembed_model *model)
{
    return model ? model->model->getMaxInputLen() : 0;
}

extern "C" LONGEMBED_API int longembed_get_hidden_size(const longembed_model *model)
{
    return model ? model->model->getHiddenSize() : 0;
}

extern "C" LONGEMBED_API longembed_status longembed_predict(longembed_model *model, const char *text,
                                                           float *out, size_t capacity, size_t *out_len)
{
    lastError.clear();
    if (!model || !text || !out_len)
    {
        return fail(LONGEMBED_ERR_INVALID_ARGUMENT, "model, text and out_len must not be NULL");
    }
    *out_len = 0;

    std::vector<float> embedding;
    try
    {
        embedding = model->model->predict(text);
    }
    catch (const std::exception &e)
    {
        return fail(statusFor(e), e.what());
    }

    if (embedding.size() > capacity || (!embedding.empty() && !out))
    {
        *out_len = embedding.size();
        return fail(LONGEMBED_ERR_BUFFER_TOO_SMALL,
                    "Output buffer holds " + std::to_string(capacity) + " floats, " +
                    std::to_string(embedding.size()) + " required");
    }

    std::copy(embedding.begin(), embedding.end(), out);
    *out_len = embedding.size();
    return LONGEMBED_OK;
}

extern "C" LONGEMBED_API const char *longembed_last_error(void)
{
    return lastError.c_str();
}
