#include "longembed/model_config.hpp"
#include "longembed/errors.hpp"
#include "longembed/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace longembed
{

namespace
{
    int requirePositiveInt(const nlohmann::json &config, const char *key)
    {
        if (!config.contains(key))
        {
            throw ModelLoadError(std::string(key) + " not found in model configuration");
        }

        const auto &value = config[key];
        if (!value.is_number_integer())
        {
            throw ModelLoadError(std::string(key) + " must be an integer in model configuration");
        }

        const auto number = value.get<long long>();
        if (number <= 0 || number > std::numeric_limits<int>::max())
        {
            throw ModelLoadError(std::string(key) + " out of range in model configuration: " + std::to_string(number));
        }
        return static_cast<int>(number);
    }
}

ModelConfig ModelConfig::fromJson(const std::string &contents)
{
    nlohmann::json config;
    try
    {
        config = nlohmann::json::parse(contents);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ModelLoadError(std::string("Invalid model configuration JSON: ") + e.what());
    }

    if (!config.is_object())
    {
        throw ModelLoadError("Model configuration must be a JSON object");
    }

    ModelConfig result;
    result.maxSeqLen = requirePositiveInt(config, "max_position_embeddings");
    result.hiddenSize = requirePositiveInt(config, "hidden_size");

    if (config.contains("model_type") && config["model_type"].is_string())
    {
        result.modelType = config["model_type"].get<std::string>();
    }

    return result;
}

ModelConfig ModelConfig::fromFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw ModelLoadError("Cannot open model configuration: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    ModelConfig result = fromJson(buffer.str());
    Logger::logDebug("Model configuration %s: type=%s max_position_embeddings=%d hidden_size=%d",
                     path.c_str(), result.modelType.empty() ? "unknown" : result.modelType.c_str(),
                     result.maxSeqLen, result.hiddenSize);
    return result;
}

} // namespace longembed
