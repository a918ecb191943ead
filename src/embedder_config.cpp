#include "longembed/embedder_config.hpp"
#include "longembed/logger.hpp"

#include <yaml-cpp/yaml.h>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace longembed
{

namespace
{
    int parseInt(const std::string &option, const std::string &value)
    {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("trailing characters in value for " + option);
        }
        return parsed;
    }

    double parseDouble(const std::string &option, const std::string &value)
    {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument("trailing characters in value for " + option);
        }
        return parsed;
    }
}

bool EmbedderConfig::loadFromFile(const std::string &configFile)
{
    try
    {
        YAML::Node config = YAML::LoadFile(configFile);

        if (config["model"])
        {
            auto node = config["model"];
            if (node["id"])
                model.id = node["id"].as<std::string>();
            if (node["revision"])
                model.revision = node["revision"].as<std::string>();
            if (node["use_pth"])
                model.usePth = node["use_pth"].as<bool>();
            if (node["cache_dir"])
                model.cacheDir = node["cache_dir"].as<std::string>();
            if (node["hub_endpoint"])
                model.hubEndpoint = node["hub_endpoint"].as<std::string>();
            if (node["hub_token"])
                model.hubToken = node["hub_token"].as<std::string>();
            if (node["config_file"])
                model.configFile = node["config_file"].as<std::string>();
            if (node["weights_file"])
                model.weightsFile = node["weights_file"].as<std::string>();
            if (node["legacy_weights_file"])
                model.legacyWeightsFile = node["legacy_weights_file"].as<std::string>();
            if (node["n_threads"])
                model.nThreads = node["n_threads"].as<int>();
            if (node["n_gpu_layers"])
                model.nGpuLayers = node["n_gpu_layers"].as<int>();
            if (node["use_mlock"])
                model.useMlock = node["use_mlock"].as<bool>();
        }

        if (config["pipeline"])
        {
            auto node = config["pipeline"];
            if (node["overlap_divisor"])
                pipeline.overlapDivisor = node["overlap_divisor"].as<int>();
            if (node["first_chunk_weight"])
                pipeline.aggregation.firstChunkWeight = node["first_chunk_weight"].as<double>();
            if (node["chunk_weight"])
                pipeline.aggregation.chunkWeight = node["chunk_weight"].as<double>();
            if (node["normalize_output"])
                pipeline.aggregation.normalizeOutput = node["normalize_output"].as<bool>();
        }

        if (config["logging"])
        {
            auto node = config["logging"];
            if (node["level"])
                logging.level = node["level"].as<std::string>();
            if (node["file"])
                logging.file = node["file"].as<std::string>();
            if (node["quiet_mode"])
                logging.quietMode = node["quiet_mode"].as<bool>();
        }

        return true;
    }
    catch (const YAML::Exception &e)
    {
        std::cerr << "Error loading config file " << configFile << ": " << e.what() << std::endl;
        return false;
    }
}

bool EmbedderConfig::loadFromArgs(const std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        const bool hasValue = i + 1 < args.size();

        try
        {
            if ((arg == "-c" || arg == "--config") && hasValue)
            {
                std::string configFile = args[++i];
                if (!loadFromFile(configFile))
                {
                    return false;
                }
                currentConfigFilePath = std::filesystem::absolute(configFile).string();
            }

            // Model options
            else if ((arg == "-m" || arg == "--model") && hasValue)
            {
                model.id = args[++i];
            }
            else if ((arg == "--revision") && hasValue)
            {
                model.revision = args[++i];
            }
            else if (arg == "--use-pth")
            {
                model.usePth = true;
            }
            else if ((arg == "--cache-dir") && hasValue)
            {
                model.cacheDir = args[++i];
            }
            else if ((arg == "--hub-endpoint") && hasValue)
            {
                model.hubEndpoint = args[++i];
            }
            else if ((arg == "--threads") && hasValue)
            {
                model.nThreads = parseInt(arg, args[++i]);
            }
            else if ((arg == "--gpu-layers") && hasValue)
            {
                model.nGpuLayers = parseInt(arg, args[++i]);
            }

            // Pipeline options
            else if ((arg == "--overlap-divisor") && hasValue)
            {
                pipeline.overlapDivisor = parseInt(arg, args[++i]);
            }
            else if ((arg == "--first-chunk-weight") && hasValue)
            {
                pipeline.aggregation.firstChunkWeight = parseDouble(arg, args[++i]);
            }
            else if ((arg == "--chunk-weight") && hasValue)
            {
                pipeline.aggregation.chunkWeight = parseDouble(arg, args[++i]);
            }
            else if (arg == "--normalize-output")
            {
                pipeline.aggregation.normalizeOutput = true;
            }

            // Logging options
            else if ((arg == "--log-level") && hasValue)
            {
                logging.level = args[++i];
            }
            else if ((arg == "--log-file") && hasValue)
            {
                logging.file = args[++i];
            }
            else if (arg == "-q" || arg == "--quiet")
            {
                logging.quietMode = true;
            }

            // Help and version
            else if (arg == "-h" || arg == "--help")
            {
                printHelp("longembed");
                helpOrVersionShown = true;
                return false;
            }
            else if (arg == "-v" || arg == "--version")
            {
                printVersion();
                helpOrVersionShown = true;
                return false;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                std::cerr << "Unknown option or missing value: " << arg << std::endl;
                return false;
            }
            else
            {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error: Invalid value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }

    return true;
}

bool EmbedderConfig::validate() const
{
    if (model.id.empty())
    {
        std::cerr << "Error: Model ID cannot be empty" << std::endl;
        return false;
    }
    if (model.revision.empty())
    {
        std::cerr << "Error: Model revision cannot be empty" << std::endl;
        return false;
    }
    if (model.configFile.empty() || model.weightsFile.empty() || model.legacyWeightsFile.empty())
    {
        std::cerr << "Error: Model file names cannot be empty" << std::endl;
        return false;
    }
    if (model.nThreads <= 0 || model.nThreads > 1024)
    {
        std::cerr << "Error: n_threads must be between 1 and 1024" << std::endl;
        return false;
    }
    if (model.nGpuLayers < 0)
    {
        std::cerr << "Error: n_gpu_layers cannot be negative" << std::endl;
        return false;
    }

    if (pipeline.overlapDivisor <= 0)
    {
        std::cerr << "Error: overlap_divisor must be positive" << std::endl;
        return false;
    }
    const auto &policy = pipeline.aggregation;
    if (!std::isfinite(policy.firstChunkWeight) || policy.firstChunkWeight <= 0.0 ||
        !std::isfinite(policy.chunkWeight) || policy.chunkWeight <= 0.0)
    {
        std::cerr << "Error: Chunk weights must be positive" << std::endl;
        return false;
    }

    LogLevel level;
    if (!Logger::parseLevel(logging.level, level))
    {
        std::cerr << "Error: Invalid log level: " << logging.level << std::endl;
        return false;
    }

    return true;
}

bool EmbedderConfig::applyLogging() const
{
    LogLevel level;
    if (!Logger::parseLevel(logging.level, level))
    {
        std::cerr << "Error: Invalid log level: " << logging.level << std::endl;
        return false;
    }

    Logger &logger = Logger::instance();
    logger.setLevel(level);
    logger.setQuietMode(logging.quietMode);

    if (!logging.file.empty() && !logger.setLogFile(logging.file))
    {
        std::cerr << "Error: Cannot open log file: " << logging.file << std::endl;
        return false;
    }
    return true;
}

void EmbedderConfig::printHelp(const std::string &programName)
{
    std::cout << "longembed v1.0.0 - Fixed-size embeddings for arbitrarily long text\n\n";
    std::cout << "USAGE:\n";
    std::cout << "    " << programName << " [OPTIONS] (--text TEXT | --file PATH)\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  Input:\n";
    std::cout << "    -t, --text TEXT           Text to embed\n";
    std::cout << "    -f, --file PATH           Read the text to embed from a file ('-' for stdin)\n";
    std::cout << "    -c, --config FILE         Load configuration from YAML file\n\n";

    std::cout << "  Model:\n";
    std::cout << "    -m, --model ID            Hub model id or local model directory\n";
    std::cout << "    --revision REV            Model revision (default: main)\n";
    std::cout << "    --use-pth                 Read legacy weights into memory instead of mapping them\n";
    std::cout << "    --cache-dir DIR           Download cache directory (default: ./models)\n";
    std::cout << "    --hub-endpoint URL        Model hub base URL (default: https://huggingface.co)\n";
    std::cout << "    --threads N               Encoder threads (default: 4)\n";
    std::cout << "    --gpu-layers N            Layers to offload to the GPU (default: 0)\n\n";

    std::cout << "  Pipeline:\n";
    std::cout << "    --overlap-divisor N       Window overlap is max_seq_len / N (default: 10)\n";
    std::cout << "    --first-chunk-weight W    Weight of the first window (default: 1.2)\n";
    std::cout << "    --chunk-weight W          Weight of every later window (default: 1.0)\n";
    std::cout << "    --normalize-output        Rescale the aggregated vector to unit length\n\n";

    std::cout << "  Logging:\n";
    std::cout << "    --log-level LEVEL         Log level: DEBUG, INFO, WARN, ERROR (default: INFO)\n";
    std::cout << "    --log-file FILE           Also write log entries to FILE\n";
    std::cout << "    -q, --quiet               Suppress per-call progress messages\n\n";

    std::cout << "  Other:\n";
    std::cout << "    -h, --help                Show this help\n";
    std::cout << "    -v, --version             Show version information\n";
}

void EmbedderConfig::printVersion()
{
    std::cout << "longembed v1.0.0\n";
    std::cout << "Long-text embeddings over a llama.cpp encoder\n";
}

} // namespace longembed
