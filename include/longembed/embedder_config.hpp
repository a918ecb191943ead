#pragma once

#include <string>
#include <vector>
#include "export.hpp"
#include "aggregator.hpp"
#include "chunker.hpp"

namespace longembed {

/**
 * @brief Which model to load and how to read it.
 */
struct ModelSourceConfig {
    std::string id;                                   // Hub repository id or local directory
    std::string revision = "main";
    bool usePth = false;                              // true: legacy weights, read into memory
    std::string cacheDir = "./models";
    std::string hubEndpoint = "https://huggingface.co";
    std::string hubToken;                             // Empty: HF_TOKEN from the environment
    std::string configFile = "config.json";
    std::string weightsFile = "model.gguf";           // Memory-mapped tensor store
    std::string legacyWeightsFile = "pytorch_model.gguf"; // Converted from pytorch_model.bin, used when usePth is set
    int nThreads = 4;
    int nGpuLayers = 0;
    bool useMlock = false;
};

/**
 * @brief Chunking and aggregation knobs.
 */
struct PipelineConfig {
    int overlapDivisor = kDefaultOverlapDivisor;
    AggregationPolicy aggregation;
};

/**
 * @brief Logger settings applied at startup.
 */
struct LoggingConfig {
    std::string level = "INFO";                       // DEBUG, INFO, WARN, ERROR
    std::string file;                                 // Empty means console only
    bool quietMode = false;
};

/**
 * @brief Embedder configuration: YAML file first, command-line overrides second.
 */
struct LONGEMBED_API EmbedderConfig {
#pragma warning(push)
#pragma warning(disable: 4251)
    ModelSourceConfig model;
    PipelineConfig pipeline;
    LoggingConfig logging;
    std::string currentConfigFilePath;
#pragma warning(pop)

    bool helpOrVersionShown = false;

    EmbedderConfig() = default;

    /**
     * @brief Loads settings from a YAML file; keys that are absent keep their values.
     * @return false if the file cannot be read or holds values of the wrong type
     */
    bool loadFromFile(const std::string& configFile);

    /**
     * @brief Applies command-line options (argument 0 is not the program name).
     * @return false on unknown options, missing values, or after --help/--version
     */
    bool loadFromArgs(const std::vector<std::string>& args);

    /**
     * @brief Checks value ranges; prints the first problem to stderr.
     */
    bool validate() const;

    /**
     * @brief Configures the process-wide logger from the logging section.
     */
    bool applyLogging() const;

    static void printHelp(const std::string& programName);
    static void printVersion();
};

} // namespace longembed
