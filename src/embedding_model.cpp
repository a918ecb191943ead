#include "longembed/embedding_model.hpp"
#include "longembed/embedder_config.hpp"
#include "longembed/errors.hpp"
#include "longembed/logger.hpp"
#include "longembed/model_repository.hpp"
#include "longembed/pooling.hpp"
#include "longembed/weights_loader.hpp"
#include "inference.h"

#include <chrono>
#include <utility>

namespace longembed
{

namespace
{
    // Special tokens on; the tokenizer never pads or truncates, windows are cut by the chunker.
    TokenizerOptions pipelineTokenizerOptions()
    {
        TokenizerOptions options;
        options.addSpecialTokens = true;
        options.parseSpecialTokens = false;
        return options;
    }
}

std::unique_ptr<EmbeddingModel> EmbeddingModel::create(const std::string &modelId, const std::string &revision, bool usePth)
{
    EmbedderConfig config;
    config.model.id = modelId;
    config.model.revision = revision;
    config.model.usePth = usePth;
    return create(config);
}

std::unique_ptr<EmbeddingModel> EmbeddingModel::create(const EmbedderConfig &config)
{
    auto start = std::chrono::steady_clock::now();

    RepositoryConfig repositoryConfig;
    repositoryConfig.endpoint = config.model.hubEndpoint;
    repositoryConfig.cacheDir = config.model.cacheDir;
    repositoryConfig.token = config.model.hubToken;

    ModelRepository repository(config.model.id, config.model.revision, repositoryConfig);

    ModelConfig modelConfig = ModelConfig::fromFile(repository.get(config.model.configFile));
    Logger::logInfo("Model %s@%s: max_seq_len=%d hidden_size=%d",
                    config.model.id.c_str(), config.model.revision.c_str(),
                    modelConfig.maxSeqLen, modelConfig.hiddenSize);

    LoadingParameters params;
    params.n_ctx = modelConfig.maxSeqLen;
    params.n_batch = modelConfig.maxSeqLen;
    params.n_ubatch = modelConfig.maxSeqLen;
    params.n_threads = config.model.nThreads;
    params.n_gpu_layers = config.model.nGpuLayers;
    params.use_mlock = config.model.useMlock;

    auto loader = makeWeightsLoader(config.model.usePth, config.model.weightsFile, config.model.legacyWeightsFile);
    const std::string weightsPath = loader->prepare(repository, params);

    auto engine = std::make_shared<InferenceEngine>();
    if (!engine->loadModel(weightsPath.c_str(), params, pipelineTokenizerOptions()))
    {
        throw ModelLoadError("Failed to load encoder from " + weightsPath + ": " + engine->getLastError());
    }

    if (engine->getVocabSize() <= 0)
    {
        throw ModelLoadError("Tokenizer vocabulary of " + weightsPath + " is empty");
    }

    if (engine->getEmbeddingSize() != modelConfig.hiddenSize)
    {
        throw ModelLoadError("Encoder embedding width " + std::to_string(engine->getEmbeddingSize()) +
                             " does not match hidden_size " + std::to_string(modelConfig.hiddenSize));
    }

    auto model = std::make_unique<EmbeddingModel>(engine, engine, modelConfig,
                                                  config.pipeline.aggregation,
                                                  config.pipeline.overlapDivisor);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::logInfo("Loaded %s with %s weights from %s in %lld ms",
                    config.model.id.c_str(), loader->name(), loader->fileName().c_str(),
                    static_cast<long long>(elapsed.count()));
    return model;
}

EmbeddingModel::EmbeddingModel(std::shared_ptr<ITokenizer> tokenizer,
                               std::shared_ptr<IEncoder> encoder,
                               const ModelConfig &config,
                               const AggregationPolicy &policy,
                               int overlapDivisor)
    : tokenizer(std::move(tokenizer)), encoder(std::move(encoder)), config(config), policy(policy),
      overlapDivisor(overlapDivisor)
{
    if (!this->tokenizer || !this->encoder)
    {
        throw InvalidConfigError("Embedding model requires both a tokenizer and an encoder");
    }

    if (config.hiddenSize <= 0)
    {
        throw InvalidConfigError("Hidden size must be positive, got " + std::to_string(config.hiddenSize));
    }

    if (overlapDivisor <= 0)
    {
        throw InvalidConfigError("Overlap divisor must be positive, got " + std::to_string(overlapDivisor));
    }

    validateAggregationPolicy(policy);
}

std::vector<float> EmbeddingModel::predict(const std::string &text)
{
    return embed(text).embedding;
}

EmbeddingResult EmbeddingModel::embed(const std::string &text)
{
    std::lock_guard<std::mutex> lock(callMutex);

    std::vector<int32_t> tokens;
    try
    {
        tokens = tokenizer->tokenize(text);
    }
    catch (const EmbedderError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw TokenizeError(std::string("Tokenization failed: ") + e.what());
    }

    for (int32_t id : tokens)
    {
        if (id < 0)
        {
            throw TokenizeError("Tokenizer produced negative token id " + std::to_string(id));
        }
    }
    Logger::logDebug("Tokenized %zu characters into %zu tokens", text.size(), tokens.size());

    const int overlap = overlapForWindow(config.maxSeqLen, overlapDivisor);
    validateChunkingParameters(config.maxSeqLen, overlap);

    std::vector<TokenChunk> chunks = chunkTokens(tokens, config.maxSeqLen, overlap);

    std::vector<std::vector<float>> chunkVectors;
    chunkVectors.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i)
    {
        chunkVectors.push_back(encodeChunk(chunks[i], i));
    }

    EmbeddingResult result;
    result.embedding = aggregateChunkVectors(chunkVectors, policy);
    result.tokens_count = tokens.size();
    result.chunks_count = chunks.size();

    Logger::logInfo("Embedded %zu tokens in %zu chunks", result.tokens_count, result.chunks_count);
    return result;
}

std::vector<float> EmbeddingModel::encodeChunk(const TokenChunk &chunk, size_t index)
{
    const std::vector<int32_t> tokenTypeIds(chunk.length(), 0);

    HiddenStates states;
    try
    {
        states = encoder->forward(chunk.tokens, tokenTypeIds);
    }
    catch (const EmbedderError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw EncodeError("Encoder failed on chunk " + std::to_string(index) + ": " + e.what());
    }

    if (states.batch != 1 || states.n_tokens != chunk.length() ||
        states.hidden_size != static_cast<size_t>(config.hiddenSize))
    {
        throw EncodeError("Encoder returned shape (" + std::to_string(states.batch) + ", " +
                          std::to_string(states.n_tokens) + ", " + std::to_string(states.hidden_size) +
                          ") for chunk " + std::to_string(index) + ", expected (1, " +
                          std::to_string(chunk.length()) + ", " + std::to_string(config.hiddenSize) + ")");
    }

    std::vector<float> pooled = meanPool(states);
    normalizeInPlace(pooled);
    return pooled;
}

} // namespace longembed
