#include "inference.h"
#include "llama.h"

#include <algorithm>
#include <climits>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

bool LoadingParameters::isValid() const
{
	if (n_ctx <= 0)
	{
		std::cerr << "[INFERENCE] [ERROR] n_ctx must be positive: " << n_ctx << std::endl;
		return false;
	}

	// Encoder models attend bidirectionally, so a whole window has to fit in one micro-batch
	if (n_batch < n_ctx || n_ubatch < n_ctx)
	{
		std::cerr << "[INFERENCE] [ERROR] n_batch (" << n_batch << ") and n_ubatch (" << n_ubatch
				  << ") must be at least n_ctx (" << n_ctx << ")" << std::endl;
		return false;
	}

	if (n_threads <= 0)
	{
		std::cerr << "[INFERENCE] [ERROR] n_threads must be positive: " << n_threads << std::endl;
		return false;
	}

	if (n_gpu_layers < 0)
	{
		std::cerr << "[INFERENCE] [ERROR] n_gpu_layers must not be negative: " << n_gpu_layers << std::endl;
		return false;
	}

	return true;
}

// Anonymous namespace to encapsulate internal classes
namespace
{
	static void llama_log_callback_null(ggml_log_level level, const char* text, void* user_data)
	{
		(void)level;
		(void)text;
		(void)user_data;
	}

	class Tokenizer
	{
	public:
		Tokenizer(const llama_vocab* vocab, const TokenizerOptions& options);

		std::vector<int32_t> tokenize(const std::string& text) const;

	private:
		const llama_vocab*     vocab;
		const TokenizerOptions options;
	};

	Tokenizer::Tokenizer(const llama_vocab* vocab, const TokenizerOptions& options)
		: vocab(vocab)
		, options(options)
	{
#ifdef DEBUG
		std::cout << "[INFERENCE] Initializing Tokenizer (special tokens: "
				  << (options.addSpecialTokens ? "on" : "off") << ")" << std::endl;
#endif
	}

	std::vector<int32_t> Tokenizer::tokenize(const std::string& text) const
	{
		if (text.size() > static_cast<size_t>(INT32_MAX))
		{
			throw std::runtime_error("Input text is too large to tokenize: " + std::to_string(text.size()) + " bytes");
		}

		const int32_t textLen = static_cast<int32_t>(text.size());

		// Upper bound: one token per byte plus the special tokens
		std::vector<llama_token> tokens(static_cast<size_t>(textLen) + 2);
		int32_t n = llama_tokenize(vocab, text.data(), textLen, tokens.data(),
								   static_cast<int32_t>(tokens.size()),
								   options.addSpecialTokens, options.parseSpecialTokens);
		if (n < 0)
		{
			if (n == INT32_MIN)
			{
				throw std::runtime_error("Tokenization overflowed the token count limit");
			}

			tokens.resize(static_cast<size_t>(-n));
			n = llama_tokenize(vocab, text.data(), textLen, tokens.data(),
							   static_cast<int32_t>(tokens.size()),
							   options.addSpecialTokens, options.parseSpecialTokens);
			if (n < 0)
			{
				throw std::runtime_error("Failed to tokenize input text");
			}
		}
		tokens.resize(static_cast<size_t>(n));

		return std::vector<int32_t>(tokens.begin(), tokens.end());
	}
}

// =============================================================================
// InferenceEngine::Impl
// =============================================================================

struct InferenceEngine::Impl
{
	Impl(const char* modelPath, const LoadingParameters& lParams, const TokenizerOptions& tokenizerOptions);
	~Impl();

	HiddenStates forward(const std::vector<int32_t>& tokenIds, const std::vector<int32_t>& tokenTypeIds);

	llama_model*               model   = nullptr;
	llama_context*             context = nullptr;
	const llama_vocab*         vocab   = nullptr;
	std::unique_ptr<Tokenizer> tokenizer;

	int n_ctx       = 0;
	int n_embd      = 0;
	int n_ctx_train = 0;
	int n_vocab     = 0;
};

InferenceEngine::Impl::Impl(const char* modelPath, const LoadingParameters& lParams, const TokenizerOptions& tokenizerOptions)
{
#ifndef DEBUG
	llama_log_set(llama_log_callback_null, NULL);
#endif

	std::filesystem::path model_path(modelPath);

	// Verify the file exists and has .gguf extension
	if (!std::filesystem::exists(model_path))
	{
		throw std::runtime_error("[INFERENCE] [ERROR] Model file not found: " + model_path.string());
	}

	if (model_path.extension() != ".gguf")
	{
		throw std::runtime_error("[INFERENCE] [ERROR] Invalid model file extension. Expected .gguf, got: " + model_path.extension().string());
	}

	if (!lParams.isValid())
	{
		throw std::runtime_error("[INFERENCE] [ERROR] Invalid loading parameters");
	}

	llama_backend_init();

	llama_model_params model_params = llama_model_default_params();
	model_params.use_mmap     = lParams.use_mmap;
	model_params.use_mlock    = lParams.use_mlock;
	model_params.n_gpu_layers = lParams.n_gpu_layers;

#ifdef DEBUG
	std::cout << "[INFERENCE] Loading model from " << model_path
			  << (lParams.use_mmap ? " (mmap)" : " (buffered)") << std::endl;
#endif

	model = llama_model_load_from_file(model_path.string().c_str(), model_params);
	if (!model)
	{
		llama_backend_free();
		throw std::runtime_error("[INFERENCE] [ERROR] Failed to load model - model is null");
	}

	llama_context_params ctx_params = llama_context_default_params();
	ctx_params.n_ctx           = static_cast<uint32_t>(lParams.n_ctx);
	ctx_params.n_batch         = static_cast<uint32_t>(lParams.n_batch);
	ctx_params.n_ubatch        = static_cast<uint32_t>(lParams.n_ubatch);
	ctx_params.n_seq_max       = 1;
	ctx_params.n_threads       = lParams.n_threads;
	ctx_params.n_threads_batch = lParams.n_threads;
	ctx_params.embeddings      = true;
	ctx_params.pooling_type    = LLAMA_POOLING_TYPE_NONE;   // pooling is done by the caller

	context = llama_init_from_model(model, ctx_params);
	if (!context)
	{
		llama_model_free(model);
		llama_backend_free();
		throw std::runtime_error("[INFERENCE] [ERROR] Failed to create context - context is null");
	}

	// Validate model dimensions
	vocab       = llama_model_get_vocab(model);
	n_vocab     = llama_vocab_n_tokens(vocab);
	n_embd      = llama_model_n_embd(model);
	n_ctx_train = llama_model_n_ctx_train(model);
	n_ctx       = static_cast<int>(llama_n_ctx(context));

	if (n_vocab <= 0 || n_embd <= 0 || n_ctx_train <= 0)
	{
		llama_free(context);
		llama_model_free(model);
		llama_backend_free();
		throw std::runtime_error("[INFERENCE] [ERROR] Invalid model dimensions - vocab:" +
			std::to_string(n_vocab) + " embd:" + std::to_string(n_embd) +
			" ctx_train:" + std::to_string(n_ctx_train));
	}

	if (lParams.n_ctx > n_ctx_train)
	{
		std::cout << "[INFERENCE] [WARNING] Requested context size (" << lParams.n_ctx
				  << ") exceeds model training context (" << n_ctx_train << ")" << std::endl;
	}

#ifdef DEBUG
	std::cout << "[INFERENCE] Model validation successful - vocab:" << n_vocab
			  << " embd:" << n_embd << " ctx_train:" << n_ctx_train << std::endl;
#endif

	try
	{
		tokenizer = std::make_unique<Tokenizer>(vocab, tokenizerOptions);
	}
	catch (const std::exception&)
	{
		llama_free(context);
		llama_model_free(model);
		llama_backend_free();
		throw;
	}
}

InferenceEngine::Impl::~Impl()
{
	tokenizer.reset();

	if (context)
	{
		llama_free(context);
		context = nullptr;
	}
	if (model)
	{
		llama_model_free(model);
		model = nullptr;
	}

	llama_backend_free();
}

HiddenStates InferenceEngine::Impl::forward(const std::vector<int32_t>& tokenIds, const std::vector<int32_t>& tokenTypeIds)
{
	if (tokenIds.empty())
	{
		throw std::runtime_error("Cannot encode an empty window");
	}

	if (tokenTypeIds.size() != tokenIds.size())
	{
		throw std::runtime_error("Token type ids length (" + std::to_string(tokenTypeIds.size()) +
			") does not match token ids length (" + std::to_string(tokenIds.size()) + ")");
	}

	// llama.cpp always embeds segment 0
	if (std::any_of(tokenTypeIds.begin(), tokenTypeIds.end(), [](int32_t t) { return t != 0; }))
	{
		throw std::runtime_error("Only token type 0 is supported by this encoder");
	}

	if (static_cast<int>(tokenIds.size()) > n_ctx)
	{
		throw std::runtime_error("Window of " + std::to_string(tokenIds.size()) +
			" tokens exceeds the context size of " + std::to_string(n_ctx));
	}

	for (int32_t id : tokenIds)
	{
		if (id < 0 || id >= n_vocab)
		{
			throw std::runtime_error("Token id out of vocabulary range: " + std::to_string(id));
		}
	}

	// Each window is encoded independently
	auto* mem = llama_get_memory(context);
	llama_memory_clear(mem, /*data=*/true);

	const int32_t n_tokens = static_cast<int32_t>(tokenIds.size());
	llama_batch batch = llama_batch_init(n_tokens, 0, 1);

	for (int32_t i = 0; i < n_tokens; ++i)
	{
		batch.token[i]     = tokenIds[i];
		batch.pos[i]       = static_cast<llama_pos>(i);
		batch.n_seq_id[i]  = 1;
		batch.seq_id[i][0] = 0;
		batch.logits[i]    = true;   // request an output row for every token
	}
	batch.n_tokens = n_tokens;

#ifdef DEBUG
	std::cout << "[INFERENCE] [ENCODER] Processing " << n_tokens << " tokens" << std::endl;
#endif

	const int ret = llama_model_has_encoder(model) ? llama_encode(context, batch) : llama_decode(context, batch);
	if (ret != 0)
	{
		llama_batch_free(batch);
		throw std::runtime_error("Failed to run encoder forward pass (code " + std::to_string(ret) + ")");
	}

	HiddenStates states(1, static_cast<size_t>(n_tokens), static_cast<size_t>(n_embd));
	for (int32_t i = 0; i < n_tokens; ++i)
	{
		const float* row = llama_get_embeddings_ith(context, i);
		if (!row)
		{
			llama_batch_free(batch);
			throw std::runtime_error("Failed to get hidden state for token " + std::to_string(i));
		}
		std::copy(row, row + n_embd, states.data.begin() + static_cast<size_t>(i) * n_embd);
	}

	llama_batch_free(batch);
	return states;
}

// =============================================================================
// InferenceEngine
// =============================================================================

INFERENCE_API InferenceEngine::InferenceEngine()
	: pimpl(nullptr)
{
}

INFERENCE_API InferenceEngine::~InferenceEngine() = default;

INFERENCE_API bool InferenceEngine::loadModel(const char* modelPath, const LoadingParameters lParams,
											  const TokenizerOptions tokenizerOptions)
{
#ifdef DEBUG
	std::cout << "[INFERENCE] Loading encoder model from " << modelPath << std::endl;
#endif
	this->pimpl.reset();
	this->lastError.clear();

	try
	{
		this->pimpl = std::make_unique<Impl>(modelPath, lParams, tokenizerOptions);
	}
	catch (const std::exception& e)
	{
		this->lastError = e.what();
		std::cerr << "[INFERENCE] [ERROR] Could not load model from: " << modelPath << "\nError: " << e.what() << "\n" << std::endl;
		return false;
	}
	return true;
}

INFERENCE_API int InferenceEngine::getEmbeddingSize() const
{
	return pimpl ? pimpl->n_embd : 0;
}

INFERENCE_API int InferenceEngine::getVocabSize() const
{
	return pimpl ? pimpl->n_vocab : 0;
}

INFERENCE_API std::string InferenceEngine::getLastError() const
{
	return lastError;
}

INFERENCE_API std::vector<int32_t> InferenceEngine::tokenize(const std::string& text)
{
	if (!pimpl)
	{
		throw std::runtime_error("[INFERENCE] [ERROR] Model not loaded");
	}
	return pimpl->tokenizer->tokenize(text);
}

INFERENCE_API HiddenStates InferenceEngine::forward(const std::vector<int32_t>& tokenIds,
													const std::vector<int32_t>& tokenTypeIds)
{
	if (!pimpl)
	{
		throw std::runtime_error("[INFERENCE] [ERROR] Model not loaded");
	}
	return pimpl->forward(tokenIds, tokenTypeIds);
}
