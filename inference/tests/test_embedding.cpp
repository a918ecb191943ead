#include "test_common.h"
#include "longembed/embedding_model.hpp"
#include "longembed/errors.hpp"
#include <filesystem>

// Engine-level checks on the GGUF file: tokenization and per-token hidden states.
static bool test_engine(const std::string &ggufPath) {
    std::cout << "\n=== Test: Encoder forward pass ===\n";
    InferenceEngine engine;
    if (!load_test_model(engine, ggufPath.c_str())) return false;

    std::vector<int32_t> ids = engine.tokenize("The quick brown fox jumps over the lazy dog");
    if (ids.size() < 3) { std::cerr << "[FAIL] tokenizer returned " << ids.size() << " ids\n"; return false; }

    HiddenStates states = engine.forward(ids, std::vector<int32_t>(ids.size(), 0));
    if (states.batch != 1 || states.n_tokens != ids.size() ||
        states.hidden_size != static_cast<size_t>(engine.getEmbeddingSize()) || !states.isConsistent()) {
        std::cerr << "[FAIL] unexpected hidden state shape\n";
        return false;
    }
    std::cout << "[PASS] " << ids.size() << " tokens x " << states.hidden_size << " channels\n";

    try {
        engine.forward(ids, std::vector<int32_t>(ids.size(), 1));
        std::cerr << "[FAIL] non-zero token type ids accepted\n";
        return false;
    } catch (const std::runtime_error &e) {
        std::cout << "[PASS] rejected token type ids: " << e.what() << "\n";
    }
    return true;
}

// Pipeline checks on a model directory holding config.json and the GGUF file.
static bool test_pipeline(const std::string &modelDir) {
    std::cout << "\n=== Test: Long text pipeline ===\n";
    std::unique_ptr<longembed::EmbeddingModel> model;
    try {
        model = longembed::EmbeddingModel::create(modelDir);
    } catch (const longembed::EmbedderError &e) {
        std::cerr << "[FAIL] create: " << e.what() << "\n";
        return false;
    }

    std::string shortText = "Paris is the capital of France.";
    std::string longText = repeat_text("Paris is the capital and most populous city of France. ", 200);

    auto shortResult = model->embed(shortText);
    auto longResult = model->embed(longText);
    if (shortResult.embedding.size() != static_cast<size_t>(model->getHiddenSize()) ||
        longResult.embedding.size() != static_cast<size_t>(model->getHiddenSize())) {
        std::cerr << "[FAIL] vector length differs from hidden size\n";
        return false;
    }
    if (shortResult.chunks_count != 1 || longResult.chunks_count < 2) {
        std::cerr << "[FAIL] chunk counts " << shortResult.chunks_count << " / " << longResult.chunks_count << "\n";
        return false;
    }
    for (float x : longResult.embedding) {
        if (!std::isfinite(x)) { std::cerr << "[FAIL] non-finite component\n"; return false; }
    }

    double sim = cosine(shortResult.embedding, longResult.embedding);
    std::cout << "[PASS] " << longResult.tokens_count << " tokens in " << longResult.chunks_count
              << " chunks, cosine to short text " << sim << "\n";

    auto again = model->predict(longText);
    if (cosine(again, longResult.embedding) < 0.9999) {
        std::cerr << "[FAIL] repeated call differs\n";
        return false;
    }
    std::cout << "[PASS] deterministic\n";
    return true;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <model-dir with config.json and model.gguf | model.gguf>\n";
        return 64;
    }
    std::filesystem::path input = argv[1];
    bool isDir = std::filesystem::is_directory(input);
    std::string gguf = isDir ? (input / "model.gguf").string() : input.string();

    int passed = 0;
    int total = isDir ? 2 : 1;

    if (test_engine(gguf)) passed++;
    if (isDir && test_pipeline(input.string())) passed++;

    std::cout << "\nTest Results: " << passed << "/" << total << " passed\n";
    return passed == total ? 0 : 1;
}
