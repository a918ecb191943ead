#include "test_common.h"
#include "longembed/c_handle.hpp"
#include "longembed/longembed_c.h"
#include <cstring>
#include <memory>

bool test_null_arguments() {
    std::cout << "\n=== Test: NULL arguments ===\n";
    longembed_model *model = nullptr;
    float buffer[4];
    size_t len = 0;
    if (longembed_create(nullptr, "main", 0, &model) != LONGEMBED_ERR_INVALID_ARGUMENT ||
        longembed_create("org/model", "main", 0, nullptr) != LONGEMBED_ERR_INVALID_ARGUMENT ||
        longembed_predict(nullptr, "text", buffer, 4, &len) != LONGEMBED_ERR_INVALID_ARGUMENT ||
        longembed_create_from_config(nullptr, &model) != LONGEMBED_ERR_INVALID_ARGUMENT) {
        std::cerr << "[FAIL] NULL arguments accepted\n";
        return false;
    }
    if (std::strlen(longembed_last_error()) == 0) {
        std::cerr << "[FAIL] no error message recorded\n";
        return false;
    }
    if (longembed_get_hidden_size(nullptr) != 0 || longembed_get_max_input_len(nullptr) != 0) {
        std::cerr << "[FAIL] NULL handle should report 0\n";
        return false;
    }
    longembed_destroy(nullptr);
    std::cout << "[PASS] rejected with a message\n";
    return true;
}

bool test_model_load_status() {
    std::cout << "\n=== Test: Load failures map to LONGEMBED_ERR_MODEL_LOAD ===\n";
    TempDir dir("c_api_missing");
    longembed_model *model = nullptr;

    // Directory without config.json
    longembed_status status = longembed_create(dir.path.string().c_str(), nullptr, 0, &model);
    if (status != LONGEMBED_ERR_MODEL_LOAD || model != nullptr) {
        std::cerr << "[FAIL] expected MODEL_LOAD, got " << status << "\n";
        return false;
    }
    std::cout << "[PASS] missing config.json: " << longembed_last_error() << "\n";

    // config.json without hidden_size
    dir.write("config.json", R"({"max_position_embeddings": 512})");
    status = longembed_create(dir.path.string().c_str(), "main", 1, &model);
    if (status != LONGEMBED_ERR_MODEL_LOAD || model != nullptr) {
        std::cerr << "[FAIL] expected MODEL_LOAD, got " << status << "\n";
        return false;
    }
    std::cout << "[PASS] incomplete config.json: " << longembed_last_error() << "\n";
    return true;
}

bool test_config_file_status() {
    std::cout << "\n=== Test: Configuration file failures ===\n";
    TempDir dir("c_api_config");
    longembed_model *model = nullptr;

    auto invalid = dir.write("invalid.yaml", "pipeline:\n  overlap_divisor: 0\nmodel:\n  id: org/model\n");
    if (longembed_create_from_config(invalid.c_str(), &model) != LONGEMBED_ERR_INVALID_CONFIG) {
        std::cerr << "[FAIL] overlap_divisor 0 accepted\n";
        return false;
    }

    auto missing = (dir.path / "missing.yaml").string();
    if (longembed_create_from_config(missing.c_str(), &model) != LONGEMBED_ERR_INVALID_CONFIG) {
        std::cerr << "[FAIL] missing file accepted\n";
        return false;
    }
    std::cout << "[PASS] INVALID_CONFIG\n";
    return true;
}

struct FakeHandle {
    std::shared_ptr<FakeTokenizer> tokenizer = std::make_shared<FakeTokenizer>();
    std::shared_ptr<OneHotEncoder> encoder = std::make_shared<OneHotEncoder>(4);
    longembed_model *handle = nullptr;

    FakeHandle() {
        auto model = std::make_unique<longembed::EmbeddingModel>(tokenizer, encoder, longembed::ModelConfig(10, 4));
        if (longembed::wrapModelHandle(std::move(model), &handle) != LONGEMBED_OK) {
            throw std::runtime_error(std::string("wrapModelHandle failed: ") + longembed_last_error());
        }
    }
    ~FakeHandle() { longembed_destroy(handle); }
};

bool test_predict_into_buffer() {
    std::cout << "\n=== Test: Predict into a caller buffer ===\n";
    FakeHandle h;
    if (longembed_get_max_input_len(h.handle) != 10 || longembed_get_hidden_size(h.handle) != 4) {
        std::cerr << "[FAIL] handle reports the wrong dimensions\n";
        return false;
    }

    float buffer[8] = {0};
    size_t len = 99;
    if (longembed_predict(h.handle, "0 1 2 5", buffer, 8, &len) != LONGEMBED_OK || len != 4) {
        std::cerr << "[FAIL] expected 4 floats, got " << len << ": " << longembed_last_error() << "\n";
        return false;
    }
    // Channels 0, 1, 2, 1 -> counts {1, 2, 1, 0} / sqrt(6)
    std::vector<float> expected = {1.0f, 2.0f, 1.0f, 0.0f};
    for (float &x : expected) x /= static_cast<float>(std::sqrt(6.0));
    if (!vectors_near(std::vector<float>(buffer, buffer + len), expected) || buffer[4] != 0.0f) {
        std::cerr << "[FAIL] buffer does not hold the embedding\n";
        return false;
    }
    std::cout << "[PASS] 4 floats copied\n";
    return true;
}

bool test_buffer_too_small() {
    std::cout << "\n=== Test: Buffer smaller than the embedding ===\n";
    FakeHandle h;
    float buffer[2] = {0};
    size_t len = 0;
    if (longembed_predict(h.handle, "1 2 3", buffer, 2, &len) != LONGEMBED_ERR_BUFFER_TOO_SMALL || len != 4) {
        std::cerr << "[FAIL] expected BUFFER_TOO_SMALL with required size 4, got " << len << "\n";
        return false;
    }
    if (buffer[0] != 0.0f || std::strlen(longembed_last_error()) == 0) {
        std::cerr << "[FAIL] buffer written or message missing\n";
        return false;
    }
    if (longembed_predict(h.handle, "1 2 3", nullptr, 4, &len) != LONGEMBED_ERR_BUFFER_TOO_SMALL || len != 4) {
        std::cerr << "[FAIL] NULL buffer accepted\n";
        return false;
    }
    std::cout << "[PASS] required size reported\n";
    return true;
}

bool test_text_without_tokens() {
    std::cout << "\n=== Test: Text without tokens ===\n";
    FakeHandle h;
    size_t len = 99;
    if (longembed_predict(h.handle, "", nullptr, 0, &len) != LONGEMBED_OK || len != 0) {
        std::cerr << "[FAIL] expected OK with 0 floats, got " << len << "\n";
        return false;
    }
    std::cout << "[PASS] 0 floats\n";
    return true;
}

bool test_predict_error_codes() {
    std::cout << "\n=== Test: Embedding failures map to their own codes ===\n";
    float buffer[4];
    size_t len = 0;
    bool ok = true;
    {
        FakeHandle h;
        h.tokenizer->fail = true;
        ok &= longembed_predict(h.handle, "1 2", buffer, 4, &len) == LONGEMBED_ERR_TOKENIZE;
    }
    {
        FakeHandle h;
        h.encoder->mode = OneHotEncoder::Mode::Throw;
        ok &= longembed_predict(h.handle, "1 2", buffer, 4, &len) == LONGEMBED_ERR_ENCODE;
    }
    {
        FakeHandle h;
        h.encoder->mode = OneHotEncoder::Mode::Zeros;
        ok &= longembed_predict(h.handle, "1 2", buffer, 4, &len) == LONGEMBED_ERR_DEGENERATE_VECTOR;
    }
    {
        longembed_model *handle = nullptr;
        ok &= longembed::wrapModelHandle(nullptr, &handle) == LONGEMBED_ERR_INVALID_ARGUMENT && handle == nullptr;
    }
    if (!ok) {
        std::cerr << "[FAIL] wrong status: " << longembed_last_error() << "\n";
        return false;
    }
    std::cout << "[PASS] TOKENIZE, ENCODE, DEGENERATE_VECTOR\n";
    return true;
}

int main() {
    quiet_logger();

    int passed = 0;
    int total = 7;

    if (test_null_arguments()) passed++;
    if (test_model_load_status()) passed++;
    if (test_config_file_status()) passed++;
    if (test_predict_into_buffer()) passed++;
    if (test_buffer_too_small()) passed++;
    if (test_text_without_tokens()) passed++;
    if (test_predict_error_codes()) passed++;

    return report("C API", passed, total);
}
