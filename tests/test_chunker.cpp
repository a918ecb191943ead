#include "test_common.h"
#include "longembed/chunker.hpp"
#include "longembed/errors.hpp"
#include <algorithm>
#include <numeric>

using namespace longembed;

static std::vector<int32_t> sequence(int n) {
    std::vector<int32_t> v(n);
    std::iota(v.begin(), v.end(), 0);
    return v;
}

bool test_short_sequence_single_chunk() {
    std::cout << "\n=== Test: Sequence shorter than the window ===\n";
    auto tokens = sequence(7);
    auto chunks = chunkTokens(tokens, 10, 1);
    if (chunks.size() != 1 || chunks[0].start != 0 || chunks[0].tokens != tokens) {
        std::cerr << "[FAIL] expected one chunk equal to the input, got " << chunks.size() << "\n";
        return false;
    }
    std::cout << "[PASS] single chunk\n";
    return true;
}

bool test_exact_window_single_chunk() {
    std::cout << "\n=== Test: Sequence exactly one window long ===\n";
    auto chunks = chunkTokens(sequence(10), 10, 1);
    if (chunks.size() != 1 || chunks[0].length() != 10) {
        std::cerr << "[FAIL] expected one full chunk, got " << chunks.size() << "\n";
        return false;
    }
    std::cout << "[PASS] single full chunk\n";
    return true;
}

bool test_overlapping_windows() {
    std::cout << "\n=== Test: 25 tokens, window 10, overlap 1 ===\n";
    auto tokens = sequence(25);
    auto chunks = chunkTokens(tokens, 10, 1);

    const size_t starts[] = {0, 9, 18};
    const size_t lengths[] = {10, 10, 7};
    if (chunks.size() != 3) {
        std::cerr << "[FAIL] expected 3 chunks, got " << chunks.size() << "\n";
        return false;
    }
    for (size_t i = 0; i < 3; ++i) {
        if (chunks[i].start != starts[i] || chunks[i].length() != lengths[i]) {
            std::cerr << "[FAIL] chunk " << i << " is [" << chunks[i].start << ", " << chunks[i].end() << ")\n";
            return false;
        }
        for (size_t j = 0; j < chunks[i].length(); ++j) {
            if (chunks[i].tokens[j] != tokens[chunks[i].start + j]) {
                std::cerr << "[FAIL] chunk " << i << " does not copy its range\n";
                return false;
            }
        }
    }
    // Neighbouring windows share exactly `overlap` tokens.
    if (chunks[0].end() - chunks[1].start != 1 || chunks[1].end() - chunks[2].start != 1) {
        std::cerr << "[FAIL] windows do not overlap by one token\n";
        return false;
    }
    std::cout << "[PASS] windows [0,10) [9,19) [18,25)\n";
    return true;
}

bool test_no_window_inside_previous_overlap() {
    std::cout << "\n=== Test: Tail that fits in the previous window ===\n";
    // 19 and 28 tokens end exactly where a window ends; no 1-token tail window follows.
    const int lengths[] = {10, 19, 28};
    const size_t expected[] = {1, 2, 3};
    for (size_t i = 0; i < 3; ++i) {
        auto chunks = chunkTokens(sequence(lengths[i]), 10, 1);
        if (chunks.size() != expected[i] || chunks.back().length() != 10) {
            std::cerr << "[FAIL] n=" << lengths[i] << " gave " << chunks.size() << " chunks, expected "
                      << expected[i] << "\n";
            return false;
        }
    }
    // Window count is 1 + ceil((n - window) / step) for every n past the first window.
    for (int n = 11; n <= 200; ++n) {
        size_t count = chunkTokens(sequence(n), 10, 1).size();
        size_t want = 1 + static_cast<size_t>((n - 10 + 8) / 9);
        if (count != want) {
            std::cerr << "[FAIL] n=" << n << " gave " << count << " chunks, expected " << want << "\n";
            return false;
        }
    }
    std::cout << "[PASS] only the windows needed to cover the input\n";
    return true;
}

bool test_ranges_reconstruct_sequence() {
    std::cout << "\n=== Test: Chunks reassemble the sequence ===\n";
    for (int n : {1, 9, 10, 11, 100, 513, 1000}) {
        for (int window : {1, 2, 10, 512}) {
            int overlap = overlapForWindow(window);
            auto tokens = sequence(n);
            auto chunks = chunkTokens(tokens, window, overlap);

            std::vector<int32_t> rebuilt;
            for (const auto &chunk : chunks) {
                if (chunk.length() == 0 || chunk.length() > static_cast<size_t>(window)) {
                    std::cerr << "[FAIL] bad chunk length " << chunk.length() << "\n";
                    return false;
                }
                if (!chunks.empty() && &chunk != &chunks.back() && chunk.end() == tokens.size()) {
                    std::cerr << "[FAIL] n=" << n << " window=" << window << " continues past the end\n";
                    return false;
                }
                size_t skip = rebuilt.size() - std::min(rebuilt.size(), chunk.start);
                rebuilt.insert(rebuilt.end(), chunk.tokens.begin() + skip, chunk.tokens.end());
            }
            if (rebuilt != tokens || chunks.back().end() != tokens.size()) {
                std::cerr << "[FAIL] n=" << n << " window=" << window << " does not reconstruct\n";
                return false;
            }
        }
    }
    std::cout << "[PASS] every configuration reconstructs its input\n";
    return true;
}

bool test_empty_sequence() {
    std::cout << "\n=== Test: Empty sequence ===\n";
    if (!chunkTokens({}, 10, 1).empty()) {
        std::cerr << "[FAIL] expected no chunks\n";
        return false;
    }
    std::cout << "[PASS] no chunks\n";
    return true;
}

bool test_overlap_derivation() {
    std::cout << "\n=== Test: Overlap derived from the window ===\n";
    if (overlapForWindow(512) != 51 || overlapForWindow(10) != 1 || overlapForWindow(9) != 0 ||
        overlapForWindow(100, 4) != 25) {
        std::cerr << "[FAIL] unexpected overlap values\n";
        return false;
    }
    std::cout << "[PASS] integer division by the divisor\n";
    return expect_throws<InvalidConfigError>([] { overlapForWindow(512, 0); }, "divisor 0");
}

bool test_invalid_parameters() {
    std::cout << "\n=== Test: Invalid chunking parameters ===\n";
    auto tokens = sequence(5);
    bool ok = true;
    ok &= expect_throws<InvalidConfigError>([&] { chunkTokens(tokens, 0, 0); }, "max_seq_len 0");
    ok &= expect_throws<InvalidConfigError>([&] { chunkTokens(tokens, 10, -1); }, "negative overlap");
    ok &= expect_throws<InvalidConfigError>([&] { chunkTokens(tokens, 10, 10); }, "overlap == max_seq_len");
    ok &= expect_throws<InvalidConfigError>([&] { chunkTokens({}, 4, 8); }, "invalid parameters on empty input");
    ok &= expect_throws<InvalidConfigError>([&] { validateChunkingParameters(3, 5); }, "overlap > max_seq_len");
    return ok;
}

int main() {
    quiet_logger();

    int passed = 0;
    int total = 8;

    if (test_short_sequence_single_chunk()) passed++;
    if (test_exact_window_single_chunk()) passed++;
    if (test_overlapping_windows()) passed++;
    if (test_no_window_inside_previous_overlap()) passed++;
    if (test_ranges_reconstruct_sequence()) passed++;
    if (test_empty_sequence()) passed++;
    if (test_overlap_derivation()) passed++;
    if (test_invalid_parameters()) passed++;

    return report("Chunker", passed, total);
}
