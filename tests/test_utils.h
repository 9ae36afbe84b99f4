#ifndef VOXPIPE_TEST_UTILS_H
#define VOXPIPE_TEST_UTILS_H

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

// Tolerance levels for different test types
#define TOL_EXACT    1e-6f
#define TOL_TIGHT    1e-5f
#define TOL_AUDIO    1e-3f

namespace voxpipe {
namespace test {

// Test result tracking
static int g_tests_passed = 0;
static int g_tests_failed = 0;

// Scratch file under the system temp directory
inline std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// First model found from $VOXPIPE_TEST_MODEL or the usual build-relative
// locations; empty when none exists
inline std::string find_test_model() {
    if (const char* env = std::getenv("VOXPIPE_TEST_MODEL")) {
        if (std::filesystem::exists(env)) return env;
    }
    const char* candidates[] = {
        "models/voice.onnx",
        "../models/voice.onnx",
        "../../models/voice.onnx",
    };
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) return path;
    }
    return "";
}

// Compare buffers with tolerance
struct CompareResult {
    bool passed;
    float max_diff;
    size_t first_mismatch_idx;
    float first_mismatch_expected;
    float first_mismatch_got;
};

inline CompareResult compare_tensors(
    const float* got,
    const float* expected,
    size_t n,
    float tolerance
) {
    CompareResult result = {true, 0.0f, 0, 0.0f, 0.0f};
    bool first_mismatch_found = false;

    for (size_t i = 0; i < n; i++) {
        float diff = std::fabs(got[i] - expected[i]);
        if (diff > result.max_diff) {
            result.max_diff = diff;
        }
        if (diff > tolerance && !first_mismatch_found) {
            result.passed = false;
            first_mismatch_found = true;
            result.first_mismatch_idx = i;
            result.first_mismatch_expected = expected[i];
            result.first_mismatch_got = got[i];
        }
    }
    return result;
}

// Assert buffers close
inline bool assert_tensor_close(
    const std::vector<float>& got,
    const std::vector<float>& expected,
    float tolerance,
    const char* test_name
) {
    if (got.size() != expected.size()) {
        printf("[FAIL] %s - size mismatch (got %zu, expected %zu)\n",
               test_name, got.size(), expected.size());
        g_tests_failed++;
        return false;
    }

    CompareResult result = compare_tensors(got.data(), expected.data(), got.size(), tolerance);
    if (result.passed) {
        printf("[PASS] %s (max_diff=%.2e)\n", test_name, result.max_diff);
        g_tests_passed++;
        return true;
    }

    printf("[FAIL] %s\n", test_name);
    printf("  max_diff=%.2e, tolerance=%.2e\n", result.max_diff, tolerance);
    printf("  First mismatch at index %zu: expected %f, got %f\n",
           result.first_mismatch_idx, result.first_mismatch_expected, result.first_mismatch_got);

    printf("  First 10 values:\n    expected: ");
    for (size_t i = 0; i < std::min(expected.size(), (size_t)10); i++) {
        printf("%.4f ", expected[i]);
    }
    printf("\n    got:      ");
    for (size_t i = 0; i < std::min(got.size(), (size_t)10); i++) {
        printf("%.4f ", got[i]);
    }
    printf("\n");

    g_tests_failed++;
    return false;
}

// Print test summary
inline int print_summary() {
    printf("\n========================================\n");
    printf("Test Summary:\n");
    printf("  Passed: %d\n", g_tests_passed);
    printf("  Failed: %d\n", g_tests_failed);
    printf("========================================\n");

    return g_tests_failed > 0 ? 1 : 0;
}

// Macro for simple assertions
#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("[FAIL] %s: %s\n", __func__, msg); \
        voxpipe::test::g_tests_failed++; \
        return false; \
    } \
} while(0)

// Assert that expr throws exception type ex
#define TEST_ASSERT_THROWS(expr, ex, msg) do { \
    bool thrown_ = false; \
    try { expr; } catch (const ex&) { thrown_ = true; } \
    TEST_ASSERT(thrown_, msg); \
} while(0)

#define TEST_PASS(msg) do { \
    printf("[PASS] %s: %s\n", __func__, msg); \
    voxpipe::test::g_tests_passed++; \
} while(0)

} // namespace test
} // namespace voxpipe

#endif // VOXPIPE_TEST_UTILS_H
