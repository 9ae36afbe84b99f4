// Output extraction: validation and flattening

#include "test_utils.h"
#include "core/errors.h"
#include "core/output_extractor.h"

#include <cstdio>

using namespace voxpipe;

bool test_flattens_float_output() {
    std::vector<float> values = {0.1f, -0.2f, 0.3f, -0.4f};
    std::optional<Tensor> out = Tensor::from_float(values, {1, 1, 4});

    SampleRun run = output_extractor::extract(out);
    TEST_ASSERT(run.size() == 4, "every element becomes a sample");
    for (size_t i = 0; i < values.size(); ++i) {
        TEST_ASSERT(run[i] == values[i], "samples keep tensor order");
    }
    TEST_PASS("float32 output flattened");
    return true;
}

bool test_absent_output() {
    TEST_ASSERT_THROWS(output_extractor::extract(std::nullopt), EmptyOutputError,
                       "absent output is EmptyOutput");
    TEST_PASS("absent output rejected");
    return true;
}

bool test_non_float_output() {
    std::optional<Tensor> out = Tensor::from_int64({1, 2, 3}, {3});
    TEST_ASSERT_THROWS(output_extractor::extract(out), OutputTypeMismatchError,
                       "int64 output is a type mismatch");

    std::optional<Tensor> unknown = Tensor(ElementType::Unknown, {2});
    TEST_ASSERT_THROWS(output_extractor::extract(unknown), OutputTypeMismatchError,
                       "unknown element type is a type mismatch");

    std::optional<Tensor> wide = Tensor(ElementType::Float64, {2});
    TEST_ASSERT_THROWS(output_extractor::extract(wide), OutputTypeMismatchError,
                       "float64 is not accepted");
    TEST_PASS("non-float32 outputs rejected");
    return true;
}

bool test_zero_element_output() {
    std::optional<Tensor> out = Tensor(ElementType::Float32, {1, 0});
    TEST_ASSERT_THROWS(output_extractor::extract(out), EmptyOutputError,
                       "zero samples is EmptyOutput");
    TEST_PASS("empty float output rejected");
    return true;
}

int main() {
    printf("voxpipe output extractor test\n");
    printf("==============================\n\n");

    test_flattens_float_output();
    test_absent_output();
    test_non_float_output();
    test_zero_element_output();

    return voxpipe::test::print_summary();
}
