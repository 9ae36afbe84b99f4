/**
 * Test ONNX Runtime integration
 *
 * Tests:
 * 1. Tensor utilities (borrow / copy out)
 * 2. Model load failure
 * 3. Model introspection and binding checks (needs a model)
 * 4. Synthesis through the real session (needs a model)
 */

#include "test_utils.h"
#include "core/errors.h"
#include "log.h"
#include "onnx/onnx_session.h"
#include "onnx/tensor_utils.h"
#include "synthesizer.h"

#include <cstdio>

using namespace voxpipe;

bool test_type_mapping() {
    const ElementType types[] = {ElementType::Float32, ElementType::Float16, ElementType::Float64,
                                 ElementType::Int32, ElementType::Int64};
    for (ElementType t : types) {
        TEST_ASSERT(tensor::fromOnnxType(tensor::toOnnxType(t)) == t, "type maps both ways");
    }
    TEST_ASSERT(tensor::fromOnnxType(ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING) == ElementType::Unknown,
                "strings are unknown");
    TEST_PASS("element type mapping");
    return true;
}

bool test_borrow_and_copy_out() {
    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    Tensor floats = Tensor::from_float({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, {2, 3});
    Ort::Value value = tensor::borrow(floats, mem);
    TEST_ASSERT(value.IsTensor(), "borrowed value is a tensor");
    TEST_ASSERT(tensor::getShape(value) == std::vector<int64_t>({2, 3}), "shape preserved");
    TEST_ASSERT(value.GetTensorRawData() == floats.raw_data(), "no copy on borrow");

    std::optional<Tensor> copy = tensor::copyOut(value);
    TEST_ASSERT(copy && copy->type() == ElementType::Float32, "copied as float32");
    TEST_ASSERT(copy->raw_data() != floats.raw_data(), "copy owns its storage");
    TEST_ASSERT(copy->float_data()[5] == 6.0f, "values copied");

    Tensor ids = Tensor::from_int64({100, 200, 300}, {1, 3});
    Ort::Value id_value = tensor::borrow(ids, mem);
    std::optional<Tensor> id_copy = tensor::copyOut(id_value);
    TEST_ASSERT(id_copy && id_copy->int64_data()[2] == 300, "int64 copied");

    Ort::Value empty(nullptr);
    TEST_ASSERT(!tensor::copyOut(empty), "null value gives nothing");
    TEST_PASS("tensor utilities");
    return true;
}

bool test_load_failure() {
    BufferLogger log;
    TEST_ASSERT_THROWS(OnnxSession("/nonexistent/voice.onnx", OnnxSessionOptions{}, log), Error,
                       "missing model throws");

    SynthConfig cfg;
    cfg.phonemizer_data_path = "";
    Synthesizer synth(cfg, "/nonexistent/voice.onnx", log);
    TEST_ASSERT(!synth.is_ready(), "synthesizer not ready");
    TEST_ASSERT(synth.get_error().find("Failed to load ONNX model") != std::string::npos, "load error kept");
    TEST_PASS("load failure reported");
    return true;
}

bool test_model_introspection(const std::string& model_path) {
    BufferLogger log;
    OnnxSessionOptions options;
    options.num_threads = 1;
    OnnxSession session(model_path, options, log);
    TEST_ASSERT(log.contains("cannot host asynchronous runs"), "single thread raised to two");

    session.printModelInfo();
    TEST_ASSERT(session.input_spec().size() >= 3, "piper model has ids, lengths, scales");
    TEST_ASSERT(!session.getOutputNames().empty(), "model has outputs");
    TEST_ASSERT(session.input_spec()[0].type == ElementType::Int64, "ids input is int64");

    TEST_ASSERT_THROWS(session.bind("no_such_input", Tensor::from_int64({1}, {1})), InputBuildError,
                       "unknown input rejected");
    TEST_ASSERT_THROWS(session.bind(session.input_spec()[0].name, Tensor::from_float({1.0f}, {1, 1})),
                       InputBuildError, "element type checked");
    TEST_ASSERT_THROWS(session.run(), MissingInputError, "unbound inputs rejected");
    TEST_ASSERT(!session.is_running(), "failed start leaves session idle");
    TEST_PASS("model introspection");
    return true;
}

bool test_model_synthesis(const std::string& model_path) {
    BufferLogger log;
    SynthConfig cfg;
    cfg.phonemizer_data_path = "";
    cfg.num_threads = 2;
    Synthesizer synth(cfg, model_path, log);
    TEST_ASSERT(synth.is_ready(), synth.get_error().c_str());

    size_t ticks = 0;
    SynthesisResult result = synth.synthesize("1 0 20 0 59 0 2 | 1 0 35 0 2", [&ticks] { ++ticks; });
    TEST_ASSERT(result.ok(), "status ok");
    TEST_ASSERT(result.report.sentences_synthesized == 2, "both sentences synthesized");
    TEST_ASSERT(!result.waveform.empty(), "audio produced");
    TEST_ASSERT(ticks >= 3, "host yielded between stages");

    // Teardown with a run in flight
    TEST_ASSERT(synth.begin("1 0 20 0 59 0 20 0 59 0 2"), "request started");
    synth.advance();
    synth.shutdown();
    TEST_ASSERT(!synth.is_ready(), "shut down");
    TEST_PASS("synthesis with ONNX Runtime");
    return true;
}

int main() {
    printf("voxpipe ONNX Runtime test\n");
    printf("==========================\n\n");

    test_type_mapping();
    test_borrow_and_copy_out();
    test_load_failure();

    std::string model_path = test::find_test_model();
    if (model_path.empty()) {
        printf("[SKIP] No ONNX voice model found (set VOXPIPE_TEST_MODEL)\n");
    } else {
        printf("Using model: %s\n", model_path.c_str());
        test_model_introspection(model_path);
        test_model_synthesis(model_path);
    }

    return voxpipe::test::print_summary();
}
