#pragma once

#include "config.h"
#include "core/inference_session.h"
#include "log.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <onnxruntime/onnxruntime_cxx_api.h>

namespace voxpipe {

struct OnnxSessionOptions {
    Backend backend = Backend::Cpu;
    int num_threads = 0;  // intra-op threads, 0 = let ORT decide
};

/**
 * ONNX Runtime session for a Piper-style acoustic model
 *
 * run() hands the inference to ORT's intra-op thread pool with RunAsync and
 * returns at once; advance() only checks whether the run has completed, so
 * the caller's thread is never blocked for the duration of a run.
 *
 * Thread-safety: single driver. Only the completion callback runs on an ORT
 * thread, and it only touches the completion state.
 */
class OnnxSession : public InferenceSession {
public:
    /**
     * Load an ONNX model from file
     * @param model_path Path to the .onnx model file
     * @param options Backend and thread settings
     * @param logger Diagnostics; must outlive the session
     * @throws voxpipe::Error if the model cannot be loaded
     */
    OnnxSession(const std::string& model_path, const OnnxSessionOptions& options, Logger& logger);

    // Cancels any in-flight run and waits for ORT to release it
    ~OnnxSession() override;

    OnnxSession(const OnnxSession&) = delete;
    OnnxSession& operator=(const OnnxSession&) = delete;

    // InferenceSession
    const ModelInputSpec& input_spec() const override { return input_spec_; }
    void bind(const std::string& name, Tensor tensor) override;
    void run() override;
    bool advance() override;
    bool is_running() const override { return running_; }
    std::optional<Tensor> peek_output() const override { return output_; }
    void clear_bindings() override;
    void cancel() override;

    // Model introspection
    const std::vector<std::string>& getOutputNames() const { return output_names_; }
    std::vector<int64_t> getOutputShape(size_t index) const;
    const std::string& getModelPath() const { return model_path_; }
    Backend backend() const { return backend_; }

    /**
     * Log model inputs and outputs
     */
    void printModelInfo() const;

private:
    // Shared with the ORT completion callback
    struct Completion {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> done{false};
        std::string error;
    };

    static void ORT_API_CALL onRunComplete(void* user_data, OrtValue** outputs, size_t num_outputs, OrtStatusPtr status);

    void configureBackend(Backend requested);
    void cacheSpec();
    void waitForCompletion();
    void releaseRun();

    std::string model_path_;
    Logger& logger_;
    Backend backend_ = Backend::Cpu;

    Ort::Env env_;
    Ort::SessionOptions options_;
    std::unique_ptr<Ort::Session> session_;
    Ort::AllocatorWithDefaultOptions allocator_;
    Ort::MemoryInfo memory_info_;

    ModelInputSpec input_spec_;
    std::vector<std::string> output_names_;

    // Bound inputs, owned until clear_bindings()
    std::map<std::string, Tensor> bindings_;

    // In-flight run state; must stay alive until the callback has fired
    bool running_ = false;
    Ort::RunOptions run_options_;
    std::vector<const char*> run_input_names_;
    std::vector<const char*> run_output_names_;
    std::vector<Ort::Value> run_inputs_;
    std::vector<Ort::Value> run_outputs_;
    std::shared_ptr<Completion> completion_;

    std::optional<Tensor> output_;
};

} // namespace voxpipe
