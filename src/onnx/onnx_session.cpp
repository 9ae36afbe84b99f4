#include "onnx_session.h"
#include "tensor_utils.h"
#include "core/errors.h"

#if defined(VOXPIPE_USE_COREML) && defined(__APPLE__)
#include <onnxruntime/coreml_provider_factory.h>
#endif

#include <sstream>
#include <stdexcept>
#include <thread>

namespace voxpipe {

namespace {
const char* TAG = "OnnxSession";
}

OnnxSession::OnnxSession(const std::string& model_path, const OnnxSessionOptions& options, Logger& logger)
    : model_path_(model_path)
    , logger_(logger)
    , env_(ORT_LOGGING_LEVEL_WARNING, "voxpipe")
    , memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
    options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    // RunAsync executes on the intra-op pool, which needs at least one
    // worker besides the calling thread
    int num_threads = options.num_threads;
    if (num_threads == 1) {
        logger_.warn(TAG, "1 intra-op thread cannot host asynchronous runs, using 2");
        num_threads = 2;
    } else if (num_threads <= 0 && std::thread::hardware_concurrency() < 2) {
        num_threads = 2;
    }
    if (num_threads > 0) {
        options_.SetIntraOpNumThreads(num_threads);
    }

    options_.EnableMemPattern();
    options_.EnableCpuMemArena();

    configureBackend(options.backend);

    try {
        session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), options_);
    } catch (const Ort::Exception& e) {
        throw Error("Failed to load ONNX model '" + model_path + "': " + e.what());
    }

    cacheSpec();
}

OnnxSession::~OnnxSession() {
    cancel();
}

void OnnxSession::configureBackend(Backend requested) {
    backend_ = Backend::Cpu;

    switch (requested) {
        case Backend::Cpu:
            break;

        case Backend::Cuda:
#ifdef VOXPIPE_USE_CUDA
            try {
                OrtCUDAProviderOptions cuda_options;
                cuda_options.device_id = 0;
                cuda_options.arena_extend_strategy = 0;
                cuda_options.do_copy_in_default_stream = 1;
                options_.AppendExecutionProvider_CUDA(cuda_options);
                backend_ = Backend::Cuda;
            } catch (const Ort::Exception& e) {
                logger_.warn(TAG, std::string("CUDA EP failed: ") + e.what());
            }
#endif
            break;

        case Backend::Rocm:
#ifdef VOXPIPE_USE_ROCM
            try {
                OrtROCMProviderOptions rocm_options;
                rocm_options.device_id = 0;
                options_.AppendExecutionProvider_ROCM(rocm_options);
                backend_ = Backend::Rocm;
            } catch (const Ort::Exception& e) {
                logger_.warn(TAG, std::string("ROCm EP failed: ") + e.what());
            }
#endif
            break;

        case Backend::CoreMl:
#if defined(VOXPIPE_USE_COREML) && defined(__APPLE__)
            try {
                Ort::ThrowOnError(OrtSessionOptionsAppendExecutionProvider_CoreML(options_, COREML_FLAG_CREATE_MLPROGRAM));
                backend_ = Backend::CoreMl;
            } catch (const Ort::Exception& e) {
                logger_.warn(TAG, std::string("CoreML EP failed: ") + e.what());
            }
#endif
            break;

        case Backend::DirectMl:
#ifdef VOXPIPE_USE_DIRECTML
            try {
                options_.AppendExecutionProvider("DML");
                backend_ = Backend::DirectMl;
            } catch (const Ort::Exception& e) {
                logger_.warn(TAG, std::string("DirectML EP failed: ") + e.what());
            }
#endif
            break;
    }

    if (backend_ != requested) {
        logger_.warn(TAG, std::string(backend_name(requested)) +
                          " execution provider not available, using CPU");
    } else {
        logger_.info(TAG, std::string("Using ") + backend_name(backend_) + " execution provider");
    }
}

void OnnxSession::cacheSpec() {
    size_t num_inputs = session_->GetInputCount();
    input_spec_.reserve(num_inputs);
    for (size_t i = 0; i < num_inputs; ++i) {
        InputSlot slot;
        auto name = session_->GetInputNameAllocated(i, allocator_);
        slot.name = name.get();

        auto type_info = session_->GetInputTypeInfo(i);
        if (type_info.GetONNXType() == ONNX_TYPE_TENSOR) {
            auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
            slot.shape = tensor_info.GetShape();
            slot.type = tensor::fromOnnxType(tensor_info.GetElementType());
        }
        input_spec_.push_back(std::move(slot));
    }

    size_t num_outputs = session_->GetOutputCount();
    output_names_.reserve(num_outputs);
    for (size_t i = 0; i < num_outputs; ++i) {
        auto name = session_->GetOutputNameAllocated(i, allocator_);
        output_names_.push_back(name.get());
    }
}

void OnnxSession::bind(const std::string& name, Tensor t) {
    if (running_) {
        throw SessionBusyError("cannot bind '" + name + "' while a run is in flight");
    }

    const InputSlot* slot = nullptr;
    for (const auto& s : input_spec_) {
        if (s.name == name) {
            slot = &s;
            break;
        }
    }
    if (!slot) {
        throw InputBuildError("model has no input named '" + name + "'");
    }
    if (slot->type != ElementType::Unknown && slot->type != t.type()) {
        throw InputBuildError("input '" + name + "' expects " + element_type_name(slot->type) +
                              ", got " + element_type_name(t.type()));
    }

    bindings_[name] = std::move(t);
}

void OnnxSession::run() {
    if (running_) {
        throw SessionBusyError("a run is already in flight on " + model_path_);
    }

    output_.reset();
    run_input_names_.clear();
    run_inputs_.clear();
    run_output_names_.clear();
    run_outputs_.clear();

    try {
        for (const auto& slot : input_spec_) {
            auto it = bindings_.find(slot.name);
            if (it == bindings_.end()) {
                throw MissingInputError(slot.name);
            }
            run_input_names_.push_back(slot.name.c_str());
            run_inputs_.push_back(tensor::borrow(it->second, memory_info_));
        }

        for (const auto& name : output_names_) {
            run_output_names_.push_back(name.c_str());
            run_outputs_.emplace_back(nullptr);
        }

        completion_ = std::make_shared<Completion>();
        session_->RunAsync(
            run_options_,
            run_input_names_.data(),
            run_inputs_.data(),
            run_inputs_.size(),
            run_output_names_.data(),
            run_outputs_.data(),
            run_outputs_.size(),
            &OnnxSession::onRunComplete,
            completion_.get()
        );
    } catch (const Ort::Exception& e) {
        releaseRun();
        throw InferenceError(std::string("ONNX inference failed to start: ") + e.what());
    } catch (const std::exception&) {
        releaseRun();
        throw;
    }

    running_ = true;
}

void ORT_API_CALL OnnxSession::onRunComplete(void* user_data, OrtValue** /*outputs*/,
                                             size_t /*num_outputs*/, OrtStatusPtr status_ptr) {
    auto* completion = static_cast<Completion*>(user_data);
    Ort::Status status(status_ptr);

    // The driver may release the completion as soon as it sees done, so
    // nothing may touch it after the lock is dropped
    std::lock_guard<std::mutex> lock(completion->mutex);
    if (!status.IsOK()) {
        completion->error = status.GetErrorMessage();
        if (completion->error.empty()) {
            completion->error = "unknown ONNX Runtime error";
        }
    }
    completion->done.store(true);
    completion->cv.notify_all();
}

bool OnnxSession::advance() {
    if (!running_) {
        return false;
    }
    if (!completion_->done.load()) {
        return true;
    }

    std::string error;
    {
        std::lock_guard<std::mutex> lock(completion_->mutex);
        error = completion_->error;
    }
    if (!error.empty()) {
        releaseRun();
        throw InferenceError("ONNX inference failed: " + error);
    }

    try {
        if (!run_outputs_.empty()) {
            output_ = tensor::copyOut(run_outputs_[0]);
        }
    } catch (const Ort::Exception& e) {
        releaseRun();
        throw InferenceError(std::string("failed to read ONNX output: ") + e.what());
    }

    releaseRun();
    return false;
}

void OnnxSession::waitForCompletion() {
    std::unique_lock<std::mutex> lock(completion_->mutex);
    completion_->cv.wait(lock, [this] { return completion_->done.load(); });
}

void OnnxSession::releaseRun() {
    running_ = false;
    run_inputs_.clear();
    run_outputs_.clear();
    run_input_names_.clear();
    run_output_names_.clear();
    completion_.reset();
}

void OnnxSession::cancel() {
    if (!running_) {
        return;
    }

    // ORT still references the borrowed inputs and the output array, so the
    // run must have signalled completion before anything is released
    try {
        run_options_.SetTerminate();
    } catch (const Ort::Exception& e) {
        logger_.error(TAG, std::string("failed to set terminate flag: ") + e.what());
    }
    waitForCompletion();
    releaseRun();

    try {
        run_options_.UnsetTerminate();
    } catch (const Ort::Exception& e) {
        logger_.error(TAG, std::string("failed to clear terminate flag: ") + e.what());
    }
    logger_.warn(TAG, "In-flight run cancelled");
}

void OnnxSession::clear_bindings() {
    cancel();
    bindings_.clear();
    output_.reset();
}

std::vector<int64_t> OnnxSession::getOutputShape(size_t index) const {
    if (index >= output_names_.size()) {
        throw std::out_of_range("Output index out of range");
    }
    auto type_info = session_->GetOutputTypeInfo(index);
    if (type_info.GetONNXType() != ONNX_TYPE_TENSOR) {
        return {};
    }
    return type_info.GetTensorTypeAndShapeInfo().GetShape();
}

void OnnxSession::printModelInfo() const {
    logger_.info(TAG, "ONNX Model: " + model_path_);
    logger_.info(TAG, "Inputs (" + std::to_string(input_spec_.size()) + "):");
    for (size_t i = 0; i < input_spec_.size(); ++i) {
        std::ostringstream line;
        line << "  [" << i << "] " << input_spec_[i].name << " : "
             << element_type_name(input_spec_[i].type) << format_shape(input_spec_[i].shape);
        logger_.info(TAG, line.str());
    }

    logger_.info(TAG, "Outputs (" + std::to_string(output_names_.size()) + "):");
    for (size_t i = 0; i < output_names_.size(); ++i) {
        std::ostringstream line;
        line << "  [" << i << "] " << output_names_[i] << " : " << format_shape(getOutputShape(i));
        logger_.info(TAG, line.str());
    }
}

} // namespace voxpipe
