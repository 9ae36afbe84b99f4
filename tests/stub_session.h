// Deterministic InferenceSession for pipeline tests
//
// Each run takes a configurable number of advance() steps and then produces
// whatever the output function returns. The default output echoes one 0.5
// sample per bound phoneme id.

#ifndef VOXPIPE_TEST_STUB_SESSION_H
#define VOXPIPE_TEST_STUB_SESSION_H

#include "core/errors.h"
#include "core/inference_session.h"
#include "core/tensor.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace voxpipe {
namespace test {

// Shared so tests can inspect a session after handing it to an owner
struct StubStats {
    size_t bind_calls = 0;
    size_t run_calls = 0;
    size_t advance_calls = 0;
    size_t cancel_calls = 0;
    size_t clear_calls = 0;
    bool destroyed = false;
    std::vector<std::vector<int64_t>> ids_per_run;
    std::vector<std::vector<float>> scales_per_run;
};

inline ModelInputSpec piper_input_spec() {
    return {
        {"input", {1, -1}, ElementType::Int64},
        {"input_lengths", {1}, ElementType::Int64},
        {"scales", {3}, ElementType::Float32},
    };
}

class StubSession : public InferenceSession {
public:
    // ids of the run, zero-based run index -> output
    using OutputFn = std::function<std::optional<Tensor>(const std::vector<int64_t>&, size_t)>;

    explicit StubSession(ModelInputSpec spec = piper_input_spec())
        : spec_(std::move(spec))
        , stats_(std::make_shared<StubStats>())
        , output_fn_(echo_half)
    {
    }

    ~StubSession() override { stats_->destroyed = true; }

    static std::optional<Tensor> echo_half(const std::vector<int64_t>& ids, size_t) {
        std::vector<float> samples(ids.size(), 0.5f);
        return Tensor::from_float(samples, {1, 1, static_cast<int64_t>(samples.size())});
    }

    void set_steps_per_run(size_t steps) { steps_per_run_ = steps == 0 ? 1 : steps; }
    void set_output(OutputFn fn) { output_fn_ = std::move(fn); }
    void fail_run(size_t run_index) { failing_runs_.insert(run_index); }

    std::shared_ptr<StubStats> stats() const { return stats_; }

    const ModelInputSpec& input_spec() const override { return spec_; }

    void bind(const std::string& name, Tensor tensor) override {
        if (running_) {
            throw SessionBusyError("bind during run");
        }
        ++stats_->bind_calls;
        bindings_[name] = std::move(tensor);
    }

    void run() override {
        if (running_) {
            throw SessionBusyError("run already in flight");
        }
        for (const auto& slot : spec_) {
            if (bindings_.find(slot.name) == bindings_.end()) {
                throw MissingInputError(slot.name);
            }
        }

        current_ids_.clear();
        const Tensor& ids = bindings_[spec_[0].name];
        if (ids.type() == ElementType::Int64) {
            current_ids_.assign(ids.int64_data(), ids.int64_data() + ids.element_count());
        }
        stats_->ids_per_run.push_back(current_ids_);

        std::vector<float> scales;
        if (spec_.size() > 2) {
            const Tensor& s = bindings_[spec_[2].name];
            if (s.type() == ElementType::Float32) {
                scales.assign(s.float_data(), s.float_data() + s.element_count());
            }
        }
        stats_->scales_per_run.push_back(scales);

        output_.reset();
        remaining_ = steps_per_run_;
        running_ = true;
        ++stats_->run_calls;
    }

    bool advance() override {
        if (!running_) {
            return false;
        }
        ++stats_->advance_calls;
        if (--remaining_ > 0) {
            return true;
        }

        running_ = false;
        const size_t run_index = stats_->run_calls - 1;
        if (failing_runs_.count(run_index)) {
            throw InferenceError("stub run " + std::to_string(run_index) + " failed");
        }
        output_ = output_fn_(current_ids_, run_index);
        return false;
    }

    bool is_running() const override { return running_; }

    std::optional<Tensor> peek_output() const override { return output_; }

    void clear_bindings() override {
        ++stats_->clear_calls;
        cancel();
        bindings_.clear();
        output_.reset();
    }

    void cancel() override {
        if (!running_) {
            return;
        }
        ++stats_->cancel_calls;
        running_ = false;
        remaining_ = 0;
    }

    size_t bound_count() const { return bindings_.size(); }

private:
    ModelInputSpec spec_;
    std::shared_ptr<StubStats> stats_;
    OutputFn output_fn_;
    size_t steps_per_run_ = 1;
    std::set<size_t> failing_runs_;

    std::map<std::string, Tensor> bindings_;
    std::vector<int64_t> current_ids_;
    bool running_ = false;
    size_t remaining_ = 0;
    std::optional<Tensor> output_;
};

} // namespace test
} // namespace voxpipe

#endif // VOXPIPE_TEST_STUB_SESSION_H
