#ifndef VOXPIPE_H
#define VOXPIPE_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// Version
#ifndef VOXPIPE_VERSION
#define VOXPIPE_VERSION "0.1.0"
#endif

// Forward declarations
struct voxpipe_context;

// Step / request status
enum voxpipe_status {
    VOXPIPE_STATUS_ERROR                = -1,
    VOXPIPE_STATUS_OK                   = 0,   // audio ready
    VOXPIPE_STATUS_PENDING              = 1,   // call voxpipe_step() again
    VOXPIPE_STATUS_NO_PHONEMES          = 2,   // nothing to synthesize
    VOXPIPE_STATUS_MALFORMED_INPUT_SPEC = 3,   // model declares fewer than 3 inputs
    VOXPIPE_STATUS_NO_AUDIO             = 4,   // every sentence was skipped
    VOXPIPE_STATUS_CANCELLED            = 5,
};

// Synthesis parameters
struct voxpipe_params {
    int32_t      sample_rate;   // Output sample rate (default: 22050)
    float        speed;         // Piper length scale (default: 1.0)
    float        pitch;         // Piper noise scale (default: 1.0)
    float        glottal;       // Piper noise width (default: 0.8)
    const char * voice;         // Phonemizer voice (default: "en-us")
    const char * data_path;     // Phonemizer data directory (default: "espeak-ng-data")
    const char * backend;       // "cpu", "cuda", "rocm", "coreml", "directml" (default: "cpu")
    int32_t      n_threads;     // Intra-op threads, 0 = runtime default
    int32_t      verbosity;     // 0 = errors only, 1 = info, 2 = debug
};

// Default parameters
struct voxpipe_params voxpipe_default_params(void);

// Context management
// Returns NULL on failure; see voxpipe_last_error(NULL)
struct voxpipe_context * voxpipe_init_from_file(
    const char * model_path,
    struct voxpipe_params params
);
void voxpipe_free(struct voxpipe_context * ctx);

// Cooperative synthesis
// voxpipe_begin() starts a request; call voxpipe_step() once per host tick
// until it returns something other than VOXPIPE_STATUS_PENDING
int  voxpipe_begin(struct voxpipe_context * ctx, const char * text);
enum voxpipe_status voxpipe_step(struct voxpipe_context * ctx);

// Cancel the running request; the next voxpipe_step() reports CANCELLED
void voxpipe_cancel(struct voxpipe_context * ctx);

// Audio of the last finished request (float32, mono)
// Caller must free the returned buffer with voxpipe_free_audio()
float * voxpipe_take_audio(struct voxpipe_context * ctx, size_t * n_samples);
void voxpipe_free_audio(float * audio);

int32_t voxpipe_sample_rate(const struct voxpipe_context * ctx);

// WAV file output (16-bit PCM, mono)
int voxpipe_write_wav(
    const char * path,
    const float * audio,
    size_t n_samples,
    int sample_rate
);

// Utility
const char * voxpipe_version(void);
const char * voxpipe_status_string(enum voxpipe_status status);
// Last error for ctx, or the last context creation error when ctx is NULL
const char * voxpipe_last_error(const struct voxpipe_context * ctx);
void voxpipe_print_system_info(void);

#ifdef __cplusplus
}
#endif

#endif // VOXPIPE_H
