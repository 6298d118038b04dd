#include "audio_backend.h"

#include <pulse/pulseaudio.h>
#include <pulse/simple.h>
#include <pulse/error.h>
#include <cstdio>
#include <utility>

static constexpr const char* CLIENT_NAME = "DroidVox";

// one listener block per fragment, so a burst shows up within a read
static constexpr uint32_t LISTEN_FRAGMENT_FRAMES = 1024;
static constexpr uint32_t VOICE_LATENCY_MS       = 50;

/* ── Stream setup ──────────────────────────────────────────────────── */

static pa_sample_spec float_spec(int sample_rate, int channels)
{
    pa_sample_spec spec{};
    spec.format   = PA_SAMPLE_FLOAT32LE;
    spec.rate     = static_cast<uint32_t>(sample_rate);
    spec.channels = static_cast<uint8_t>(channels);
    return spec;
}

static pa_simple* open_stream(pa_stream_direction_t dir, const std::string& device,
                              const char* stream_name, const pa_sample_spec& spec,
                              const pa_buffer_attr& attr)
{
    int err = 0;
    pa_simple* pa = pa_simple_new(nullptr, CLIENT_NAME, dir,
                                  device.empty() ? nullptr : device.c_str(),
                                  stream_name, &spec, nullptr, &attr, &err);
    if (!pa) {
        fprintf(stderr, "DroidVox: cannot open %s stream on %s: %s\n",
                stream_name, device.empty() ? "the default device" : device.c_str(),
                pa_strerror(err));
    }
    return pa;
}

static size_t frame_bytes(int frames, int channels)
{
    return static_cast<size_t>(frames) * static_cast<size_t>(channels) * sizeof(float);
}

/* ── Listener input ────────────────────────────────────────────────── */

class PulseCapture : public AudioCapture {
public:
    ~PulseCapture() override { close(); }

    bool open(const std::string& device_id, int sample_rate, int channels) override {
        close();

        pa_sample_spec spec = float_spec(sample_rate, channels);
        pa_buffer_attr attr{};
        attr.maxlength = static_cast<uint32_t>(-1);
        attr.fragsize  = static_cast<uint32_t>(frame_bytes(LISTEN_FRAGMENT_FRAMES, channels));

        pa_ = open_stream(PA_STREAM_RECORD, device_id, "Droid listener", spec, attr);
        if (!pa_) return false;

        channels_ = channels;
        fprintf(stderr, "DroidVox: listening on %s at %d Hz\n",
                device_id.empty() ? "the default source" : device_id.c_str(), sample_rate);
        return true;
    }

    int read(float* buffer, int frames) override {
        if (!pa_) return -1;
        int err = 0;
        if (pa_simple_read(pa_, buffer, frame_bytes(frames, channels_), &err) < 0) {
            fprintf(stderr, "DroidVox: listener lost its input: %s\n", pa_strerror(err));
            return -1;
        }
        return 0;
    }

    void close() override {
        if (pa_) { pa_simple_free(pa_); pa_ = nullptr; }
    }

private:
    pa_simple* pa_       = nullptr;
    int        channels_ = 1;
};

/* ── Droid voice output ────────────────────────────────────────────── */

class PulsePlayback : public AudioPlayback {
public:
    ~PulsePlayback() override { close(); }

    bool open(int sample_rate, int channels) override {
        close();

        pa_sample_spec spec = float_spec(sample_rate, channels);
        pa_buffer_attr attr{};
        attr.maxlength = static_cast<uint32_t>(-1);
        attr.tlength   = static_cast<uint32_t>(pa_usec_to_bytes(VOICE_LATENCY_MS * PA_USEC_PER_MSEC, &spec));
        attr.prebuf    = static_cast<uint32_t>(-1);
        attr.minreq    = static_cast<uint32_t>(-1);

        pa_ = open_stream(PA_STREAM_PLAYBACK, std::string(), "Droid voice", spec, attr);
        if (!pa_) return false;

        channels_ = channels;
        return true;
    }

    int write(const float* buffer, int frames) override {
        if (!pa_) return -1;
        int err = 0;
        if (pa_simple_write(pa_, buffer, frame_bytes(frames, channels_), &err) < 0) {
            fprintf(stderr, "DroidVox: voice stream write failed: %s\n", pa_strerror(err));
            return -1;
        }
        return 0;
    }

    int drain() override {
        if (!pa_) return -1;
        int err = 0;
        if (pa_simple_drain(pa_, &err) < 0) {
            fprintf(stderr, "DroidVox: voice stream did not drain: %s\n", pa_strerror(err));
            return -1;
        }
        return 0;
    }

    void flush() override {
        if (!pa_) return;
        int err = 0;
        if (pa_simple_flush(pa_, &err) < 0)
            fprintf(stderr, "DroidVox: voice stream flush failed: %s\n", pa_strerror(err));
    }

    void close() override {
        if (pa_) { pa_simple_free(pa_); pa_ = nullptr; }
    }

private:
    pa_simple* pa_       = nullptr;
    int        channels_ = 1;
};

/* ── Listener source enumeration ───────────────────────────────────── */

struct SourceQuery {
    pa_threaded_mainloop*    ml  = nullptr;
    pa_context*              ctx = nullptr;
    std::vector<AudioDevice> devices;

    ~SourceQuery() {
        if (ctx) {
            pa_context_disconnect(ctx);
            pa_context_unref(ctx);
        }
        if (ml) {
            pa_threaded_mainloop_unlock(ml);
            pa_threaded_mainloop_stop(ml);
            pa_threaded_mainloop_free(ml);
        }
    }
};

static void on_source(pa_context* /*ctx*/, const pa_source_info* info, int eol, void* userdata)
{
    auto* query = static_cast<SourceQuery*>(userdata);
    if (eol > 0) {
        pa_threaded_mainloop_signal(query->ml, 0);
        return;
    }
    // monitors only echo our own voice back
    if (!info || info->monitor_of_sink != PA_INVALID_INDEX)
        return;

    AudioDevice dev;
    dev.id          = info->name;
    dev.description = info->description ? info->description : info->name;
    query->devices.push_back(std::move(dev));
}

static void on_context_state(pa_context* ctx, void* userdata)
{
    switch (pa_context_get_state(ctx)) {
    case PA_CONTEXT_READY:
    case PA_CONTEXT_FAILED:
    case PA_CONTEXT_TERMINATED:
        pa_threaded_mainloop_signal(static_cast<pa_threaded_mainloop*>(userdata), 0);
        break;
    default:
        break;
    }
}

static bool wait_until_ready(SourceQuery& query)
{
    while (true) {
        pa_context_state_t state = pa_context_get_state(query.ctx);
        if (state == PA_CONTEXT_READY) return true;
        if (!PA_CONTEXT_IS_GOOD(state)) {
            fprintf(stderr, "DroidVox: sound server unavailable: %s\n",
                    pa_strerror(pa_context_errno(query.ctx)));
            return false;
        }
        pa_threaded_mainloop_wait(query.ml);
    }
}

std::vector<AudioDevice> audio_enumerate_inputs()
{
    SourceQuery query;

    pa_threaded_mainloop* ml = pa_threaded_mainloop_new();
    if (!ml) return {};
    pa_threaded_mainloop_lock(ml);
    query.ml = ml;

    query.ctx = pa_context_new(pa_threaded_mainloop_get_api(ml), CLIENT_NAME);
    if (!query.ctx) return {};
    pa_context_set_state_callback(query.ctx, on_context_state, ml);

    if (pa_threaded_mainloop_start(ml) < 0 ||
        pa_context_connect(query.ctx, nullptr, PA_CONTEXT_NOFLAGS, nullptr) < 0) {
        fprintf(stderr, "DroidVox: cannot reach the sound server: %s\n",
                pa_strerror(pa_context_errno(query.ctx)));
        return {};
    }
    if (!wait_until_ready(query)) return {};

    pa_operation* op = pa_context_get_source_info_list(query.ctx, on_source, &query);
    if (op) {
        while (pa_operation_get_state(op) == PA_OPERATION_RUNNING)
            pa_threaded_mainloop_wait(ml);
        pa_operation_unref(op);
    }

    fprintf(stderr, "DroidVox: %zu input source(s) available\n", query.devices.size());
    return std::move(query.devices);
}

/* ── Factory functions ─────────────────────────────────────────────── */

std::unique_ptr<AudioCapture> audio_create_capture() {
    return std::make_unique<PulseCapture>();
}

std::unique_ptr<AudioPlayback> audio_create_playback() {
    return std::make_unique<PulsePlayback>();
}
