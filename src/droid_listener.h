#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "audio_backend.h"
#include "droid_types.h"

/* ── DroidListener ─────────────────────────────────────────────────────
 *
 *  Input energy monitor:
 *    AudioCapture → mean |x| / RMS level → threshold → callback
 *                 → windowed FFT → spectrum for the visualizer
 *
 *  Nothing is decoded; "droid sounds" only means the mean absolute level
 *  of a block went above DETECT_THRESHOLD.  The callback fires once per
 *  burst, on the listening thread.  Status is exposed via atomics.
 * ──────────────────────────────────────────────────────────────────── */

class DroidListener {
public:
    using CaptureFactory = std::function<std::unique_ptr<AudioCapture>()>;
    using DetectCallback = std::function<void(const std::string&)>;

    static constexpr int   READ_FRAMES      = 1024;
    static constexpr float DETECT_THRESHOLD = 0.01f;
    static constexpr int   FFT_SIZE         = 512;
    static constexpr int   SPECTRUM_BINS    = FFT_SIZE / 2;   // 256

    explicit DroidListener(CaptureFactory factory);
    ~DroidListener();

    DroidListener(const DroidListener&)            = delete;
    DroidListener& operator=(const DroidListener&) = delete;

    /* lifecycle -------------------------------------------------------------- */
    DroidStatus start(const std::string& device_id, int sample_rate, DetectCallback callback);
    void        stop();

    /* status queries (thread-safe) ------------------------------------------ */
    bool     is_running()      const { return running_.load(std::memory_order_relaxed); }
    float    get_input_level() const { return input_level_.load(std::memory_order_relaxed); }
    float    get_rms_level()   const { return rms_level_.load(std::memory_order_relaxed); }
    unsigned detections()      const { return detections_.load(std::memory_order_relaxed); }
    int      sample_rate()     const { return sample_rate_; }

    /* spectrum (thread-safe via mutex) --------------------------------------- */
    void get_spectrum(float* out, int n) const;           // copies up to n bins (dB)

private:
    void listening_loop();
    void update_spectrum(const float* block);

    CaptureFactory                make_capture_;
    std::unique_ptr<AudioCapture> capture_;
    DetectCallback                callback_;
    int                           sample_rate_ = DEFAULT_SAMPLE_RATE;

    /* ── FFT / spectrum ────────────────────────────────────────────────── */
    float              fft_window_[FFT_SIZE]        = {};
    float              spectrum_mag_[SPECTRUM_BINS] = {};   // dB magnitudes
    mutable std::mutex spectrum_mutex_;

    /* ── Thread & atomics ─────────────────────────────────────────────── */
    std::thread           thread_;
    std::atomic<bool>     running_     {false};
    std::atomic<float>    input_level_ {0.0f};
    std::atomic<float>    rms_level_   {0.0f};
    std::atomic<unsigned> detections_  {0};
};
