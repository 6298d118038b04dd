#include "droid_listener.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static const char* const DETECTED_TEXT = "[Droid sounds detected]";

static_assert(DroidListener::READ_FRAMES >= DroidListener::FFT_SIZE,
              "spectrum is taken from the tail of each block");

/* ── construction / destruction ──────────────────────────────────────── */

DroidListener::DroidListener(CaptureFactory factory)
    : make_capture_(std::move(factory))
{
    for (int i = 0; i < FFT_SIZE; i++)
        fft_window_[i] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * i / (FFT_SIZE - 1)));
    std::fill(std::begin(spectrum_mag_), std::end(spectrum_mag_), -200.0f);
}

DroidListener::~DroidListener() { stop(); }

/* ── radix-2 Cooley-Tukey FFT (in-place, N must be power of 2) ────────── */

static void fft_radix2(std::complex<float>* x, int N)
{
    /* bit-reversal permutation */
    for (int i = 1, j = 0; i < N; i++) {
        int bit = N >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }
    /* butterfly passes */
    for (int len = 2; len <= N; len <<= 1) {
        float ang = -2.0f * static_cast<float>(M_PI) / len;
        std::complex<float> wlen(std::cos(ang), std::sin(ang));
        for (int i = 0; i < N; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (int j = 0; j < len / 2; j++) {
                auto u = x[i + j];
                auto v = x[i + j + len / 2] * w;
                x[i + j]           = u + v;
                x[i + j + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}

void DroidListener::get_spectrum(float* out, int n) const
{
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    int count = std::min(n, SPECTRUM_BINS);
    std::memcpy(out, spectrum_mag_, static_cast<size_t>(count) * sizeof(float));
}

void DroidListener::update_spectrum(const float* block)
{
    // last FFT_SIZE samples of the block
    std::complex<float> fft_buf[FFT_SIZE];
    const float* tail = block + (READ_FRAMES - FFT_SIZE);
    for (int i = 0; i < FFT_SIZE; i++)
        fft_buf[i] = tail[i] * fft_window_[i];

    fft_radix2(fft_buf, FFT_SIZE);

    float tmp[SPECTRUM_BINS];
    for (int i = 0; i < SPECTRUM_BINS; i++) {
        float mag = std::abs(fft_buf[i]) / (FFT_SIZE * 0.5f);
        tmp[i] = (mag > 1e-10f) ? 20.0f * std::log10(mag) : -200.0f;
    }

    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    std::memcpy(spectrum_mag_, tmp, sizeof(spectrum_mag_));
}

/* ── start / stop ────────────────────────────────────────────────────── */

DroidStatus DroidListener::start(const std::string& device_id, int sample_rate,
                                 DetectCallback callback)
{
    if (running_) return DroidStatus::Ok;
    if (thread_.joinable()) thread_.join();    // previous loop ended on its own

    capture_ = make_capture_ ? make_capture_() : nullptr;
    if (!capture_ || !capture_->open(device_id, sample_rate, 1)) {
        capture_.reset();
        return DroidStatus::NoAudioDevice;
    }

    sample_rate_ = sample_rate;
    callback_    = std::move(callback);
    detections_  = 0;
    running_     = true;
    thread_      = std::thread(&DroidListener::listening_loop, this);

    fprintf(stderr, "DroidVox: listening on %s, %d Hz\n",
            device_id.empty() ? "(default)" : device_id.c_str(), sample_rate);
    return DroidStatus::Ok;
}

void DroidListener::stop()
{
    running_ = false;
    if (thread_.joinable()) thread_.join();

    if (capture_) {
        capture_->close();
        capture_.reset();
    }
    input_level_ = 0.0f;
    rms_level_   = 0.0f;
}

/* ── listening loop (dedicated thread) ───────────────────────────────── */

void DroidListener::listening_loop()
{
    std::vector<float> block(READ_FRAMES);
    bool in_burst = false;

    while (running_.load(std::memory_order_relaxed)) {
        if (capture_->read(block.data(), READ_FRAMES) < 0) {
            if (running_.load(std::memory_order_relaxed))
                fprintf(stderr, "DroidVox: capture read failed, listener stopped\n");
            running_ = false;
            break;
        }

        double sum_abs = 0.0, sum2 = 0.0;
        for (float s : block) {
            sum_abs += std::fabs(s);
            sum2    += static_cast<double>(s) * s;
        }
        float energy = static_cast<float>(sum_abs / READ_FRAMES);
        input_level_.store(energy, std::memory_order_relaxed);
        rms_level_.store(static_cast<float>(std::sqrt(sum2 / READ_FRAMES)),
                         std::memory_order_relaxed);

        update_spectrum(block.data());

        /* rising edge only: re-arm once the level drops back */
        if (energy > DETECT_THRESHOLD) {
            if (!in_burst) {
                in_burst = true;
                detections_.fetch_add(1, std::memory_order_relaxed);
                if (callback_) callback_(DETECTED_TEXT);
            }
        } else {
            in_burst = false;
        }
    }
}
