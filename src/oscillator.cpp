#include "oscillator.h"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static constexpr double TWO_PI = 2.0 * M_PI;

static inline float square_sample(double cycles, double duty)
{
    double frac = cycles - std::floor(cycles);
    return frac < duty ? 1.0f : -1.0f;
}

static inline double duty_at(const std::vector<double>& duty, size_t i)
{
    if (duty.empty()) return 0.5;
    return duty[std::min(i, duty.size() - 1)];
}

int samples_for(double seconds, int sample_rate)
{
    long n = std::lround(static_cast<double>(sample_rate) * seconds);
    return n > 0 ? static_cast<int>(n) : 0;
}

std::vector<float> square_wave(double freq, double duration, double duty,
                               int sample_rate)
{
    int n = samples_for(duration, sample_rate);
    std::vector<float> out(static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        double t = static_cast<double>(i) / sample_rate;
        out[static_cast<size_t>(i)] = square_sample(freq * t, duty);
    }
    return out;
}

std::vector<float> square_wave(double freq, double duration,
                               const std::vector<double>& duty, int sample_rate)
{
    int n = samples_for(duration, sample_rate);
    std::vector<float> out(static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        double t = static_cast<double>(i) / sample_rate;
        out[static_cast<size_t>(i)] = square_sample(freq * t, duty_at(duty, static_cast<size_t>(i)));
    }
    return out;
}

std::vector<float> square_from_phase(const std::vector<double>& phase,
                                     const std::vector<double>& duty)
{
    std::vector<float> out(phase.size());
    for (size_t i = 0; i < phase.size(); i++)
        out[i] = square_sample(phase[i] / TWO_PI, duty_at(duty, i));
    return out;
}

std::vector<float> sine_wave(const std::vector<double>& phase)
{
    std::vector<float> out(phase.size());
    for (size_t i = 0; i < phase.size(); i++)
        out[i] = static_cast<float>(std::sin(phase[i]));
    return out;
}

std::vector<double> integrate_phase(const std::vector<double>& inst_freq,
                                    int sample_rate)
{
    std::vector<double> phase(inst_freq.size());
    double acc = 0.0;
    for (size_t i = 0; i < inst_freq.size(); i++) {
        acc += inst_freq[i];
        phase[i] = TWO_PI * acc / sample_rate;
    }
    return phase;
}

void click_fade(std::vector<float>& wave, int fade_samples)
{
    int n    = static_cast<int>(wave.size());
    int fade = std::min(fade_samples, n / 2);
    if (fade <= 0) return;

    // ramp includes both endpoints: first sample 0, last ramp sample 1
    double denom = fade > 1 ? static_cast<double>(fade - 1) : 1.0;
    for (int i = 0; i < fade; i++) {
        float g = static_cast<float>(fade > 1 ? i / denom : 0.0);
        wave[static_cast<size_t>(i)]         *= g;
        wave[static_cast<size_t>(n - 1 - i)] *= g;
    }
}

int click_fade_samples(int sample_rate)
{
    return samples_for(0.01, sample_rate);
}
