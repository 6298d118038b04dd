#pragma once

#include <vector>

/* ── Oscillator primitives ─────────────────────────────────────────────
 *
 *  Pure functions over sample arrays.  Time is t[i] = i / sample_rate,
 *  phase is referenced to t = 0.  Square waves are not band-limited.
 * ──────────────────────────────────────────────────────────────────── */

// round(sample_rate * seconds), never negative
int samples_for(double seconds, int sample_rate);

// +1 for the first `duty` fraction of every cycle of `freq`, -1 otherwise
std::vector<float> square_wave(double freq, double duration, double duty,
                               int sample_rate);

// Same, with a per-sample duty cycle (last value repeats if `duty` is short)
std::vector<float> square_wave(double freq, double duration,
                               const std::vector<double>& duty, int sample_rate);

// Square wave driven by a precomputed phase (radians), for modulated pitch
std::vector<float> square_from_phase(const std::vector<double>& phase,
                                     const std::vector<double>& duty);

std::vector<float> sine_wave(const std::vector<double>& phase);

// phase[i] = 2π · Σ inst_freq[0..i] / sample_rate
std::vector<double> integrate_phase(const std::vector<double>& inst_freq,
                                    int sample_rate);

// Linear 0→1 ramp over the first fade_samples and 1→0 over the last.
// The window is clamped to half the wave so the two ramps never overlap.
void click_fade(std::vector<float>& wave, int fade_samples);

// 10 ms
int click_fade_samples(int sample_rate);
