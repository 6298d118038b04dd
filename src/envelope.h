#pragma once

#include <vector>

/* ── Envelope / modulation library ─────────────────────────────────── */

// depth = 0.2 + 0.6 · exaggeration
double lfo_depth(double exaggeration);

// (1 - depth) + depth · (0.5 + 0.5 · sin(2π · rate · t)); stays within [1 - depth, 1]
std::vector<float> lfo_envelope(int num_samples, double rate, double exaggeration,
                                int sample_rate);

// center + depth_hz · sin(2π · rate_hz · t), fed to integrate_phase()
std::vector<double> freq_mod_curve(int num_samples, double center_freq,
                                   double depth_hz, double rate_hz, int sample_rate);
