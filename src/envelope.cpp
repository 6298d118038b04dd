#include "envelope.h"

#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double lfo_depth(double exaggeration)
{
    return 0.2 + 0.6 * exaggeration;
}

std::vector<float> lfo_envelope(int num_samples, double rate, double exaggeration,
                                int sample_rate)
{
    double depth  = lfo_depth(exaggeration);
    double offset = 1.0 - depth;

    std::vector<float> env(static_cast<size_t>(num_samples > 0 ? num_samples : 0));
    for (size_t i = 0; i < env.size(); i++) {
        double t = static_cast<double>(i) / sample_rate;
        env[i] = static_cast<float>(offset + depth * (0.5 + 0.5 * std::sin(2.0 * M_PI * rate * t)));
    }
    return env;
}

std::vector<double> freq_mod_curve(int num_samples, double center_freq,
                                   double depth_hz, double rate_hz, int sample_rate)
{
    std::vector<double> freq(static_cast<size_t>(num_samples > 0 ? num_samples : 0));
    for (size_t i = 0; i < freq.size(); i++) {
        double t = static_cast<double>(i) / sample_rate;
        freq[i] = center_freq + depth_hz * std::sin(2.0 * M_PI * rate_hz * t);
    }
    return freq;
}
