#include "effect_engine.h"

#include <algorithm>
#include <cmath>

#include "envelope.h"
#include "oscillator.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static constexpr double TWO_PI = 2.0 * M_PI;

EffectEngine::EffectEngine(const SynthesisConfig& config) : config_(config) {}

/* ── dispatch ────────────────────────────────────────────────────────── */

EffectKind EffectEngine::resolve(EffectKind effect, RandomSource& rng)
{
    return effect == EffectKind::Random ? rng.uniform_effect() : effect;
}

double EffectEngine::duration_scale(EffectKind effect)
{
    switch (effect) {
    case EffectKind::Blatt: return 0.7;
    case EffectKind::Trill: return 1.3;
    default:                return 1.0;
    }
}

std::vector<float> EffectEngine::generate(EffectKind effect, double freq,
                                          double duration, RandomSource& rng) const
{
    int n = samples_for(duration, config_.sample_rate());

    std::vector<float> wave;
    switch (resolve(effect, rng)) {
    case EffectKind::Normal:   wave = gen_normal(freq, n);        break;
    case EffectKind::Blatt:    wave = gen_blatt(freq, n);         break;
    case EffectKind::Trill:    wave = gen_trill(freq, n);         break;
    case EffectKind::Whistle:  wave = gen_whistle(freq, n);       break;
    case EffectKind::Scream:   wave = gen_scream(freq, n, rng);   break;
    case EffectKind::Happy:    wave = gen_happy(freq, n);         break;
    case EffectKind::Sad:      wave = gen_sad(freq, n);           break;
    case EffectKind::Question: wave = gen_question(freq, n);      break;
    case EffectKind::Random:   wave = gen_normal(freq, n);        break;   // unreachable
    }

    click_fade(wave, click_fade_samples(config_.sample_rate()));
    return wave;
}

std::vector<float> EffectEngine::render(EffectKind effect, double freq,
                                        double duration, RandomSource& rng) const
{
    EffectKind concrete = resolve(effect, rng);
    std::vector<float> wave = generate(concrete, freq, duration, rng);
    warble(concrete, wave);
    return wave;
}

/* ── raw generators ──────────────────────────────────────────────────── */

// Square wave, duty cycle wobbling ±0.1 at 0.5 Hz
std::vector<float> EffectEngine::gen_normal(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double dc = config_.duty_cycle();

    std::vector<double> duty(static_cast<size_t>(n));
    for (int i = 0; i < n; i++)
        duty[static_cast<size_t>(i)] = dc + 0.1 * std::sin(TWO_PI * 0.5 * time_at(i));

    return square_wave(freq, static_cast<double>(n) / sr, duty, sr);
}

// Fast duty wobble, pitch jitter and a 10 ms attack boost
std::vector<float> EffectEngine::gen_blatt(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double dc = config_.duty_cycle();
    double ex = config_.exaggeration();

    double wobble_rate = 20.0 + 40.0 * ex;
    std::vector<double> duty(static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        double d = dc + 0.3 * std::sin(TWO_PI * wobble_rate * time_at(i));
        duty[static_cast<size_t>(i)] = std::clamp(d, 0.0, 1.0);
    }

    std::vector<double> inst = freq_mod_curve(n, freq, 100.0 * ex, 15.0, sr);
    std::vector<float>  wave = square_from_phase(integrate_phase(inst, sr), duty);

    int attack = std::min(samples_for(0.01, sr), n);
    for (int i = 0; i < attack; i++)
        wave[static_cast<size_t>(i)] *= static_cast<float>(0.5 + static_cast<double>(i) / attack);

    return wave;
}

// Frequency-modulated square wave
std::vector<float> EffectEngine::gen_trill(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double ex = config_.exaggeration();

    std::vector<double> inst = freq_mod_curve(n, freq, 200.0 + 500.0 * ex, 12.0 + 25.0 * ex, sr);
    std::vector<double> duty(1, config_.duty_cycle());
    return square_from_phase(integrate_phase(inst, sr), duty);
}

// Sine an octave or more above the base, with vibrato
std::vector<float> EffectEngine::gen_whistle(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double ex = config_.exaggeration();

    std::vector<double> inst = freq_mod_curve(n, (2.0 + ex) * freq,
                                              30.0 + 70.0 * ex, 8.0 + 7.0 * ex, sr);
    return sine_wave(integrate_phase(inst, sr));
}

// Quadratic rise to 5x, noisy duty cycle, noise mixed in
std::vector<float> EffectEngine::gen_scream(double freq, int n, RandomSource& rng) const
{
    int    sr = config_.sample_rate();
    double dc = config_.duty_cycle();
    double ex = config_.exaggeration();
    double len = n > 0 ? static_cast<double>(n) : 1.0;

    std::vector<double> inst(static_cast<size_t>(n));
    std::vector<double> duty(static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        double u = i / len;
        inst[static_cast<size_t>(i)] = freq * (1.0 + 4.0 * u * u);
        duty[static_cast<size_t>(i)] = std::clamp(dc + 0.1 * rng.gaussian(), 0.1, 0.9);
    }

    std::vector<float> wave = square_from_phase(integrate_phase(inst, sr), duty);
    for (float& s : wave)
        s = static_cast<float>(0.7 * s + 0.3 * ex * rng.gaussian());

    return wave;
}

// Rising run of short beeps, padded or cut to n samples
std::vector<float> EffectEngine::gen_happy(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double dc = config_.duty_cycle();
    double ex = config_.exaggeration();

    int beeps  = 3 + static_cast<int>(std::lround(4.0 * ex));
    int beep_n = n / beeps;

    std::vector<float> wave;
    wave.reserve(static_cast<size_t>(n));

    for (int b = 0; b < beeps && beep_n > 0; b++) {
        std::vector<float> beep = square_wave(freq * (1.0 + 0.15 * b),
                                              static_cast<double>(beep_n) / sr, dc, sr);
        beep.resize(static_cast<size_t>(beep_n), 0.0f);

        int ramp = std::max(1, static_cast<int>(std::lround(0.15 * beep_n)));
        ramp = std::min(ramp, beep_n / 2);
        for (int i = 0; i < ramp; i++) {
            float g = static_cast<float>(i) / ramp;
            beep[static_cast<size_t>(i)]              *= g;
            beep[static_cast<size_t>(beep_n - 1 - i)] *= g;
        }
        wave.insert(wave.end(), beep.begin(), beep.end());
    }

    wave.resize(static_cast<size_t>(n), 0.0f);
    return wave;
}

// Linear fall to (1 - 0.5·exag) of the base, with a slow 3 Hz sob
std::vector<float> EffectEngine::gen_sad(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double ex = config_.exaggeration();
    double len = n > 0 ? static_cast<double>(n) : 1.0;

    std::vector<double> inst(static_cast<size_t>(n));
    for (int i = 0; i < n; i++)
        inst[static_cast<size_t>(i)] = freq * (1.0 - 0.5 * ex * (i / len));

    std::vector<double> duty(1, config_.duty_cycle());
    std::vector<float>  wave = square_from_phase(integrate_phase(inst, sr), duty);
    std::vector<float>  sob  = lfo_envelope(n, 3.0, ex, sr);
    for (size_t i = 0; i < wave.size(); i++)
        wave[i] *= sob[i];

    return wave;
}

// Steady for 70%, then a quadratic upward inflection with 15 Hz jitter
std::vector<float> EffectEngine::gen_question(double freq, int n) const
{
    int    sr = config_.sample_rate();
    double ex = config_.exaggeration();

    int    steady = static_cast<int>(std::lround(0.7 * n));
    double tail   = n - steady > 0 ? static_cast<double>(n - steady) : 1.0;
    double rise   = 0.3 + 0.7 * ex;         // fraction of base added by the end
    double jitter = 10.0 + 20.0 * ex;       // Hz

    std::vector<double> inst(static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        if (i < steady) {
            inst[static_cast<size_t>(i)] = freq;
        } else {
            double u = (i - steady) / tail;
            inst[static_cast<size_t>(i)] = freq * (1.0 + rise * u * u)
                                         + jitter * std::sin(TWO_PI * 15.0 * time_at(i));
        }
    }

    std::vector<double> duty(1, config_.duty_cycle());
    return square_from_phase(integrate_phase(inst, sr), duty);
}

/* ── warble post-processing ─────────────────────────────────────────── */

void EffectEngine::warble(EffectKind effect, std::vector<float>& wave) const
{
    int    n  = static_cast<int>(wave.size());
    double ex = config_.exaggeration();

    std::vector<float> lfo = lfo_envelope(n, config_.lfo_rate(), ex, config_.sample_rate());

    for (int i = 0; i < n; i++) {
        double t   = time_at(i);
        double sub = 1.0;

        switch (effect) {
        case EffectKind::Blatt:
            // 30 Hz square-shaped chop
            sub = 0.8 + 0.5 * ex * (std::sin(TWO_PI * 30.0 * t) > 0.0 ? 1.0 : -0.5);
            break;
        case EffectKind::Trill:
            sub = 1.0 + 0.5 * ex * std::sin(TWO_PI * 20.0 * t);
            break;
        case EffectKind::Scream: {
            // each partial pulled toward 1.0 by (1 - exag)
            double a = 0.8  + 0.2  * std::sin(TWO_PI * 13.0 * t);
            double b = 0.9  + 0.1  * std::sin(TWO_PI * 27.0 * t);
            double c = 0.95 + 0.05 * std::sin(TWO_PI * 41.0 * t);
            sub = (1.0 - (1.0 - a) * ex) * (1.0 - (1.0 - b) * ex) * (1.0 - (1.0 - c) * ex);
            break;
        }
        case EffectKind::Normal:
        case EffectKind::Whistle:
        case EffectKind::Happy:
        case EffectKind::Sad:
        case EffectKind::Question:
        case EffectKind::Random:
            break;
        }

        wave[static_cast<size_t>(i)] *= static_cast<float>(lfo[static_cast<size_t>(i)] * sub);
    }
}
