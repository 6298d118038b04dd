#pragma once

#include <vector>

#include "droid_types.h"
#include "random_source.h"

/* ── EffectEngine ──────────────────────────────────────────────────────
 *
 *  One raw generator and one warble post-process per effect:
 *
 *    generate()  oscillators + modulation, then the click fade
 *    warble()    amplitude envelope built on the configured LFO
 *    render()    resolves Random once, then generate() + warble()
 *
 *  Sample counts are round(sample_rate · duration) for every effect.
 * ──────────────────────────────────────────────────────────────────── */

class EffectEngine {
public:
    explicit EffectEngine(const SynthesisConfig& config);

    // Random is resolved here with `rng`; pass a concrete effect to skip that.
    std::vector<float> generate(EffectKind effect, double freq, double duration,
                                RandomSource& rng) const;

    // Random has no envelope of its own and gets the plain LFO.
    void warble(EffectKind effect, std::vector<float>& wave) const;

    std::vector<float> render(EffectKind effect, double freq, double duration,
                              RandomSource& rng) const;

    // Per-character duration multiplier (Blatt 0.7, Trill 1.3, others 1.0)
    static double duration_scale(EffectKind effect);

    static EffectKind resolve(EffectKind effect, RandomSource& rng);

private:
    std::vector<float> gen_normal  (double freq, int n) const;
    std::vector<float> gen_blatt   (double freq, int n) const;
    std::vector<float> gen_trill   (double freq, int n) const;
    std::vector<float> gen_whistle (double freq, int n) const;
    std::vector<float> gen_scream  (double freq, int n, RandomSource& rng) const;
    std::vector<float> gen_happy   (double freq, int n) const;
    std::vector<float> gen_sad     (double freq, int n) const;
    std::vector<float> gen_question(double freq, int n) const;

    double time_at(int i) const { return static_cast<double>(i) / config_.sample_rate(); }

    SynthesisConfig config_;
};
