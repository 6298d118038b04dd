#include <catch2/catch.hpp>

#include <cmath>
#include <vector>

#include "effect_engine.h"
#include "envelope.h"
#include "oscillator.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static constexpr int SR = 48000;

static bool all_finite(const std::vector<float>& w)
{
    for (float s : w)
        if (!std::isfinite(s)) return false;
    return true;
}

// sign flips in [begin, end), zero samples skipped
static int sign_changes(const std::vector<float>& w, size_t begin, size_t end)
{
    int   count = 0;
    float prev  = 0.0f;
    for (size_t i = begin; i < end && i < w.size(); i++) {
        if (w[i] == 0.0f) continue;
        if (prev != 0.0f && (w[i] > 0.0f) != (prev > 0.0f)) count++;
        prev = w[i];
    }
    return count;
}

static SynthesisConfig with_exaggeration(float ex)
{
    SynthesisParams p;
    p.exaggeration = ex;
    return SynthesisConfig(p);
}

TEST_CASE("every effect renders the requested length", "[effects]")
{
    EffectEngine engine{SynthesisConfig()};
    RandomSource rng(7);

    for (int i = 0; i < EFFECT_COUNT; i++) {
        auto effect = static_cast<EffectKind>(i);
        INFO("effect " << effect_name(effect));

        std::vector<float> w = engine.render(effect, 800.0, 0.1, rng);
        REQUIRE(w.size() == 4800);
        REQUIRE(all_finite(w));
        // click fade pins both ends to silence
        REQUIRE(w.front() == 0.0f);
        REQUIRE(w.back() == 0.0f);
    }
}

TEST_CASE("short and empty segments stay well-formed", "[effects]")
{
    EffectEngine engine{SynthesisConfig()};
    RandomSource rng(1);

    for (int i = 0; i < CONCRETE_EFFECT_COUNT; i++) {
        auto effect = static_cast<EffectKind>(i);
        INFO("effect " << effect_name(effect));

        std::vector<float> shorter = engine.render(effect, 1500.0, 0.005, rng);
        REQUIRE(shorter.size() == 240);
        REQUIRE(all_finite(shorter));

        REQUIRE(engine.render(effect, 1500.0, 0.0, rng).empty());
    }
}

TEST_CASE("seeded rendering is deterministic", "[effects]")
{
    EffectEngine engine{SynthesisConfig()};

    SECTION("scream noise") {
        RandomSource a(1234), b(1234), c(99);
        std::vector<float> wa = engine.render(EffectKind::Scream, 800.0, 0.1, a);
        std::vector<float> wb = engine.render(EffectKind::Scream, 800.0, 0.1, b);
        std::vector<float> wc = engine.render(EffectKind::Scream, 800.0, 0.1, c);
        REQUIRE(wa == wb);
        REQUIRE(wa != wc);
    }

    SECTION("random effect choice") {
        RandomSource a(42), b(42);
        for (int k = 0; k < 5; k++)
            REQUIRE(engine.render(EffectKind::Random, 800.0, 0.05, a) ==
                    engine.render(EffectKind::Random, 800.0, 0.05, b));
    }
}

TEST_CASE("random resolves to a concrete effect", "[effects]")
{
    RandomSource rng(3);
    for (int k = 0; k < 200; k++)
        REQUIRE(EffectEngine::resolve(EffectKind::Random, rng) != EffectKind::Random);

    REQUIRE(EffectEngine::resolve(EffectKind::Sad, rng) == EffectKind::Sad);
}

TEST_CASE("duration multipliers", "[effects]")
{
    REQUIRE(EffectEngine::duration_scale(EffectKind::Blatt) == Approx(0.7));
    REQUIRE(EffectEngine::duration_scale(EffectKind::Trill) == Approx(1.3));
    REQUIRE(EffectEngine::duration_scale(EffectKind::Normal) == Approx(1.0));
    REQUIRE(EffectEngine::duration_scale(EffectKind::Question) == Approx(1.0));
    REQUIRE(EffectEngine::duration_scale(EffectKind::Random) == Approx(1.0));
}

TEST_CASE("whistle stays within the unit range", "[effects]")
{
    SynthesisParams p;
    p.exaggeration = 1.0f;
    EffectEngine engine{SynthesisConfig(p)};
    RandomSource rng(5);

    // sine source and a LFO envelope capped at 1
    std::vector<float> w = engine.render(EffectKind::Whistle, 1000.0, 0.1, rng);
    for (float s : w)
        REQUIRE(std::fabs(s) <= 1.0f + 1e-6f);
}

/* ── raw generators ──────────────────────────────────────────────────── */

TEST_CASE("blatt attack rises from half to one and a half", "[effects]")
{
    EffectEngine engine{SynthesisConfig()};
    RandomSource rng(0);

    std::vector<float> w = engine.generate(EffectKind::Blatt, 800.0, 0.1, rng);
    REQUIRE(w.size() == 4800);

    // 10 ms attack (0.5 + i/480) under the 10 ms click fade (i/479)
    for (int i = 1; i < 480; i++) {
        INFO("sample " << i);
        REQUIRE(std::fabs(w[i]) == Approx((0.5 + i / 480.0) * (i / 479.0)));
    }
    REQUIRE(std::fabs(w[479]) > 1.49f);
    REQUIRE(std::fabs(w[240]) == Approx(240.0 / 479.0));

    for (size_t i = 480; i < 4320; i++)
        REQUIRE(std::fabs(w[i]) == 1.0f);
}

TEST_CASE("happy is a run of rising beeps", "[effects]")
{
    RandomSource rng(0);

    auto check = [&](float ex, int beeps) {
        EffectEngine engine{with_exaggeration(ex)};
        std::vector<float> w = engine.generate(EffectKind::Happy, 1000.0, 0.1, rng);
        REQUIRE(w.size() == 4800);

        const int beep_n = 4800 / beeps;
        int last = 0;
        for (int k = 0; k < beeps; k++) {
            size_t start = static_cast<size_t>(k * beep_n);
            INFO("beep " << k);

            // every beep ramps in and out from silence
            REQUIRE(w[start] == 0.0f);
            REQUIRE(w[start + beep_n - 1] == 0.0f);

            double f     = 1000.0 * (1.0 + 0.15 * k);
            int    flips = sign_changes(w, start, start + beep_n);
            REQUIRE(flips == Approx(2.0 * f * beep_n / SR).margin(2));
            REQUIRE(flips > last);
            last = flips;
        }
    };

    SECTION("no exaggeration: three beeps") { check(0.0f, 3); }
    SECTION("half exaggeration: five beeps") { check(0.5f, 5); }
    SECTION("full exaggeration: seven beeps") { check(1.0f, 7); }
}

TEST_CASE("scream rises toward five times the base", "[effects]")
{
    const double f = 500.0;
    const int    n = 9600;

    std::vector<double> rising(n), steady(n, f);
    for (int i = 0; i < n; i++) {
        double u = static_cast<double>(i) / n;
        rising[static_cast<size_t>(i)] = f * (1.0 + 4.0 * u * u);
    }
    std::vector<float> ideal = square_from_phase(integrate_phase(rising, SR), {0.5});
    std::vector<float> flat  = square_from_phase(integrate_phase(steady, SR), {0.5});

    SECTION("without noise the square follows the quadratic sweep") {
        EffectEngine engine{with_exaggeration(0.0f)};
        RandomSource rng(17);
        std::vector<float> w = engine.generate(EffectKind::Scream, f, 0.2, rng);
        REQUIRE(w.size() == static_cast<size_t>(n));

        int agree = 0, agree_flat_tail = 0;
        for (size_t i = 480; i < 9120; i++) {
            REQUIRE(std::fabs(w[i]) == Approx(0.7f));
            if ((w[i] > 0.0f) == (ideal[i] > 0.0f)) agree++;
            if (i >= 7200 && (w[i] > 0.0f) == (flat[i] > 0.0f)) agree_flat_tail++;
        }
        // the noisy duty cycle only moves the edge inside each cycle
        REQUIRE(agree > 0.8 * (9120 - 480));
        // by the last quarter the pitch is well away from the base
        REQUIRE(agree_flat_tail < 0.7 * (9120 - 7200));
    }

    SECTION("exaggeration mixes noise into the level") {
        EffectEngine engine{with_exaggeration(1.0f)};
        RandomSource rng(17);
        std::vector<float> w = engine.generate(EffectKind::Scream, f, 0.2, rng);

        int off_level = 0;
        for (size_t i = 480; i < 9120; i++)
            if (std::fabs(std::fabs(w[i]) - 0.7f) > 0.05f) off_level++;
        REQUIRE(off_level > (9120 - 480) / 2);
    }
}

TEST_CASE("sad falls in pitch under a 3 Hz sob", "[effects]")
{
    EffectEngine engine{with_exaggeration(1.0f)};
    RandomSource rng(0);

    std::vector<float> w   = engine.generate(EffectKind::Sad, 1000.0, 0.2, rng);
    std::vector<float> sob = lfo_envelope(9600, 3.0, 1.0, SR);
    REQUIRE(w.size() == 9600);

    for (size_t i = 480; i < 9120; i++)
        REQUIRE(std::fabs(w[i]) == sob[i]);

    // pitch runs from 1000 Hz down to 1 - 0.5 of it
    int early = sign_changes(w, 480, 2400);       // mean ~925 Hz
    int late  = sign_changes(w, 7200, 9120);      // mean ~575 Hz
    REQUIRE(early == Approx(0.08 * 925.0).margin(3));
    REQUIRE(late == Approx(0.08 * 575.0).margin(3));
    REQUIRE(late < 0.7 * early);
}

TEST_CASE("question holds its pitch before the inflection", "[effects]")
{
    EffectEngine engine{with_exaggeration(1.0f)};
    RandomSource rng(0);

    const double f = 1000.0;
    std::vector<float> w    = engine.generate(EffectKind::Question, f, 0.2, rng);
    std::vector<float> flat = square_from_phase(integrate_phase(std::vector<double>(9600, f), SR), {0.5});
    REQUIRE(w.size() == 9600);

    // first 70% (6720 samples) is the plain carrier
    for (size_t i = 480; i < 6720; i++)
        REQUIRE(w[i] == flat[i]);

    int held  = sign_changes(w, 5760, 6720);
    int raised = sign_changes(w, 8160, 9120);
    REQUIRE(held == Approx(0.04 * f).margin(1));
    REQUIRE(raised > 1.3 * held);
}

TEST_CASE("whistle sits above the base frequency", "[effects]")
{
    EffectEngine engine{with_exaggeration(0.5f)};
    RandomSource rng(0);

    // center (2 + 0.5) · 400 Hz for 0.1 s, two zero crossings per cycle
    std::vector<float> w = engine.generate(EffectKind::Whistle, 400.0, 0.1, rng);
    REQUIRE(sign_changes(w, 0, w.size()) == Approx(200).margin(4));
}

TEST_CASE("trill sweeps around the base frequency", "[effects]")
{
    EffectEngine engine{with_exaggeration(0.5f)};
    RandomSource rng(0);

    // ±450 Hz at 24.5 Hz: crest near sample 490, trough near 1469
    std::vector<float> w = engine.generate(EffectKind::Trill, 1000.0, 0.1, rng);
    int crest  = sign_changes(w, 245, 735);
    int trough = sign_changes(w, 1224, 1714);
    REQUIRE(crest > trough + 10);
}

/* ── warble ─────────────────────────────────────────────────────────── */

TEST_CASE("warble layers per-effect envelopes on the LFO", "[effects]")
{
    const int n = 4800;
    SynthesisConfig config;                     // exaggeration 0.5, LFO 12 Hz
    EffectEngine    engine{config};
    std::vector<float> lfo = lfo_envelope(n, config.lfo_rate(), 0.5, SR);

    auto warbled = [&](EffectKind effect) {
        std::vector<float> w(n, 1.0f);
        engine.warble(effect, w);
        return w;
    };

    SECTION("blatt chops at 30 Hz") {
        std::vector<float> w = warbled(EffectKind::Blatt);
        REQUIRE(w[400] == Approx(lfo[400] * 1.05));       // sin(π/2) > 0
        REQUIRE(w[1200] == Approx(lfo[1200] * 0.675));    // sin(3π/2) < 0
        for (int i = 0; i < n; i++) {
            double sub = w[i] / lfo[i];
            REQUIRE((sub == Approx(1.05) || sub == Approx(0.675)));
        }
    }

    SECTION("trill swells at 20 Hz") {
        std::vector<float> w = warbled(EffectKind::Trill);
        REQUIRE(w[600] == Approx(lfo[600] * 1.25));
        REQUIRE(w[1800] == Approx(lfo[1800] * 0.75));
    }

    SECTION("scream stacks 13, 27 and 41 Hz") {
        std::vector<float> w = warbled(EffectKind::Scream);
        for (int i : {0, 300, 777, 2500, 4100}) {
            double t = static_cast<double>(i) / SR;
            double a = 0.8 + 0.2 * std::sin(2.0 * M_PI * 13.0 * t);
            double b = 0.9 + 0.1 * std::sin(2.0 * M_PI * 27.0 * t);
            double c = 0.95 + 0.05 * std::sin(2.0 * M_PI * 41.0 * t);
            double sub = (1.0 - 0.5 * (1.0 - a)) * (1.0 - 0.5 * (1.0 - b)) * (1.0 - 0.5 * (1.0 - c));
            INFO("sample " << i);
            REQUIRE(w[i] == Approx(lfo[i] * sub));
        }
        REQUIRE(w[0] == Approx(lfo[0] * 0.9 * 0.95 * 0.975));
    }

    SECTION("other effects get the plain LFO") {
        for (EffectKind effect : {EffectKind::Normal, EffectKind::Whistle, EffectKind::Happy,
                                  EffectKind::Sad, EffectKind::Question, EffectKind::Random}) {
            INFO("effect " << effect_name(effect));
            REQUIRE(warbled(effect) == lfo);
        }
    }

    SECTION("no exaggeration flattens the sub-envelopes") {
        EffectEngine calm{with_exaggeration(0.0f)};
        std::vector<float> plain = lfo_envelope(n, config.lfo_rate(), 0.0, SR);
        for (EffectKind effect : {EffectKind::Blatt, EffectKind::Trill, EffectKind::Scream}) {
            INFO("effect " << effect_name(effect));
            std::vector<float> w(n, 1.0f);
            calm.warble(effect, w);
            if (effect == EffectKind::Blatt) {
                for (int i = 0; i < n; i++) REQUIRE(w[i] == Approx(plain[i] * 0.8));
            } else {
                REQUIRE(w == plain);
            }
        }
    }
}
