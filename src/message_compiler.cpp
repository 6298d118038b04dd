#include "message_compiler.h"

#include <algorithm>
#include <cmath>

#include "char_mapper.h"
#include "effect_engine.h"
#include "oscillator.h"

/* ── personality and pacing constants ────────────────────────────────── */

static constexpr size_t INTRO_MIN_CHARS  = 4;     // intro when len > 3
static constexpr size_t OUTRO_MIN_CHARS  = 6;     // outro when len > 5

static constexpr double INTRO_FREQ_SCALE = 1.2;   // × carrier[0]
static constexpr double INTRO_DURATION   = 2.5;   // × base duration
static constexpr double INTRO_PAUSE      = 0.3;
static constexpr double OUTRO_FREQ_SCALE = 1.1;   // × carrier[2]
static constexpr double OUTRO_DURATION   = 2.0;
static constexpr double OUTRO_PAUSE      = 0.4;
static constexpr double CHAR_PAUSE       = 0.2;

static constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

/* ── UTF-8 ───────────────────────────────────────────────────────────── */

std::vector<uint32_t> utf8_code_points(const std::string& text)
{
    std::vector<uint32_t> out;
    out.reserve(text.size());

    const auto* p   = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();

    while (p < end) {
        unsigned char c0 = *p++;
        int      extra;
        uint32_t cp;
        uint32_t min_cp;

        if (c0 < 0x80)              { out.push_back(c0); continue; }
        else if ((c0 >> 5) == 0x6)  { extra = 1; cp = c0 & 0x1F; min_cp = 0x80; }
        else if ((c0 >> 4) == 0xE)  { extra = 2; cp = c0 & 0x0F; min_cp = 0x800; }
        else if ((c0 >> 3) == 0x1E) { extra = 3; cp = c0 & 0x07; min_cp = 0x10000; }
        else                        { out.push_back(REPLACEMENT_CHAR); continue; }

        // only continuation bytes are consumed; a bad or missing one ends
        // the sequence and decoding resumes at that byte
        int k = 0;
        while (k < extra && p + k < end && (p[k] & 0xC0) == 0x80) {
            cp = (cp << 6) | (p[k] & 0x3F);
            k++;
        }
        p += k;
        if (k < extra) {
            out.push_back(REPLACEMENT_CHAR);
            continue;
        }

        // overlong forms, surrogate halves and values past U+10FFFF
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            cp = REPLACEMENT_CHAR;
        out.push_back(cp);
    }
    return out;
}

/* ── normalization ───────────────────────────────────────────────────── */

void normalize_buffer(std::vector<float>& samples, float volume)
{
    float peak = 0.0f;
    for (float s : samples)
        peak = std::max(peak, std::fabs(s));

    // silent or empty: nothing to normalize, result stays silent
    if (peak > 0.0f) {
        for (float& s : samples)
            s /= peak;
    }
    for (float& s : samples)
        s *= volume;
}

size_t planned_length(const std::vector<Segment>& segments)
{
    size_t total = 0;
    for (const Segment& seg : segments)
        total += static_cast<size_t>(seg.samples);
    return total;
}

/* ── MessageCompiler ─────────────────────────────────────────────────── */

MessageCompiler::MessageCompiler(const SynthesisConfig& config) : config_(config) {}

std::vector<Segment> MessageCompiler::plan(const std::string& message,
                                           const EncodeOptions& options) const
{
    const int        sr       = config_.sample_rate();
    const double     base     = config_.char_duration();
    const CarrierSet& carriers = config_.carrier_frequencies();

    const EffectMapping mapping = options.mapping ? *options.mapping
                                                  : default_effect_mapping();
    const std::vector<uint32_t> codes = utf8_code_points(message);

    std::vector<Segment> segments;

    auto add_pause = [&](double seconds) {
        Segment pause;
        pause.kind    = SegmentKind::Pause;
        pause.seconds = seconds;
        pause.samples = samples_for(seconds, sr);
        segments.push_back(pause);
    };

    if (options.add_personality && codes.size() >= INTRO_MIN_CHARS) {
        Segment intro;
        intro.kind      = SegmentKind::Intro;
        intro.effect    = EffectKind::Trill;
        intro.frequency = carriers[0] * INTRO_FREQ_SCALE;
        intro.seconds   = base * INTRO_DURATION;
        intro.samples   = samples_for(intro.seconds, sr);
        segments.push_back(intro);
        add_pause(base * INTRO_PAUSE);
    }

    for (size_t i = 0; i < codes.size(); i++) {
        uint32_t c       = codes[i];
        bool     is_last = (i + 1 == codes.size());

        Segment seg;
        seg.kind       = SegmentKind::Character;
        seg.code_point = c;
        seg.frequency  = carriers[c % CARRIER_COUNT] + static_cast<double>(c % 10) * 20.0;

        if (options.effect_override) {
            EffectMapping forced;
            for (int k = 0; k < CHARACTER_CLASS_COUNT; k++)
                forced[static_cast<CharacterClass>(k)] = *options.effect_override;
            seg.effect = resolve_effect(classify_char(c), c, forced, is_last,
                                        config_.default_effect());
        } else {
            seg.effect = resolve_effect(classify_char(c), c, mapping, is_last,
                                        config_.default_effect());
        }

        seg.seconds = base * EffectEngine::duration_scale(seg.effect);
        seg.samples = samples_for(seg.seconds, sr);
        segments.push_back(seg);

        if (!is_last)
            add_pause(base * CHAR_PAUSE);
    }

    if (options.add_personality && codes.size() >= OUTRO_MIN_CHARS) {
        add_pause(base * OUTRO_PAUSE);

        Segment outro;
        outro.kind      = SegmentKind::Outro;
        outro.effect    = EffectKind::Happy;
        outro.frequency = carriers[2] * OUTRO_FREQ_SCALE;
        outro.seconds   = base * OUTRO_DURATION;
        outro.samples   = samples_for(outro.seconds, sr);
        segments.push_back(outro);
    }

    return segments;
}

AudioBuffer MessageCompiler::encode(const std::string& message,
                                    const EncodeOptions& options,
                                    RandomSource& rng) const
{
    std::vector<Segment> segments = plan(message, options);
    EffectEngine engine(config_);

    AudioBuffer out;
    out.sample_rate = config_.sample_rate();
    out.samples.reserve(planned_length(segments));

    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::Pause) {
            out.samples.insert(out.samples.end(), static_cast<size_t>(seg.samples), 0.0f);
            continue;
        }

        std::vector<float> wave = engine.render(seg.effect, seg.frequency, seg.seconds, rng);
        // render() uses the same rounding as plan(); pin it anyway
        wave.resize(static_cast<size_t>(seg.samples), 0.0f);
        out.samples.insert(out.samples.end(), wave.begin(), wave.end());
    }

    normalize_buffer(out.samples, config_.volume());
    return out;
}

AudioBuffer encode_message(const std::string& message, const SynthesisConfig& config,
                           const EncodeOptions& options, RandomSource& rng)
{
    return MessageCompiler(config).encode(message, options, rng);
}
