#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "droid_types.h"
#include "random_source.h"

/* ── MessageCompiler ───────────────────────────────────────────────────
 *
 *  text → code points → (frequency, effect) → segments → one buffer,
 *  normalized to a peak of 1.0 and scaled by the configured volume.
 *
 *  plan() lays out every segment and its sample count before anything
 *  is synthesized; encode() renders exactly that plan.  Random effects
 *  are resolved at render time and never change a segment's length.
 * ──────────────────────────────────────────────────────────────────── */

enum class SegmentKind { Intro, Character, Pause, Outro };

struct Segment {
    SegmentKind kind       = SegmentKind::Pause;
    EffectKind  effect     = EffectKind::Normal;   // unused for pauses
    uint32_t    code_point = 0;                    // Character only
    double      frequency  = 0.0;
    double      seconds    = 0.0;
    int         samples    = 0;
};

struct EncodeOptions {
    std::optional<EffectMapping> mapping;          // default_effect_mapping() when empty
    bool                         add_personality = true;
    std::optional<EffectKind>    effect_override;  // replaces the class mapping for every char
};

class MessageCompiler {
public:
    explicit MessageCompiler(const SynthesisConfig& config);

    std::vector<Segment> plan(const std::string& message,
                              const EncodeOptions& options) const;

    AudioBuffer encode(const std::string& message, const EncodeOptions& options,
                       RandomSource& rng) const;

    const SynthesisConfig& config() const { return config_; }

private:
    SynthesisConfig config_;
};

size_t planned_length(const std::vector<Segment>& segments);

// Divide by the peak absolute sample (skipped when the peak is 0), then scale.
void normalize_buffer(std::vector<float>& samples, float volume);

// Best-effort UTF-8 decode; malformed sequences become U+FFFD.
std::vector<uint32_t> utf8_code_points(const std::string& text);

// Convenience entry point: one-shot MessageCompiler.
AudioBuffer encode_message(const std::string& message, const SynthesisConfig& config,
                           const EncodeOptions& options, RandomSource& rng);
