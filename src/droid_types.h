#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/* ── Effects and character classes ─────────────────────────────────── */

enum class EffectKind {
    Normal,
    Blatt,
    Trill,
    Whistle,
    Scream,
    Happy,
    Sad,
    Question,
    Random,     // meta-effect, resolved to one of the above at render time
};

constexpr int EFFECT_COUNT          = 9;
constexpr int CONCRETE_EFFECT_COUNT = 8;   // everything except Random

enum class CharacterClass {
    Uppercase,
    Lowercase,
    Number,
    Whitespace,
    Punctuation,
    Special,
};

constexpr int CHARACTER_CLASS_COUNT = 6;

// Classes missing from a mapping fall back to SynthesisConfig::default_effect().
using EffectMapping = std::map<CharacterClass, EffectKind>;

const char* effect_name(EffectKind effect);
const char* character_class_name(CharacterClass cls);

// Strict lookup (case-insensitive). Returns false for unknown names.
bool effect_parse(const std::string& name, EffectKind& out);

// Lenient lookup: unknown names log a warning and give EffectKind::Normal.
EffectKind effect_from_name(const std::string& name);

/* ── I/O status ────────────────────────────────────────────────────── */

enum class DroidStatus {
    Ok,
    NoAudioDevice,
    StreamWriteFailed,
    CaptureFailed,
    FileOpenFailed,
    FileWriteFailed,
    BadFormat,
};

const char* droid_status_string(DroidStatus status);

/* ── Audio buffer ──────────────────────────────────────────────────── */

struct AudioBuffer {
    std::vector<float> samples;     // mono
    int                sample_rate = 0;

    size_t size()    const { return samples.size(); }
    bool   empty()   const { return samples.empty(); }
    double seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/* ── Synthesis configuration ───────────────────────────────────────── */

enum class Protocol { Audible, Ultrasound };

const char* protocol_name(Protocol protocol);
bool        protocol_parse(const std::string& name, Protocol& out);

constexpr int    DEFAULT_SAMPLE_RATE   = 48000;
constexpr float  DEFAULT_VOLUME        = 0.5f;
constexpr float  DEFAULT_DUTY_CYCLE    = 0.5f;
constexpr float  DEFAULT_LFO_RATE      = 12.0f;
constexpr float  DEFAULT_EXAGGERATION  = 0.5f;
constexpr double DEFAULT_CHAR_DURATION = 0.1;     // seconds per character

constexpr int CARRIER_COUNT = 5;
using CarrierSet = std::array<double, CARRIER_COUNT>;

// Knobs as the user supplied them; may be out of range.
struct SynthesisParams {
    int        sample_rate    = DEFAULT_SAMPLE_RATE;
    float      volume         = DEFAULT_VOLUME;
    float      duty_cycle     = DEFAULT_DUTY_CYCLE;
    float      lfo_rate       = DEFAULT_LFO_RATE;
    float      exaggeration   = DEFAULT_EXAGGERATION;
    double     char_duration  = DEFAULT_CHAR_DURATION;
    Protocol   protocol       = Protocol::Audible;
    EffectKind default_effect = EffectKind::Normal;
};

/*
 * Read-only view of the synthesis knobs. Out-of-range values are clamped
 * silently when the config is built:
 *   volume       → [0, 1]
 *   duty_cycle   → [0.3, 0.7]
 *   lfo_rate     → [5, 20] Hz
 *   exaggeration → [0, 1]
 * A non-positive sample rate or character duration falls back to the default.
 */
class SynthesisConfig {
public:
    explicit SynthesisConfig(const SynthesisParams& params = SynthesisParams{});

    int               sample_rate()    const { return sample_rate_; }
    float             volume()         const { return volume_; }
    float             duty_cycle()     const { return duty_cycle_; }
    float             lfo_rate()       const { return lfo_rate_; }
    float             exaggeration()   const { return exaggeration_; }
    double            char_duration()  const { return char_duration_; }
    Protocol          protocol()       const { return protocol_; }
    EffectKind        default_effect() const { return default_effect_; }
    const CarrierSet& carrier_frequencies() const { return carriers_; }

private:
    int        sample_rate_;
    float      volume_;
    float      duty_cycle_;
    float      lfo_rate_;
    float      exaggeration_;
    double     char_duration_;
    Protocol   protocol_;
    EffectKind default_effect_;
    CarrierSet carriers_;
};
