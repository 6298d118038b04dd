#include "droid_types.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

/* ── name tables ───────────────────────────────────────────────────── */

static const char* const EFFECT_NAMES[EFFECT_COUNT] = {
    "normal", "blatt", "trill", "whistle", "scream",
    "happy",  "sad",   "question", "random",
};

static const char* const CLASS_NAMES[CHARACTER_CLASS_COUNT] = {
    "uppercase", "lowercase", "number", "whitespace", "punctuation", "special",
};

static std::string to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* effect_name(EffectKind effect)
{
    return EFFECT_NAMES[static_cast<int>(effect)];
}

const char* character_class_name(CharacterClass cls)
{
    return CLASS_NAMES[static_cast<int>(cls)];
}

bool effect_parse(const std::string& name, EffectKind& out)
{
    std::string key = to_lower(name);
    for (int i = 0; i < EFFECT_COUNT; i++) {
        if (key == EFFECT_NAMES[i]) {
            out = static_cast<EffectKind>(i);
            return true;
        }
    }
    return false;
}

EffectKind effect_from_name(const std::string& name)
{
    EffectKind effect = EffectKind::Normal;
    if (!effect_parse(name, effect)) {
        fprintf(stderr, "DroidVox: warning: unknown effect '%s', using normal\n",
                name.c_str());
        return EffectKind::Normal;
    }
    return effect;
}

const char* droid_status_string(DroidStatus status)
{
    switch (status) {
    case DroidStatus::Ok:                return "ok";
    case DroidStatus::NoAudioDevice:     return "no audio device available";
    case DroidStatus::StreamWriteFailed: return "audio stream write failed";
    case DroidStatus::CaptureFailed:     return "audio capture failed";
    case DroidStatus::FileOpenFailed:    return "could not open file";
    case DroidStatus::FileWriteFailed:   return "could not write file";
    case DroidStatus::BadFormat:         return "unsupported or malformed WAV data";
    }
    return "unknown status";
}

const char* protocol_name(Protocol protocol)
{
    return protocol == Protocol::Ultrasound ? "ultrasound" : "audible";
}

bool protocol_parse(const std::string& name, Protocol& out)
{
    std::string key = to_lower(name);
    if (key == "audible")    { out = Protocol::Audible;    return true; }
    if (key == "ultrasound") { out = Protocol::Ultrasound; return true; }
    return false;
}

/* ── SynthesisConfig ───────────────────────────────────────────────── */

// R2 unit range is roughly 300 Hz - 3 kHz
static constexpr CarrierSet AUDIBLE_CARRIERS    = {300.0, 800.0, 1500.0, 2200.0, 3000.0};
static constexpr CarrierSet ULTRASOUND_CARRIERS = {17500.0, 18000.0, 18500.0, 19000.0, 19500.0};

SynthesisConfig::SynthesisConfig(const SynthesisParams& params)
    : sample_rate_   (params.sample_rate > 0 ? params.sample_rate : DEFAULT_SAMPLE_RATE),
      volume_        (std::clamp(params.volume,       0.0f, 1.0f)),
      duty_cycle_    (std::clamp(params.duty_cycle,   0.3f, 0.7f)),
      lfo_rate_      (std::clamp(params.lfo_rate,     5.0f, 20.0f)),
      exaggeration_  (std::clamp(params.exaggeration, 0.0f, 1.0f)),
      char_duration_ (params.char_duration > 0.0 ? params.char_duration : DEFAULT_CHAR_DURATION),
      protocol_      (params.protocol),
      default_effect_(params.default_effect),
      carriers_      (params.protocol == Protocol::Ultrasound ? ULTRASOUND_CARRIERS
                                                              : AUDIBLE_CARRIERS)
{
}
