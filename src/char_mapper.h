#pragma once

#include <cstdint>

#include "droid_types.h"

/* ── Character classification ──────────────────────────────────────── */

// ASCII bands only; everything outside them (including all non-ASCII) is Special
CharacterClass classify_char(uint32_t code_point);

// uppercase→trill, lowercase→normal, number→blatt, whitespace→normal,
// punctuation→whistle, special→random
EffectMapping default_effect_mapping();

// Class lookup (fallback when the class is absent), then the
// '?' → Question, '!' → Scream, '.' → Sad cues for every character
// except the last one of the message.
EffectKind resolve_effect(CharacterClass cls, uint32_t code_point,
                          const EffectMapping& mapping, bool is_last,
                          EffectKind fallback = EffectKind::Normal);
