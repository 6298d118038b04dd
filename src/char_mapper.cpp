#include "char_mapper.h"

CharacterClass classify_char(uint32_t c)
{
    if (c >= 65 && c <= 90)  return CharacterClass::Uppercase;
    if (c >= 97 && c <= 122) return CharacterClass::Lowercase;
    if (c >= 48 && c <= 57)  return CharacterClass::Number;
    if (c == 32)             return CharacterClass::Whitespace;
    if ((c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
        (c >= 91 && c <= 96) || (c >= 123 && c <= 126))
        return CharacterClass::Punctuation;
    return CharacterClass::Special;
}

EffectMapping default_effect_mapping()
{
    return {
        {CharacterClass::Uppercase,   EffectKind::Trill},
        {CharacterClass::Lowercase,   EffectKind::Normal},
        {CharacterClass::Number,      EffectKind::Blatt},
        {CharacterClass::Whitespace,  EffectKind::Normal},
        {CharacterClass::Punctuation, EffectKind::Whistle},
        {CharacterClass::Special,     EffectKind::Random},
    };
}

EffectKind resolve_effect(CharacterClass cls, uint32_t code_point,
                          const EffectMapping& mapping, bool is_last,
                          EffectKind fallback)
{
    auto it = mapping.find(cls);
    EffectKind effect = (it != mapping.end()) ? it->second : fallback;

    if (!is_last) {
        switch (code_point) {
        case '?': effect = EffectKind::Question; break;
        case '!': effect = EffectKind::Scream;   break;
        case '.': effect = EffectKind::Sad;      break;
        default: break;
        }
    }
    return effect;
}
