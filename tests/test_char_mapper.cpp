#include <catch2/catch.hpp>

#include "char_mapper.h"

TEST_CASE("characters are classified by ASCII band", "[mapper]")
{
    REQUIRE(classify_char('A') == CharacterClass::Uppercase);
    REQUIRE(classify_char('Z') == CharacterClass::Uppercase);
    REQUIRE(classify_char('a') == CharacterClass::Lowercase);
    REQUIRE(classify_char('z') == CharacterClass::Lowercase);
    REQUIRE(classify_char('0') == CharacterClass::Number);
    REQUIRE(classify_char('9') == CharacterClass::Number);
    REQUIRE(classify_char(' ') == CharacterClass::Whitespace);
    REQUIRE(classify_char('!') == CharacterClass::Punctuation);
    REQUIRE(classify_char('@') == CharacterClass::Punctuation);
    REQUIRE(classify_char('[') == CharacterClass::Punctuation);
    REQUIRE(classify_char('~') == CharacterClass::Punctuation);

    SECTION("everything else is special") {
        REQUIRE(classify_char('\t') == CharacterClass::Special);
        REQUIRE(classify_char('\n') == CharacterClass::Special);
        REQUIRE(classify_char(127) == CharacterClass::Special);
        REQUIRE(classify_char(0xE9) == CharacterClass::Special);
        REQUIRE(classify_char(0x1F916) == CharacterClass::Special);
    }
}

TEST_CASE("default mapping", "[mapper]")
{
    EffectMapping m = default_effect_mapping();
    REQUIRE(m.size() == CHARACTER_CLASS_COUNT);
    REQUIRE(m[CharacterClass::Uppercase] == EffectKind::Trill);
    REQUIRE(m[CharacterClass::Lowercase] == EffectKind::Normal);
    REQUIRE(m[CharacterClass::Number] == EffectKind::Blatt);
    REQUIRE(m[CharacterClass::Whitespace] == EffectKind::Normal);
    REQUIRE(m[CharacterClass::Punctuation] == EffectKind::Whistle);
    REQUIRE(m[CharacterClass::Special] == EffectKind::Random);
}

TEST_CASE("punctuation cues apply to non-final characters only", "[mapper]")
{
    EffectMapping m = default_effect_mapping();

    REQUIRE(resolve_effect(CharacterClass::Punctuation, '?', m, false) == EffectKind::Question);
    REQUIRE(resolve_effect(CharacterClass::Punctuation, '!', m, false) == EffectKind::Scream);
    REQUIRE(resolve_effect(CharacterClass::Punctuation, '.', m, false) == EffectKind::Sad);

    REQUIRE(resolve_effect(CharacterClass::Punctuation, '?', m, true) == EffectKind::Whistle);
    REQUIRE(resolve_effect(CharacterClass::Punctuation, '!', m, true) == EffectKind::Whistle);
    REQUIRE(resolve_effect(CharacterClass::Punctuation, ',', m, false) == EffectKind::Whistle);
}

TEST_CASE("missing classes use the fallback", "[mapper]")
{
    EffectMapping partial{{CharacterClass::Uppercase, EffectKind::Happy}};

    REQUIRE(resolve_effect(CharacterClass::Uppercase, 'Q', partial, false) == EffectKind::Happy);
    REQUIRE(resolve_effect(CharacterClass::Lowercase, 'q', partial, false) == EffectKind::Normal);
    REQUIRE(resolve_effect(CharacterClass::Lowercase, 'q', partial, false, EffectKind::Sad)
            == EffectKind::Sad);
}

TEST_CASE("effect names parse back", "[mapper]")
{
    for (int i = 0; i < EFFECT_COUNT; i++) {
        auto effect = static_cast<EffectKind>(i);
        EffectKind parsed;
        REQUIRE(effect_parse(effect_name(effect), parsed));
        REQUIRE(parsed == effect);
    }

    EffectKind e;
    REQUIRE(effect_parse("SCREAM", e));
    REQUIRE(e == EffectKind::Scream);
    REQUIRE_FALSE(effect_parse("honk", e));
    REQUIRE(effect_from_name("honk") == EffectKind::Normal);
}
