#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

#include "message_compiler.h"

static std::vector<SegmentKind> kinds(const std::vector<Segment>& segs)
{
    std::vector<SegmentKind> out;
    for (const Segment& s : segs) out.push_back(s.kind);
    return out;
}

static float peak_of(const std::vector<float>& samples)
{
    float peak = 0.0f;
    for (float s : samples) peak = std::max(peak, std::fabs(s));
    return peak;
}

static EncodeOptions plain()
{
    EncodeOptions o;
    o.add_personality = false;
    return o;
}

TEST_CASE("two uppercase characters without personality", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};
    std::vector<Segment> segs = compiler.plan("AB", plain());

    REQUIRE(segs.size() == 3);
    REQUIRE(segs[0].effect == EffectKind::Trill);
    REQUIRE(segs[0].samples == 6240);       // 0.1 s × 1.3
    REQUIRE(segs[1].kind == SegmentKind::Pause);
    REQUIRE(segs[1].samples == 960);        // 0.2 × 0.1 s
    REQUIRE(segs[2].samples == 6240);
    REQUIRE(planned_length(segs) == 13440);

    RandomSource rng(1);
    AudioBuffer buf = compiler.encode("AB", plain(), rng);
    REQUIRE(buf.size() == 13440);
    REQUIRE(buf.sample_rate == 48000);
}

TEST_CASE("character frequencies follow the carrier table", "[compiler]")
{
    SECTION("audible") {
        MessageCompiler compiler{SynthesisConfig()};
        std::vector<Segment> segs = compiler.plan("A", plain());
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0].frequency == Approx(300.0 + 5 * 20.0));     // 'A' = 65
    }

    SECTION("ultrasound") {
        SynthesisParams p;
        p.protocol = Protocol::Ultrasound;
        MessageCompiler compiler{SynthesisConfig(p)};
        std::vector<Segment> segs = compiler.plan("b", plain());    // 'b' = 98
        REQUIRE(segs[0].frequency == Approx(19000.0 + 8 * 20.0));
    }
}

TEST_CASE("personality thresholds", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};
    EncodeOptions with;

    SECTION("three characters: none") {
        std::vector<Segment> segs = compiler.plan("abc", with);
        REQUIRE(segs.front().kind == SegmentKind::Character);
        REQUIRE(segs.back().kind == SegmentKind::Character);
    }

    SECTION("four characters: intro only") {
        std::vector<Segment> segs = compiler.plan("abcd", with);
        REQUIRE(segs[0].kind == SegmentKind::Intro);
        REQUIRE(segs[0].effect == EffectKind::Trill);
        REQUIRE(segs[0].frequency == Approx(360.0));
        REQUIRE(segs[0].samples == 12000);
        REQUIRE(segs[1].kind == SegmentKind::Pause);
        REQUIRE(segs[1].samples == 1440);
        REQUIRE(segs.back().kind == SegmentKind::Character);
    }

    SECTION("six characters: intro and outro") {
        std::vector<Segment> segs = compiler.plan("abcdef", with);
        REQUIRE(segs.front().kind == SegmentKind::Intro);

        const Segment& outro = segs.back();
        REQUIRE(outro.kind == SegmentKind::Outro);
        REQUIRE(outro.effect == EffectKind::Happy);
        REQUIRE(outro.frequency == Approx(1650.0));
        REQUIRE(outro.samples == 9600);
        REQUIRE(segs[segs.size() - 2].kind == SegmentKind::Pause);
        REQUIRE(segs[segs.size() - 2].samples == 1920);

        // intro + pause + 6 chars + 5 gaps + pause + outro
        REQUIRE(segs.size() == 15);
    }

    SECTION("disabled") {
        std::vector<SegmentKind> k = kinds(compiler.plan("abcdefgh", plain()));
        REQUIRE(std::count(k.begin(), k.end(), SegmentKind::Intro) == 0);
        REQUIRE(std::count(k.begin(), k.end(), SegmentKind::Outro) == 0);
    }
}

TEST_CASE("question mark cue depends on position", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};

    std::vector<Segment> last = compiler.plan("Hi?", plain());
    REQUIRE(last.back().code_point == '?');
    REQUIRE(last.back().effect == EffectKind::Whistle);

    std::vector<Segment> inner = compiler.plan("Hi? there", plain());
    auto q = std::find_if(inner.begin(), inner.end(),
                          [](const Segment& s) { return s.code_point == '?'; });
    REQUIRE(q != inner.end());
    REQUIRE(q->effect == EffectKind::Question);
}

TEST_CASE("effect override", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};
    EncodeOptions o = plain();
    o.effect_override = EffectKind::Blatt;

    std::vector<Segment> segs = compiler.plan("a.b", o);
    REQUIRE(segs[0].effect == EffectKind::Blatt);
    REQUIRE(segs[0].samples == 3360);       // 0.1 s × 0.7
    REQUIRE(segs[2].effect == EffectKind::Sad);
    REQUIRE(segs[4].effect == EffectKind::Blatt);
}

TEST_CASE("random characters keep their planned length", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};
    std::vector<Segment> segs = compiler.plan("\xC3\xA9", plain());     // é
    REQUIRE(segs.size() == 1);
    REQUIRE(segs[0].effect == EffectKind::Random);
    REQUIRE(segs[0].samples == 4800);

    for (uint32_t seed = 0; seed < 10; seed++) {
        RandomSource rng(seed);
        REQUIRE(compiler.encode("\xC3\xA9", plain(), rng).size() == 4800);
    }
}

TEST_CASE("encoded buffers are normalized to the volume", "[compiler]")
{
    SynthesisParams p;
    p.volume = 0.8f;
    MessageCompiler compiler{SynthesisConfig(p)};
    RandomSource rng(11);

    AudioBuffer buf = compiler.encode("Hello, droid!", EncodeOptions(), rng);
    REQUIRE(buf.size() == planned_length(compiler.plan("Hello, droid!", EncodeOptions())));
    REQUIRE(peak_of(buf.samples) == Approx(0.8f).margin(1e-5));
}

TEST_CASE("seeded encoding is reproducible", "[compiler]")
{
    SynthesisConfig config;
    RandomSource a(2024), b(2024);

    const char* msg = "R2! Where are you? \xE2\x98\x85";
    REQUIRE(encode_message(msg, config, EncodeOptions(), a).samples ==
            encode_message(msg, config, EncodeOptions(), b).samples);
}

TEST_CASE("empty and silent input", "[compiler]")
{
    MessageCompiler compiler{SynthesisConfig()};
    RandomSource rng(0);

    AudioBuffer buf = compiler.encode("", EncodeOptions(), rng);
    REQUIRE(buf.empty());
    REQUIRE(buf.sample_rate == 48000);

    std::vector<float> zeros(100, 0.0f);
    normalize_buffer(zeros, 0.5f);
    for (float s : zeros)
        REQUIRE(s == 0.0f);

    std::vector<float> none;
    normalize_buffer(none, 0.5f);
    REQUIRE(none.empty());
}

TEST_CASE("utf8 decoding", "[compiler]")
{
    REQUIRE(utf8_code_points("Ab") == std::vector<uint32_t>{'A', 'b'});
    REQUIRE(utf8_code_points("\xC3\xA9") == std::vector<uint32_t>{0xE9});
    REQUIRE(utf8_code_points("\xF0\x9F\xA4\x96") == std::vector<uint32_t>{0x1F916});
    REQUIRE(utf8_code_points("\xFF" "a") == std::vector<uint32_t>{0xFFFD, 'a'});
    REQUIRE(utf8_code_points("\xC0\xAF") == std::vector<uint32_t>{0xFFFD});   // overlong
    REQUIRE(utf8_code_points("\xE2\x98") == std::vector<uint32_t>{0xFFFD});   // truncated

    SECTION("a broken sequence does not swallow the next character") {
        REQUIRE(utf8_code_points("\xC3" "AB") == std::vector<uint32_t>{0xFFFD, 'A', 'B'});
        REQUIRE(utf8_code_points("x\xE2" "a") == std::vector<uint32_t>{'x', 0xFFFD, 'a'});
        REQUIRE(utf8_code_points("\xE2\x98" "ok") == std::vector<uint32_t>{0xFFFD, 'o', 'k'});
        REQUIRE(utf8_code_points("\xF0\x9F" "\xC3\xA9") == std::vector<uint32_t>{0xFFFD, 0xE9});
    }

    SECTION("the character count drives personality") {
        // four code points: intro is added even though one is malformed
        MessageCompiler compiler{SynthesisConfig()};
        std::vector<Segment> segs = compiler.plan("\xC3" "abc", EncodeOptions());
        REQUIRE(segs.front().kind == SegmentKind::Intro);
    }
}
