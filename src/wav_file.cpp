#include "wav_file.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

#define WAV_FMT_PCM   1
#define WAV_FMT_FLOAT 3

static constexpr uint32_t WAV_HEADER_BYTES = 44;

/* ── little-endian helpers ───────────────────────────────────────────── */

static void put_u16(std::vector<uint8_t>& out, uint16_t v)
{
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

static void put_u32(std::vector<uint8_t>& out, uint32_t v)
{
    for (int i = 0; i < 4; i++)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

static void put_tag(std::vector<uint8_t>& out, const char* tag)
{
    out.insert(out.end(), tag, tag + 4);
}

static uint16_t get_u16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

static uint32_t get_u32(const uint8_t* p)
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

/* ── writing ─────────────────────────────────────────────────────────── */

std::vector<uint8_t> wav_encode_pcm16(const AudioBuffer& buffer)
{
    const uint16_t channels    = 1;
    const uint16_t bits        = 16;
    const uint16_t block_align = channels * bits / 8;
    const uint32_t rate        = static_cast<uint32_t>(buffer.sample_rate);
    const uint32_t data_bytes  = static_cast<uint32_t>(buffer.samples.size()) * block_align;

    std::vector<uint8_t> out;
    out.reserve(WAV_HEADER_BYTES + data_bytes);

    put_tag(out, "RIFF");
    put_u32(out, WAV_HEADER_BYTES - 8 + data_bytes);
    put_tag(out, "WAVE");

    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, WAV_FMT_PCM);
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * block_align);     // byte rate
    put_u16(out, block_align);
    put_u16(out, bits);

    put_tag(out, "data");
    put_u32(out, data_bytes);

    for (float s : buffer.samples) {
        float   c = std::clamp(s, -1.0f, 1.0f);
        int16_t q = static_cast<int16_t>(std::lround(c * 32767.0f));
        put_u16(out, static_cast<uint16_t>(q));
    }
    return out;
}

DroidStatus wav_save_pcm16(const std::string& path, const AudioBuffer& buffer)
{
    std::vector<uint8_t> bytes = wav_encode_pcm16(buffer);

    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        fprintf(stderr, "DroidVox: cannot open %s for writing\n", path.c_str());
        return DroidStatus::FileOpenFailed;
    }

    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
    bool   closed  = (std::fclose(f) == 0);
    if (written != bytes.size() || !closed) {
        fprintf(stderr, "DroidVox: short write on %s\n", path.c_str());
        return DroidStatus::FileWriteFailed;
    }

    fprintf(stderr, "DroidVox: wrote %s, %zu samples, %d Hz, 16-bit mono\n",
            path.c_str(), buffer.samples.size(), buffer.sample_rate);
    return DroidStatus::Ok;
}

/* ── reading ─────────────────────────────────────────────────────────── */

static bool wav_read_header(FILE* f, WavInfo& info)
{
    uint8_t riff[12];
    if (std::fread(riff, 1, 12, f) != 12) return false;
    if (std::memcmp(riff, "RIFF", 4) || std::memcmp(riff + 8, "WAVE", 4)) return false;

    bool have_fmt = false;
    while (true) {
        uint8_t chunk[8];
        if (std::fread(chunk, 1, 8, f) != 8) return false;
        uint32_t chunk_size = get_u32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16) return false;
            uint8_t buf[16];
            if (std::fread(buf, 1, 16, f) != 16) return false;

            uint16_t audio_fmt   = get_u16(buf + 0);
            info.num_channels    = get_u16(buf + 2);
            info.sample_rate     = static_cast<int>(get_u32(buf + 4));
            info.bits_per_sample = get_u16(buf + 14);
            info.is_float        = (audio_fmt == WAV_FMT_FLOAT);
            if (audio_fmt != WAV_FMT_PCM && audio_fmt != WAV_FMT_FLOAT) return false;
            have_fmt = true;

            if (chunk_size > 16)
                std::fseek(f, static_cast<long>(chunk_size - 16), SEEK_CUR);

        } else if (std::memcmp(chunk, "data", 4) == 0) {
            // trust the header only as far as the file actually goes
            long here = std::ftell(f);
            if (here < 0 || std::fseek(f, 0, SEEK_END) != 0) return false;
            long file_end = std::ftell(f);
            if (file_end < here || std::fseek(f, here, SEEK_SET) != 0) return false;
            info.data_size = std::min(chunk_size, static_cast<uint32_t>(file_end - here));
            return have_fmt && info.num_channels > 0 && info.bits_per_sample >= 8;
        } else {
            std::fseek(f, static_cast<long>((chunk_size + 1) & ~1u), SEEK_CUR);
        }
    }
}

static bool wav_read_mono_float(FILE* f, const WavInfo& info, std::vector<float>& buf)
{
    int  bps   = info.bits_per_sample;
    int  nch   = info.num_channels;
    long total = static_cast<long>(info.data_size) / (bps / 8);
    long mono  = total / nch;

    buf.assign(static_cast<size_t>(mono), 0.0f);

    for (long i = 0; i < mono; i++) {
        float sum = 0.0f;
        for (int ch = 0; ch < nch; ch++) {
            float v = 0.0f;
            if (info.is_float && bps == 32) {
                float tmp; if (std::fread(&tmp, 4, 1, f) != 1) return false;
                v = tmp;
            } else if (info.is_float && bps == 64) {
                double tmp; if (std::fread(&tmp, 8, 1, f) != 1) return false;
                v = static_cast<float>(tmp);
            } else if (!info.is_float && bps == 16) {
                uint8_t b[2]; if (std::fread(b, 1, 2, f) != 2) return false;
                v = static_cast<int16_t>(get_u16(b)) / 32767.0f;
            } else if (!info.is_float && bps == 24) {
                uint8_t b[3]; if (std::fread(b, 1, 3, f) != 3) return false;
                int32_t raw = (static_cast<int32_t>(b[2]) << 16) | (b[1] << 8) | b[0];
                if (raw & 0x800000) raw |= static_cast<int32_t>(0xFF000000);
                v = raw / 8388608.0f;
            } else if (!info.is_float && bps == 32) {
                uint8_t b[4]; if (std::fread(b, 1, 4, f) != 4) return false;
                v = static_cast<int32_t>(get_u32(b)) / 2147483648.0f;
            } else {
                return false;
            }
            sum += v;
        }
        buf[static_cast<size_t>(i)] = sum / nch;
    }
    return true;
}

DroidStatus wav_load(const std::string& path, AudioBuffer& out, WavInfo* info)
{
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return DroidStatus::FileOpenFailed;

    WavInfo wav{};
    bool ok = wav_read_header(f, wav) && wav_read_mono_float(f, wav, out.samples);
    std::fclose(f);
    if (!ok) {
        out.samples.clear();
        return DroidStatus::BadFormat;
    }

    out.sample_rate = wav.sample_rate;
    if (info) *info = wav;
    return DroidStatus::Ok;
}
