#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "droid_types.h"

struct WavInfo {
    int      sample_rate     = 0;
    int      num_channels    = 0;
    int      bits_per_sample = 0;
    bool     is_float        = false;
    uint32_t data_size       = 0;     // bytes in the data chunk
};

/* ── writing ───────────────────────────────────────────────────────── */

// 44-byte RIFF/WAVE header + 16-bit little-endian PCM, mono.
// Each sample is clamped to [-1, 1] and quantized to round(s · 32767).
std::vector<uint8_t> wav_encode_pcm16(const AudioBuffer& buffer);

DroidStatus wav_save_pcm16(const std::string& path, const AudioBuffer& buffer);

/* ── reading ───────────────────────────────────────────────────────── */

// 16/24/32-bit PCM or 32/64-bit float; channels are averaged to mono.
DroidStatus wav_load(const std::string& path, AudioBuffer& out, WavInfo* info = nullptr);
