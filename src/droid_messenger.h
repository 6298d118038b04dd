#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "audio_backend.h"
#include "droid_listener.h"
#include "droid_types.h"
#include "message_compiler.h"
#include "random_source.h"

// Everything a front end can set; persisted by settings.cpp.
struct DroidSettings {
    SynthesisParams           synth;
    std::optional<EffectKind> effect_override;     // empty = per-character mapping
    bool                      add_personality = true;
    std::optional<uint32_t>   seed;                // empty = std::random_device
    std::string               input_device;        // empty = default source
};

/* ── DroidMessenger ────────────────────────────────────────────────────
 *
 *  compose()  text → AudioBuffer, no side effects
 *  play()     opens a playback stream, writes, drains; the stream is
 *             released on every exit path
 *  send()     compose, optionally save a WAV, then play
 *
 *  compose/configure are serialized by one mutex so a GUI worker thread
 *  may synthesize while the main thread changes the knobs.
 * ──────────────────────────────────────────────────────────────────── */

class DroidMessenger {
public:
    using PlaybackFactory = std::function<std::unique_ptr<AudioPlayback>()>;

    DroidMessenger(const DroidSettings& settings,
                   PlaybackFactory playback,
                   DroidListener::CaptureFactory capture);
    ~DroidMessenger();

    void          configure(const DroidSettings& settings);
    DroidSettings settings() const;

    AudioBuffer compose(const std::string& message);
    DroidStatus play(const AudioBuffer& buffer);
    DroidStatus send(const std::string& message, const std::string& save_path = std::string());

    DroidStatus start_listening(DroidListener::DetectCallback callback);
    void        stop_listening();
    bool        is_listening() const { return listener_.is_running(); }

    const DroidListener& listener() const { return listener_; }

private:
    mutable std::mutex mutex_;
    DroidSettings      settings_;
    MessageCompiler    compiler_;
    RandomSource       rng_;
    PlaybackFactory    make_playback_;
    DroidListener      listener_;
};
