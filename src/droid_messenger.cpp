#include "droid_messenger.h"

#include <algorithm>
#include <cstdio>

#include "wav_file.h"

static constexpr int PLAYBACK_CHUNK = 4096;   // frames per write

static RandomSource make_rng(const std::optional<uint32_t>& seed)
{
    return seed ? RandomSource(*seed) : RandomSource();
}

/* ── construction / configuration ────────────────────────────────────── */

DroidMessenger::DroidMessenger(const DroidSettings& settings,
                               PlaybackFactory playback,
                               DroidListener::CaptureFactory capture)
    : settings_(settings),
      compiler_(SynthesisConfig(settings.synth)),
      rng_(make_rng(settings.seed)),
      make_playback_(std::move(playback)),
      listener_(std::move(capture))
{
}

DroidMessenger::~DroidMessenger() { stop_listening(); }

void DroidMessenger::configure(const DroidSettings& settings)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool reseed = settings.seed && settings.seed != settings_.seed;
    settings_ = settings;
    compiler_ = MessageCompiler(SynthesisConfig(settings.synth));
    if (reseed) rng_.reseed(*settings.seed);
}

DroidSettings DroidMessenger::settings() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

/* ── synthesis ───────────────────────────────────────────────────────── */

AudioBuffer DroidMessenger::compose(const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    EncodeOptions options;
    options.add_personality = settings_.add_personality;
    options.effect_override = settings_.effect_override;
    return compiler_.encode(message, options, rng_);
}

/* ── playback ────────────────────────────────────────────────────────── */

DroidStatus DroidMessenger::play(const AudioBuffer& buffer)
{
    std::unique_ptr<AudioPlayback> out = make_playback_ ? make_playback_() : nullptr;
    if (!out || !out->open(buffer.sample_rate, 1))
        return DroidStatus::NoAudioDevice;

    // out's destructor closes the stream on every return below
    size_t total = buffer.samples.size();
    for (size_t pos = 0; pos < total; pos += PLAYBACK_CHUNK) {
        int frames = static_cast<int>(std::min<size_t>(PLAYBACK_CHUNK, total - pos));
        if (out->write(buffer.samples.data() + pos, frames) < 0) {
            out->flush();
            return DroidStatus::StreamWriteFailed;
        }
    }
    if (out->drain() < 0)
        return DroidStatus::StreamWriteFailed;

    out->close();
    return DroidStatus::Ok;
}

DroidStatus DroidMessenger::send(const std::string& message, const std::string& save_path)
{
    fprintf(stderr, "DroidVox: sending \"%s\"\n", message.c_str());

    AudioBuffer buffer = compose(message);

    if (!save_path.empty()) {
        DroidStatus st = wav_save_pcm16(save_path, buffer);
        if (st != DroidStatus::Ok) return st;
    }
    return play(buffer);
}

/* ── listening ───────────────────────────────────────────────────────── */

DroidStatus DroidMessenger::start_listening(DroidListener::DetectCallback callback)
{
    DroidSettings s = settings();
    return listener_.start(s.input_device, SynthesisConfig(s.synth).sample_rate(),
                           std::move(callback));
}

void DroidMessenger::stop_listening()
{
    listener_.stop();
}
