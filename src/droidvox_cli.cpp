#include <glib.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

#include "audio_backend.h"
#include "char_mapper.h"
#include "droid_messenger.h"
#include "settings.h"
#include "wav_file.h"

/* ── command-line options ────────────────────────────────────────────── */

struct CliOptions {
    gchar   *save          = nullptr;
    gchar   *info          = nullptr;
    gdouble  volume        = 0.0;
    gdouble  duty          = 0.0;
    gdouble  lfo           = 0.0;
    gdouble  exaggeration  = 0.0;
    gchar   *effect        = nullptr;
    gchar   *protocol      = nullptr;
    gint     rate          = 0;
    gint64   seed          = -1;
    gboolean no_personality = FALSE;
    gboolean no_play       = FALSE;
    gboolean interactive   = FALSE;
    gboolean compare       = FALSE;
    gboolean list_effects  = FALSE;
    gchar  **message       = nullptr;

    ~CliOptions() {
        g_free(save);
        g_free(info);
        g_free(effect);
        g_free(protocol);
        g_strfreev(message);
    }
};

static std::string join_words(gchar **words) {
    std::string out;
    for (gchar **w = words; w && *w; w++) {
        if (!out.empty()) out += ' ';
        out += *w;
    }
    return out;
}

static bool apply_effect_name(const std::string &name, DroidSettings &settings) {
    if (name.empty() || name == "auto") {
        settings.effect_override.reset();
        return true;
    }
    EffectKind effect;
    if (!effect_parse(name, effect)) {
        fprintf(stderr, "Unknown effect '%s' (try --list-effects)\n", name.c_str());
        return false;
    }
    settings.effect_override = effect;
    return true;
}

static bool report(DroidStatus st) {
    if (st == DroidStatus::Ok) return true;
    fprintf(stderr, "Error: %s\n", droid_status_string(st));
    return false;
}

/* ── interactive mode ────────────────────────────────────────────────── */

static void print_help() {
    printf("\nCommands:\n"
           "  send <message>          - Send a message with droid sounds\n"
           "  save <file> <message>   - Save message to WAV file (and play it)\n"
           "  effect <name|auto>      - Force an effect for every character\n"
           "  listen                  - Start listening for droid sounds\n"
           "  stop                    - Stop listening\n"
           "  quit                    - Exit the program\n");
}

static int run_interactive(DroidMessenger &messenger) {
    printf("\n=== DroidVox Messenger - Interactive Mode ===\n");
    print_help();

    std::string line;
    while (true) {
        printf("\n> ");
        fflush(stdout);
        if (!std::getline(std::cin, line)) break;

        gchar *trimmed = g_strstrip(g_strdup(line.c_str()));
        std::string command(trimmed);
        g_free(trimmed);
        if (command.empty()) continue;

        std::string verb = command.substr(0, command.find(' '));
        std::string rest = verb.size() < command.size() ? command.substr(verb.size() + 1) : "";
        gchar *lower = g_ascii_strdown(verb.c_str(), -1);
        verb = lower;
        g_free(lower);

        if (verb == "quit" || verb == "exit") {
            break;
        } else if (verb == "help") {
            print_help();
        } else if (verb == "listen") {
            if (messenger.is_listening()) {
                printf("Already listening!\n");
                continue;
            }
            DroidStatus st = messenger.start_listening([](const std::string &msg) {
                printf("\nReceived: %s\n", msg.c_str());
                fflush(stdout);
            });
            if (report(st)) printf("Started listening for droid transmissions...\n");
        } else if (verb == "stop") {
            messenger.stop_listening();
            printf("Stopped listening.\n");
        } else if (verb == "send") {
            if (rest.empty()) {
                printf("Error: No message specified\n");
                continue;
            }
            report(messenger.send(rest));
        } else if (verb == "save") {
            size_t sp = rest.find(' ');
            if (rest.empty() || sp == std::string::npos) {
                printf("Error: Format is 'save <file> <message>'\n");
                continue;
            }
            report(messenger.send(rest.substr(sp + 1), rest.substr(0, sp)));
        } else if (verb == "effect") {
            DroidSettings s = messenger.settings();
            if (apply_effect_name(rest, s)) {
                messenger.configure(s);
                printf("Effect: %s\n", s.effect_override ? effect_name(*s.effect_override) : "auto");
            }
        } else {
            printf("Unknown command. Try 'send', 'save', 'effect', 'listen', 'stop', or 'quit'.\n");
        }
    }

    messenger.stop_listening();
    printf("\nExiting DroidVox Messenger.\n");
    return 0;
}

/* ── one-shot modes ──────────────────────────────────────────────────── */

static void list_effects() {
    for (int i = 0; i < EFFECT_COUNT; i++)
        printf("%s\n", effect_name(static_cast<EffectKind>(i)));

    printf("\nDefault mapping:\n");
    for (const auto &entry : default_effect_mapping())
        printf("  %-12s -> %s\n", character_class_name(entry.first), effect_name(entry.second));
}

static int run_info(const char *path) {
    AudioBuffer buffer;
    WavInfo     info;
    if (!report(wav_load(path, buffer, &info))) return 1;

    float peak = 0.0f;
    for (float s : buffer.samples)
        peak = std::max(peak, std::fabs(s));

    printf("%s\n", path);
    printf("  format:      %d-bit %s, %d channel%s\n", info.bits_per_sample,
           info.is_float ? "float" : "PCM", info.num_channels,
           info.num_channels == 1 ? "" : "s");
    printf("  sample rate: %d Hz\n", info.sample_rate);
    printf("  data:        %u bytes, %zu frames\n", info.data_size, buffer.size());
    printf("  duration:    %.3f s\n", buffer.seconds());
    printf("  peak:        %.4f\n", peak);
    return 0;
}

static int run_compare(DroidMessenger &messenger, const std::string &message) {
    DroidSettings s = messenger.settings();
    for (int i = 0; i < CONCRETE_EFFECT_COUNT; i++) {
        auto effect = static_cast<EffectKind>(i);
        s.effect_override = effect;
        messenger.configure(s);
        printf("Effect: %s\n", effect_name(effect));
        fflush(stdout);
        if (!report(messenger.send(message))) return 1;
    }
    return 0;
}

static int run_say(DroidMessenger &messenger, const std::string &message,
                   const char *save_path, bool play) {
    printf("R2 unit says: %s\n", message.c_str());

    if (play)
        return report(messenger.send(message, save_path ? save_path : "")) ? 0 : 1;

    AudioBuffer buffer = messenger.compose(message);
    if (!save_path) {
        printf("%zu samples, %.2f s (nothing saved or played)\n",
               buffer.size(), buffer.seconds());
        return 0;
    }
    return report(wav_save_pcm16(save_path, buffer)) ? 0 : 1;
}

int main(int argc, char *argv[]) {
    DroidSettings settings;
    settings_load(settings);

    CliOptions opt;
    opt.volume       = settings.synth.volume;
    opt.duty         = settings.synth.duty_cycle;
    opt.lfo          = settings.synth.lfo_rate;
    opt.exaggeration = settings.synth.exaggeration;
    opt.rate         = settings.synth.sample_rate;

    GOptionEntry entries[] = {
        {"save",           's', 0, G_OPTION_ARG_FILENAME, &opt.save,           "Save to WAV file", "FILE"},
        {"info",           'I', 0, G_OPTION_ARG_FILENAME, &opt.info,           "Describe a WAV file and exit", "FILE"},
        {"volume",         'v', 0, G_OPTION_ARG_DOUBLE,   &opt.volume,         "Volume (0.0-1.0)", "V"},
        {"duty",           'd', 0, G_OPTION_ARG_DOUBLE,   &opt.duty,           "Duty cycle (0.3-0.7)", "D"},
        {"lfo",            'l', 0, G_OPTION_ARG_DOUBLE,   &opt.lfo,            "LFO rate in Hz (5-20)", "HZ"},
        {"exaggeration",   'e', 0, G_OPTION_ARG_DOUBLE,   &opt.exaggeration,   "Exaggeration level (0.0-1.0)", "E"},
        {"effect",          0,  0, G_OPTION_ARG_STRING,   &opt.effect,         "Override sound effect", "NAME"},
        {"protocol",       'p', 0, G_OPTION_ARG_STRING,   &opt.protocol,       "audible or ultrasound", "NAME"},
        {"rate",           'r', 0, G_OPTION_ARG_INT,      &opt.rate,           "Sample rate in Hz", "HZ"},
        {"seed",            0,  0, G_OPTION_ARG_INT64,    &opt.seed,           "Seed for random/scream effects", "N"},
        {"no-personality",  0,  0, G_OPTION_ARG_NONE,     &opt.no_personality, "Disable droid personality", nullptr},
        {"no-play",        'n', 0, G_OPTION_ARG_NONE,     &opt.no_play,        "Do not play through the sound device", nullptr},
        {"interactive",    'i', 0, G_OPTION_ARG_NONE,     &opt.interactive,    "Interactive messenger", nullptr},
        {"compare",        'c', 0, G_OPTION_ARG_NONE,     &opt.compare,        "Play the message once per effect", nullptr},
        {"list-effects",    0,  0, G_OPTION_ARG_NONE,     &opt.list_effects,   "List effect names", nullptr},
        {G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_STRING_ARRAY, &opt.message,    nullptr, "MESSAGE"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr},
    };

    GOptionContext *ctx = g_option_context_new("- droid vocalizations from text");
    g_option_context_add_main_entries(ctx, entries, nullptr);
    GError *err = nullptr;
    gboolean parsed = g_option_context_parse(ctx, &argc, &argv, &err);
    g_option_context_free(ctx);
    if (!parsed) {
        fprintf(stderr, "%s\n", err->message);
        g_error_free(err);
        return 2;
    }

    if (opt.list_effects) {
        list_effects();
        return 0;
    }
    if (opt.info)
        return run_info(opt.info);

    settings.synth.volume       = static_cast<float>(opt.volume);
    settings.synth.duty_cycle   = static_cast<float>(opt.duty);
    settings.synth.lfo_rate     = static_cast<float>(opt.lfo);
    settings.synth.exaggeration = static_cast<float>(opt.exaggeration);
    settings.synth.sample_rate  = opt.rate;
    if (opt.no_personality) settings.add_personality = false;
    if (opt.seed >= 0)      settings.seed = static_cast<uint32_t>(opt.seed);
    if (opt.effect && !apply_effect_name(opt.effect, settings)) return 2;
    if (opt.protocol && !protocol_parse(opt.protocol, settings.synth.protocol)) {
        fprintf(stderr, "Unknown protocol '%s'\n", opt.protocol);
        return 2;
    }

    DroidMessenger messenger(settings, audio_create_playback, audio_create_capture);

    if (opt.interactive)
        return run_interactive(messenger);

    std::string message = join_words(opt.message);
    if (message.empty()) {
        fprintf(stderr, "No message given (see --help)\n");
        return 2;
    }

    if (opt.compare)
        return run_compare(messenger, message);

    return run_say(messenger, message, opt.save, !opt.no_play);
}
