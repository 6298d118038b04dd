#include "settings.h"

#include <glib.h>
#include <cstdio>

/* ── Configuration persistence ─────────────────────────────────────── */

std::string settings_path() {
    const gchar *dir = g_get_user_config_dir();  // ~/.config
    std::string path = std::string(dir) + "/DroidVox";
    g_mkdir_with_parents(path.c_str(), 0755);
    return path + "/settings.ini";
}

static void load_double(GKeyFile *kf, const char *key, float &out) {
    GError *err = nullptr;
    double val = g_key_file_get_double(kf, "synth", key, &err);
    if (!err)
        out = static_cast<float>(val);
    else
        g_error_free(err);
}

static std::string load_string(GKeyFile *kf, const char *group, const char *key) {
    std::string result;
    gchar *val = g_key_file_get_string(kf, group, key, nullptr);
    if (val) {
        result = val;
        g_free(val);
    }
    return result;
}

bool settings_load(DroidSettings &settings) {
    GKeyFile *kf = g_key_file_new();
    std::string path = settings_path();
    if (!g_key_file_load_from_file(kf, path.c_str(), G_KEY_FILE_NONE, nullptr)) {
        g_key_file_free(kf);
        return false;
    }

    load_double(kf, "volume",       settings.synth.volume);
    load_double(kf, "duty_cycle",   settings.synth.duty_cycle);
    load_double(kf, "lfo_rate",     settings.synth.lfo_rate);
    load_double(kf, "exaggeration", settings.synth.exaggeration);

    GError *err = nullptr;
    int rate = g_key_file_get_integer(kf, "synth", "sample_rate", &err);
    if (!err)
        settings.synth.sample_rate = rate;
    else
        g_clear_error(&err);

    gboolean personality = g_key_file_get_boolean(kf, "synth", "personality", &err);
    if (!err)
        settings.add_personality = personality;
    else
        g_clear_error(&err);

    std::string effect = load_string(kf, "synth", "effect");
    if (effect == "auto")
        settings.effect_override.reset();
    else if (!effect.empty())
        settings.effect_override = effect_from_name(effect);

    std::string protocol = load_string(kf, "synth", "protocol");
    if (!protocol.empty() && !protocol_parse(protocol, settings.synth.protocol))
        fprintf(stderr, "DroidVox: warning: unknown protocol '%s' in %s\n",
                protocol.c_str(), path.c_str());

    std::string device = load_string(kf, "audio", "input_device");
    if (!device.empty())
        settings.input_device = device;

    g_key_file_free(kf);
    return true;
}

bool settings_save(const DroidSettings &settings) {
    GKeyFile *kf = g_key_file_new();
    std::string path = settings_path();
    g_key_file_load_from_file(kf, path.c_str(), G_KEY_FILE_KEEP_COMMENTS, nullptr);

    g_key_file_set_double (kf, "synth", "volume",       settings.synth.volume);
    g_key_file_set_double (kf, "synth", "duty_cycle",   settings.synth.duty_cycle);
    g_key_file_set_double (kf, "synth", "lfo_rate",     settings.synth.lfo_rate);
    g_key_file_set_double (kf, "synth", "exaggeration", settings.synth.exaggeration);
    g_key_file_set_integer(kf, "synth", "sample_rate",  settings.synth.sample_rate);
    g_key_file_set_boolean(kf, "synth", "personality",  settings.add_personality);
    g_key_file_set_string (kf, "synth", "effect",
                           settings.effect_override ? effect_name(*settings.effect_override) : "auto");
    g_key_file_set_string (kf, "synth", "protocol",     protocol_name(settings.synth.protocol));
    g_key_file_set_string (kf, "audio", "input_device", settings.input_device.c_str());

    GError *err = nullptr;
    bool ok = g_key_file_save_to_file(kf, path.c_str(), &err);
    if (!ok) {
        fprintf(stderr, "DroidVox: cannot save %s: %s\n", path.c_str(), err->message);
        g_error_free(err);
    }
    g_key_file_free(kf);
    return ok;
}
