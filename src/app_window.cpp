#include "app_window.h"
#include "audio_backend.h"
#include "settings.h"
#include "wav_file.h"
#include <algorithm>
#include <string>
#include <cstdio>

static const char *TEST_MESSAGE = "Test... test... test...";

static DroidSettings load_settings() {
    DroidSettings s;
    settings_load(s);
    return s;
}

AppWindow::AppWindow()
    : messenger(load_settings(), audio_create_playback, audio_create_capture) {}

static void set_status(AppWindow *win, const char *text) {
    gtk_statusbar_pop(GTK_STATUSBAR(win->statusbar), win->statusbar_context);
    gtk_statusbar_push(GTK_STATUSBAR(win->statusbar), win->statusbar_context, text);
}

/* ── Settings from the controls ─────────────────────────────────────── */

static void apply_controls(AppWindow *win) {
    DroidSettings s = win->messenger.settings();
    s.synth.volume       = static_cast<float>(gtk_range_get_value(GTK_RANGE(win->volume_slider)));
    s.synth.duty_cycle   = static_cast<float>(gtk_range_get_value(GTK_RANGE(win->duty_slider)));
    s.synth.lfo_rate     = static_cast<float>(gtk_range_get_value(GTK_RANGE(win->lfo_slider)));
    s.synth.exaggeration = static_cast<float>(gtk_range_get_value(GTK_RANGE(win->exag_slider)));
    s.add_personality    = gtk_toggle_button_get_active(GTK_TOGGLE_BUTTON(win->personality_check));

    const gchar *id = gtk_combo_box_get_active_id(GTK_COMBO_BOX(win->effect_combo));
    EffectKind effect;
    if (id && effect_parse(id, effect))
        s.effect_override = effect;
    else
        s.effect_override.reset();

    int dev = gtk_combo_box_get_active(GTK_COMBO_BOX(win->audio_combo));
    if (dev >= 0 && dev < static_cast<int>(win->audio_source_ids.size()))
        s.input_device = win->audio_source_ids[dev];

    win->messenger.configure(s);
    settings_save(s);
}

static void on_control_changed(GtkWidget * /*widget*/, gpointer data) {
    apply_controls(static_cast<AppWindow *>(data));
}

/* ── Spectrum display ───────────────────────────────────────────────── */

// Bar hue follows the forced effect; with Auto every bar gets its own hue.
static double effect_hue(AppWindow *win, int bar, int bars) {
    DroidSettings s = win->messenger.settings();
    if (s.effect_override)
        return static_cast<int>(*s.effect_override) / static_cast<double>(EFFECT_COUNT);
    return bar / static_cast<double>(bars);
}

static gboolean on_spectrum_draw(GtkWidget *widget, cairo_t *cr, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    int w = gtk_widget_get_allocated_width(widget);
    int h = gtk_widget_get_allocated_height(widget);

    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    cairo_paint(cr);
    if (w <= 0 || h <= 0)
        return TRUE;

    const int bars = 64;
    const int bins_per_bar = DroidListener::SPECTRUM_BINS / bars;
    double bar_w = static_cast<double>(w) / bars;

    for (int b = 0; b < bars; b++) {
        float peak = -200.0f;
        for (int k = 0; k < bins_per_bar; k++)
            peak = std::max(peak, win->spectrum[b * bins_per_bar + k]);

        double t = (peak + 100.0f) / 80.0f;  // -100 dB → 0, -20 dB → 1
        if (t < 0.0) t = 0.0;
        if (t > 1.0) t = 1.0;

        double r, g, bl;
        gtk_hsv_to_rgb(effect_hue(win, b, bars), 0.8, 0.4 + 0.6 * t, &r, &g, &bl);
        cairo_set_source_rgb(cr, r, g, bl);
        double bh = t * h;
        cairo_rectangle(cr, b * bar_w + 1.0, h - bh, bar_w - 2.0, bh);
        cairo_fill(cr);
    }
    return TRUE;
}

static gboolean on_spectrum_timer(gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    win->messenger.listener().get_spectrum(win->spectrum, DroidListener::SPECTRUM_BINS);
    gtk_widget_queue_draw(win->spectrum_area);
    return G_SOURCE_CONTINUE;
}

static void spectrum_timer_start(AppWindow *win) {
    if (win->spectrum_timer_id == 0)
        win->spectrum_timer_id = g_timeout_add(50, on_spectrum_timer, win);
}

static void spectrum_timer_stop(AppWindow *win) {
    if (win->spectrum_timer_id != 0) {
        g_source_remove(win->spectrum_timer_id);
        win->spectrum_timer_id = 0;
    }
}

/* ── Status bar update timer ────────────────────────────────────────── */

static void set_send_sensitive(AppWindow *win, gboolean on) {
    gtk_widget_set_sensitive(win->send_button, on);
    gtk_widget_set_sensitive(win->test_button, on);
    gtk_widget_set_sensitive(win->save_button, on);
}

static gboolean on_status_timer(gpointer data) {
    auto *win = static_cast<AppWindow *>(data);

    // playback finished on the worker
    if (!win->busy && win->worker.joinable()) {
        win->worker.join();
        set_send_sensitive(win, TRUE);
        DroidStatus st = win->last_status;
        set_status(win, st == DroidStatus::Ok ? "Message sent" : droid_status_string(st));
    }

    const DroidListener &listener = win->messenger.listener();
    if (gtk_toggle_button_get_active(GTK_TOGGLE_BUTTON(win->listen_button)) &&
        !listener.is_running()) {
        // capture thread gave up
        gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(win->listen_button), FALSE);
        set_status(win, "Listening stopped: capture failed");
        return G_SOURCE_CONTINUE;
    }

    if (listener.is_running()) {
        unsigned n = listener.detections();
        char buf[128];
        snprintf(buf, sizeof(buf), "Listening | Level: %.3f | Droid bursts: %u%s",
                 listener.get_input_level(), n,
                 n != win->shown_detections ? " | [Droid sounds detected]" : "");
        win->shown_detections = n;
        if (!win->busy) set_status(win, buf);
    }
    return G_SOURCE_CONTINUE;
}

/* ── Sending ────────────────────────────────────────────────────────── */

static void start_send(AppWindow *win, const std::string &message, const std::string &save_path) {
    if (win->busy || win->worker.joinable())
        return;
    if (message.empty()) {
        set_status(win, "Please enter a message");
        return;
    }

    win->busy = true;
    set_send_sensitive(win, FALSE);
    set_status(win, "Sending...");
    win->worker = std::thread([win, message, save_path]() {
        win->last_status = win->messenger.send(message, save_path);
        win->busy = false;
    });
}

static std::string entry_text(AppWindow *win) {
    return gtk_entry_get_text(GTK_ENTRY(win->message_entry));
}

static void on_send_clicked(GtkWidget * /*widget*/, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    start_send(win, entry_text(win), std::string());
}

static void on_test_clicked(GtkWidget * /*widget*/, gpointer data) {
    start_send(static_cast<AppWindow *>(data), TEST_MESSAGE, std::string());
}

static void on_save_clicked(GtkWidget * /*widget*/, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    std::string message = entry_text(win);
    if (message.empty()) {
        set_status(win, "Please enter a message");
        return;
    }

    GtkWidget *dialog = gtk_file_chooser_dialog_new(
        "Save WAV File",
        GTK_WINDOW(win->window),
        GTK_FILE_CHOOSER_ACTION_SAVE,
        "_Cancel", GTK_RESPONSE_CANCEL,
        "_Save",   GTK_RESPONSE_ACCEPT,
        nullptr);
    gtk_file_chooser_set_do_overwrite_confirmation(GTK_FILE_CHOOSER(dialog), TRUE);
    gtk_file_chooser_set_current_name(GTK_FILE_CHOOSER(dialog), "droid_message.wav");

    GtkFileFilter *filter = gtk_file_filter_new();
    gtk_file_filter_set_name(filter, "WAV files");
    gtk_file_filter_add_pattern(filter, "*.wav");
    gtk_file_filter_add_pattern(filter, "*.WAV");
    gtk_file_chooser_add_filter(GTK_FILE_CHOOSER(dialog), filter);

    if (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_ACCEPT) {
        gchar *filename = gtk_file_chooser_get_filename(GTK_FILE_CHOOSER(dialog));
        gtk_widget_destroy(dialog);

        DroidStatus st = wav_save_pcm16(filename, win->messenger.compose(message));
        gchar *basename = g_path_get_basename(filename);
        char msg[256];
        if (st == DroidStatus::Ok)
            snprintf(msg, sizeof(msg), "Saved: %s", basename);
        else
            snprintf(msg, sizeof(msg), "%s: %s", droid_status_string(st), basename);
        set_status(win, msg);
        g_free(basename);
        g_free(filename);
    } else {
        gtk_widget_destroy(dialog);
    }
}

/* ── Audio device helpers ──────────────────────────────────────────── */

static void populate_audio_inputs(AppWindow *win) {
    g_signal_handlers_block_by_func(win->audio_combo, (gpointer)on_control_changed, win);
    gtk_combo_box_text_remove_all(GTK_COMBO_BOX_TEXT(win->audio_combo));
    win->audio_source_ids.clear();

    gtk_combo_box_text_append_text(GTK_COMBO_BOX_TEXT(win->audio_combo), "Default input");
    win->audio_source_ids.push_back(std::string());

    std::string saved = win->messenger.settings().input_device;
    int saved_index = 0;

    for (const AudioDevice &dev : audio_enumerate_inputs()) {
        if (!saved.empty() && saved == dev.id)
            saved_index = static_cast<int>(win->audio_source_ids.size());
        gtk_combo_box_text_append_text(GTK_COMBO_BOX_TEXT(win->audio_combo),
                                       dev.description.c_str());
        win->audio_source_ids.push_back(dev.id);
    }

    gtk_combo_box_set_active(GTK_COMBO_BOX(win->audio_combo), saved_index);
    g_signal_handlers_unblock_by_func(win->audio_combo, (gpointer)on_control_changed, win);
}

static void on_refresh_clicked(GtkWidget * /*widget*/, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    populate_audio_inputs(win);
    set_status(win, "Audio devices refreshed");
}

static void on_listen_toggled(GtkToggleButton *button, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);

    if (!gtk_toggle_button_get_active(button)) {
        spectrum_timer_stop(win);
        win->messenger.stop_listening();
        gtk_button_set_label(GTK_BUTTON(button), "Listen");
        gtk_widget_set_sensitive(win->audio_combo, TRUE);
        gtk_widget_set_sensitive(win->refresh_button, TRUE);
        set_status(win, "Stopped listening");
        return;
    }
    if (win->messenger.is_listening())
        return;

    DroidStatus st = win->messenger.start_listening([](const std::string &text) {
        fprintf(stderr, "DroidVox: %s\n", text.c_str());
    });
    if (st != DroidStatus::Ok) {
        set_status(win, droid_status_string(st));
        gtk_toggle_button_set_active(button, FALSE);
        return;
    }

    win->shown_detections = 0;
    spectrum_timer_start(win);
    gtk_button_set_label(GTK_BUTTON(button), "Stop");
    gtk_widget_set_sensitive(win->audio_combo, FALSE);
    gtk_widget_set_sensitive(win->refresh_button, FALSE);
    set_status(win, "Listening for droid transmissions...");
}

static void on_window_destroy(GtkWidget * /*widget*/, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    if (win->status_timer_id != 0) {
        g_source_remove(win->status_timer_id);
        win->status_timer_id = 0;
    }
    spectrum_timer_stop(win);
    win->messenger.stop_listening();
    if (win->worker.joinable())
        win->worker.join();
    delete win;
}

/* ── Layout helpers ─────────────────────────────────────────────────── */

static GtkWidget *add_slider(AppWindow *win, GtkWidget *grid, int row, const char *label,
                             double min, double max, double step, double value) {
    GtkWidget *lbl = gtk_label_new(label);
    gtk_widget_set_halign(lbl, GTK_ALIGN_START);
    gtk_grid_attach(GTK_GRID(grid), lbl, 0, row, 1, 1);

    GtkWidget *scale = gtk_scale_new_with_range(GTK_ORIENTATION_HORIZONTAL, min, max, step);
    gtk_scale_set_value_pos(GTK_SCALE(scale), GTK_POS_RIGHT);
    gtk_widget_set_hexpand(scale, TRUE);
    gtk_range_set_value(GTK_RANGE(scale), value);
    g_signal_connect(scale, "value-changed", G_CALLBACK(on_control_changed), win);
    gtk_grid_attach(GTK_GRID(grid), scale, 1, row, 1, 1);
    return scale;
}

static void on_menu_exit(GtkMenuItem * /*item*/, gpointer data) {
    auto *win = static_cast<AppWindow *>(data);
    gtk_widget_destroy(win->window);
}

AppWindow *app_window_new(GtkApplication *app) {
    auto *win = new AppWindow();
    DroidSettings s = win->messenger.settings();
    SynthesisConfig cfg(s.synth);

    // Main window
    win->window = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(win->window), "DroidVox");
    gtk_window_set_default_size(GTK_WINDOW(win->window), 520, 560);
    g_signal_connect(win->window, "destroy", G_CALLBACK(on_window_destroy), win);

    GtkWidget *outer_vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_container_add(GTK_CONTAINER(win->window), outer_vbox);

    // Menu bar
    GtkWidget *menubar = gtk_menu_bar_new();

    GtkWidget *file_menu = gtk_menu_new();
    GtkWidget *file_item = gtk_menu_item_new_with_label("File");
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(file_item), file_menu);

    GtkWidget *save_item = gtk_menu_item_new_with_label("Save WAV...");
    g_signal_connect(save_item, "activate", G_CALLBACK(on_save_clicked), win);
    gtk_menu_shell_append(GTK_MENU_SHELL(file_menu), save_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(file_menu), gtk_separator_menu_item_new());

    GtkWidget *exit_item = gtk_menu_item_new_with_label("Exit");
    g_signal_connect(exit_item, "activate", G_CALLBACK(on_menu_exit), win);
    gtk_menu_shell_append(GTK_MENU_SHELL(file_menu), exit_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menubar), file_item);
    gtk_box_pack_start(GTK_BOX(outer_vbox), menubar, FALSE, FALSE, 0);

    GtkWidget *vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_container_set_border_width(GTK_CONTAINER(vbox), 12);
    gtk_box_pack_start(GTK_BOX(outer_vbox), vbox, TRUE, TRUE, 0);

    // Header label
    win->header_label = gtk_label_new("DroidVox Messenger");
    PangoAttrList *attrs = pango_attr_list_new();
    pango_attr_list_insert(attrs, pango_attr_weight_new(PANGO_WEIGHT_BOLD));
    pango_attr_list_insert(attrs, pango_attr_scale_new(1.4));
    gtk_label_set_attributes(GTK_LABEL(win->header_label), attrs);
    pango_attr_list_unref(attrs);
    gtk_box_pack_start(GTK_BOX(vbox), win->header_label, FALSE, FALSE, 0);

    gtk_box_pack_start(GTK_BOX(vbox), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL), FALSE, FALSE, 0);

    // Message row: entry + send / test / save
    GtkWidget *msg_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_box_pack_start(GTK_BOX(vbox), msg_box, FALSE, FALSE, 0);

    win->message_entry = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(win->message_entry), "Type a message...");
    gtk_box_pack_start(GTK_BOX(msg_box), win->message_entry, TRUE, TRUE, 0);
    g_signal_connect(win->message_entry, "activate", G_CALLBACK(on_send_clicked), win);

    win->send_button = gtk_button_new_with_label("Send");
    gtk_box_pack_start(GTK_BOX(msg_box), win->send_button, FALSE, FALSE, 0);
    g_signal_connect(win->send_button, "clicked", G_CALLBACK(on_send_clicked), win);

    win->test_button = gtk_button_new_with_label("Test");
    gtk_box_pack_start(GTK_BOX(msg_box), win->test_button, FALSE, FALSE, 0);
    g_signal_connect(win->test_button, "clicked", G_CALLBACK(on_test_clicked), win);

    win->save_button = gtk_button_new_with_label("Save WAV");
    gtk_box_pack_start(GTK_BOX(msg_box), win->save_button, FALSE, FALSE, 0);
    g_signal_connect(win->save_button, "clicked", G_CALLBACK(on_save_clicked), win);

    // Synthesis controls
    GtkWidget *grid = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(grid), 4);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 12);
    gtk_box_pack_start(GTK_BOX(vbox), grid, FALSE, FALSE, 0);

    win->volume_slider = add_slider(win, grid, 0, "Volume",       0.0,  1.0, 0.05, cfg.volume());
    win->duty_slider   = add_slider(win, grid, 1, "Duty cycle",   0.3,  0.7, 0.01, cfg.duty_cycle());
    win->lfo_slider    = add_slider(win, grid, 2, "LFO rate",     5.0, 20.0, 0.5,  cfg.lfo_rate());
    win->exag_slider   = add_slider(win, grid, 3, "Exaggeration", 0.0,  1.0, 0.05, cfg.exaggeration());

    GtkWidget *effect_label = gtk_label_new("Effect");
    gtk_widget_set_halign(effect_label, GTK_ALIGN_START);
    gtk_grid_attach(GTK_GRID(grid), effect_label, 0, 4, 1, 1);

    win->effect_combo = gtk_combo_box_text_new();
    gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(win->effect_combo), "auto", "Auto");
    for (int i = 0; i < EFFECT_COUNT; i++) {
        const char *name = effect_name(static_cast<EffectKind>(i));
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(win->effect_combo), name, name);
    }
    gtk_combo_box_set_active_id(GTK_COMBO_BOX(win->effect_combo),
                                s.effect_override ? effect_name(*s.effect_override) : "auto");
    g_signal_connect(win->effect_combo, "changed", G_CALLBACK(on_control_changed), win);
    gtk_grid_attach(GTK_GRID(grid), win->effect_combo, 1, 4, 1, 1);

    win->personality_check = gtk_check_button_new_with_label("Droid personality (intro / outro)");
    gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(win->personality_check), s.add_personality);
    g_signal_connect(win->personality_check, "toggled", G_CALLBACK(on_control_changed), win);
    gtk_grid_attach(GTK_GRID(grid), win->personality_check, 1, 5, 1, 1);

    gtk_box_pack_start(GTK_BOX(vbox), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL), FALSE, FALSE, 0);

    // Audio input row: label + combo + refresh button + listen toggle
    GtkWidget *audio_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_box_pack_start(GTK_BOX(vbox), audio_box, FALSE, FALSE, 0);

    gtk_box_pack_start(GTK_BOX(audio_box), gtk_label_new("Audio Input:"), FALSE, FALSE, 0);

    win->audio_combo = gtk_combo_box_text_new();
    gtk_widget_set_size_request(win->audio_combo, 50, -1);  // allow shrinking
    gtk_box_pack_start(GTK_BOX(audio_box), win->audio_combo, TRUE, TRUE, 0);
    g_signal_connect(win->audio_combo, "changed", G_CALLBACK(on_control_changed), win);

    win->refresh_button = gtk_button_new_with_label("Refresh");
    gtk_box_pack_start(GTK_BOX(audio_box), win->refresh_button, FALSE, FALSE, 0);
    g_signal_connect(win->refresh_button, "clicked", G_CALLBACK(on_refresh_clicked), win);

    win->listen_button = gtk_toggle_button_new_with_label("Listen");
    gtk_box_pack_start(GTK_BOX(audio_box), win->listen_button, FALSE, FALSE, 0);
    g_signal_connect(win->listen_button, "toggled", G_CALLBACK(on_listen_toggled), win);

    // Spectrum visualizer
    win->spectrum_area = gtk_drawing_area_new();
    gtk_widget_set_size_request(win->spectrum_area, -1, 160);
    gtk_box_pack_start(GTK_BOX(vbox), win->spectrum_area, TRUE, TRUE, 0);
    g_signal_connect(win->spectrum_area, "draw", G_CALLBACK(on_spectrum_draw), win);

    // Status bar
    win->statusbar = gtk_statusbar_new();
    win->statusbar_context = gtk_statusbar_get_context_id(
        GTK_STATUSBAR(win->statusbar), "main");
    gtk_statusbar_push(GTK_STATUSBAR(win->statusbar), win->statusbar_context, "Ready");
    gtk_box_pack_end(GTK_BOX(vbox), win->statusbar, FALSE, FALSE, 0);

    populate_audio_inputs(win);

    win->status_timer_id = g_timeout_add(250, on_status_timer, win);
    return win;
}
