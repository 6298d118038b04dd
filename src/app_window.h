#ifndef APP_WINDOW_H
#define APP_WINDOW_H

#include <gtk/gtk.h>
#include <atomic>
#include <thread>
#include <vector>
#include <string>
#include "droid_messenger.h"

struct AppWindow {
    AppWindow();

    GtkWidget *window            = nullptr;
    GtkWidget *header_label      = nullptr;
    GtkWidget *message_entry     = nullptr;
    GtkWidget *send_button       = nullptr;
    GtkWidget *test_button       = nullptr;
    GtkWidget *save_button       = nullptr;
    GtkWidget *effect_combo      = nullptr;
    GtkWidget *personality_check = nullptr;
    GtkWidget *audio_combo       = nullptr;
    GtkWidget *refresh_button    = nullptr;
    GtkWidget *listen_button     = nullptr;
    GtkWidget *statusbar         = nullptr;
    guint      statusbar_context = 0;

    // Synthesis knobs
    GtkWidget *volume_slider     = nullptr;
    GtkWidget *duty_slider       = nullptr;
    GtkWidget *lfo_slider        = nullptr;
    GtkWidget *exag_slider       = nullptr;

    DroidMessenger messenger;

    // Audio device IDs (parallel to combo box entries, "" = default source)
    std::vector<std::string> audio_source_ids;

    // Playback worker; the status timer joins it once busy drops
    std::thread              worker;
    std::atomic<bool>        busy        {false};
    std::atomic<DroidStatus> last_status {DroidStatus::Ok};

    // Spectrum bar display
    GtkWidget *spectrum_area     = nullptr;
    float      spectrum[DroidListener::SPECTRUM_BINS] = {};
    guint      spectrum_timer_id = 0;

    // Status bar update timer
    guint      status_timer_id   = 0;
    unsigned   shown_detections  = 0;
};

AppWindow *app_window_new(GtkApplication *app);

#endif
