#include <gtk/gtk.h>
#include <cstdio>
#include "app_window.h"

// A second launch only raises the running messenger window.
static void on_activate(GtkApplication *app, gpointer /*user_data*/) {
    GtkWindow *existing = gtk_application_get_active_window(app);
    if (existing) {
        gtk_window_present(existing);
        return;
    }

    AppWindow *win = app_window_new(app);
    gtk_widget_show_all(win->window);
}

int main(int argc, char *argv[]) {
    g_set_application_name("DroidVox Messenger");

    GtkApplication *app = gtk_application_new(
        "org.droidvox.Messenger", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(on_activate), nullptr);

    int status = g_application_run(G_APPLICATION(app), argc, argv);
    g_object_unref(app);

    if (status != 0)
        fprintf(stderr, "DroidVox: messenger exited with status %d\n", status);
    return status;
}
