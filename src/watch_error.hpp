// watch_error.hpp - GError domain for file watch setup failures

#ifndef PROMFILE_WATCH_ERROR_HPP
#define PROMFILE_WATCH_ERROR_HPP

#include <glib.h>

#define PROMFILE_WATCH_ERROR (promfile::watch_error_quark())

namespace promfile {

enum WatchError {
    PROMFILE_WATCH_ERROR_NOT_FOUND,   // watched path does not exist
    PROMFILE_WATCH_ERROR_NOTIFIER,    // inotify instance or watch could not be set up
    PROMFILE_WATCH_ERROR_THREAD       // worker thread could not be started
};

GQuark watch_error_quark();

} // namespace promfile

#endif // PROMFILE_WATCH_ERROR_HPP
