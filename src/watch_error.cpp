#include "watch_error.hpp"

namespace promfile {

GQuark watch_error_quark() {
    return g_quark_from_static_string("promfile-watch-error-quark");
}

} // namespace promfile
