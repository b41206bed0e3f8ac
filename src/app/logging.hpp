#pragma once

#include "core/result.hpp"
#include <QString>
#include <QtGlobal>

namespace jitstreamer::app {

// Installs a Qt message handler that stamps each line with UTC time, level
// and category, writes it to stderr and, when `log_file` is non-empty,
// appends it to that file as well.
[[nodiscard]] Result<void, Error> install_logging(const QString& log_file);

// Turns on debug output for every jitstreamer.* category.
void enable_debug_logging();

// Formats one log line the way the handler writes it (without newline).
[[nodiscard]] QString format_log_line(QtMsgType type, const char* category, const QString& message);

} // namespace jitstreamer::app
