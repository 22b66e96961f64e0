#pragma once

namespace kpi_lineage {

namespace ansi {

constexpr const char* kReset   = "\033[0m";
constexpr const char* kBold    = "\033[1m";
constexpr const char* kDim     = "\033[90m";
constexpr const char* kRed     = "\033[1;31m";
constexpr const char* kGreen   = "\033[1;32m";
constexpr const char* kYellow  = "\033[33m";
constexpr const char* kCyan    = "\033[36m";
constexpr const char* kMagenta = "\033[35m";

} // namespace ansi

// Tri-state color request from --color / --no-color.
enum class ColorMode {
    Auto,
    Always,
    Never,
};

/// Returns true if stdout is a terminal (for colored table/error output).
bool IsStdoutTty();

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether to emit ANSI colors for a stream. NO_COLOR wins over
/// Always; Auto follows the TTY check.
bool ShouldUseColor(ColorMode mode, bool stream_is_tty);

} // namespace kpi_lineage
