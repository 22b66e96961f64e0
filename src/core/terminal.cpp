#include <kpi_lineage/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace kpi_lineage {

bool IsStdoutTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ShouldUseColor(ColorMode mode, bool stream_is_tty) {
    if (NoColorEnvSet() || mode == ColorMode::Never) {
        return false;
    }
    if (mode == ColorMode::Always) {
        return true;
    }
    return stream_is_tty;
}

} // namespace kpi_lineage
