#include "console.hpp"
#include <iostream>
#include <cstdlib>
#include <unistd.h>

namespace ds {
namespace console {

static bool g_quiet = false;

static bool useColor(int fd) {
    const char* noColor = getenv("NO_COLOR");
    if (noColor && noColor[0] != '\0') return false;
    return isatty(fd) == 1;
}

static void emit(std::ostream& out, int fd, const char* color, const std::string& message) {
    if (useColor(fd)) {
        out << color << "[devsession]\033[0m " << message << "\n";
    } else {
        out << "[devsession] " << message << "\n";
    }
    out.flush();
}

void status(const std::string& message) {
    if (g_quiet) return;
    emit(std::cout, STDOUT_FILENO, "\033[36m", message);
}

void warn(const std::string& message) {
    emit(std::cerr, STDERR_FILENO, "\033[33m", "warning: " + message);
}

void error(const std::string& message) {
    emit(std::cerr, STDERR_FILENO, "\033[31m", "error: " + message);
}

void setQuiet(bool quiet) {
    g_quiet = quiet;
}

} // namespace console
} // namespace ds
