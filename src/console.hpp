#ifndef DS_CONSOLE_HPP
#define DS_CONSOLE_HPP

#include <string>

namespace ds {
namespace console {

// Progress line on stdout
void status(const std::string& message);

// Best-effort failure on stderr, the launch continues
void warn(const std::string& message);

// Fatal diagnostic on stderr
void error(const std::string& message);

// Silence status() output (warnings and errors are always printed)
void setQuiet(bool quiet);

} // namespace console
} // namespace ds

#endif // DS_CONSOLE_HPP
