#ifndef DS_LAUNCHER_HPP
#define DS_LAUNCHER_HPP

#include "types.hpp"
#include "settings.hpp"
#include <string>
#include <vector>
#include <map>

namespace ds {

// Web:     Idle -> PortChecked -> Reaped -> ConfigComposed -> Launched
// Desktop: Idle -> EnvCleared -> Launched
enum class LaunchPhase { Idle, PortChecked, Reaped, ConfigComposed, EnvCleared, Launched };

std::string phaseName(LaunchPhase phase);

// How the application is started
struct EntryPoint {
    std::string program;        // absolute path passed to execve
    std::string script;         // entry script, interpreter mode only
    bool packagedRunner = false;
};

// Locate the interpreter or packaged runner. Throws LaunchError when the
// files are missing, before anything else has been touched.
EntryPoint resolveEntryPoint(const Settings& settings);

// argv for the child, program first
std::vector<std::string> buildArguments(const EntryPoint& entry,
                                        const LaunchConfig& config,
                                        const Settings& settings);

// Replace ${var} placeholders
std::string interpolate(const std::string& text, const std::map<std::string, std::string>& vars);

struct LaunchOptions {
    LaunchMode mode = LaunchMode::Web;
    bool lan = false;
    bool replaceProcess = false;    // execve in place instead of fork and wait
};

// Run the launch state machine for the mode; returns the child's exit code,
// or 1 without touching anything when the entry point is missing
int launchSession(const LaunchOptions& options, const Settings& settings);

// Fork, exec and wait. Exit code of the child, or 128 + signal.
int runChild(const std::vector<std::string>& argv,
             const Environment& env,
             const std::string& workDir);

// execve in place; only returns by throwing LaunchError
void execInPlace(const std::vector<std::string>& argv,
                 const Environment& env,
                 const std::string& workDir);

} // namespace ds

#endif // DS_LAUNCHER_HPP
