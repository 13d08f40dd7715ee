#ifndef DS_REAPER_HPP
#define DS_REAPER_HPP

#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace ds {

struct ReconcileRequest {
    int port = 0;
    std::string runnerName;     // interpreter process name, e.g. "python"
    std::string entryPoint;     // entry-point filename, e.g. "main.py"
    std::string workDir;        // must appear in the command line of a match
    std::chrono::milliseconds grace{500};
    std::string netDir = "/proc/net";
};

struct ReconcileReport {
    std::vector<ProcessRef> terminated;
    std::vector<ProcessRef> failed;
    bool waited = false;
    bool stillListening = false;
};

// Stop whatever holds the port and any stale instance of the application,
// then wait for the port to be released. Never throws for kill failures.
ReconcileReport reconcilePort(const ReconcileRequest& request);

// SIGKILL each target not already in the report, skipping this process and
// pid <= 1. Failures are logged and recorded in report.failed.
void stopProcesses(const std::vector<ProcessRef>& targets,
                   const std::string& reason,
                   ReconcileReport& report);

// Processes that look like a previous instance started from workDir
std::vector<ProcessRef> findStaleInstances(const std::string& runnerName,
                                           const std::string& entryPoint,
                                           const std::string& workDir);

// Name check plus both command-line substrings
bool matchesSignature(const ProcessInfo& info,
                      const std::string& runnerName,
                      const std::string& entryPoint,
                      const std::string& workDir);

// SIGKILL. Returns false and sets errno on failure.
bool terminateProcess(int pid);

// Extract the basename of the first word of a command
std::string extractProcessName(const std::string& command);

} // namespace ds

#endif // DS_REAPER_HPP
