#include "reaper.hpp"
#include "procutil.hpp"
#include "console.hpp"
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>
#include <thread>

namespace ds {

std::string extractProcessName(const std::string& command) {
    if (command.empty()) {
        return "";
    }

    std::istringstream iss(command);
    std::string exe;
    iss >> exe;

    size_t lastSlash = exe.find_last_of('/');
    if (lastSlash != std::string::npos) {
        exe = exe.substr(lastSlash + 1);
    }

    return exe;
}

// "python" matches python, python3 and python3.12
static bool nameMatches(const std::string& name, const std::string& runnerName) {
    return !name.empty() && name.compare(0, runnerName.size(), runnerName) == 0;
}

bool matchesSignature(const ProcessInfo& info,
                      const std::string& runnerName,
                      const std::string& entryPoint,
                      const std::string& workDir) {
    if (runnerName.empty() || entryPoint.empty() || workDir.empty()) return false;

    std::string exeName = info.exe.substr(info.exe.find_last_of('/') + 1);
    if (!nameMatches(info.name, runnerName) &&
        !nameMatches(exeName, runnerName) &&
        !nameMatches(extractProcessName(info.cmdline), runnerName)) {
        return false;
    }

    return info.cmdline.find(entryPoint) != std::string::npos &&
           info.cmdline.find(workDir) != std::string::npos;
}

std::vector<ProcessRef> findStaleInstances(const std::string& runnerName,
                                           const std::string& entryPoint,
                                           const std::string& workDir) {
    std::vector<ProcessRef> result;
    int self = getpid();

    for (const auto& info : listProcesses()) {
        if (info.pid == self || info.pid <= 1) continue;
        if (!matchesSignature(info, runnerName, entryPoint, workDir)) continue;

        ProcessRef ref;
        ref.pid = info.pid;
        ref.commandLineSignature = info.cmdline;
        result.push_back(ref);
    }

    return result;
}

bool terminateProcess(int pid) {
    if (pid <= 1) {
        errno = EINVAL;
        return false;
    }
    return kill(pid, SIGKILL) == 0;
}

static std::string describe(const ProcessRef& ref) {
    std::string text = "pid " + std::to_string(ref.pid);
    if (ref.commandLineSignature) {
        std::string command = *ref.commandLineSignature;
        if (command.length() > 60) {
            command = command.substr(0, 57) + "...";
        }
        text += " (" + command + ")";
    }
    return text;
}

static bool alreadyHandled(const ReconcileReport& report, int pid) {
    auto samePid = [pid](const ProcessRef& ref) { return ref.pid == pid; };
    return std::any_of(report.terminated.begin(), report.terminated.end(), samePid) ||
           std::any_of(report.failed.begin(), report.failed.end(), samePid);
}

void stopProcesses(const std::vector<ProcessRef>& targets,
                   const std::string& reason,
                   ReconcileReport& report) {
    int self = getpid();

    for (const auto& ref : targets) {
        if (ref.pid == self || ref.pid <= 1) continue;
        if (alreadyHandled(report, ref.pid)) continue;

        if (terminateProcess(ref.pid)) {
            console::status("Stopped " + describe(ref) + ": " + reason);
            report.terminated.push_back(ref);
        } else {
            console::warn("could not stop " + describe(ref) + ": " + strerror(errno));
            report.failed.push_back(ref);
        }
    }
}

ReconcileReport reconcilePort(const ReconcileRequest& request) {
    ReconcileReport report;

    // Phase 1: whatever owns a listening socket on the port
    PortState before = inspectPort(request.port, request.netDir);
    if (!before.available) {
        console::warn("TCP tables unavailable, cannot check port " + std::to_string(request.port));
    }
    stopProcesses(before.listeners, "listening on port " + std::to_string(request.port), report);
    if (before.unresolvedListeners > 0) {
        console::warn("port " + std::to_string(request.port) +
                      " is held by a process that cannot be inspected");
    }

    // Phase 2: previous instances started from the same directory
    stopProcesses(findStaleInstances(request.runnerName, request.entryPoint, request.workDir),
                  "stale instance of " + request.entryPoint, report);

    if (report.terminated.empty()) {
        return report;
    }

    // Phase 3: give the kernel time to release the socket
    std::this_thread::sleep_for(request.grace);
    report.waited = true;

    PortState after = inspectPort(request.port, request.netDir);
    report.stillListening = !after.listeners.empty() || after.unresolvedListeners > 0;
    if (report.stillListening) {
        console::warn("port " + std::to_string(request.port) + " is still in use after " +
                      std::to_string(request.grace.count()) + "ms");
    } else {
        console::status("Port " + std::to_string(request.port) + " cleared");
    }

    return report;
}

} // namespace ds
