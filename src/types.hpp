#ifndef DS_TYPES_HPP
#define DS_TYPES_HPP

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace ds {

using json = nlohmann::json;

// Environment handed to the application process (name -> value)
using Environment = std::map<std::string, std::string>;

// LaunchError marks a setup failure that must stop the launch
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& what) : std::runtime_error(what) {}
};

enum class LaunchMode { Desktop, Web };

inline std::string modeName(LaunchMode mode) {
    return mode == LaunchMode::Web ? "web" : "desktop";
}

// ProcessRef identifies a candidate for termination
struct ProcessRef {
    int pid = 0;
    std::optional<std::string> commandLineSignature;  // cmdline when readable
};

inline void to_json(json& j, const ProcessRef& p) {
    j = json{{"pid", p.pid}};
    if (p.commandLineSignature) {
        j["command"] = *p.commandLineSignature;
    } else {
        j["command"] = nullptr;
    }
}

// PortState is a snapshot of one TCP port, recomputed on every launch
struct PortState {
    int port = 0;
    std::vector<ProcessRef> listeners;       // distinct owners of listening sockets
    bool establishedLoopbackPeers = false;   // a local client is connected
    int unresolvedListeners = 0;             // listening sockets with no visible owner
    bool available = true;                   // false if no TCP table could be read
};

inline void to_json(json& j, const PortState& s) {
    j = json{
        {"port", s.port},
        {"listeners", s.listeners},
        {"loopback_client", s.establishedLoopbackPeers},
        {"unresolved_listeners", s.unresolvedListeners},
        {"available", s.available}
    };
}

// LaunchConfig is everything the application process is started with
struct LaunchConfig {
    LaunchMode mode = LaunchMode::Desktop;
    int port = 0;
    std::string bindHost;
    bool forceWeb = false;
    std::string secretKey;
    bool secretGenerated = false;
    std::string uploadDir;
    Environment env;                         // complete child environment
};

// ProcessInfo contains detailed information about a process read from /proc
struct ProcessInfo {
    int pid = 0;
    int ppid = 0;                            // Parent process ID
    std::string name;                        // comm, truncated by the kernel
    std::string cmdline;                     // Full command line
    std::string exe;                         // Executable path
    std::string cwd;                         // Working directory
};

} // namespace ds

#endif // DS_TYPES_HPP
