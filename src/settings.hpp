#ifndef DS_SETTINGS_HPP
#define DS_SETTINGS_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>

namespace ds {

// Names of the variables the application reads its configuration from
struct EnvNames {
    std::string port = "PORT";
    std::string forceWeb = "FLET_FORCE_WEB_SERVER";
    std::string webHost = "FLET_SERVER_IP";
    std::string secretKey = "FLET_SECRET_KEY";
    std::string uploadDir = "FLET_UPLOAD_DIR";
};

void to_json(json& j, const EnvNames& n);
void from_json(const json& j, EnvNames& n);

// Settings holds the launcher configuration for one working directory
class Settings {
public:
    Settings();

    // Load <workDir>/devsession.json on top of the defaults
    static Settings load(const std::string& workDir);

    // Apply --key=value overrides from the command line
    void applyOverrides(const std::map<std::string, std::string>& vars);

    // Absolute paths derived from workDir
    std::string interpreterPath() const;
    std::string entryPath() const;
    std::string runnerPath() const;
    std::string uploadPath() const;
    std::string envFilePath() const;

    static const char* CONFIG_FILE;
    static constexpr int DEFAULT_PORT = 8550;

    std::string workDir;
    int port;
    std::string localHost;
    std::string lanHost;
    std::string interpreter;        // relative to workDir
    std::string runnerName;         // process name of a running instance
    std::string entry;              // entry-point script, relative to workDir
    std::string runner;             // packaged runner, empty = interpreter mode
    std::vector<std::string> runnerWebArgs;
    std::vector<std::string> runnerDesktopArgs;
    std::string uploadSubdir;
    int graceMs;
    std::string envFile;
    std::vector<std::string> requiredEnv;
    EnvNames envNames;
};

void to_json(json& j, const Settings& s);
void from_json(const json& j, Settings& s);

// Join a path relative to base; absolute paths are returned unchanged
std::string joinPath(const std::string& base, const std::string& path);

} // namespace ds

#endif // DS_SETTINGS_HPP
