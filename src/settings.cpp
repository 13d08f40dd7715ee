#include "settings.hpp"
#include "console.hpp"
#include <fstream>

namespace ds {

const char* Settings::CONFIG_FILE = "devsession.json";

static void validatePort(int port) {
    if (port < 1 || port > 65535) {
        throw LaunchError("invalid port " + std::to_string(port) + " (expected 1-65535)");
    }
}

std::string joinPath(const std::string& base, const std::string& path) {
    if (path.empty()) return base;
    if (path[0] == '/' || base.empty()) return path;
    if (base.back() == '/') return base + path;
    return base + "/" + path;
}

void to_json(json& j, const EnvNames& n) {
    j = json{
        {"port", n.port},
        {"force_web", n.forceWeb},
        {"web_host", n.webHost},
        {"secret_key", n.secretKey},
        {"upload_dir", n.uploadDir}
    };
}

void from_json(const json& j, EnvNames& n) {
    n.port = j.value("port", n.port);
    n.forceWeb = j.value("force_web", n.forceWeb);
    n.webHost = j.value("web_host", n.webHost);
    n.secretKey = j.value("secret_key", n.secretKey);
    n.uploadDir = j.value("upload_dir", n.uploadDir);
}

void to_json(json& j, const Settings& s) {
    j = json{
        {"workdir", s.workDir},
        {"port", s.port},
        {"local_host", s.localHost},
        {"lan_host", s.lanHost},
        {"interpreter", s.interpreter},
        {"runner_name", s.runnerName},
        {"entry", s.entry},
        {"runner", s.runner},
        {"runner_web_args", s.runnerWebArgs},
        {"runner_desktop_args", s.runnerDesktopArgs},
        {"upload_subdir", s.uploadSubdir},
        {"grace_ms", s.graceMs},
        {"env_file", s.envFile},
        {"required_env", s.requiredEnv},
        {"env_names", s.envNames}
    };
}

// Missing keys keep their current value
void from_json(const json& j, Settings& s) {
    s.port = j.value("port", s.port);
    s.localHost = j.value("local_host", s.localHost);
    s.lanHost = j.value("lan_host", s.lanHost);
    s.interpreter = j.value("interpreter", s.interpreter);
    s.runnerName = j.value("runner_name", s.runnerName);
    s.entry = j.value("entry", s.entry);
    s.runner = j.value("runner", s.runner);
    s.runnerWebArgs = j.value("runner_web_args", s.runnerWebArgs);
    s.runnerDesktopArgs = j.value("runner_desktop_args", s.runnerDesktopArgs);
    s.uploadSubdir = j.value("upload_subdir", s.uploadSubdir);
    s.graceMs = j.value("grace_ms", s.graceMs);
    s.envFile = j.value("env_file", s.envFile);
    s.requiredEnv = j.value("required_env", s.requiredEnv);

    if (j.contains("env_names") && j["env_names"].is_object()) {
        from_json(j["env_names"], s.envNames);
    }
}

Settings::Settings()
    : port(DEFAULT_PORT),
      localHost("127.0.0.1"),
      lanHost("0.0.0.0"),
      interpreter(".venv/bin/python"),
      runnerName("python"),
      entry("main.py"),
      runnerWebArgs{"run", "--web", "--port", "${port}", "--host", "${host}", "${entry}"},
      runnerDesktopArgs{"run", "--hidden", "${entry}"},
      uploadSubdir(".uploads"),
      graceMs(500),
      envFile(".env"),
      requiredEnv{"DB_HOST", "DB_NAME", "DB_USER", "DB_PASSWORD", "DB_PORT"} {
}

Settings Settings::load(const std::string& workDir) {
    Settings settings;
    settings.workDir = workDir;

    std::string configFile = joinPath(workDir, CONFIG_FILE);
    std::ifstream file(configFile);

    if (!file.is_open()) {
        // Defaults if the file doesn't exist
        return settings;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            console::warn(configFile + " is not a JSON object, using defaults");
            return settings;
        }
        Settings loaded = settings;
        from_json(j, loaded);
        settings = loaded;
    } catch (const json::exception& e) {
        console::warn("error parsing " + configFile + ": " + e.what() + ", using defaults");
        return settings;
    }

    validatePort(settings.port);
    if (settings.graceMs < 0) {
        throw LaunchError("grace_ms must not be negative");
    }
    return settings;
}

void Settings::applyOverrides(const std::map<std::string, std::string>& vars) {
    auto it = vars.find("port");
    if (it != vars.end()) {
        int value = 0;
        try {
            size_t used = 0;
            value = std::stoi(it->second, &used);
            if (used != it->second.size()) {
                throw LaunchError("invalid port '" + it->second + "'");
            }
        } catch (const std::logic_error&) {
            throw LaunchError("invalid port '" + it->second + "'");
        }
        validatePort(value);
        port = value;
    }
}

std::string Settings::interpreterPath() const {
    return joinPath(workDir, interpreter);
}

std::string Settings::entryPath() const {
    return joinPath(workDir, entry);
}

std::string Settings::runnerPath() const {
    return runner.empty() ? "" : joinPath(workDir, runner);
}

std::string Settings::uploadPath() const {
    return joinPath(workDir, uploadSubdir);
}

std::string Settings::envFilePath() const {
    return envFile.empty() ? "" : joinPath(workDir, envFile);
}

} // namespace ds
