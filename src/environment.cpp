#include "environment.hpp"
#include "console.hpp"
#include <fstream>
#include <cerrno>
#include <cstring>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <sys/stat.h>
#include <unistd.h>

extern char** environ;

namespace ds {

Environment captureEnvironment() {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        size_t eqPos = pair.find('=');
        if (eqPos == std::string::npos || eqPos == 0) continue;
        env[pair.substr(0, eqPos)] = pair.substr(eqPos + 1);
    }
    return env;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool isBlank(const std::string& value) {
    return trim(value).empty();
}

int mergeEnvFile(const std::string& path, Environment& env) {
    if (path.empty()) return 0;

    std::ifstream file(path);
    if (!file.is_open()) return 0;

    int added = 0;
    int lineNo = 0;
    std::string line;
    while (std::getline(file, line)) {
        lineNo++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos || eqPos == 0) {
            console::warn(path + ":" + std::to_string(lineNo) + ": expected KEY=VALUE");
            continue;
        }

        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (env.count(key) > 0) continue;
        env[key] = value;
        added++;
    }

    return added;
}

std::string generateSecretKey() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw LaunchError(std::string("cannot generate secret key: ") + reason);
    }

    static const char digits[] = "0123456789abcdef";
    std::string key;
    key.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        key += digits[b >> 4];
        key += digits[b & 0x0f];
    }
    return key;
}

void ensureUploadDir(const std::string& path) {
    if (path.empty()) {
        throw LaunchError("upload directory path is empty");
    }

    // mkdir -p
    for (size_t pos = 1; pos <= path.size(); pos++) {
        if (pos != path.size() && path[pos] != '/') continue;

        std::string prefix = path.substr(0, pos);
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            throw LaunchError("cannot create " + prefix + ": " + strerror(errno));
        }
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw LaunchError(path + " exists and is not a directory");
    }
    if (access(path.c_str(), W_OK) != 0) {
        throw LaunchError(path + " is not writable: " + strerror(errno));
    }
}

std::vector<std::string> missingVariables(const Environment& env,
                                          const std::vector<std::string>& required) {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        auto it = env.find(name);
        if (it == env.end() || isBlank(it->second)) {
            missing.push_back(name);
        }
    }
    return missing;
}

LaunchConfig composeLaunchConfig(LaunchMode mode, bool lan,
                                 const Settings& settings,
                                 const Environment& ambient) {
    const EnvNames& names = settings.envNames;

    LaunchConfig config;
    config.mode = mode;
    config.env = ambient;

    if (mode == LaunchMode::Desktop) {
        // A web configuration left over from an earlier session must not leak in
        config.env.erase(names.port);
        config.env.erase(names.forceWeb);
        config.env.erase(names.webHost);
        return config;
    }

    config.port = settings.port;
    config.bindHost = lan ? settings.lanHost : settings.localHost;
    config.forceWeb = true;

    auto secret = ambient.find(names.secretKey);
    if (secret != ambient.end() && !isBlank(secret->second)) {
        config.secretKey = secret->second;
        config.secretGenerated = false;
    } else {
        config.secretKey = generateSecretKey();
        config.secretGenerated = true;
    }

    config.uploadDir = settings.uploadPath();
    ensureUploadDir(config.uploadDir);

    config.env[names.port] = std::to_string(config.port);
    config.env[names.forceWeb] = "true";
    config.env[names.webHost] = config.bindHost;
    config.env[names.secretKey] = config.secretKey;
    config.env[names.uploadDir] = config.uploadDir;

    return config;
}

std::vector<std::string> flattenEnvironment(const Environment& env) {
    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& kv : env) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

} // namespace ds
