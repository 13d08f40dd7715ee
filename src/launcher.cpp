#include "launcher.hpp"
#include "environment.hpp"
#include "procutil.hpp"
#include "reaper.hpp"
#include "console.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <signal.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <chrono>

namespace ds {

std::string phaseName(LaunchPhase phase) {
    switch (phase) {
        case LaunchPhase::Idle: return "idle";
        case LaunchPhase::PortChecked: return "port-checked";
        case LaunchPhase::Reaped: return "reaped";
        case LaunchPhase::ConfigComposed: return "config-composed";
        case LaunchPhase::EnvCleared: return "env-cleared";
        case LaunchPhase::Launched: return "launched";
    }
    return "unknown";
}

static bool isRegularFile(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static bool isExecutable(const std::string& path) {
    return isRegularFile(path) && access(path.c_str(), X_OK) == 0;
}

EntryPoint resolveEntryPoint(const Settings& settings) {
    EntryPoint entry;
    std::string script = settings.entryPath();

    if (!settings.runner.empty()) {
        entry.program = settings.runnerPath();
        entry.packagedRunner = true;
        if (!isExecutable(entry.program)) {
            throw LaunchError("application runner not found at " + entry.program);
        }
    } else {
        entry.program = settings.interpreterPath();
        if (!isExecutable(entry.program)) {
            throw LaunchError("interpreter not found at " + entry.program +
                              " (is the virtual environment set up?)");
        }
    }

    if (!isRegularFile(script)) {
        throw LaunchError("entry point not found at " + script);
    }
    entry.script = script;

    return entry;
}

std::string interpolate(const std::string& text, const std::map<std::string, std::string>& vars) {
    std::string result = text;
    for (const auto& kv : vars) {
        std::string placeholder = "${" + kv.first + "}";
        size_t pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.length(), kv.second);
            pos += kv.second.length();
        }
    }
    return result;
}

std::vector<std::string> buildArguments(const EntryPoint& entry,
                                        const LaunchConfig& config,
                                        const Settings& settings) {
    std::vector<std::string> argv{entry.program};

    if (!entry.packagedRunner) {
        // Interpreter mode: configuration travels in the environment only
        argv.push_back(entry.script);
        return argv;
    }

    std::map<std::string, std::string> vars;
    vars["entry"] = entry.script;
    vars["workdir"] = settings.workDir;
    vars["port"] = std::to_string(config.port);
    vars["host"] = config.bindHost;

    const auto& templates = config.mode == LaunchMode::Web
        ? settings.runnerWebArgs : settings.runnerDesktopArgs;
    for (const auto& arg : templates) {
        argv.push_back(interpolate(arg, vars));
    }
    return argv;
}

static std::string joinArgs(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) text += " ";
        text += arg;
    }
    return text;
}

// Pointer arrays for execve; the strings must outlive the call
struct ExecArgs {
    std::vector<std::string> envStrings;
    std::vector<char*> argv;
    std::vector<char*> envp;

    ExecArgs(const std::vector<std::string>& args, const Environment& env)
        : envStrings(flattenEnvironment(env)) {
        for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        for (auto& pair : envStrings) envp.push_back(const_cast<char*>(pair.c_str()));
        envp.push_back(nullptr);
    }
};

int runChild(const std::vector<std::string>& argv,
             const Environment& env,
             const std::string& workDir) {
    if (argv.empty()) {
        throw LaunchError("nothing to run");
    }

    ExecArgs exec(argv, env);

    // Ctrl-C goes to the whole foreground group; let the child decide.
    // Ignored before fork and restored in the child.
    struct sigaction ignore, oldInt, oldQuit;
    memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &oldInt);
    sigaction(SIGQUIT, &ignore, &oldQuit);

    pid_t pid = fork();

    if (pid == -1) {
        int forkErrno = errno;
        sigaction(SIGINT, &oldInt, nullptr);
        sigaction(SIGQUIT, &oldQuit, nullptr);
        throw LaunchError(std::string("failed to fork process: ") + strerror(forkErrno));
    }

    if (pid == 0) {
        // Child process
        sigaction(SIGINT, &oldInt, nullptr);
        sigaction(SIGQUIT, &oldQuit, nullptr);

        if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
            _exit(126); // chdir failed
        }

        execve(exec.argv[0], exec.argv.data(), exec.envp.data());
        dprintf(STDERR_FILENO, "[devsession] exec %s failed: %s\n", exec.argv[0], strerror(errno));
        _exit(127); // If exec fails
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);
    int waitErrno = errno;

    sigaction(SIGINT, &oldInt, nullptr);
    sigaction(SIGQUIT, &oldQuit, nullptr);

    if (waited == -1) {
        throw LaunchError(std::string("waiting for application failed: ") + strerror(waitErrno));
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

void execInPlace(const std::vector<std::string>& argv,
                 const Environment& env,
                 const std::string& workDir) {
    if (argv.empty()) {
        throw LaunchError("nothing to run");
    }

    ExecArgs exec(argv, env);

    if (!workDir.empty() && chdir(workDir.c_str()) != 0) {
        throw LaunchError("cannot change to " + workDir + ": " + strerror(errno));
    }

    execve(exec.argv[0], exec.argv.data(), exec.envp.data());
    throw LaunchError("exec " + argv[0] + " failed: " + strerror(errno));
}

int launchSession(const LaunchOptions& options, const Settings& settings) {
    // Fails before any side effect
    EntryPoint entry;
    try {
        entry = resolveEntryPoint(settings);
    } catch (const LaunchError& e) {
        console::error(e.what());
        return 1;
    }

    LaunchPhase phase = LaunchPhase::Idle;
    auto advance = [&phase](LaunchPhase next) {
        console::status("[" + phaseName(phase) + " -> " + phaseName(next) + "]");
        phase = next;
    };

    console::status("Launching " + settings.entry + " in " + modeName(options.mode) + " mode");

    Environment ambient = captureEnvironment();
    int loaded = mergeEnvFile(settings.envFilePath(), ambient);
    if (loaded > 0) {
        console::status("Loaded " + std::to_string(loaded) + " variable(s) from " + settings.envFilePath());
    }

    LaunchConfig config;

    if (options.mode == LaunchMode::Web) {
        std::string port = std::to_string(settings.port);

        PortState state = inspectPort(settings.port);
        if (state.listeners.empty() && state.unresolvedListeners == 0) {
            console::status("Port " + port + " is free");
        } else {
            console::status("Port " + port + " has " +
                            std::to_string(state.listeners.size() + state.unresolvedListeners) +
                            " listener(s)");
        }
        if (state.establishedLoopbackPeers) {
            console::status("A local client is connected to port " + port + ", it will need to reload");
        }
        advance(LaunchPhase::PortChecked);

        ReconcileRequest request;
        request.port = settings.port;
        request.runnerName = settings.runnerName;
        request.entryPoint = settings.entry;
        request.workDir = settings.workDir;
        request.grace = std::chrono::milliseconds(settings.graceMs);
        ReconcileReport report = reconcilePort(request);
        if (report.terminated.empty() && report.failed.empty()) {
            console::status("No previous instance to stop");
        }
        advance(LaunchPhase::Reaped);

        config = composeLaunchConfig(LaunchMode::Web, options.lan, settings, ambient);
        if (config.secretGenerated) {
            console::status("Generated a session secret (" + settings.envNames.secretKey + ")");
        } else {
            console::status("Using " + settings.envNames.secretKey + " from the environment");
        }
        console::status("Upload directory: " + config.uploadDir);
        console::status("Serving on http://" + config.bindHost + ":" + port +
                        (options.lan ? " (LAN)" : ""));
        advance(LaunchPhase::ConfigComposed);
    } else {
        config = composeLaunchConfig(LaunchMode::Desktop, options.lan, settings, ambient);
        console::status("Cleared " + settings.envNames.port + " and " +
                        settings.envNames.forceWeb + " for a native window");
        advance(LaunchPhase::EnvCleared);
    }

    auto missing = missingVariables(config.env, settings.requiredEnv);
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        console::warn("not set: " + names + " (the application may fail to connect)");
    }

    std::vector<std::string> argv = buildArguments(entry, config, settings);
    console::status("Starting " + joinArgs(argv));
    advance(LaunchPhase::Launched);

    if (options.replaceProcess) {
        execInPlace(argv, config.env, settings.workDir);
    }
    return runChild(argv, config.env, settings.workDir);
}

} // namespace ds
