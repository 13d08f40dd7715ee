#include "cli.hpp"
#include "settings.hpp"
#include "launcher.hpp"
#include "procutil.hpp"
#include "console.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <map>
#include <limits.h>
#include <stdlib.h>
#include <unistd.h>

using namespace ds;

std::string resolveWorkDir(const std::map<std::string, std::string>& vars) {
    std::string dir = ".";
    auto it = vars.find("workdir");
    if (it != vars.end() && !it->second.empty()) {
        dir = it->second;
    }

    char resolved[PATH_MAX];
    if (!realpath(dir.c_str(), resolved)) {
        throw LaunchError("working directory " + dir + " does not exist");
    }
    return resolved;
}

void printUsage() {
    std::cerr << "Usage: devsession [command] [options]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  web        - Stop any previous instance and serve on the port (default)\n";
    std::cerr << "  desktop    - Start in a native window\n";
    std::cerr << "  inspect    - Print listeners and clients on the port as JSON\n";
    std::cerr << "  config     - Print the effective configuration as JSON\n";
    std::cerr << "Options:\n";
    std::cerr << "  lan, --lan        - Bind all interfaces instead of loopback\n";
    std::cerr << "  --port=N          - Port to serve on (default: " << Settings::DEFAULT_PORT << ")\n";
    std::cerr << "  --workdir=PATH    - Application directory (default: current directory)\n";
    std::cerr << "  --exec            - Replace the launcher with the application\n";
    std::cerr << "  --quiet           - Only print warnings and errors\n";
}

int main(int argc, char* argv[]) {
    CommandLine cl = parseCommandLine(argc, argv);

    if (cl.command == "help" || cl.vars.count("help")) {
        printUsage();
        return 0;
    }

    if (!cl.unknown.empty()) {
        std::cerr << "Unexpected argument: " << cl.unknown[0] << "\n";
        printUsage();
        return 2;
    }

    auto badOptions = unknownOptions(cl);
    if (!badOptions.empty()) {
        std::cerr << "Unknown option: --" << badOptions[0] << "\n";
        printUsage();
        return 2;
    }

    LaunchOptions options;
    try {
        console::setQuiet(flagEnabled(cl, "quiet"));
        options.lan = flagEnabled(cl, "lan");
        options.replaceProcess = flagEnabled(cl, "exec");
    } catch (const LaunchError& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return 2;
    }

    try {
        Settings settings = Settings::load(resolveWorkDir(cl.vars));
        settings.applyOverrides(cl.vars);

        if (cl.command == "inspect") {
            json j = inspectPort(settings.port);
            std::cout << j.dump(2) << "\n";
            return 0;
        }

        if (cl.command == "config") {
            json j = settings;
            std::cout << j.dump(2) << "\n";
            return 0;
        }

        if (cl.command == "web") {
            options.mode = LaunchMode::Web;
        } else if (cl.command == "desktop") {
            options.mode = LaunchMode::Desktop;
        } else {
            std::cerr << "Unknown command: " << cl.command << "\n";
            printUsage();
            return 2;
        }

        return launchSession(options, settings);
    } catch (const LaunchError& e) {
        console::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        console::error(std::string("unexpected failure: ") + e.what());
        return 1;
    }
}
