#include "cli.hpp"
#include "types.hpp"
#include <set>

namespace ds {

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cl;
    bool haveCommand = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--") {
            size_t eqPos = arg.find('=');
            if (eqPos != std::string::npos) {
                cl.vars[arg.substr(2, eqPos - 2)] = arg.substr(eqPos + 1);
            } else {
                cl.vars[arg.substr(2)] = "true";
            }
        } else if (arg == "lan") {
            cl.vars["lan"] = "true";
        } else if (!haveCommand) {
            cl.command = arg;
            haveCommand = true;
        } else {
            cl.unknown.push_back(arg);
        }
    }

    return cl;
}

std::vector<std::string> unknownOptions(const CommandLine& cl) {
    static const std::set<std::string> known = {
        "port", "workdir", "lan", "exec", "quiet", "help"
    };

    std::vector<std::string> result;
    for (const auto& pair : cl.vars) {
        if (known.count(pair.first) == 0) result.push_back(pair.first);
    }
    return result;
}

bool flagEnabled(const CommandLine& cl, const std::string& name) {
    auto it = cl.vars.find(name);
    if (it == cl.vars.end() || it->second == "false") return false;
    if (it->second == "true") return true;
    throw LaunchError("--" + name + " expects true or false, got '" + it->second + "'");
}

} // namespace ds
