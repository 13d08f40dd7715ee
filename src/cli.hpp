#ifndef DS_CLI_HPP
#define DS_CLI_HPP

#include <map>
#include <string>
#include <vector>

namespace ds {

struct CommandLine {
    std::string command = "web";
    std::map<std::string, std::string> vars;
    std::vector<std::string> unknown;
};

// --key=value and --flag; "lan" is accepted without dashes
CommandLine parseCommandLine(int argc, char* argv[]);

// Keys that are not options of the launcher
std::vector<std::string> unknownOptions(const CommandLine& cl);

// "true" or "false"; absent means false. Throws LaunchError otherwise.
bool flagEnabled(const CommandLine& cl, const std::string& name);

} // namespace ds

#endif // DS_CLI_HPP
