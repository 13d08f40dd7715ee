#ifndef DS_ENVIRONMENT_HPP
#define DS_ENVIRONMENT_HPP

#include "types.hpp"
#include "settings.hpp"
#include <string>
#include <vector>

namespace ds {

// Snapshot of this process's environment
Environment captureEnvironment();

// Merge KEY=VALUE lines from a dotenv file. Existing keys win.
// Returns the number of variables added; a missing file adds none.
int mergeEnvFile(const std::string& path, Environment& env);

// 128 random bits as 32 lowercase hex characters
std::string generateSecretKey();

// Create the directory (and parents) if needed and check it is writable.
// Throws LaunchError on failure.
void ensureUploadDir(const std::string& path);

// Names from required that are unset or blank in env
std::vector<std::string> missingVariables(const Environment& env,
                                          const std::vector<std::string>& required);

bool isBlank(const std::string& value);

// Build the configuration for the next launch from the ambient environment.
// Web mode creates the upload directory; the ambient map is not modified.
LaunchConfig composeLaunchConfig(LaunchMode mode, bool lan,
                                 const Settings& settings,
                                 const Environment& ambient);

// NAME=VALUE strings for execve
std::vector<std::string> flattenEnvironment(const Environment& env);

} // namespace ds

#endif // DS_ENVIRONMENT_HPP
