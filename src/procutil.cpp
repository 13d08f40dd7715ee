#include "procutil.hpp"
#include <fstream>
#include <sstream>
#include <iterator>
#include <dirent.h>
#include <unistd.h>
#include <signal.h>
#include <limits.h>
#include <arpa/inet.h>
#include <sys/stat.h>
#include <cctype>
#include <cstdlib>

namespace ds {

static int parseHex(const std::string& text) {
    size_t used = 0;
    int value = std::stoi(text, &used, 16);
    if (used != text.size()) {
        throw std::invalid_argument("trailing characters in " + text);
    }
    return value;
}

// Split "0100007F:1F90" into address and port
static bool splitEndpoint(const std::string& endpoint, std::string& address, int& port) {
    size_t colonPos = endpoint.find(':');
    if (colonPos == std::string::npos) return false;

    address = endpoint.substr(0, colonPos);
    port = parseHex(endpoint.substr(colonPos + 1));
    return true;
}

std::vector<SocketEntry> parseTcpTable(std::istream& in, bool ipv6) {
    std::vector<SocketEntry> entries;

    std::string line;
    std::getline(in, line); // Skip header

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::vector<std::string> fields;
        std::string field;
        while (iss >> field) {
            fields.push_back(field);
        }

        if (fields.size() < 10) continue;

        SocketEntry entry;
        entry.ipv6 = ipv6;
        try {
            if (!splitEndpoint(fields[1], entry.localAddress, entry.localPort)) continue;
            if (!splitEndpoint(fields[2], entry.remoteAddress, entry.remotePort)) continue;
            entry.state = parseHex(fields[3]);
        } catch (const std::logic_error&) {
            continue;
        }
        entry.inode = fields[9];

        entries.push_back(entry);
    }

    return entries;
}

std::vector<SocketEntry> readTcpTables(bool& available, const std::string& netDir) {
    std::vector<SocketEntry> entries;
    available = false;

    const char* tcpFiles[] = {"tcp", "tcp6"};

    for (const char* tcpFile : tcpFiles) {
        std::ifstream file(netDir + "/" + tcpFile);
        if (!file.is_open()) continue;
        available = true;

        bool ipv6 = std::string(tcpFile).back() == '6';
        auto table = parseTcpTable(file, ipv6);
        entries.insert(entries.end(), table.begin(), table.end());
    }

    return entries;
}

// Bytes in network order. The kernel prints each 32-bit word in host order.
static std::vector<unsigned char> decodeAddress(const std::string& hex) {
    std::vector<unsigned char> bytes;
    if (hex.size() != 8 && hex.size() != 32) return bytes;

    for (size_t word = 0; word < hex.size(); word += 8) {
        unsigned char chunk[4];
        for (size_t i = 0; i < 4; i++) {
            std::string pair = hex.substr(word + i * 2, 2);
            if (!isxdigit(static_cast<unsigned char>(pair[0])) ||
                !isxdigit(static_cast<unsigned char>(pair[1]))) {
                return {};
            }
            chunk[i] = static_cast<unsigned char>(strtoul(pair.c_str(), nullptr, 16));
        }
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        bytes.insert(bytes.end(), {chunk[3], chunk[2], chunk[1], chunk[0]});
#else
        bytes.insert(bytes.end(), {chunk[0], chunk[1], chunk[2], chunk[3]});
#endif
    }
    return bytes;
}

bool isLoopbackAddress(const std::string& hexAddress) {
    auto bytes = decodeAddress(hexAddress);

    if (bytes.size() == 4) {
        return bytes[0] == 127;
    }

    if (bytes.size() == 16) {
        bool zeroPrefix = true;
        for (size_t i = 0; i < 10; i++) {
            if (bytes[i] != 0) zeroPrefix = false;
        }
        if (!zeroPrefix) return false;

        // ::1
        if (bytes[10] == 0 && bytes[11] == 0 && bytes[12] == 0 &&
            bytes[13] == 0 && bytes[14] == 0 && bytes[15] == 1) {
            return true;
        }

        // ::ffff:127.x.x.x
        return bytes[10] == 0xff && bytes[11] == 0xff && bytes[12] == 127;
    }

    return false;
}

std::string formatAddress(const std::string& hexAddress) {
    auto bytes = decodeAddress(hexAddress);
    char text[INET6_ADDRSTRLEN];

    if (bytes.size() == 4) {
        if (inet_ntop(AF_INET, bytes.data(), text, sizeof(text))) return text;
    } else if (bytes.size() == 16) {
        if (inet_ntop(AF_INET6, bytes.data(), text, sizeof(text))) return text;
    }
    return hexAddress;
}

std::map<std::string, std::vector<int>> mapSocketOwners(const std::set<std::string>& inodes) {
    std::map<std::string, std::vector<int>> owners;
    if (inodes.empty()) return owners;

    DIR* procDir = opendir("/proc");
    if (!procDir) return owners;

    struct dirent* entry;
    while ((entry = readdir(procDir)) != nullptr) {
        // Check if entry is a PID (numeric)
        if (!isdigit(static_cast<unsigned char>(entry->d_name[0]))) continue;

        int pid = atoi(entry->d_name);

        // Unreadable for processes of other users
        std::string fdDir = std::string("/proc/") + entry->d_name + "/fd";
        DIR* fdDirPtr = opendir(fdDir.c_str());
        if (!fdDirPtr) continue;

        struct dirent* fdEntry;
        while ((fdEntry = readdir(fdDirPtr)) != nullptr) {
            if (fdEntry->d_name[0] == '.') continue;

            std::string fdPath = fdDir + "/" + fdEntry->d_name;
            char link[256];
            ssize_t len = readlink(fdPath.c_str(), link, sizeof(link) - 1);
            if (len == -1) continue;
            link[len] = '\0';

            std::string linkStr(link);
            if (linkStr.compare(0, 8, "socket:[") != 0 || linkStr.back() != ']') continue;

            std::string inode = linkStr.substr(8, linkStr.length() - 9);
            if (inodes.count(inode) == 0) continue;

            auto& pids = owners[inode];
            bool known = false;
            for (int p : pids) {
                if (p == pid) known = true;
            }
            if (!known) pids.push_back(pid);
        }
        closedir(fdDirPtr);
    }
    closedir(procDir);

    return owners;
}

PortState inspectPort(int port, const std::string& netDir) {
    PortState state;
    state.port = port;

    auto entries = readTcpTables(state.available, netDir);

    std::set<std::string> listenInodes;
    for (const auto& entry : entries) {
        if (entry.localPort != port) continue;

        if (entry.state == TCP_LISTEN) {
            if (entry.inode != "0") listenInodes.insert(entry.inode);
        } else if (entry.state == TCP_ESTABLISHED) {
            if (isLoopbackAddress(entry.remoteAddress)) {
                state.establishedLoopbackPeers = true;
            }
        }
    }

    auto owners = mapSocketOwners(listenInodes);

    std::set<int> seen;
    for (const auto& inode : listenInodes) {
        auto it = owners.find(inode);
        if (it == owners.end()) {
            state.unresolvedListeners++;
            continue;
        }

        for (int pid : it->second) {
            if (!seen.insert(pid).second) continue;

            ProcessRef ref;
            ref.pid = pid;
            auto info = readProcessInfo(pid);
            if (info && !info->cmdline.empty()) {
                ref.commandLineSignature = info->cmdline;
            }
            state.listeners.push_back(ref);
        }
    }

    return state;
}

bool isKernelThread(int pid, const std::string& cmdline) {
    if (pid == 2) return true;

    if (cmdline.empty() || cmdline.find_first_not_of(" \t\n\r") == std::string::npos) {
        std::string statPath = "/proc/" + std::to_string(pid) + "/stat";
        std::ifstream file(statPath);
        if (!file.is_open()) return false;

        std::string line;
        std::getline(file, line);

        size_t lastParen = line.rfind(')');
        if (lastParen == std::string::npos) return false;

        std::istringstream iss(line.substr(lastParen + 1));
        std::string state;
        int ppid = -1;
        iss >> state >> ppid;

        if (ppid == 2 || ppid == 0) return true;
    }

    return false;
}

std::shared_ptr<ProcessInfo> readProcessInfo(int pid) {
    auto info = std::make_shared<ProcessInfo>();
    info->pid = pid;

    std::string procDir = "/proc/" + std::to_string(pid);

    // Check if process exists
    struct stat st;
    if (stat(procDir.c_str(), &st) != 0) {
        return nullptr;
    }

    std::ifstream statFile(procDir + "/stat");
    if (!statFile.is_open()) return nullptr;

    std::string statLine;
    std::getline(statFile, statLine);

    // The name may itself contain parentheses
    size_t firstParen = statLine.find('(');
    size_t lastParen = statLine.rfind(')');
    if (firstParen == std::string::npos || lastParen == std::string::npos || lastParen < firstParen) {
        return nullptr;
    }
    info->name = statLine.substr(firstParen + 1, lastParen - firstParen - 1);

    std::istringstream iss(statLine.substr(lastParen + 1));
    std::string state;
    iss >> state >> info->ppid;

    // Arguments are NUL separated
    std::ifstream cmdlineFile(procDir + "/cmdline");
    if (cmdlineFile.is_open()) {
        std::string cmdline((std::istreambuf_iterator<char>(cmdlineFile)),
                            std::istreambuf_iterator<char>());

        for (char& c : cmdline) {
            if (c == '\0') c = ' ';
        }

        size_t end = cmdline.find_last_not_of(" \t\n\r");
        cmdline.erase(end == std::string::npos ? 0 : end + 1);
        info->cmdline = cmdline;
    }

    if (!isKernelThread(pid, info->cmdline)) {
        char path[PATH_MAX];
        ssize_t len = readlink((procDir + "/exe").c_str(), path, sizeof(path) - 1);
        if (len != -1) {
            path[len] = '\0';
            info->exe = path;
        }

        len = readlink((procDir + "/cwd").c_str(), path, sizeof(path) - 1);
        if (len != -1) {
            path[len] = '\0';
            info->cwd = path;
        }
    }

    return info;
}

std::vector<ProcessInfo> listProcesses() {
    std::vector<ProcessInfo> result;

    DIR* procDir = opendir("/proc");
    if (!procDir) {
        return result;
    }

    struct dirent* entry;
    while ((entry = readdir(procDir)) != nullptr) {
        int pid = atoi(entry->d_name);
        if (pid <= 0) {
            continue;
        }

        // Processes can exit between readdir and open
        auto info = readProcessInfo(pid);
        if (!info) {
            continue;
        }

        if (isKernelThread(pid, info->cmdline)) {
            continue;
        }

        result.push_back(*info);
    }

    closedir(procDir);
    return result;
}

bool isProcessRunning(int pid) {
    return kill(pid, 0) == 0;
}

} // namespace ds
