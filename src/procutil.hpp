#ifndef DS_PROCUTIL_HPP
#define DS_PROCUTIL_HPP

#include "types.hpp"
#include <istream>
#include <vector>
#include <map>
#include <set>
#include <memory>

namespace ds {

// TCP socket states as they appear in /proc/net/tcp
const int TCP_ESTABLISHED = 0x01;
const int TCP_LISTEN = 0x0A;

// One row of /proc/net/tcp or /proc/net/tcp6
struct SocketEntry {
    std::string localAddress;   // hex, kernel byte order
    int localPort = 0;
    std::string remoteAddress;
    int remotePort = 0;
    int state = 0;
    std::string inode;
    bool ipv6 = false;
};

// Parse a TCP table; malformed rows are skipped
std::vector<SocketEntry> parseTcpTable(std::istream& in, bool ipv6);

// Read tcp and tcp6 from netDir. Sets available to false when neither
// table could be opened.
std::vector<SocketEntry> readTcpTables(bool& available, const std::string& netDir = "/proc/net");

// True for 127.0.0.0/8, ::1 and ::ffff:127.0.0.0/104
bool isLoopbackAddress(const std::string& hexAddress);

// Render a /proc/net address as text ("127.0.0.1", "::1")
std::string formatAddress(const std::string& hexAddress);

// Map socket inodes to the PIDs holding them, by scanning /proc/[pid]/fd
std::map<std::string, std::vector<int>> mapSocketOwners(const std::set<std::string>& inodes);

// Inspect listeners and established connections on a local port
PortState inspectPort(int port, const std::string& netDir = "/proc/net");

// Read process information from /proc/[pid]
std::shared_ptr<ProcessInfo> readProcessInfo(int pid);

// Every readable user process
std::vector<ProcessInfo> listProcesses();

// Check if a process is a kernel thread
bool isKernelThread(int pid, const std::string& cmdline);

// Check if a process exists
bool isProcessRunning(int pid);

} // namespace ds

#endif // DS_PROCUTIL_HPP
