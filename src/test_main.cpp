#include "test.hpp"
#include "settings.hpp"
#include "procutil.hpp"
#include "reaper.hpp"
#include "environment.hpp"
#include "launcher.hpp"
#include "console.hpp"
#include <unistd.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sstream>
#include <thread>
#include <chrono>

using namespace ds;
using namespace ds::test;

// Listening socket on 127.0.0.1 with a kernel-chosen port
static int openListener(int& port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    assertTrue(fd >= 0, "socket");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    assertTrue(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
    assertTrue(listen(fd, 4) == 0, "listen");

    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
}

// A port nobody is listening on right now
static int freePort() {
    int port = 0;
    int fd = openListener(port);
    close(fd);
    return port;
}

// Child that holds a listening socket and sleeps; the parent's copy is closed
static pid_t startListeningChild(int& port) {
    int fd = openListener(port);

    pid_t pid = fork();
    if (pid == 0) {
        // Child
        setpgid(0, 0);
        for (;;) pause();
    }
    // Also from the parent so kill(-pid) works before the child has run
    setpgid(pid, pid);
    close(fd);
    return pid;
}

// Helper to start a test process
static pid_t startTestProcess(const std::vector<std::string>& args) {
    pid_t pid = fork();
    if (pid == 0) {
        // Child
        setpgid(0, 0);
        std::vector<char*> argv;
        for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);
        execv(argv[0], argv.data());
        _exit(127);
    }
    setpgid(pid, pid);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return pid;
}

// Helper to kill a test process
static void killTestProcess(pid_t pid) {
    if (pid > 0) {
        if (kill(-pid, SIGKILL) != 0) {
            kill(pid, SIGKILL);
        }
        waitpid(pid, nullptr, 0);
    }
}

static bool hasListener(const PortState& state, int pid) {
    for (const auto& ref : state.listeners) {
        if (ref.pid == pid) return true;
    }
    return false;
}

static bool contains(const std::vector<ProcessRef>& refs, int pid) {
    for (const auto& ref : refs) {
        if (ref.pid == pid) return true;
    }
    return false;
}

// Variables the fake interpreter saw, one NAME=VALUE per line
static Environment readEnvDump(const std::string& path) {
    Environment env;
    std::istringstream in(readFile(path));
    std::string line;
    while (std::getline(in, line)) {
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;
        env[line.substr(0, eqPos)] = line.substr(eqPos + 1);
    }
    return env;
}

// Application directory with a fake interpreter that dumps its environment
static std::string makeAppDir(int exitCode) {
    std::string dir = makeTempDir();
    mkdir((dir + "/.venv").c_str(), 0755);
    mkdir((dir + "/.venv/bin").c_str(), 0755);
    writeFile(dir + "/.venv/bin/python",
              "#!/bin/sh\n"
              "env > \"" + dir + "/env.out\"\n"
              "echo \"$@\" > \"" + dir + "/args.out\"\n"
              "exit " + std::to_string(exitCode) + "\n",
              0755);
    writeFile(dir + "/main.py", "print('hello')\n");
    return dir;
}

static Settings appSettings(const std::string& dir) {
    Settings settings = Settings::load(dir);
    settings.port = freePort();
    settings.graceMs = 100;
    settings.requiredEnv.clear();
    return settings;
}

TEST(Inspect_FreePort) {
    int port = freePort();
    PortState state = inspectPort(port);

    ASSERT_EQUALS(port, state.port, "port recorded");
    ASSERT_TRUE(state.available, "TCP tables readable");
    ASSERT_TRUE(state.listeners.empty(), "nothing listening");
    ASSERT_TRUE(!state.establishedLoopbackPeers, "no clients");
}

TEST(Inspect_FindsListenerOwner) {
    int port = 0;
    pid_t pid = startListeningChild(port);

    PortState state = inspectPort(port);
    ASSERT_EQUALS(1, state.listeners.size(), "one owner");
    ASSERT_TRUE(hasListener(state, pid), "owner is the child");
    ASSERT_TRUE(state.listeners[0].commandLineSignature.has_value(), "command line read");

    killTestProcess(pid);
}

TEST(Inspect_LoopbackClient) {
    int port = 0;
    int server = openListener(port);

    int client = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    ASSERT_TRUE(connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "connect");
    int accepted = accept(server, nullptr, nullptr);
    ASSERT_TRUE(accepted >= 0, "accept");

    PortState state = inspectPort(port);
    ASSERT_TRUE(state.establishedLoopbackPeers, "local client detected");
    ASSERT_TRUE(hasListener(state, getpid()), "this process listens");

    close(accepted);
    close(client);
    close(server);
}

TEST(Reconcile_KillsListener) {
    int port = 0;
    pid_t pid = startListeningChild(port);
    ASSERT_TRUE(hasListener(inspectPort(port), pid), "child listening before");

    ReconcileRequest request;
    request.port = port;
    request.runnerName = "no-such-runner";
    request.entryPoint = "main.py";
    request.workDir = "/nonexistent/devsession";
    request.grace = std::chrono::milliseconds(300);

    ReconcileReport report = reconcilePort(request);
    ASSERT_TRUE(contains(report.terminated, pid), "listener terminated");
    ASSERT_TRUE(report.failed.empty(), "no failures");
    ASSERT_TRUE(report.waited, "grace interval observed");
    ASSERT_TRUE(!report.stillListening, "port released");

    PortState after = inspectPort(port);
    ASSERT_TRUE(after.listeners.empty(), "zero listeners afterwards");

    int status = 0;
    ASSERT_EQUALS(pid, waitpid(pid, &status, 0), "child reaped");
    ASSERT_TRUE(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, "killed forcefully");
}

TEST(Reconcile_NoOpWhenNothingMatches) {
    int port = freePort();

    ReconcileRequest request;
    request.port = port;
    request.runnerName = "no-such-runner";
    request.entryPoint = "main.py";
    request.workDir = "/nonexistent/devsession";

    auto start = std::chrono::steady_clock::now();
    ReconcileReport report = reconcilePort(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(report.terminated.empty(), "nothing terminated");
    ASSERT_TRUE(report.failed.empty(), "nothing failed");
    ASSERT_TRUE(!report.waited, "no grace wait");
    ASSERT_TRUE(elapsed < request.grace, "returned without sleeping");
}

TEST(Helpers_KillRightAfterFork) {
    for (int i = 0; i < 20; i++) {
        int port = 0;
        pid_t pid = startListeningChild(port);
        killTestProcess(pid);
        ASSERT_TRUE(!isProcessRunning(pid), "child gone");
    }
}

TEST(Reconcile_KillFailureIsNotFatal) {
    // A pid that has already exited and been reaped
    pid_t pid = fork();
    if (pid == 0) {
        _exit(0);
    }
    ASSERT_EQUALS(pid, waitpid(pid, nullptr, 0), "child reaped");

    ProcessRef gone;
    gone.pid = pid;
    gone.commandLineSignature = std::string("python main.py");

    ReconcileReport report;
    stopProcesses({gone}, "listening on port 8550", report);
    ASSERT_TRUE(report.terminated.empty(), "nothing terminated");
    ASSERT_EQUALS(1, report.failed.size(), "failure recorded");
    ASSERT_EQUALS(pid, report.failed[0].pid, "failed pid");

    stopProcesses({gone}, "stale instance of main.py", report);
    ASSERT_EQUALS(1, report.failed.size(), "each pid tried once");
}

TEST(Reconcile_TablesUnavailable) {
    std::string dir = makeTempDir();

    ReconcileRequest request;
    request.port = freePort();
    request.runnerName = "no-such-runner";
    request.entryPoint = "main.py";
    request.workDir = "/nonexistent/devsession";
    request.netDir = dir + "/missing";

    ReconcileReport report = reconcilePort(request);
    ASSERT_TRUE(report.terminated.empty(), "nothing terminated");
    ASSERT_TRUE(report.failed.empty(), "nothing failed");
    ASSERT_TRUE(!report.waited, "no grace wait");

    removeTree(dir);
}

TEST(Reconcile_StopsStaleInstance) {
    std::string dir = makeTempDir();
    writeFile(dir + "/main.py", "");

    // Looks like "sh <dir>/main.py" to the matcher; the loop keeps sh alive
    pid_t pid = startTestProcess({"/bin/sh", "-c", "while :; do sleep 1; done", dir + "/main.py"});

    auto stale = findStaleInstances("sh", "main.py", dir);
    ASSERT_TRUE(contains(stale, pid), "stale instance found");

    ReconcileRequest request;
    request.port = freePort();
    request.runnerName = "sh";
    request.entryPoint = "main.py";
    request.workDir = dir;
    request.grace = std::chrono::milliseconds(100);

    ReconcileReport report = reconcilePort(request);
    ASSERT_TRUE(contains(report.terminated, pid), "stale instance terminated");

    int status = 0;
    ASSERT_EQUALS(pid, waitpid(pid, &status, 0), "child reaped");
    ASSERT_TRUE(WIFSIGNALED(status), "killed");

    kill(-pid, SIGKILL);
    removeTree(dir);
}

TEST(Launch_MissingEntryPointFailsFast) {
    std::string dir = makeTempDir();
    Settings settings = appSettings(dir);

    LaunchOptions options;
    options.mode = LaunchMode::Web;
    int code = launchSession(options, settings);

    ASSERT_EQUALS(1, code, "exit code 1");
    ASSERT_TRUE(!isDirectory(dir + "/.uploads"), "no upload directory created");

    removeTree(dir);
}

TEST(Launch_MissingEntryScriptFailsFast) {
    std::string dir = makeAppDir(0);
    ::remove((dir + "/main.py").c_str());
    Settings settings = appSettings(dir);

    int port = 0;
    pid_t pid = startListeningChild(port);
    settings.port = port;

    LaunchOptions options;
    options.mode = LaunchMode::Web;
    ASSERT_EQUALS(1, launchSession(options, settings), "exit code 1");
    ASSERT_TRUE(isProcessRunning(pid), "listener left alone");
    ASSERT_TRUE(!isDirectory(dir + "/.uploads"), "no upload directory created");

    killTestProcess(pid);
    removeTree(dir);
}

TEST(Launch_WebMode) {
    std::string dir = makeAppDir(7);
    Settings settings = appSettings(dir);

    int port = 0;
    pid_t stale = startListeningChild(port);
    settings.port = port;

    unsetenv("FLET_SECRET_KEY");
    LaunchOptions options;
    options.mode = LaunchMode::Web;
    options.lan = true;
    int code = launchSession(options, settings);

    ASSERT_EQUALS(7, code, "child exit code relayed");

    int status = 0;
    ASSERT_EQUALS(stale, waitpid(stale, &status, 0), "previous listener reaped");
    ASSERT_TRUE(WIFSIGNALED(status), "previous listener killed");

    Environment env = readEnvDump(dir + "/env.out");
    ASSERT_EQUALS(std::to_string(port), env["PORT"], "PORT");
    ASSERT_EQUALS(std::string("true"), env["FLET_FORCE_WEB_SERVER"], "force web");
    ASSERT_EQUALS(std::string("0.0.0.0"), env["FLET_SERVER_IP"], "LAN host");
    ASSERT_EQUALS(32, env["FLET_SECRET_KEY"].size(), "generated secret");
    ASSERT_EQUALS(dir + "/.uploads", env["FLET_UPLOAD_DIR"], "upload dir");
    ASSERT_TRUE(isDirectory(dir + "/.uploads"), "upload dir exists");
    ASSERT_CONTAINS(readFile(dir + "/args.out"), dir + "/main.py", "entry script passed");
    ASSERT_TRUE(getenv("PORT") == nullptr, "launcher environment untouched");

    removeTree(dir);
}

TEST(Launch_DesktopModeClearsWebConfig) {
    std::string dir = makeAppDir(3);
    Settings settings = appSettings(dir);

    setenv("PORT", "8550", 1);
    setenv("FLET_FORCE_WEB_SERVER", "true", 1);

    LaunchOptions options;
    options.mode = LaunchMode::Desktop;
    int code = launchSession(options, settings);

    unsetenv("PORT");
    unsetenv("FLET_FORCE_WEB_SERVER");

    ASSERT_EQUALS(3, code, "child exit code relayed");

    Environment env = readEnvDump(dir + "/env.out");
    ASSERT_TRUE(!env.empty(), "child ran");
    ASSERT_TRUE(env.count("PORT") == 0, "PORT not inherited");
    ASSERT_TRUE(env.count("FLET_FORCE_WEB_SERVER") == 0, "force web not inherited");
    ASSERT_TRUE(!isDirectory(dir + "/.uploads"), "no upload dir in desktop mode");

    removeTree(dir);
}

TEST(Launch_EnvFileReachesChild) {
    std::string dir = makeAppDir(0);
    writeFile(dir + "/.env", "DB_HOST=db.internal\n");
    Settings settings = appSettings(dir);
    unsetenv("DB_HOST");

    LaunchOptions options;
    options.mode = LaunchMode::Desktop;
    ASSERT_EQUALS(0, launchSession(options, settings), "success");

    Environment env = readEnvDump(dir + "/env.out");
    ASSERT_EQUALS(std::string("db.internal"), env["DB_HOST"], ".env variable passed");
    ASSERT_TRUE(getenv("DB_HOST") == nullptr, "launcher environment untouched");

    removeTree(dir);
}

TEST(RunChild_RelaysSignal) {
    int code = runChild({"/bin/sh", "-c", "kill -TERM $$"}, captureEnvironment(), "");
    ASSERT_EQUALS(128 + SIGTERM, code, "signal mapped to 128 + n");
}

TEST(RunChild_ChildReceivesInterrupt) {
    int code = runChild({"/bin/sh", "-c", "kill -INT $$"}, captureEnvironment(), "");
    ASSERT_EQUALS(128 + SIGINT, code, "child has the default SIGINT action");

    struct sigaction current;
    sigaction(SIGINT, nullptr, &current);
    ASSERT_TRUE(current.sa_handler == SIG_DFL, "launcher handler restored");
}

TEST(RunChild_ExecFailure) {
    int code = runChild({"/nonexistent/program"}, captureEnvironment(), "");
    ASSERT_EQUALS(127, code, "exec failure");
}

int main() {
    console::setQuiet(true);
    return TestRunner::instance().run();
}
