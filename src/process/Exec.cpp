#include "process/Exec.hpp"
#include "process/CommandLine.hpp"

#include <fmt/core.h>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace bob::process {

#ifdef _WIN32

int spawnForwardingSignals(const fs::path& binary, const std::vector<std::string>& args) {
    auto line = commandLine(binary.string(), args);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    if (!CreateProcessA(nullptr, line.data(), nullptr, nullptr, FALSE, 0, nullptr, nullptr, &si, &pi))
        throw std::runtime_error(fmt::format("Failed to start {} (error {})", binary.string(), GetLastError()));

    // Ctrl+C reaches the child through the shared console; the parent only waits.
    SetConsoleCtrlHandler(nullptr, TRUE);
    WaitForSingleObject(pi.hProcess, INFINITE);
    SetConsoleCtrlHandler(nullptr, FALSE);

    DWORD code = 1;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return static_cast<int>(code);
}

void replaceProcess(const fs::path& binary, const std::vector<std::string>& args) {
    std::exit(spawnForwardingSignals(binary, args));
}

#else

namespace {

volatile sig_atomic_t childPid = 0;

constexpr int FORWARDED_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGUSR1};

void forwardSignal(const int sig) {
    if (childPid > 0) ::kill(childPid, sig);
}

std::vector<char*> makeArgv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 2);
    out.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

}

int spawnForwardingSignals(const fs::path& binary, const std::vector<std::string>& args) {
    const auto program = binary.string();
    auto argv = makeArgv(program, args);

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(errno)));
    if (pid == 0) {
        execv(program.c_str(), argv.data());
        _exit(127);
    }

    childPid = pid;
    struct sigaction sa{};
    sa.sa_handler = forwardSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    struct sigaction previous[std::size(FORWARDED_SIGNALS)];
    for (size_t i = 0; i < std::size(FORWARDED_SIGNALS); ++i)
        sigaction(FORWARDED_SIGNALS[i], &sa, &previous[i]);

    int status = 0;
    pid_t waited;
    while ((waited = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {}

    for (size_t i = 0; i < std::size(FORWARDED_SIGNALS); ++i)
        sigaction(FORWARDED_SIGNALS[i], &previous[i], nullptr);
    childPid = 0;

    if (waited < 0) throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

void replaceProcess(const fs::path& binary, const std::vector<std::string>& args) {
    const auto program = binary.string();
    auto argv = makeArgv(program, args);
    execv(program.c_str(), argv.data());
    throw std::runtime_error(fmt::format("Failed to execute {}: {}", program, std::strerror(errno)));
}

#endif

}
