#include "process/Runner.hpp"
#include "process/CommandLine.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace bob::process {

std::string Command::toString() const {
    if (args.empty()) return program;
    return fmt::format("{} {}", program, fmt::join(args, " "));
}

void Runner::check(const Command& cmd) {
    const auto res = run(cmd);
    if (!res.ok())
        throw SubprocessError(fmt::format("Command `{}` failed with exit code {}", cmd.toString(), res.exitCode),
                              cmd.toString(), res.exitCode);
}

std::string Runner::checkOutput(const Command& cmd) {
    auto res = capture(cmd);
    if (!res.ok())
        throw SubprocessError(fmt::format("Command `{}` failed with exit code {}", cmd.toString(), res.exitCode),
                              cmd.toString(), res.exitCode);
    return std::move(res.output);
}

bool Runner::probe(const std::string& program, const std::vector<std::string>& args) {
    return capture({program, args, std::nullopt}).ok();
}

#ifdef _WIN32

namespace {

ExecResult spawn(const Command& cmd, HANDLE stdoutHandle) {
    STARTUPINFOA si{};
    si.cb = sizeof(si);
    if (stdoutHandle) {
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        si.hStdOutput = stdoutHandle;
        si.hStdError = nullptr;
    }
    PROCESS_INFORMATION pi{};

    auto line = commandLine(cmd.program, cmd.args);
    const auto cwd = cmd.cwd ? cmd.cwd->string() : std::string{};

    if (!CreateProcessA(nullptr, line.data(), nullptr, nullptr, stdoutHandle != nullptr, 0, nullptr,
                        cmd.cwd ? cwd.c_str() : nullptr, &si, &pi))
        return {127, {}};

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return {static_cast<int>(code), {}};
}

}

ExecResult SystemRunner::run(const Command& cmd) {
    log::Registry::install()->debug("[SystemRunner] {}", cmd.toString());
    return spawn(cmd, nullptr);
}

ExecResult SystemRunner::capture(const Command& cmd) {
    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE readEnd = nullptr, writeEnd = nullptr;
    if (!CreatePipe(&readEnd, &writeEnd, &sa, 0)) throw std::runtime_error("CreatePipe failed");
    SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

    // The pipe is drained after exit; outputs larger than the pipe buffer are not expected here.
    auto res = spawn(cmd, writeEnd);
    CloseHandle(writeEnd);

    char buf[4096];
    DWORD n = 0;
    while (ReadFile(readEnd, buf, sizeof(buf), &n, nullptr) && n > 0) res.output.append(buf, n);
    CloseHandle(readEnd);
    return res;
}

#else

namespace {

std::vector<char*> argv(const Command& cmd) {
    std::vector<char*> out;
    out.reserve(cmd.args.size() + 2);
    out.push_back(const_cast<char*>(cmd.program.c_str()));
    for (const auto& a : cmd.args) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

int waitFor(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

[[noreturn]] void execChild(const Command& cmd) {
    if (cmd.cwd && chdir(cmd.cwd->c_str()) != 0) _exit(126);
    auto args = argv(cmd);
    execvp(cmd.program.c_str(), args.data());
    _exit(127);
}

}

ExecResult SystemRunner::run(const Command& cmd) {
    log::Registry::install()->debug("[SystemRunner] {}", cmd.toString());

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(errno)));
    if (pid == 0) execChild(cmd);

    return {waitFor(pid), {}};
}

ExecResult SystemRunner::capture(const Command& cmd) {
    int pipefd[2];
    if (pipe(pipefd) != 0)
        throw std::runtime_error(fmt::format("pipe failed: {}", std::strerror(errno)));
    fcntl(pipefd[0], F_SETFD, FD_CLOEXEC);
    fcntl(pipefd[1], F_SETFD, FD_CLOEXEC);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]); close(pipefd[1]);
        throw std::runtime_error(fmt::format("fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        ::close(pipefd[0]);
        if (dup2(pipefd[1], STDOUT_FILENO) == -1) _exit(126);
        if (const int devnull = open("/dev/null", O_WRONLY); devnull >= 0) dup2(devnull, STDERR_FILENO);
        execChild(cmd);
    }

    ::close(pipefd[1]);
    ExecResult result;
    char buf[4096];
    ssize_t n;
    while ((n = ::read(pipefd[0], buf, sizeof(buf))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        result.output.append(buf, buf + n);
    }
    ::close(pipefd[0]);

    result.exitCode = waitFor(pid);
    return result;
}

#endif

}
