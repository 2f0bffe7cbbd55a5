#include "system/runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace elemental {

namespace {

constexpr size_t kMaxErrorOutput = 4096;

std::string TailForError(const std::string& out) {
    if (out.size() <= kMaxErrorOutput) return out;
    return "..." + out.substr(out.size() - kMaxErrorOutput);
}

} // namespace

std::string FormatCommand(const std::string& cmd, const std::vector<std::string>& args) {
    std::string line = cmd;
    for (const auto& a : args) {
        line += ' ';
        line += a;
    }
    return line;
}

Result ExecRunner::Run(const std::string& cmd,
                       const std::vector<std::string>& args,
                       std::string* output) const {
    LogDebug("running: %s", FormatCommand(cmd, args).c_str());

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Result::FromErrno("pipe2");
    }
    Fd read_end(fds[0]);
    Fd write_end(fds[1]);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(cmd.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::FromErrno("fork");
    }
    if (pid == 0) {
        ::dup2(write_end.Get(), STDOUT_FILENO);
        ::dup2(write_end.Get(), STDERR_FILENO);
        ::execvp(cmd.c_str(), argv.data());
        _exit(127);
    }
    write_end.Close();

    std::string out;
    std::array<char, 4096> buf{};
    while (true) {
        const ssize_t n = ::read(read_end.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result::FromErrno("waitpid " + cmd);
        }
    }

    if (output) *output = out;

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return Result::Ok();
    }
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return Result::Fail(code, cmd + " failed (exit " + std::to_string(code) + "): " + TailForError(out));
}

} // namespace elemental
