#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nftfw {

namespace {

const std::string kComponent = "CommandExecutor";

/// Pipe pair that closes whatever ends are still open
class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
    int readEnd() const { return fds_[0]; }
    int writeEnd() const { return fds_[1]; }

    void closeRead() {
        if (fds_[0] >= 0) {
            close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void closeWrite() {
        if (fds_[1] >= 0) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2];
};

CommandResult failure(const std::string& command, const std::string& reason) {
    CommandResult result;
    result.success = false;
    result.exit_code = -1;
    result.stderr_output = reason;
    result.command = command;
    Logger::error(kComponent, reason + ": " + command);
    return result;
}

} // anonymous namespace

CommandResult CommandExecutor::execute(const std::vector<std::string>& args) {
    return execute(args, "");
}

CommandResult CommandExecutor::execute(const std::vector<std::string>& args, const std::string& input) {
    if (args.empty()) {
        return failure("", "No command specified");
    }

    std::string command = argsToCommand(args);
    Logger::debug(kComponent, "Executing command: " + command);

    Pipe in;
    Pipe out;
    Pipe err;
    if (!in.valid() || !out.valid() || !err.valid()) {
        return failure(command, std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return failure(command, std::string("Failed to fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        dup2(in.readEnd(), STDIN_FILENO);
        dup2(out.writeEnd(), STDOUT_FILENO);
        dup2(err.writeEnd(), STDERR_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    in.closeRead();
    out.closeWrite();
    err.closeWrite();

    // A child that exits early must not kill us through SIGPIPE
    signal(SIGPIPE, SIG_IGN);

    if (input.empty()) {
        in.closeWrite();
    }

    CommandResult result;
    result.command = command;

    size_t written = 0;
    bool io_error = false;
    std::array<char, 4096> buffer;

    while (out.readEnd() >= 0 || err.readEnd() >= 0) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        int in_index = -1;

        if (out.readEnd() >= 0) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{out.readEnd(), POLLIN, 0};
        }
        if (err.readEnd() >= 0) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{err.readEnd(), POLLIN, 0};
        }
        if (in.writeEnd() >= 0) {
            in_index = static_cast<int>(count);
            fds[count++] = pollfd{in.writeEnd(), POLLOUT, 0};
        }

        if (poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            io_error = true;
            result.stderr_output = std::string("poll failed: ") + std::strerror(errno);
            break;
        }

        if (in_index >= 0 && fds[in_index].revents != 0) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                in.closeWrite();
            } else {
                ssize_t n = write(in.writeEnd(), input.data() + written, input.size() - written);
                if (n < 0 && errno != EINTR && errno != EAGAIN) {
                    io_error = true;
                    result.stderr_output = std::string("write to child failed: ") + std::strerror(errno);
                    in.closeWrite();
                } else if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) {
                        in.closeWrite();
                    }
                }
            }
        }

        if (out_index >= 0 && fds[out_index].revents != 0) {
            ssize_t n = read(out.readEnd(), buffer.data(), buffer.size());
            if (n > 0) {
                result.stdout_output.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                out.closeRead();
            }
        }

        if (err_index >= 0 && fds[err_index].revents != 0) {
            ssize_t n = read(err.readEnd(), buffer.data(), buffer.size());
            if (n > 0) {
                result.stderr_output.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                err.closeRead();
            }
        }
    }

    in.closeWrite();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return failure(command, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    result.success = !io_error;
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    std::string resultLog = "Command completed with exit code " + std::to_string(result.exit_code);
    if (!result.stdout_output.empty()) {
        resultLog += " (output: " + std::to_string(result.stdout_output.length()) + " bytes)";
    }
    Logger::log(result.isSuccess() ? LogLevel::Debug : LogLevel::Error, kComponent, resultLog);

    return result;
}

bool CommandExecutor::isAvailable(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }

    return false;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }

    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~") == std::string::npos) {
        return arg;
    }

    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace nftfw
