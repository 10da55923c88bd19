#include <astkg/llm/command_adapters.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace astkg::llm {

namespace {

std::filesystem::path makeInputFile() {
    static std::atomic<unsigned> counter{0};
    return std::filesystem::temp_directory_path() /
           ("astkg-input-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".txt");
}

// Reaps the child; false when it is still running at the deadline
bool waitForExit(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid)
            return true;
        if (r < 0 && errno != EINTR)
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

// SIGTERM the child's process group, then SIGKILL whatever is left
void terminateGroup(pid_t pid) {
    int status = 0;
    const pid_t target = ::getpgid(pid) == pid ? -pid : pid;
    if (::kill(target, SIGTERM) == 0 &&
        waitForExit(pid, status, std::chrono::steady_clock::now() + std::chrono::milliseconds{200})) {
        return;
    }
    spdlog::warn("[runCommand] forcefully killing pid {}", pid);
    ::kill(target, SIGKILL);
    ::waitpid(pid, &status, 0);
}

} // namespace

Result<std::string> runCommand(const std::string& command, const std::string& input,
                               std::chrono::milliseconds timeout) {
    if (command.empty()) {
        return Error{ErrorCode::InvalidArgument, "no command configured"};
    }
    const auto inputPath = makeInputFile();
    {
        std::ofstream out(inputPath, std::ios::binary);
        if (!out) {
            return Error{ErrorCode::InternalError, "cannot write " + inputPath.string()};
        }
        out << input;
    }
    struct InputCleanup {
        std::filesystem::path path;
        ~InputCleanup() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    } cleanup{inputPath};

    const int inputFd = ::open(inputPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (inputFd < 0) {
        return Error{ErrorCode::InternalError,
                     "cannot open " + inputPath.string() + ": " + std::strerror(errno)};
    }
    int stdoutPipe[2];
    if (::pipe2(stdoutPipe, O_CLOEXEC) < 0) {
        const int err = errno;
        ::close(inputFd);
        return Error{ErrorCode::InternalError, std::string("pipe() failed: ") + std::strerror(err)};
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(inputFd);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return Error{ErrorCode::InternalError, std::string("fork() failed: ") + std::strerror(err)};
    }
    if (pid == 0) {
        // Own process group so a timeout also reaches anything the shell started
        ::setpgid(0, 0);
        ::dup2(inputFd, STDIN_FILENO);
        ::dup2(stdoutPipe[1], STDOUT_FILENO);
        ::close(inputFd);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::setpgid(pid, pid);
    ::close(inputFd);
    ::close(stdoutPipe[1]);
    const int outFd = stdoutPipe[0];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::string output;
    bool timedOut = false;
    char buffer[4096];
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd{outFd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }
        const ssize_t n = ::read(outFd, buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    ::close(outFd);

    int status = 0;
    if (timedOut || !waitForExit(pid, status, deadline)) {
        terminateGroup(pid);
        return Error{ErrorCode::Timeout, fmt::format("command timed out after {} ms: {}",
                                                     timeout.count(), command)};
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return Error{ErrorCode::InternalError, "command exited with status " +
                                                   std::to_string(code) + ": " +
                                                   output.substr(0, 200)};
    }
    return output;
}

Result<std::string> CommandAnswerer::generate(const std::string& prompt) {
    auto out = runCommand(command_, prompt, timeout_);
    if (!out) {
        spdlog::warn("[CommandAnswerer] {}", out.error().message);
    }
    return out;
}

Result<Embedding> CommandEmbeddingModel::embed(const std::string& text) {
    auto out = runCommand(command_, text, timeout_);
    if (!out) {
        return out.error();
    }
    auto j = nlohmann::json::parse(out.value(), nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        return Error{ErrorCode::ParseError, "embedding command did not print a JSON array"};
    }
    Embedding emb;
    emb.reserve(j.size());
    for (const auto& v : j) {
        if (!v.is_number()) {
            return Error{ErrorCode::ParseError, "embedding contains a non-numeric value"};
        }
        emb.push_back(v.get<float>());
    }
    return emb;
}

} // namespace astkg::llm
