#pragma once

#include <astkg/llm/model_interfaces.h>

#include <chrono>
#include <string>

namespace astkg::llm {

/**
 * Run a shell command with `input` on stdin and return its stdout. A non-zero
 * exit status is reported as ErrorCode::InternalError with the captured output.
 * A command still running at `timeout` is killed with its process group and
 * reported as ErrorCode::Timeout.
 */
Result<std::string> runCommand(const std::string& command, const std::string& input,
                               std::chrono::milliseconds timeout = std::chrono::seconds{60});

// Delegates completion to an external command (prompt on stdin, text on stdout)
class CommandAnswerer final : public Answerer {
public:
    explicit CommandAnswerer(std::string command,
                             std::chrono::milliseconds timeout = std::chrono::seconds{60})
        : command_(std::move(command)), timeout_(timeout) {}

    Result<std::string> generate(const std::string& prompt) override;

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

// Delegates embedding to an external command printing a JSON array of floats
class CommandEmbeddingModel final : public EmbeddingModel {
public:
    explicit CommandEmbeddingModel(std::string command,
                                   std::chrono::milliseconds timeout = std::chrono::seconds{5})
        : command_(std::move(command)), timeout_(timeout) {}

    Result<Embedding> embed(const std::string& text) override;

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

} // namespace astkg::llm
