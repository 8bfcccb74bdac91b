#pragma once

#include <csignal>
#include <cstdio>
#include <memory>
#include <string>

namespace scenereel {

// Runs a shell command and returns its stdout. Throws std::runtime_error if
// the process cannot be started or exits with a non-zero status.
std::string execute_command(const std::string& command);

// Runs a shell command, discarding output; returns the exit status
int run_command(const std::string& command);

// True when `program` resolves to an executable on PATH (or is a path to one)
bool command_available(const std::string& program);

// Single-quotes an argument for /bin/sh
std::string shell_quote(const std::string& argument);

// Write end of a child process's stdin. Closing (or destruction) waits for
// the child to exit. SIGPIPE is ignored while the pipe is open and the
// previous disposition is restored on close.
class PipeWriter {
public:
    explicit PipeWriter(const std::string& command);
    ~PipeWriter();

    PipeWriter(const PipeWriter&) = delete;
    PipeWriter& operator=(const PipeWriter&) = delete;

    // Throws std::runtime_error if the child stopped reading
    void write(const void* data, size_t bytes);

    // Returns the child's exit status; subsequent calls return the same value
    int close();

private:
    FILE* pipe_ = nullptr;
    int exit_status_ = -1;
    void (*previous_sigpipe_)(int) = SIG_DFL;
};

} // namespace scenereel
