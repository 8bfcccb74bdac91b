#include "process_runner.hpp"
#include <array>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <sys/wait.h>

namespace scenereel {

namespace {

int decode_status(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

} // namespace

std::string execute_command(const std::string& command) {
    std::array<char, 4096> buffer;
    std::string result;

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed for: " + command);
    }

    try {
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            result += buffer.data();
        }
    } catch (...) {
        pclose(pipe);
        throw;
    }

    int exit_code = decode_status(pclose(pipe));
    if (exit_code != 0) {
        throw std::runtime_error("Command failed with exit code " + std::to_string(exit_code) + ": " + command);
    }

    return result;
}

int run_command(const std::string& command) {
    return decode_status(std::system(command.c_str()));
}

bool command_available(const std::string& program) {
    if (program.empty()) return false;
    return run_command("command -v " + shell_quote(program) + " > /dev/null 2>&1") == 0;
}

std::string shell_quote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

PipeWriter::PipeWriter(const std::string& command) {
    // A child that exits early must surface as a write error, not kill us
    previous_sigpipe_ = std::signal(SIGPIPE, SIG_IGN);

    pipe_ = popen(command.c_str(), "w");
    if (!pipe_) {
        std::signal(SIGPIPE, previous_sigpipe_);
        throw std::runtime_error("popen() failed for: " + command);
    }
}

PipeWriter::~PipeWriter() {
    if (pipe_) {
        int status = close();
        if (status != 0) {
            std::cerr << "Warning: piped process exited with status " << status << std::endl;
        }
    }
}

void PipeWriter::write(const void* data, size_t bytes) {
    if (!pipe_) {
        throw std::runtime_error("Write to closed pipe");
    }
    if (std::fwrite(data, 1, bytes, pipe_) != bytes) {
        throw std::runtime_error("Piped process stopped accepting input");
    }
}

int PipeWriter::close() {
    if (pipe_) {
        exit_status_ = decode_status(pclose(pipe_));
        pipe_ = nullptr;
        std::signal(SIGPIPE, previous_sigpipe_);
    }
    return exit_status_;
}

} // namespace scenereel
