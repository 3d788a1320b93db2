#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = 0;  // 127 if the program could not be executed, 128+N if killed by signal N
    std::string out;
    std::string err;
};

// Run argv[0] (looked up in $PATH, no shell) and collect its output. The child is
// killed once `timeout` elapses and an error is returned instead of a result.
std::expected<ProcessResult, std::string>
    run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
