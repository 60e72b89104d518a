/**
 * @file process_runner.hpp
 * @brief Blocking child-process execution with timeout and cancellation
 *
 * Runs a program by argv (no shell), captures stdout and stderr separately,
 * and kills the child's process group when the deadline passes or the
 * cancellation token fires.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace vmsandbox {
namespace core {
class CancellationToken;
}

namespace control {

/**
 * @struct ProcessSpec
 * @brief What to run and how long to wait for it
 */
struct ProcessSpec {
    std::vector<std::string> argv;               ///< Program followed by its arguments
    std::chrono::milliseconds timeout{100000};   ///< Wall-clock limit
    const core::CancellationToken* cancel{nullptr};  ///< Optional abort signal
    std::size_t max_output_bytes{1 << 20};       ///< Per-stream capture limit
};

/**
 * @struct ProcessResult
 * @brief Outcome of a child process
 */
struct ProcessResult {
    int exit_code{-1};                     ///< Exit status, 128+signal if killed by a signal
    std::string stdout_output;             ///< Captured standard output
    std::string stderr_output;             ///< Captured standard error
    std::chrono::milliseconds duration{0}; ///< Wall-clock runtime
    bool timed_out{false};                 ///< Killed because the deadline passed
    bool cancelled{false};                 ///< Killed because the token fired
    bool spawn_failed{false};              ///< Program could not be started
    std::string error_message;             ///< Reason when spawn_failed
};

/**
 * @brief Run a program to completion
 *
 * Blocks the calling thread. Never throws for child failures; inspect the
 * result flags instead.
 *
 * @param spec Program, timeout and cancellation token
 * @return Captured result
 */
ProcessResult RunProcess(const ProcessSpec& spec);

} // namespace control
} // namespace vmsandbox
