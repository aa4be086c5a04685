#pragma once

#include <stop_token>
#include <string>

namespace cmdguard {

/**
 * @brief What a backend reports for one command run
 */
struct BackendOutcome {
    bool success = false;
    std::string output;     // textual result on success
    std::string error;      // failure message when !success
};

/**
 * @brief Abstract command backend interface
 *
 * The seam between CommandExecutor and whatever actually runs a command
 * (a simulator, a real process spawner). CommandExecutor holds
 * shared_ptr<ICommandBackend> and calls run() on a worker thread under its
 * timeout race.
 *
 * Implementations should return promptly once @p stop is requested; the
 * executor has already given up on the attempt by then and discards
 * whatever is returned. Exceptions thrown from run() become failed
 * attempts.
 */
class ICommandBackend {
public:
    virtual ~ICommandBackend() = default;

    [[nodiscard]] virtual BackendOutcome run(
        const std::string& command, std::stop_token stop) = 0;
};

} // namespace cmdguard
