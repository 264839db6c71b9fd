/**
 * @file ssh_executor.hpp
 * @brief IRemoteExecutor backed by the system ssh client.
 */

#pragma once

#include "core/config.hpp"
#include "remote/remote_executor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleet_usage {

/**
 * @brief Spawns `<program> <options...> <host> <command>` per call.
 *
 * Standard input is /dev/null. Both output pipes are drained with poll() so
 * a chatty stderr cannot block the child. When the deadline passes the child
 * is killed with SIGKILL.
 */
class SshExecutor : public IRemoteExecutor {
public:
    explicit SshExecutor(SshConfig config);

    Result<std::string> run(const std::string& host,
                            const std::string& command,
                            std::chrono::milliseconds timeout) override;

    /// Full argument vector used for a call, program first.
    [[nodiscard]] std::vector<std::string> argv_for(const std::string& host,
                                                    const std::string& command) const;

private:
    SshConfig config_;
};

/// Quote a word for a POSIX shell with single quotes.
[[nodiscard]] std::string shell_quote(const std::string& word);

}  // namespace fleet_usage
