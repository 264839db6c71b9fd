/**
 * @file remote_executor.hpp
 * @brief Interface for running a command on a remote machine.
 *
 * Virtual so that fleet_gather picks ssh at runtime while tests inject a
 * scripted executor.
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <string>

namespace fleet_usage {

class IRemoteExecutor {
public:
    virtual ~IRemoteExecutor() = default;

    /**
     * @brief Run `command` on `host` and return its standard output.
     *
     * Must be safe to call from several threads at once. Failures to connect,
     * non-zero exits and expired deadlines are reported as Connection errors.
     */
    virtual Result<std::string> run(const std::string& host,
                                    const std::string& command,
                                    std::chrono::milliseconds timeout) = 0;
};

}  // namespace fleet_usage
