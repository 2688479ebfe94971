#pragma once

/**
 * Static description of one worker process
 *
 * Loaded once at startup and never modified afterwards.
 */

#include "../config/defaults.hpp"

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mcpgw {
namespace worker {

struct WorkerDescriptor {
    std::string name;                         // routing name, e.g. "binance"
    std::vector<std::string> command;         // argv; command[0] resolved through PATH
    std::chrono::milliseconds timeout{30000}; // per-call deadline
    std::string description;
    std::map<std::string, std::string> env;   // extra environment for the child
    std::string working_dir;                  // empty = inherit
};

/**
 * Validate a descriptor set. Returns one message per problem.
 */
inline std::vector<std::string> validate_descriptors(const std::vector<WorkerDescriptor>& descriptors) {
    std::vector<std::string> errors;
    std::set<std::string> seen;

    if (descriptors.empty()) {
        errors.push_back("No workers configured");
    }

    for (const auto& d : descriptors) {
        if (d.name.empty()) {
            errors.push_back("Worker with empty name");
            continue;
        }
        if (d.name.find("://") != std::string::npos) {
            errors.push_back("Worker name '" + d.name + "' must not contain '://'");
        }
        if (!seen.insert(d.name).second) {
            errors.push_back("Duplicate worker name '" + d.name + "'");
        }
        if (d.command.empty() || d.command[0].empty()) {
            errors.push_back("Worker '" + d.name + "' has no command");
        }
        if (d.timeout.count() <= 0) {
            errors.push_back("Worker '" + d.name + "' timeout must be positive");
        } else if (d.timeout.count() > config::workers::MAX_TIMEOUT_MS) {
            errors.push_back("Worker '" + d.name + "' timeout " + std::to_string(d.timeout.count()) +
                             "ms exceeds the maximum of " + std::to_string(config::workers::MAX_TIMEOUT_MS) + "ms");
        }
    }
    return errors;
}

} // namespace worker
} // namespace mcpgw
