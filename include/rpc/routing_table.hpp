#pragma once

/**
 * RoutingTable - externally visible tool name -> owning worker
 *
 * Built once at startup from the tools every worker advertised. A tool
 * name may belong to exactly one worker; a second registration under a
 * different worker is refused instead of overwriting the first.
 */

#include <map>
#include <optional>
#include <string>

namespace mcpgw {
namespace rpc {

class RoutingTable {
public:
    /**
     * Register tool -> worker. Re-registering the same pair is a no-op.
     * Returns false on a conflict and reports the current owner.
     */
    bool add(const std::string& tool, const std::string& worker, std::string* existing_owner = nullptr) {
        auto [it, inserted] = routes_.emplace(tool, worker);
        if (inserted || it->second == worker)
            return true;
        if (existing_owner)
            *existing_owner = it->second;
        return false;
    }

    std::optional<std::string> lookup(const std::string& tool) const {
        auto it = routes_.find(tool);
        if (it == routes_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& tool) const { return routes_.count(tool) != 0; }
    size_t size() const { return routes_.size(); }
    bool empty() const { return routes_.empty(); }
    void clear() { routes_.clear(); }

    const std::map<std::string, std::string>& entries() const { return routes_; }

private:
    std::map<std::string, std::string> routes_;
};

} // namespace rpc
} // namespace mcpgw
