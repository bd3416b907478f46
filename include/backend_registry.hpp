#pragma once

#include "compute_backend.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace acti {

using BackendFactory = std::function<std::unique_ptr<ComputeBackend>()>;

struct BackendInfo {
    std::string id;
    std::string displayName;
    int priority{0};  // lower is preferred
    std::string description;
    bool available{false};
    std::vector<Capability> capabilities;
};

// Read-only table of backends, assembled once through Builder.
class BackendRegistry {
public:
    class Builder {
    public:
        // Throws BackendError when the id is already registered.
        Builder& add(const std::string& id,
                     BackendFactory factory,
                     const std::string& displayName,
                     int priority,
                     const std::string& description,
                     bool available);

        BackendRegistry build() const;

    private:
        std::vector<BackendInfo> infos_;
        std::vector<BackendFactory> factories_;
    };

    // Throws BackendError for unknown or unavailable ids.
    std::unique_ptr<ComputeBackend> create(const std::string& id) const;

    // Available backend with the lowest priority value; ties keep registration order.
    std::unique_ptr<ComputeBackend> create() const;

    std::vector<std::string> ids() const;
    std::vector<std::string> availableBackends() const;
    std::vector<std::string> backendsWithCapability(Capability capability) const;
    bool contains(const std::string& id) const;
    const BackendInfo& info(const std::string& id) const;

private:
    BackendRegistry(std::vector<BackendInfo> infos, std::vector<BackendFactory> factories);

    std::size_t indexOf(const std::string& id) const;

    std::vector<BackendInfo> infos_;
    std::vector<BackendFactory> factories_;
};

// Process-wide registry holding the reference and accelerated backends.
const BackendRegistry& defaultRegistry();

}  // namespace acti
