#include "backend_registry.hpp"

#include "accelerated_backend.hpp"
#include "errors.hpp"
#include "reference_backend.hpp"

#include <utility>

namespace acti {

namespace {

constexpr std::size_t kNotFound = static_cast<std::size_t>(-1);

std::string joinIds(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return "none";
    }
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += ids[i];
    }
    return out;
}

}  // namespace

BackendRegistry::Builder& BackendRegistry::Builder::add(const std::string& id,
                                                        BackendFactory factory,
                                                        const std::string& displayName,
                                                        int priority,
                                                        const std::string& description,
                                                        bool available) {
    for (const auto& info : infos_) {
        if (info.id == id) {
            throw BackendError("Backend '" + id + "' is already registered");
        }
    }
    if (!factory) {
        throw BackendError("Backend '" + id + "' has no factory");
    }
    BackendInfo info;
    info.id = id;
    info.displayName = displayName;
    info.priority = priority;
    info.description = description;
    info.available = available;
    infos_.push_back(std::move(info));
    factories_.push_back(std::move(factory));
    return *this;
}

BackendRegistry BackendRegistry::Builder::build() const {
    std::vector<BackendInfo> infos = infos_;
    for (std::size_t i = 0; i < infos.size(); ++i) {
        std::unique_ptr<ComputeBackend> sample = factories_[i]();
        if (!sample) {
            throw BackendError("Backend '" + infos[i].id + "' factory returned nothing");
        }
        infos[i].capabilities = sample->capabilities().list();
    }
    return BackendRegistry(std::move(infos), factories_);
}

BackendRegistry::BackendRegistry(std::vector<BackendInfo> infos, std::vector<BackendFactory> factories)
    : infos_(std::move(infos)), factories_(std::move(factories)) {}

std::size_t BackendRegistry::indexOf(const std::string& id) const {
    for (std::size_t i = 0; i < infos_.size(); ++i) {
        if (infos_[i].id == id) {
            return i;
        }
    }
    return kNotFound;
}

std::unique_ptr<ComputeBackend> BackendRegistry::create(const std::string& id) const {
    std::size_t index = indexOf(id);
    if (index == kNotFound) {
        throw BackendError("Unknown backend '" + id + "'. Available: " + joinIds(availableBackends()));
    }
    if (!infos_[index].available) {
        throw BackendError("Backend '" + id + "' is registered but not available (missing dependencies)");
    }
    return factories_[index]();
}

std::unique_ptr<ComputeBackend> BackendRegistry::create() const {
    std::size_t best = kNotFound;
    for (std::size_t i = 0; i < infos_.size(); ++i) {
        if (!infos_[i].available) {
            continue;
        }
        if (best == kNotFound || infos_[i].priority < infos_[best].priority) {
            best = i;
        }
    }
    if (best == kNotFound) {
        throw BackendError("No backends available");
    }
    return factories_[best]();
}

std::vector<std::string> BackendRegistry::ids() const {
    std::vector<std::string> out;
    for (const auto& info : infos_) {
        out.push_back(info.id);
    }
    return out;
}

std::vector<std::string> BackendRegistry::availableBackends() const {
    std::vector<std::string> out;
    for (const auto& info : infos_) {
        if (info.available) {
            out.push_back(info.id);
        }
    }
    return out;
}

std::vector<std::string> BackendRegistry::backendsWithCapability(Capability capability) const {
    std::vector<std::string> out;
    for (const auto& info : infos_) {
        if (!info.available) {
            continue;
        }
        for (Capability c : info.capabilities) {
            if (c == capability) {
                out.push_back(info.id);
                break;
            }
        }
    }
    return out;
}

bool BackendRegistry::contains(const std::string& id) const {
    return indexOf(id) != kNotFound;
}

const BackendInfo& BackendRegistry::info(const std::string& id) const {
    std::size_t index = indexOf(id);
    if (index == kNotFound) {
        throw BackendError("Unknown backend '" + id + "'. Available: " + joinIds(availableBackends()));
    }
    return infos_[index];
}

const BackendRegistry& defaultRegistry() {
    static const BackendRegistry registry =
        BackendRegistry::Builder()
            .add("accelerated",
                 []() { return std::make_unique<AcceleratedBackend>(); },
                 "Accelerated (multi-threaded)",
                 10,
                 "Threaded metrics and calibration features",
                 AcceleratedBackend::compiledIn())
            .add("reference",
                 []() { return std::make_unique<ReferenceBackend>(); },
                 "Reference (portable)",
                 50,
                 "Single-threaded implementation of every algorithm",
                 true)
            .build();
    return registry;
}

}  // namespace acti
