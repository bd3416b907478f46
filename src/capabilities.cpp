#include "capabilities.hpp"

#include <array>

namespace acti {

namespace {

const std::array<const char*, kCapabilityCount> kNames = {
    "parse_gt3x",
    "parse_gt3x_metadata",
    "parse_gt3x_sensors",
    "calibration",
    "imputation",
    "epoching",
    "enmo",
    "angles",
    "lfenmo",
    "hfen",
    "bfen",
    "hfenplus",
    "sadeh",
    "cole_kripke",
    "van_hees_sib",
    "hdcza",
    "sleep_period_metrics",
    "sleep_period_detection",
    "van_hees_nonwear",
    "choi_nonwear",
    "capsense_nonwear",
    "nonwear_overlap",
    "m5l5",
    "ivis",
    "sri",
    "cohens_kappa",
    "parallel_processing",
};

}  // namespace

std::string capabilityName(Capability capability) {
    auto index = static_cast<std::size_t>(capability);
    if (index >= kCapabilityCount) {
        return "unknown";
    }
    return kNames[index];
}

std::optional<Capability> parseCapability(const std::string& name) {
    for (std::size_t i = 0; i < kCapabilityCount; ++i) {
        if (name == kNames[i]) {
            return static_cast<Capability>(i);
        }
    }
    return std::nullopt;
}

std::vector<Capability> allCapabilities() {
    std::vector<Capability> result;
    result.reserve(kCapabilityCount);
    for (std::size_t i = 0; i < kCapabilityCount; ++i) {
        result.push_back(static_cast<Capability>(i));
    }
    return result;
}

CapabilitySet::CapabilitySet(std::initializer_list<Capability> capabilities) {
    for (Capability c : capabilities) {
        set(c);
    }
}

CapabilitySet& CapabilitySet::set(Capability capability) {
    bits_.set(static_cast<std::size_t>(capability));
    return *this;
}

CapabilitySet& CapabilitySet::reset(Capability capability) {
    bits_.reset(static_cast<std::size_t>(capability));
    return *this;
}

bool CapabilitySet::test(Capability capability) const {
    auto index = static_cast<std::size_t>(capability);
    return index < kCapabilityCount && bits_.test(index);
}

std::vector<Capability> CapabilitySet::list() const {
    std::vector<Capability> result;
    for (std::size_t i = 0; i < kCapabilityCount; ++i) {
        if (bits_.test(i)) {
            result.push_back(static_cast<Capability>(i));
        }
    }
    return result;
}

CapabilitySet CapabilitySet::all() {
    CapabilitySet set;
    set.bits_.set();
    return set;
}

}  // namespace acti
