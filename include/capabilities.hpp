#pragma once

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace acti {

enum class Capability : std::size_t {
    // Parsing
    ParseGt3x,
    ParseGt3xMetadata,
    ParseGt3xSensors,
    // Preprocessing
    Calibration,
    Imputation,
    Epoching,
    // Metrics
    Enmo,
    Angles,
    Lfenmo,
    Hfen,
    Bfen,
    HfenPlus,
    // Sleep
    Sadeh,
    ColeKripke,
    VanHeesSib,
    Hdcza,
    SleepPeriodMetrics,
    SleepPeriodDetection,
    // Nonwear
    VanHeesNonwear,
    ChoiNonwear,
    CapsenseNonwear,
    NonwearOverlap,
    // Circadian and agreement
    M5L5,
    Ivis,
    Sri,
    CohensKappa,
    // Batch
    ParallelProcessing,

    Count
};

constexpr std::size_t kCapabilityCount = static_cast<std::size_t>(Capability::Count);

std::string capabilityName(Capability capability);
std::optional<Capability> parseCapability(const std::string& name);
std::vector<Capability> allCapabilities();

class CapabilitySet {
public:
    CapabilitySet() = default;
    CapabilitySet(std::initializer_list<Capability> capabilities);

    CapabilitySet& set(Capability capability);
    CapabilitySet& reset(Capability capability);
    bool test(Capability capability) const;
    std::size_t count() const { return bits_.count(); }
    std::vector<Capability> list() const;

    static CapabilitySet all();

private:
    std::bitset<kCapabilityCount> bits_;
};

}  // namespace acti
