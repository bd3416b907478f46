#pragma once

#include "data_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace acti {

struct Gt3xReadOptions {
    bool includeAuxiliary{false};  // light, battery and capsense records
};

// Log record types understood by the decoder.
enum class Gt3xRecordType : std::uint8_t {
    Activity = 0x00,
    Battery = 0x02,
    Lux = 0x05,
    Capsense = 0x0D,
    Activity2 = 0x1A
};

constexpr std::uint8_t kGt3xRecordSeparator = 0x1E;
constexpr double kGt3xDefaultScaleActivity2 = 256.0;
constexpr double kGt3xDefaultScaleActivity = 341.0;

// .NET ticks (100 ns since 0001-01-01) to Unix seconds.
double ticksToUnixSeconds(std::int64_t ticks);

// "[-]HH:MM[:SS]" to seconds.
double parseTimezoneOffset(const std::string& text);

DeviceMetadata parseGt3xInfo(const std::string& infoText, const std::string& label);

// Metadata only; does not decode the sample log.
DeviceMetadata readGt3xMetadata(const std::string& path);

RawSampleSet readGt3x(const std::string& path, const Gt3xReadOptions& options = {});

// Decodes an in-memory log stream against already parsed metadata.
RawSampleSet decodeGt3xLog(const std::vector<std::uint8_t>& log,
                           const DeviceMetadata& metadata,
                           const Gt3xReadOptions& options,
                           const std::string& label);

}  // namespace acti
