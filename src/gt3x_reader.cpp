#include "gt3x_reader.hpp"

#include "errors.hpp"
#include "zip_archive.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace acti {

namespace {

constexpr std::int64_t kTicksAtUnixEpoch = 621355968000000000LL;
constexpr double kTicksPerSecond = 1.0e7;
constexpr std::size_t kRecordHeaderSize = 8;

std::string trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool parseDouble(const std::string& token, double& out) {
    try {
        size_t idx = 0;
        double value = std::stod(token, &idx);
        if (idx != token.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseTicks(const std::string& token, std::int64_t& out) {
    try {
        size_t idx = 0;
        long long value = std::stoll(token, &idx);
        if (idx != token.size()) {
            return false;
        }
        out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::uint16_t readU16(const std::vector<std::uint8_t>& buf, std::size_t pos) {
    return static_cast<std::uint16_t>(buf[pos] | (buf[pos + 1] << 8));
}

std::int16_t readI16(const std::vector<std::uint8_t>& buf, std::size_t pos) {
    return static_cast<std::int16_t>(readU16(buf, pos));
}

std::uint32_t readU32(const std::vector<std::uint8_t>& buf, std::size_t pos) {
    return static_cast<std::uint32_t>(buf[pos]) |
           (static_cast<std::uint32_t>(buf[pos + 1]) << 8) |
           (static_cast<std::uint32_t>(buf[pos + 2]) << 16) |
           (static_cast<std::uint32_t>(buf[pos + 3]) << 24);
}

// 12-bit big-endian field starting at an arbitrary nibble.
int readPacked12(const std::vector<std::uint8_t>& buf, std::size_t start, std::size_t bitOffset) {
    std::size_t byte = start + bitOffset / 8;
    int value = 0;
    if (bitOffset % 8 == 0) {
        value = (buf[byte] << 4) | (buf[byte + 1] >> 4);
    } else {
        value = ((buf[byte] & 0x0F) << 8) | buf[byte + 1];
    }
    if (value > 2047) {
        value -= 4096;
    }
    return value;
}

std::string formatError(const std::string& label, std::size_t offset, const std::string& what) {
    std::ostringstream msg;
    msg << "Malformed log in " << label << " at byte " << offset << ": " << what;
    return msg.str();
}

std::optional<double> optionalTicks(const std::map<std::string, std::string>& raw, const std::string& key) {
    auto it = raw.find(key);
    if (it == raw.end()) {
        return std::nullopt;
    }
    std::int64_t ticks = 0;
    if (!parseTicks(it->second, ticks) || ticks <= 0) {
        return std::nullopt;
    }
    return ticksToUnixSeconds(ticks);
}

std::optional<double> optionalNumber(const std::map<std::string, std::string>& raw, const std::string& key) {
    auto it = raw.find(key);
    double value = 0.0;
    if (it == raw.end() || !parseDouble(it->second, value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

double ticksToUnixSeconds(std::int64_t ticks) {
    return static_cast<double>(ticks - kTicksAtUnixEpoch) / kTicksPerSecond;
}

double parseTimezoneOffset(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("Empty timezone offset");
    }
    double sign = 1.0;
    if (value[0] == '-' || value[0] == '+') {
        sign = value[0] == '-' ? -1.0 : 1.0;
        value = value.substr(1);
    }
    std::istringstream ss(value);
    std::string part;
    double multipliers[3] = {3600.0, 60.0, 1.0};
    double seconds = 0.0;
    int index = 0;
    while (std::getline(ss, part, ':')) {
        double number = 0.0;
        if (index >= 3 || !parseDouble(part, number)) {
            throw std::invalid_argument("Invalid timezone offset: " + text);
        }
        seconds += number * multipliers[index++];
    }
    return sign * seconds;
}

DeviceMetadata parseGt3xInfo(const std::string& infoText, const std::string& label) {
    DeviceMetadata meta;
    std::istringstream lines(infoText);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, colon));
        if (!key.empty()) {
            meta.raw[key] = trim(line.substr(colon + 1));
        }
    }

    auto require = [&](const std::string& key) -> const std::string& {
        auto it = meta.raw.find(key);
        if (it == meta.raw.end() || it->second.empty()) {
            throw FormatError("Metadata in " + label + " is missing '" + key + "'");
        }
        return it->second;
    };

    if (!parseDouble(require("Sample Rate"), meta.sampleRate) || meta.sampleRate <= 0.0) {
        throw FormatError("Invalid sample rate in " + label + ": " + meta.raw["Sample Rate"]);
    }
    std::int64_t startTicks = 0;
    if (!parseTicks(require("Start Date"), startTicks)) {
        throw FormatError("Invalid start date in " + label + ": " + meta.raw["Start Date"]);
    }
    meta.startTime = ticksToUnixSeconds(startTicks);

    meta.serialNumber = meta.raw.count("Serial Number") ? meta.raw["Serial Number"] : "";
    meta.deviceType = meta.raw.count("Device Type") ? meta.raw["Device Type"] : "";
    meta.firmware = meta.raw.count("Firmware") ? meta.raw["Firmware"] : "";
    meta.stopTime = optionalTicks(meta.raw, "Stop Date");
    meta.lastSampleTime = optionalTicks(meta.raw, "Last Sample Time");
    meta.downloadTime = optionalTicks(meta.raw, "Download Date");
    meta.accelerationMin = optionalNumber(meta.raw, "Acceleration Min");
    meta.accelerationMax = optionalNumber(meta.raw, "Acceleration Max");

    auto tz = meta.raw.find("TimeZone");
    if (tz != meta.raw.end() && !tz->second.empty()) {
        try {
            meta.timezoneOffsetSeconds = parseTimezoneOffset(tz->second);
        } catch (const std::invalid_argument& ex) {
            throw FormatError(std::string(ex.what()) + " in " + label);
        }
    }

    auto scale = optionalNumber(meta.raw, "Acceleration Scale");
    if (scale && *scale > 0.0) {
        meta.accelerationScale = *scale;
    }
    return meta;
}

DeviceMetadata readGt3xMetadata(const std::string& path) {
    ZipArchive archive = ZipArchive::open(path);
    if (!archive.contains("info.txt")) {
        throw FormatError("Not a GT3X file (missing info.txt): " + path);
    }
    return parseGt3xInfo(archive.readText("info.txt"), path);
}

RawSampleSet readGt3x(const std::string& path, const Gt3xReadOptions& options) {
    ZipArchive archive = ZipArchive::open(path);
    if (!archive.contains("info.txt")) {
        throw FormatError("Not a GT3X file (missing info.txt): " + path);
    }
    if (!archive.contains("log.bin")) {
        throw FormatError("Not a GT3X file (missing log.bin): " + path);
    }
    DeviceMetadata meta = parseGt3xInfo(archive.readText("info.txt"), path);
    return decodeGt3xLog(archive.read("log.bin"), meta, options, path);
}

RawSampleSet decodeGt3xLog(const std::vector<std::uint8_t>& log,
                           const DeviceMetadata& metadata,
                           const Gt3xReadOptions& options,
                           const std::string& label) {
    RawSampleSet out;
    out.sampleRate = metadata.sampleRate;
    out.metadata = metadata;
    if (options.includeAuxiliary) {
        out.light = AuxiliaryChannel{};
        out.battery = AuxiliaryChannel{};
        out.capsense = CapsenseChannel{};
    }

    double luxScale = optionalNumber(metadata.raw, "Lux Scale Factor").value_or(1.0);
    std::optional<double> luxMax = optionalNumber(metadata.raw, "Lux Max Value");
    double sampleRate = metadata.sampleRate;

    auto resolveScale = [&](double fallback) {
        if (out.metadata->accelerationScale > 0.0) {
            return out.metadata->accelerationScale;
        }
        out.metadata->accelerationScale = fallback;
        out.metadata->raw["scale_source"] = "default";
        return fallback;
    };

    std::size_t pos = 0;
    while (pos < log.size()) {
        if (log[pos] != kGt3xRecordSeparator) {
            throw FormatError(formatError(label, pos, "expected record separator"));
        }
        if (pos + kRecordHeaderSize > log.size()) {
            throw FormatError(formatError(label, pos, "truncated record header"));
        }
        auto type = log[pos + 1];
        double recordTime = static_cast<double>(readU32(log, pos + 2));
        std::size_t size = readU16(log, pos + 6);
        std::size_t payload = pos + kRecordHeaderSize;
        if (payload + size + 1 > log.size()) {
            throw FormatError(formatError(label, pos, "truncated record payload"));
        }

        std::uint8_t checksum = 0;
        for (std::size_t i = pos; i < payload + size; ++i) {
            checksum ^= log[i];
        }
        checksum = static_cast<std::uint8_t>(~checksum);
        if (checksum != log[payload + size]) {
            throw FormatError(formatError(label, pos, "checksum mismatch"));
        }

        switch (static_cast<Gt3xRecordType>(type)) {
            case Gt3xRecordType::Activity2: {
                double scale = resolveScale(kGt3xDefaultScaleActivity2);
                std::size_t count = size / 6;
                for (std::size_t i = 0; i < count; ++i) {
                    std::size_t p = payload + i * 6;
                    out.x.push_back(readI16(log, p) / scale);
                    out.y.push_back(readI16(log, p + 2) / scale);
                    out.z.push_back(readI16(log, p + 4) / scale);
                    out.timestamps.push_back(recordTime + static_cast<double>(i) / sampleRate);
                }
                break;
            }
            case Gt3xRecordType::Activity: {
                double scale = resolveScale(kGt3xDefaultScaleActivity);
                std::size_t count = size * 8 / 36;
                for (std::size_t i = 0; i < count; ++i) {
                    std::size_t bit = i * 36;
                    // Packed order is y, x, z.
                    out.y.push_back(readPacked12(log, payload, bit) / scale);
                    out.x.push_back(readPacked12(log, payload, bit + 12) / scale);
                    out.z.push_back(readPacked12(log, payload, bit + 24) / scale);
                    out.timestamps.push_back(recordTime + static_cast<double>(i) / sampleRate);
                }
                break;
            }
            case Gt3xRecordType::Lux:
                if (options.includeAuxiliary && size >= 2) {
                    double lux = readU16(log, payload) * luxScale;
                    if (luxMax) {
                        lux = std::min(lux, *luxMax);
                    }
                    out.light->timestamps.push_back(recordTime);
                    out.light->values.push_back(lux);
                }
                break;
            case Gt3xRecordType::Battery:
                if (options.includeAuxiliary && size >= 2) {
                    out.battery->timestamps.push_back(recordTime);
                    out.battery->values.push_back(readU16(log, payload) / 1000.0);
                }
                break;
            case Gt3xRecordType::Capsense:
                if (options.includeAuxiliary && size >= 6) {
                    out.capsense->timestamps.push_back(recordTime);
                    out.capsense->signal.push_back(readU16(log, payload));
                    out.capsense->reference.push_back(readU16(log, payload + 2));
                    out.capsense->state.push_back(log[payload + 4]);
                    out.capsense->bursts.push_back(log[payload + 5]);
                }
                break;
            default:
                break;
        }
        pos = payload + size + 1;
    }

    return out;
}

}  // namespace acti
