#pragma once

// In-memory builders for .gt3x archives used by the reader and pipeline tests.

#include <zlib.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace acti::fixture {

using Bytes = std::vector<std::uint8_t>;

struct ZipEntrySpec {
    std::string name;
    Bytes data;
    bool deflate{false};
};

inline void putU16(Bytes& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

inline void putU32(Bytes& out, std::uint32_t v) {
    putU16(out, v & 0xFFFF);
    putU16(out, (v >> 16) & 0xFFFF);
}

inline Bytes toBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline Bytes deflateRaw(const Bytes& input) {
    z_stream stream{};
    deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    Bytes out(deflateBound(&stream, static_cast<uLong>(input.size())) + 16);
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());
    deflate(&stream, Z_FINISH);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

inline std::uint32_t crcOf(const Bytes& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

inline Bytes buildZip(const std::vector<ZipEntrySpec>& entries) {
    Bytes out;
    Bytes central;
    for (const auto& e : entries) {
        Bytes payload = e.deflate ? deflateRaw(e.data) : e.data;
        std::uint32_t crc = crcOf(e.data);
        std::uint16_t method = e.deflate ? 8 : 0;
        auto offset = static_cast<std::uint32_t>(out.size());

        putU32(out, 0x04034b50);
        putU16(out, 20);
        putU16(out, 0);
        putU16(out, method);
        putU16(out, 0);
        putU16(out, 0);
        putU32(out, crc);
        putU32(out, static_cast<std::uint32_t>(payload.size()));
        putU32(out, static_cast<std::uint32_t>(e.data.size()));
        putU16(out, static_cast<std::uint32_t>(e.name.size()));
        putU16(out, 0);
        out.insert(out.end(), e.name.begin(), e.name.end());
        out.insert(out.end(), payload.begin(), payload.end());

        putU32(central, 0x02014b50);
        putU16(central, 20);
        putU16(central, 20);
        putU16(central, 0);
        putU16(central, method);
        putU16(central, 0);
        putU16(central, 0);
        putU32(central, crc);
        putU32(central, static_cast<std::uint32_t>(payload.size()));
        putU32(central, static_cast<std::uint32_t>(e.data.size()));
        putU16(central, static_cast<std::uint32_t>(e.name.size()));
        putU16(central, 0);
        putU16(central, 0);
        putU16(central, 0);
        putU16(central, 0);
        putU32(central, 0);
        putU32(central, offset);
        central.insert(central.end(), e.name.begin(), e.name.end());
    }

    auto centralOffset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());
    putU32(out, 0x06054b50);
    putU16(out, 0);
    putU16(out, 0);
    putU16(out, static_cast<std::uint32_t>(entries.size()));
    putU16(out, static_cast<std::uint32_t>(entries.size()));
    putU32(out, static_cast<std::uint32_t>(central.size()));
    putU32(out, centralOffset);
    putU16(out, 0);
    return out;
}

inline std::int64_t unixToTicks(double seconds) {
    return 621355968000000000LL + static_cast<std::int64_t>(std::llround(seconds * 1.0e7));
}

inline std::string infoText(double sampleRate, double startUnix, double scale = 256.0) {
    std::ostringstream info;
    info << "Serial Number: MOS2E00000001\n"
         << "Device Type: wGT3XBT\n"
         << "Firmware: 1.9.2\n"
         << "Sample Rate: " << sampleRate << "\n"
         << "Start Date: " << unixToTicks(startUnix) << "\n"
         << "Download Date: " << unixToTicks(startUnix + 86400.0) << "\n"
         << "TimeZone: -05:00:00\n";
    if (scale > 0.0) {
        info << "Acceleration Scale: " << scale << "\n";
    }
    info << "Acceleration Min: -8.0\n"
         << "Acceleration Max: 8.0\n";
    return info.str();
}

inline Bytes record(std::uint8_t type, std::uint32_t timestamp, const Bytes& payload) {
    Bytes out;
    out.push_back(0x1E);
    out.push_back(type);
    putU32(out, timestamp);
    putU16(out, static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    std::uint8_t checksum = 0;
    for (std::uint8_t b : out) {
        checksum ^= b;
    }
    out.push_back(static_cast<std::uint8_t>(~checksum));
    return out;
}

// ACTIVITY2 payload: int16 LE x, y, z per sample, in counts.
inline Bytes activity2Payload(const std::vector<std::array<int, 3>>& samples) {
    Bytes out;
    for (const auto& s : samples) {
        for (int v : s) {
            putU16(out, static_cast<std::uint16_t>(static_cast<std::int16_t>(v)));
        }
    }
    return out;
}

// ACTIVITY payload: 12-bit big-endian fields packed in y, x, z order.
inline Bytes activityPayload(const std::vector<std::array<int, 3>>& samples) {
    std::vector<int> fields;
    for (const auto& s : samples) {
        fields.push_back(s[1]);
        fields.push_back(s[0]);
        fields.push_back(s[2]);
    }
    std::size_t bits = fields.size() * 12;
    Bytes out((bits + 7) / 8, 0);
    for (std::size_t f = 0; f < fields.size(); ++f) {
        auto v = static_cast<std::uint16_t>(fields[f] & 0x0FFF);
        std::size_t bit = f * 12;
        std::size_t byte = bit / 8;
        if (bit % 8 == 0) {
            out[byte] = static_cast<std::uint8_t>(v >> 4);
            out[byte + 1] |= static_cast<std::uint8_t>((v & 0x0F) << 4);
        } else {
            out[byte] |= static_cast<std::uint8_t>(v >> 8);
            out[byte + 1] = static_cast<std::uint8_t>(v & 0xFF);
        }
    }
    return out;
}

inline Bytes u16Payload(std::uint16_t value) {
    Bytes out;
    putU16(out, value);
    return out;
}

inline Bytes capsensePayload(std::uint16_t signal, std::uint16_t reference, std::uint8_t state, std::uint8_t bursts) {
    Bytes out;
    putU16(out, signal);
    putU16(out, reference);
    out.push_back(state);
    out.push_back(bursts);
    return out;
}

// One ACTIVITY2 record per second holding the same sample.
inline Bytes constantActivity2Log(std::uint32_t startUnix, std::size_t seconds, int sampleRate,
                                  std::array<int, 3> sample) {
    Bytes log;
    std::vector<std::array<int, 3>> samples(static_cast<std::size_t>(sampleRate), sample);
    Bytes payload = activity2Payload(samples);
    for (std::size_t s = 0; s < seconds; ++s) {
        Bytes r = record(0x1A, startUnix + static_cast<std::uint32_t>(s), payload);
        log.insert(log.end(), r.begin(), r.end());
    }
    return log;
}

// Writes bytes to a file under the temp directory and removes it on scope exit.
class TempFile {
public:
    TempFile(const std::string& name, const Bytes& bytes)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline Bytes gt3xArchive(const std::string& info, const Bytes& log, bool deflate = false) {
    return buildZip({{"info.txt", toBytes(info), deflate}, {"log.bin", log, deflate}});
}

}  // namespace acti::fixture
