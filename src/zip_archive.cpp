#include "zip_archive.hpp"

#include "errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace acti {

namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

// Deflate cannot expand its input by more than 1032:1.
constexpr std::size_t kMaxDeflateRatio = 1032;

std::uint16_t readU16(const std::vector<std::uint8_t>& buf, std::size_t pos) {
    return static_cast<std::uint16_t>(buf[pos] | (buf[pos + 1] << 8));
}

std::uint32_t readU32(const std::vector<std::uint8_t>& buf, std::size_t pos) {
    return static_cast<std::uint32_t>(buf[pos]) |
           (static_cast<std::uint32_t>(buf[pos + 1]) << 8) |
           (static_cast<std::uint32_t>(buf[pos + 2]) << 16) |
           (static_cast<std::uint32_t>(buf[pos + 3]) << 24);
}

std::string describe(const std::string& label, std::size_t offset, const std::string& what) {
    std::ostringstream msg;
    msg << "Malformed archive " << label << " at byte " << offset << ": " << what;
    return msg.str();
}

std::vector<std::uint8_t> inflateRaw(const std::uint8_t* data, std::size_t size, std::size_t expected,
                                     const std::string& context) {
    if (expected / kMaxDeflateRatio > size) {
        throw FormatError("Declared size " + std::to_string(expected) + " is impossible for " +
                          std::to_string(size) + " compressed bytes in " + context);
    }
    std::vector<std::uint8_t> out(std::max<std::size_t>(expected, 1));
    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw FormatError("Failed to initialise inflate for " + context);
    }
    int status = inflate(&stream, Z_FINISH);
    std::size_t produced = stream.total_out;
    inflateEnd(&stream);

    if (status != Z_STREAM_END) {
        throw FormatError("Corrupt deflate stream in " + context);
    }
    if (produced != expected) {
        throw FormatError("Unexpected decompressed size in " + context);
    }
    out.resize(produced);
    return out;
}

}  // namespace

ZipArchive::ZipArchive(std::vector<std::uint8_t> bytes, std::string label)
    : bytes_(std::move(bytes)), label_(std::move(label)) {}

ZipArchive ZipArchive::open(const std::string& path) {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FormatError("Failed to open archive: " + path);
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return fromBuffer(std::move(bytes), path);
}

ZipArchive ZipArchive::fromBuffer(std::vector<std::uint8_t> bytes, std::string label) {
    ZipArchive archive(std::move(bytes), std::move(label));
    archive.parseCentralDirectory();
    return archive;
}

void ZipArchive::parseCentralDirectory() {
    if (bytes_.size() < kEndOfCentralDirSize) {
        throw FormatError("Not a ZIP archive (too small): " + label_);
    }

    std::size_t searchEnd = bytes_.size() - kEndOfCentralDirSize;
    std::size_t searchStart = searchEnd > kMaxCommentSize ? searchEnd - kMaxCommentSize : 0;
    std::optional<std::size_t> eocd;
    for (std::size_t pos = searchEnd + 1; pos-- > searchStart;) {
        if (readU32(bytes_, pos) == kEndOfCentralDirSignature) {
            eocd = pos;
            break;
        }
    }
    if (!eocd) {
        throw FormatError("Not a ZIP archive (no end of central directory): " + label_);
    }

    std::uint16_t entryCount = readU16(bytes_, *eocd + 10);
    std::uint32_t dirSize = readU32(bytes_, *eocd + 12);
    std::uint32_t dirOffset = readU32(bytes_, *eocd + 16);
    if (dirOffset == 0xFFFFFFFFu || entryCount == 0xFFFF) {
        throw FormatError("ZIP64 archives are not supported: " + label_);
    }
    if (static_cast<std::size_t>(dirOffset) + dirSize > *eocd) {
        throw FormatError(describe(label_, *eocd, "central directory out of range"));
    }

    entries_.clear();
    entries_.reserve(entryCount);
    std::size_t pos = dirOffset;
    for (std::uint16_t i = 0; i < entryCount; ++i) {
        if (pos + kCentralHeaderSize > bytes_.size() || readU32(bytes_, pos) != kCentralHeaderSignature) {
            throw FormatError(describe(label_, pos, "bad central directory header"));
        }
        Entry entry;
        entry.flags = readU16(bytes_, pos + 8);
        entry.method = readU16(bytes_, pos + 10);
        entry.crc32 = readU32(bytes_, pos + 16);
        entry.compressedSize = readU32(bytes_, pos + 20);
        entry.uncompressedSize = readU32(bytes_, pos + 24);
        std::uint16_t nameLength = readU16(bytes_, pos + 28);
        std::uint16_t extraLength = readU16(bytes_, pos + 30);
        std::uint16_t commentLength = readU16(bytes_, pos + 32);
        entry.localHeaderOffset = readU32(bytes_, pos + 42);

        std::size_t nameStart = pos + kCentralHeaderSize;
        if (nameStart + nameLength > bytes_.size()) {
            throw FormatError(describe(label_, pos, "entry name out of range"));
        }
        entry.name.assign(bytes_.begin() + nameStart, bytes_.begin() + nameStart + nameLength);
        entries_.push_back(entry);
        pos = nameStart + nameLength + extraLength + commentLength;
    }
}

const ZipArchive::Entry* ZipArchive::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

std::size_t ZipArchive::dataOffset(const Entry& entry) const {
    std::size_t pos = entry.localHeaderOffset;
    if (pos + kLocalHeaderSize > bytes_.size() || readU32(bytes_, pos) != kLocalHeaderSignature) {
        throw FormatError(describe(label_, pos, "bad local header for " + entry.name));
    }
    std::uint16_t nameLength = readU16(bytes_, pos + 26);
    std::uint16_t extraLength = readU16(bytes_, pos + 28);
    std::size_t start = pos + kLocalHeaderSize + nameLength + extraLength;
    if (start + entry.compressedSize > bytes_.size()) {
        throw FormatError(describe(label_, pos, "truncated data for " + entry.name));
    }
    return start;
}

std::vector<std::uint8_t> ZipArchive::read(const std::string& name) const {
    const Entry* entry = find(name);
    if (entry == nullptr) {
        throw FormatError("Archive " + label_ + " has no entry " + name);
    }
    if (entry->flags & kFlagEncrypted) {
        throw FormatError("Encrypted entry " + name + " in " + label_);
    }

    std::size_t start = dataOffset(*entry);
    const std::uint8_t* data = bytes_.data() + start;
    std::vector<std::uint8_t> out;
    if (entry->method == kMethodStored) {
        out.assign(data, data + entry->compressedSize);
    } else if (entry->method == kMethodDeflate) {
        out = inflateRaw(data, entry->compressedSize, entry->uncompressedSize, label_ + ":" + name);
    } else {
        throw FormatError("Unsupported compression method " + std::to_string(entry->method) + " for " + name +
                          " in " + label_);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data(), static_cast<uInt>(out.size()));
    if (static_cast<std::uint32_t>(crc) != entry->crc32) {
        throw FormatError("CRC mismatch for " + name + " in " + label_);
    }
    return out;
}

std::string ZipArchive::readText(const std::string& name) const {
    auto bytes = read(name);
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace acti
