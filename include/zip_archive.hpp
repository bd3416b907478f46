#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace acti {

// Read-only view of a ZIP container. Supports stored and deflated entries.
class ZipArchive {
public:
    struct Entry {
        std::string name;
        std::uint16_t method{0};
        std::uint16_t flags{0};
        std::uint32_t crc32{0};
        std::uint32_t compressedSize{0};
        std::uint32_t uncompressedSize{0};
        std::uint32_t localHeaderOffset{0};
    };

    // Throws FileNotFoundError or FormatError.
    static ZipArchive open(const std::string& path);
    static ZipArchive fromBuffer(std::vector<std::uint8_t> bytes, std::string label);

    const std::vector<Entry>& entries() const { return entries_; }
    const Entry* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Decompressed, CRC-checked contents of an entry.
    std::vector<std::uint8_t> read(const std::string& name) const;
    std::string readText(const std::string& name) const;

    const std::string& label() const { return label_; }

private:
    ZipArchive(std::vector<std::uint8_t> bytes, std::string label);

    void parseCentralDirectory();
    std::size_t dataOffset(const Entry& entry) const;

    std::vector<std::uint8_t> bytes_;
    std::string label_;
    std::vector<Entry> entries_;
};

}  // namespace acti
