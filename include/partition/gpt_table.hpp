#pragma once

#include "types/partition.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

inline constexpr std::uint64_t kSectorSize = 512;
inline constexpr std::uint64_t kGptFirstPartitionLba = 2048;
inline constexpr std::uint32_t kGptEntryCount = 128;
inline constexpr std::uint32_t kGptEntrySize = 128;

// RFC 4122 byte order.
using Guid = std::array<std::uint8_t, 16>;

std::string GuidToString(const Guid& guid);
std::expected<Guid, std::string> ParseGuid(std::string_view text);
// Name based (v5) GUID in the URL namespace.
Guid GuidFromName(std::string_view name);

extern const Guid kEfiSystemPartitionType;
extern const Guid kLinuxFilesystemType;
extern const Guid kBiosBootType;

struct GptEntry {
    Guid type{};
    Guid unique{};
    std::uint64_t first_lba = 0;
    std::uint64_t last_lba = 0;
    std::uint64_t attributes = 0;
    std::string name;

    bool operator==(const GptEntry&) const = default;
};

struct GptTable {
    Guid disk_guid{};
    std::uint64_t disk_sectors = 0;
    std::vector<GptEntry> entries;

    std::uint64_t FirstUsableLba() const { return 34; }
    std::uint64_t LastUsableLba() const { return disk_sectors - 34; }
};

// Places `parts` one after another from sector 2048. A zero sized
// partition takes the rest of the disk.
std::expected<GptTable, std::string> LayoutPartitions(const PartitionList& parts, std::uint64_t disk_bytes);

// Size of a regular file or block device in bytes.
Result DeviceSize(const std::string& path, std::uint64_t& out);

// Writes the protective MBR, both headers and both entry arrays.
Result WriteGptTable(const std::string& path, const GptTable& table);
// Reads and verifies the primary header and its entries.
Result ReadGptTable(const std::string& path, GptTable& out);

} // namespace elemental
