#include "partition/gpt_table.hpp"

#include "io/fd.hpp"
#include "util/constants.hpp"

#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <uuid/uuid.h>
#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace elemental {

namespace {

constexpr char kGptSignature[] = "EFI PART";
constexpr std::uint32_t kGptRevision = 0x00010000;
constexpr std::uint32_t kGptHeaderSize = 92;
constexpr std::uint64_t kEntryArrayBytes = static_cast<std::uint64_t>(kGptEntryCount) * kGptEntrySize;
constexpr std::uint64_t kEntryArraySectors = kEntryArrayBytes / kSectorSize;
constexpr std::uint64_t kMiB = 1024 * 1024;
constexpr std::size_t kMaxNameUnits = 36;

Guid MustParse(std::string_view text) {
    auto g = ParseGuid(text);
    return g ? *g : Guid{};
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void PutLe16(std::uint8_t* p, std::uint16_t v) {
    p[0] = static_cast<std::uint8_t>(v);
    p[1] = static_cast<std::uint8_t>(v >> 8);
}

void PutLe32(std::uint8_t* p, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

void PutLe64(std::uint8_t* p, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

std::uint16_t GetLe16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t GetLe32(const std::uint8_t* p) {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

std::uint64_t GetLe64(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

// GPT stores the first three GUID fields little endian.
void PutGuid(std::uint8_t* p, const Guid& g) {
    const int order[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};
    for (int i = 0; i < 16; ++i) p[i] = g[order[i]];
}

Guid GetGuid(const std::uint8_t* p) {
    const int order[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};
    Guid g{};
    for (int i = 0; i < 16; ++i) g[order[i]] = p[i];
    return g;
}

std::uint32_t Crc32(const std::uint8_t* data, std::size_t len) {
    return static_cast<std::uint32_t>(::crc32(0L, data, static_cast<uInt>(len)));
}

std::vector<std::uint8_t> EncodeEntries(const GptTable& table) {
    std::vector<std::uint8_t> buf(kEntryArrayBytes, 0);
    for (std::size_t i = 0; i < table.entries.size() && i < kGptEntryCount; ++i) {
        const GptEntry& e = table.entries[i];
        std::uint8_t* p = buf.data() + i * kGptEntrySize;
        PutGuid(p, e.type);
        PutGuid(p + 16, e.unique);
        PutLe64(p + 32, e.first_lba);
        PutLe64(p + 40, e.last_lba);
        PutLe64(p + 48, e.attributes);
        // Names are stored as UTF-16LE, only ASCII is expected here.
        for (std::size_t c = 0; c < e.name.size() && c < kMaxNameUnits; ++c) {
            PutLe16(p + 56 + 2 * c, static_cast<std::uint8_t>(e.name[c]));
        }
    }
    return buf;
}

std::vector<std::uint8_t> EncodeHeader(const GptTable& table,
                                       std::uint64_t current_lba,
                                       std::uint64_t backup_lba,
                                       std::uint64_t entries_lba,
                                       std::uint32_t entries_crc) {
    std::vector<std::uint8_t> buf(kSectorSize, 0);
    std::uint8_t* p = buf.data();
    std::memcpy(p, kGptSignature, 8);
    PutLe32(p + 8, kGptRevision);
    PutLe32(p + 12, kGptHeaderSize);
    PutLe64(p + 24, current_lba);
    PutLe64(p + 32, backup_lba);
    PutLe64(p + 40, table.FirstUsableLba());
    PutLe64(p + 48, table.LastUsableLba());
    PutGuid(p + 56, table.disk_guid);
    PutLe64(p + 72, entries_lba);
    PutLe32(p + 80, kGptEntryCount);
    PutLe32(p + 84, kGptEntrySize);
    PutLe32(p + 88, entries_crc);
    PutLe32(p + 16, Crc32(p, kGptHeaderSize));
    return buf;
}

std::vector<std::uint8_t> EncodeProtectiveMbr(std::uint64_t disk_sectors) {
    std::vector<std::uint8_t> buf(kSectorSize, 0);
    std::uint8_t* entry = buf.data() + 446;
    entry[1] = 0x00;
    entry[2] = 0x02;
    entry[3] = 0x00;
    entry[4] = 0xEE;
    entry[5] = 0xFF;
    entry[6] = 0xFF;
    entry[7] = 0xFF;
    PutLe32(entry + 8, 1);
    const std::uint64_t size = disk_sectors - 1;
    PutLe32(entry + 12, size > 0xFFFFFFFFULL ? 0xFFFFFFFFU : static_cast<std::uint32_t>(size));
    buf[510] = 0x55;
    buf[511] = 0xAA;
    return buf;
}

Result PWriteAll(int fd, const std::vector<std::uint8_t>& data, std::uint64_t offset, const std::string& path) {
    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::pwrite(fd, data.data() + done, data.size() - done,
                                   static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        return Result::FromErrno("failed writing partition table to " + path);
    }
    return Result::Ok();
}

Result PReadAll(int fd, std::vector<std::uint8_t>& data, std::uint64_t offset, const std::string& path) {
    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::pread(fd, data.data() + done, data.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == 0) return Result::Fail(EIO, "short read on " + path);
        return Result::FromErrno("failed reading partition table from " + path);
    }
    return Result::Ok();
}

Guid PartitionType(const Partition& part) {
    if (part.fs == kEfiFs) return kEfiSystemPartitionType;
    if (part.HasFlag(kBiosGrubFlag)) return kBiosBootType;
    return kLinuxFilesystemType;
}

} // namespace

const Guid kEfiSystemPartitionType = MustParse("C12A7328-F81F-11D2-BA4B-00A0C93EC93B");
const Guid kLinuxFilesystemType = MustParse("0FC63DAF-8483-4772-8E79-3D69D8477DE4");
const Guid kBiosBootType = MustParse("21686148-6449-6E6F-744E-656564454649");

std::string GuidToString(const Guid& guid) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[guid[i] >> 4]);
        out.push_back(hex[guid[i] & 0x0F]);
    }
    return out;
}

std::expected<Guid, std::string> ParseGuid(std::string_view text) {
    if (text.size() != 36) return std::unexpected("invalid GUID: " + std::string(text));
    Guid g{};
    std::size_t byte = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return std::unexpected("invalid GUID: " + std::string(text));
            ++i;
            continue;
        }
        const int hi = HexValue(text[i]);
        const int lo = HexValue(text[i + 1]);
        if (hi < 0 || lo < 0) return std::unexpected("invalid GUID: " + std::string(text));
        g[byte++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return g;
}

Guid GuidFromName(std::string_view name) {
    uuid_t out;
    uuid_generate_sha1(out, *uuid_get_template("url"), name.data(), name.size());
    Guid g{};
    std::memcpy(g.data(), out, g.size());
    return g;
}

std::expected<GptTable, std::string> LayoutPartitions(const PartitionList& parts, std::uint64_t disk_bytes) {
    GptTable table;
    table.disk_sectors = disk_bytes / kSectorSize;
    table.disk_guid = GuidFromName(kDiskGuidSeed);
    if (table.disk_sectors < kGptFirstPartitionLba + table.FirstUsableLba()) {
        return std::unexpected("disk is too small for a partition table");
    }
    if (parts.size() > kGptEntryCount) return std::unexpected("too many partitions");

    std::uint64_t start = kGptFirstPartitionLba;
    std::uint64_t used = 0;
    for (const auto& part : parts) {
        if (part->size > disk_bytes / kMiB) {
            return std::unexpected("partition " + part->name + " does not fit on disk");
        }
        std::uint64_t bytes = part->size * kMiB;
        if (part->size == 0) {
            if (disk_bytes <= kMiB + used) return std::unexpected("no space left for partition " + part->name);
            bytes = disk_bytes - (kMiB + used);
        }

        GptEntry e;
        e.type = PartitionType(*part);
        e.unique = GuidFromName(part->filesystem_label.empty() ? part->name : part->filesystem_label);
        e.first_lba = start;
        e.last_lba = start + bytes / kSectorSize - 1;
        e.name = part->name;

        if (e.last_lba > table.LastUsableLba()) {
            if (part->size != 0) {
                return std::unexpected("partition " + part->name + " does not fit on disk");
            }
            e.last_lba = table.LastUsableLba();
        }
        if (e.last_lba < e.first_lba) return std::unexpected("no space left for partition " + part->name);

        table.entries.push_back(e);
        used += bytes;
        start = e.last_lba + 1;
    }
    return table;
}

Result DeviceSize(const std::string& path, std::uint64_t& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) return Result::FromErrno("failed opening " + path);

    struct stat st {};
    if (::fstat(fd.Get(), &st) != 0) return Result::FromErrno("failed to stat " + path);
    if (S_ISBLK(st.st_mode)) {
        std::uint64_t bytes = 0;
        if (::ioctl(fd.Get(), BLKGETSIZE64, &bytes) != 0) return Result::FromErrno("BLKGETSIZE64 " + path);
        out = bytes;
        return Result::Ok();
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result WriteGptTable(const std::string& path, const GptTable& table) {
    Fd fd(::open(path.c_str(), O_RDWR | O_CLOEXEC));
    if (!fd.Valid()) return Result::FromErrno("failed opening " + path);

    const auto entries = EncodeEntries(table);
    const std::uint32_t entries_crc = Crc32(entries.data(), entries.size());
    const std::uint64_t last_lba = table.disk_sectors - 1;
    const std::uint64_t backup_entries_lba = last_lba - kEntryArraySectors;

    const auto primary = EncodeHeader(table, 1, last_lba, 2, entries_crc);
    const auto backup = EncodeHeader(table, last_lba, 1, backup_entries_lba, entries_crc);

    auto r = PWriteAll(fd.Get(), EncodeProtectiveMbr(table.disk_sectors), 0, path);
    if (r.is_ok()) r = PWriteAll(fd.Get(), primary, kSectorSize, path);
    if (r.is_ok()) r = PWriteAll(fd.Get(), entries, 2 * kSectorSize, path);
    if (r.is_ok()) r = PWriteAll(fd.Get(), entries, backup_entries_lba * kSectorSize, path);
    if (r.is_ok()) r = PWriteAll(fd.Get(), backup, last_lba * kSectorSize, path);
    if (!r.is_ok()) return r;
    if (::fsync(fd.Get()) != 0) return Result::FromErrno("fsync " + path);
    return Result::Ok();
}

Result ReadGptTable(const std::string& path, GptTable& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) return Result::FromErrno("failed opening " + path);

    std::vector<std::uint8_t> mbr(kSectorSize);
    std::vector<std::uint8_t> header(kSectorSize);
    auto r = PReadAll(fd.Get(), mbr, 0, path);
    if (r.is_ok()) r = PReadAll(fd.Get(), header, kSectorSize, path);
    if (!r.is_ok()) return r;

    if (mbr[510] != 0x55 || mbr[511] != 0xAA || mbr[446 + 4] != 0xEE) {
        return Result::Fail(EINVAL, "no protective MBR on " + path);
    }
    if (std::memcmp(header.data(), kGptSignature, 8) != 0) {
        return Result::Fail(EINVAL, "no GPT header on " + path);
    }
    const std::uint32_t header_crc = GetLe32(header.data() + 16);
    PutLe32(header.data() + 16, 0);
    if (Crc32(header.data(), kGptHeaderSize) != header_crc) {
        return Result::Fail(EINVAL, "GPT header checksum mismatch on " + path);
    }

    const std::uint64_t entries_lba = GetLe64(header.data() + 72);
    const std::uint32_t count = GetLe32(header.data() + 80);
    const std::uint32_t entry_size = GetLe32(header.data() + 84);
    if (entry_size != kGptEntrySize || count != kGptEntryCount) {
        return Result::Fail(EINVAL, "unsupported GPT entry layout on " + path);
    }
    std::vector<std::uint8_t> entries(kEntryArrayBytes);
    r = PReadAll(fd.Get(), entries, entries_lba * kSectorSize, path);
    if (!r.is_ok()) return r;
    if (Crc32(entries.data(), entries.size()) != GetLe32(header.data() + 88)) {
        return Result::Fail(EINVAL, "GPT entries checksum mismatch on " + path);
    }

    GptTable table;
    table.disk_guid = GetGuid(header.data() + 56);
    table.disk_sectors = GetLe64(header.data() + 32) + 1;
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint8_t* p = entries.data() + static_cast<std::size_t>(i) * kGptEntrySize;
        GptEntry e;
        e.type = GetGuid(p);
        if (e.type == Guid{}) continue;
        e.unique = GetGuid(p + 16);
        e.first_lba = GetLe64(p + 32);
        e.last_lba = GetLe64(p + 40);
        e.attributes = GetLe64(p + 48);
        for (std::size_t c = 0; c < kMaxNameUnits; ++c) {
            const std::uint16_t unit = GetLe16(p + 56 + 2 * c);
            if (unit == 0) break;
            e.name.push_back(static_cast<char>(unit));
        }
        table.entries.push_back(e);
    }
    out = std::move(table);
    return Result::Ok();
}

} // namespace elemental
