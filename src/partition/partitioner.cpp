#include "partition/partitioner.hpp"

#include "partition/gpt_table.hpp"
#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <linux/fs.h>

#include <cerrno>
#include <fcntl.h>

namespace elemental {

Partitioner::Partitioner(Config cfg) : cfg_(std::move(cfg)) {}

Result Partitioner::FormatDevice(const std::string& device, const std::string& fs, const std::string& label) const {
    std::string cmd;
    std::vector<std::string> args;
    if (fs == "ext2" || fs == "ext3" || fs == "ext4") {
        cmd = "mkfs." + fs;
        args = {"-F"};
        if (!label.empty()) args.insert(args.end(), {"-L", label});
    } else if (fs == "xfs" || fs == "btrfs") {
        cmd = "mkfs." + fs;
        args = {"-f"};
        if (!label.empty()) args.insert(args.end(), {"-L", label});
    } else if (fs == "vfat") {
        cmd = "mkfs.vfat";
        if (!label.empty()) args = {"-n", label};
    } else {
        return Result::Fail(-1, "unsupported filesystem: " + fs);
    }
    args.push_back(device);
    LogDebug("formatting %s as %s", device.c_str(), fs.c_str());
    return cfg_.runner->Run(cmd, args);
}

Result Partitioner::FormatPartition(const Partition& part) const {
    LogInfo("formatting %s partition (%s)", part.name.c_str(), part.path.c_str());
    return FormatDevice(part.path, part.fs, part.filesystem_label).Context("failed formatting " + part.name);
}

Result Partitioner::RereadPartitionTable(const std::string& device) const {
    int fd = -1;
    auto r = cfg_.syscall->Open(device, O_RDONLY | O_CLOEXEC, fd);
    if (!r.is_ok()) return r;
    r = cfg_.syscall->Ioctl(fd, BLKRRPART, 0);
    auto close_r = cfg_.syscall->Close(fd);
    if (!r.is_ok()) return r.Context("failed re-reading partition table of " + device);
    return close_r;
}

void Partitioner::SettleUdev() const {
    auto r = cfg_.runner->Run("udevadm", {"trigger"});
    if (!r.is_ok()) LogWarn("udevadm trigger failed: %s", r.msg.c_str());
    r = cfg_.runner->Run("udevadm", {"settle"});
    if (!r.is_ok()) LogWarn("udevadm settle failed: %s", r.msg.c_str());
}

Result Partitioner::PartitionAndFormatDevice(InstallSpec& spec) const {
    if (!cfg_.fs->Exists(spec.target)) return Result::Fail(ENOENT, "disk " + spec.target + " does not exist");
    if (spec.part_table != kGpt) return Result::Fail(-1, "invalid partition type: " + spec.part_table);

    const PartitionList parts = spec.partitions.PartitionsByInstallOrder(spec.extra_partitions);
    const std::string raw = cfg_.fs->RawPath(spec.target);

    std::uint64_t disk_bytes = 0;
    auto r = DeviceSize(raw, disk_bytes);
    if (!r.is_ok()) return r;

    auto table = LayoutPartitions(parts, disk_bytes);
    if (!table) return Result::Fail(-1, "failed partitioning " + spec.target + ": " + table.error());

    LogInfo("writing partition table to %s", spec.target.c_str());
    r = WriteGptTable(raw, *table);
    if (!r.is_ok()) return r;

    if (IsDevPath(spec.target)) {
        r = RereadPartitionTable(spec.target);
        if (!r.is_ok()) return r;
    }
    cfg_.syscall->Sync();
    SettleUdev();

    for (const auto& part : parts) {
        if (part->HasFlag(kBiosGrubFlag)) continue;

        const std::string link = JoinPath("/dev/disk/by-partlabel", part->name);
        std::string device;
        r = cfg_.fs->EvalSymlinks(link, device);
        if (!r.is_ok()) return r.Context("could not find device of partition " + part->name);
        part->path = device;
        part->disk = spec.target;

        if (part->fs.empty()) continue;
        r = FormatPartition(*part);
        if (!r.is_ok()) return r;
    }
    cfg_.syscall->Sync();
    return Result::Ok();
}

} // namespace elemental
