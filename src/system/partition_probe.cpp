#include "system/partition_probe.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <thread>

namespace elemental {

namespace {

using json = nlohmann::json;

constexpr const char* kSysBlock = "/sys/block";
constexpr const char* kUdevData = "/run/udev/data";

std::string JsonString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// Older lsblk releases print numbers and booleans as strings.
std::uint64_t JsonU64(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return 0;
    if (it->is_number_unsigned() || it->is_number_integer()) return it->get<std::uint64_t>();
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

std::string FindDisk(const std::map<std::string, std::string>& parents, const std::string& name) {
    std::string current = name;
    // Bounded walk, lsblk output never nests deeper than a handful of levels.
    for (int depth = 0; depth < 16; ++depth) {
        auto it = parents.find(current);
        if (it == parents.end() || it->second.empty()) return current;
        current = it->second;
    }
    return current;
}

std::map<std::string, std::string> ParseUdevData(const std::string& data) {
    std::map<std::string, std::string> out;
    for (const auto& line : SplitString(data, '\n')) {
        if (!HasPrefix(line, "E:")) continue;
        const std::string kv = line.substr(2);
        const size_t eq = kv.find('=');
        if (eq == std::string::npos) continue;
        out[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return out;
}

std::string Lookup(const std::map<std::string, std::string>& m, const char* key) {
    auto it = m.find(key);
    return it == m.end() ? std::string{} : it->second;
}

} // namespace

PartitionProbe::PartitionProbe(std::shared_ptr<const IRunner> runner,
                               std::shared_ptr<const IFs> fs,
                               std::chrono::milliseconds retry_interval)
    : runner_(std::move(runner)), fs_(std::move(fs)), retry_interval_(retry_interval) {}

Result PartitionProbe::ParseLsblk(const std::string& text, PartitionList& out) {
    out.clear();
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        return Result::Fail(-1, std::string("invalid lsblk output: ") + e.what());
    }
    if (!doc.is_object()) return Result::Fail(-1, "invalid lsblk output: not an object");

    auto devices = doc.find("blockdevices");
    if (devices == doc.end() || devices->is_null()) return Result::Ok();
    if (!devices->is_array()) return Result::Fail(-1, "invalid lsblk output: blockdevices is not a list");

    std::map<std::string, std::string> parents;
    for (const auto& dev : *devices) {
        auto p = std::make_shared<Partition>();
        p->name = JsonString(dev, "name");
        p->filesystem_label = JsonString(dev, "label");
        p->size = JsonU64(dev, "size") / (1024 * 1024);
        p->fs = JsonString(dev, "fstype");
        p->mount_point = JsonString(dev, "mountpoint");
        p->path = JsonString(dev, "path");
        parents[p->name] = JsonString(dev, "pkname");
        out.push_back(std::move(p));
    }
    for (auto& p : out) {
        const std::string disk = FindDisk(parents, p->name);
        if (!disk.empty()) p->disk = JoinPath("/dev", disk);
    }
    return Result::Ok();
}

Result PartitionProbe::GetAllPartitions(PartitionList& out) const {
    std::string output;
    auto r = runner_->Run("lsblk",
                          {"--list", "--bytes", "-o", "NAME,PKNAME,PATH,FSTYPE,MOUNTPOINT,SIZE,RO,LABEL", "-J"},
                          &output);
    if (!r.is_ok()) return r.Context("lsblk failed");
    return ParseLsblk(output, out);
}

PartitionPtr PartitionProbe::GetPartitionViaDM(const std::string& label) const {
    std::vector<DirEntry> devices;
    if (!fs_->ReadDir(kSysBlock, devices).is_ok()) return nullptr;

    for (const auto& dev : devices) {
        if (!HasPrefix(dev.name, "dm-")) continue;
        const std::string dev_dir = JoinPath(kSysBlock, dev.name);

        std::string dev_no;
        if (!fs_->ReadFile(JoinPath(dev_dir, "dev"), dev_no).is_ok() || TrimSpace(dev_no).empty()) continue;

        std::string udev;
        if (!fs_->ReadFile(JoinPath(kUdevData, "b" + TrimSpace(dev_no)), udev).is_ok()) continue;
        const auto info = ParseUdevData(udev);
        if (Lookup(info, "ID_FS_LABEL") != label) continue;

        auto part = std::make_shared<Partition>();
        part->name = Lookup(info, "DM_LV_NAME");
        part->filesystem_label = label;
        part->fs = Lookup(info, "ID_FS_TYPE");
        const std::string dm_name = Lookup(info, "DM_NAME");
        part->path = dm_name.empty() ? JoinPath("/dev/disk/by-label", label) : JoinPath("/dev/mapper", dm_name);

        std::string sectors;
        std::string sector_size;
        if (fs_->ReadFile(JoinPath(dev_dir, "size"), sectors).is_ok() &&
            fs_->ReadFile(JoinPath(dev_dir, "queue", "logical_block_size"), sector_size).is_ok()) {
            try {
                const std::uint64_t bytes = std::stoull(TrimSpace(sectors)) * std::stoull(TrimSpace(sector_size));
                part->size = bytes / (1024 * 1024);
            } catch (const std::exception&) {
                LogDebug("unreadable size for %s", dev_dir.c_str());
            }
        }

        std::vector<DirEntry> slaves;
        if (fs_->ReadDir(JoinPath(dev_dir, "slaves"), slaves).is_ok() && slaves.size() == 1) {
            std::string slave_no;
            if (fs_->ReadFile(JoinPath(dev_dir, "slaves", slaves[0].name, "dev"), slave_no).is_ok() &&
                !TrimSpace(slave_no).empty()) {
                // The parent disk of partition bMAJ:N is bMAJ:0.
                const std::string major = SplitString(TrimSpace(slave_no), ':')[0];
                std::string disk_udev;
                if (fs_->ReadFile(JoinPath(kUdevData, "b" + major + ":0"), disk_udev).is_ok()) {
                    const std::string id_path = Lookup(ParseUdevData(disk_udev), "ID_PATH");
                    std::string disk;
                    if (!id_path.empty() &&
                        fs_->EvalSymlinks(JoinPath("/dev/disk/by-path", id_path), disk).is_ok()) {
                        part->disk = disk;
                    }
                }
            }
        } else {
            LogDebug("no single slave for %s", dev_dir.c_str());
        }

        if (!part->disk.empty()) {
            std::string mounts;
            if (fs_->ReadFile("/proc/mounts", mounts).is_ok()) {
                for (const auto& line : SplitString(mounts, '\n')) {
                    const auto entry = SplitString(line, ' ');
                    if (entry.size() > 1 && entry[0] == part->path) {
                        part->mount_point = entry[1];
                        break;
                    }
                }
            }
        }
        return part;
    }
    return nullptr;
}

PartitionPtr PartitionProbe::FindByLabel(const PartitionList& list, const std::string& label) const {
    auto p = GetPartitionByLabel(list, label);
    if (p) return p;
    return GetPartitionViaDM(label);
}

Result PartitionProbe::GetDeviceByLabel(const std::string& label, int attempts, std::string& out_device) const {
    for (int attempt = 0; attempt < attempts; ++attempt) {
        std::string output;
        auto r = runner_->Run("udevadm", {"trigger"}, &output);
        if (!r.is_ok()) LogDebug("udevadm trigger: %s", r.msg.c_str());
        r = runner_->Run("udevadm", {"settle"}, &output);
        if (!r.is_ok()) LogDebug("udevadm settle: %s", r.msg.c_str());

        PartitionList parts;
        r = GetAllPartitions(parts);
        if (!r.is_ok()) return r;
        auto p = GetPartitionByLabel(parts, label);
        if (p && !p->path.empty()) {
            out_device = p->path;
            return Result::Ok();
        }
        if (attempt + 1 < attempts) std::this_thread::sleep_for(retry_interval_);
    }
    return Result::Fail(-1, "no device found with label " + label);
}

} // namespace elemental
