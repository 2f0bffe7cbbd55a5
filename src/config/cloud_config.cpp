#include "config/cloud_config.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>

namespace elemental {

namespace {

void MergeInto(YAML::Node dst, const YAML::Node& src) {
    for (auto it = src.begin(); it != src.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        YAML::Node current = dst[key];
        if (it->second.IsMap() && current.IsMap()) {
            MergeInto(current, it->second);
        } else {
            dst[key] = YAML::Clone(it->second);
        }
    }
}

std::expected<YAML::Node, std::string> ParseDocument(std::string_view text, const std::string& origin) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return std::unexpected("invalid yaml in " + origin + ": " + e.what());
    }
    if (doc.IsNull() || !doc.IsDefined()) return YAML::Node(YAML::NodeType::Map);
    if (!doc.IsMap()) return std::unexpected("invalid yaml in " + origin + ": root must be a map");
    return doc;
}

template <typename T>
Result GetIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (!node.IsMap()) return Result::Ok();
    const YAML::Node v = node[key];
    if (!v.IsDefined() || v.IsNull()) return Result::Ok();
    try {
        out = v.as<T>();
    } catch (const YAML::Exception& e) {
        return Result::Fail(-1, std::string("invalid value for ") + key + ": " + e.what());
    }
    return Result::Ok();
}

Result GetSourceIfPresent(const YAML::Node& node, const char* key, ImageSource& out) {
    std::string uri;
    auto r = GetIfPresent(node, key, uri);
    if (!r.is_ok() || uri.empty()) return r;
    auto src = ImageSource::FromUri(uri);
    if (!src) return Result::Fail(-1, "invalid value for " + std::string(key) + ": " + src.error());
    out = std::move(*src);
    return Result::Ok();
}

Result OverlayImage(const YAML::Node& node, Image& img) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsMap()) return Result::Fail(-1, "image settings must be a map");
    for (auto r : {GetIfPresent(node, "label", img.label),
                   GetIfPresent(node, "size", img.size),
                   GetIfPresent(node, "fs", img.fs),
                   GetSourceIfPresent(node, "source", img.source),
                   GetSourceIfPresent(node, "uri", img.source)}) {
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result OverlayPartition(const YAML::Node& node, Partition& part) {
    if (!node.IsMap()) return Result::Fail(-1, "partition settings must be a map");
    for (auto r : {GetIfPresent(node, "name", part.name),
                   GetIfPresent(node, "label", part.filesystem_label),
                   GetIfPresent(node, "size", part.size),
                   GetIfPresent(node, "fs", part.fs),
                   GetIfPresent(node, "flags", part.flags)}) {
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result OverlayPartitions(const YAML::Node& node, ElementalPartitions& parts) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsMap()) return Result::Fail(-1, "partitions must be a map");

    const std::pair<const char*, PartitionPtr*> slots[] = {
        {"oem", &parts.oem},
        {"recovery", &parts.recovery},
        {"state", &parts.state},
        {"persistent", &parts.persistent},
    };
    for (const auto& [key, slot] : slots) {
        const YAML::Node p = node[key];
        if (!p.IsDefined() || p.IsNull()) continue;
        if (!*slot) *slot = std::make_shared<Partition>();
        auto r = OverlayPartition(p, **slot);
        if (!r.is_ok()) return r.Context(std::string("partitions.") + key);
    }
    return Result::Ok();
}

Result OverlayExtraPartitions(const YAML::Node& node, PartitionList& out) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsSequence()) return Result::Fail(-1, "extra-partitions must be a list");
    PartitionList list;
    for (const auto& item : node) {
        auto p = std::make_shared<Partition>();
        auto r = OverlayPartition(item, *p);
        if (!r.is_ok()) return r.Context("extra-partitions");
        list.push_back(std::move(p));
    }
    out = std::move(list);
    return Result::Ok();
}

// Keys shared by the three action blocks.
Result OverlayCommon(const YAML::Node& node,
                     Image& active,
                     std::string& grub_entry,
                     bool& reboot,
                     bool& poweroff,
                     std::vector<std::string>& extra_dirs) {
    for (auto r : {GetIfPresent(node, "grub-entry-name", grub_entry),
                   GetIfPresent(node, "reboot", reboot),
                   GetIfPresent(node, "poweroff", poweroff),
                   GetIfPresent(node, "extra-dirs-rootfs", extra_dirs)}) {
        if (!r.is_ok()) return r;
    }
    auto r = OverlayImage(node["system"], active);
    if (!r.is_ok()) return r.Context("system");
    return Result::Ok();
}

bool HasSizeFactors(const YAML::Node& node) {
    return node.IsDefined() && node.IsMap();
}

} // namespace

CloudConfig::CloudConfig() : root_(YAML::NodeType::Map) {}

std::expected<CloudConfig, std::string> CloudConfig::FromString(std::string_view yaml) {
    auto doc = ParseDocument(yaml, "cloud-config");
    if (!doc) return std::unexpected(doc.error());
    CloudConfig cc;
    cc.root_ = *doc;
    return cc;
}

std::expected<CloudConfig, std::string> CloudConfig::Load(const IFs& fs, const std::vector<std::string>& paths) {
    CloudConfig merged;
    for (const auto& path : paths) {
        std::vector<std::string> files;
        if (fs.IsDir(path)) {
            std::vector<DirEntry> entries;
            auto r = fs.ReadDir(path, entries);
            if (!r.is_ok()) return std::unexpected(r.msg);
            for (const auto& e : entries) {
                if (e.is_dir) continue;
                if (HasSuffix(e.name, ".yaml") || HasSuffix(e.name, ".yml")) files.push_back(JoinPath(path, e.name));
            }
            std::sort(files.begin(), files.end());
        } else if (fs.Exists(path)) {
            files.push_back(path);
        } else {
            LogDebug("cloud-config path %s does not exist", path.c_str());
            continue;
        }

        for (const auto& file : files) {
            std::string text;
            auto r = fs.ReadFile(file, text);
            if (!r.is_ok()) return std::unexpected(r.msg);
            auto doc = ParseDocument(text, file);
            if (!doc) return std::unexpected(doc.error());
            LogDebug("loaded cloud-config %s", file.c_str());
            MergeInto(merged.root_, *doc);
        }
    }
    return merged;
}

void CloudConfig::Merge(const CloudConfig& other) { MergeInto(root_, other.root_); }

YAML::Node CloudConfig::Section(std::string_view name) const {
    const YAML::Node& root = root_;
    return root[std::string(name)];
}

void CloudConfig::SetString(std::string_view section, std::string_view dotted_key, const std::string& value) {
    YAML::Node patch(YAML::NodeType::Map);
    YAML::Node leaf = patch[std::string(section)];
    const auto keys = SplitString(dotted_key, '.');
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        YAML::Node next = leaf[keys[i]];
        leaf.reset(next);
    }
    leaf[keys.back()] = value;
    MergeInto(root_, patch);
}

bool CloudConfig::Has(std::string_view section, std::string_view dotted_key) const {
    YAML::Node node = Section(section);
    for (const auto& key : SplitString(dotted_key, '.')) {
        if (!node.IsDefined() || !node.IsMap()) return false;
        const YAML::Node& cnode = node;
        YAML::Node next = cnode[key];
        if (!next.IsDefined() || next.IsNull()) return false;
        node.reset(next);
    }
    return true;
}

Result ApplyAgentOptions(const CloudConfig& cc, Config& cfg) {
    const YAML::Node& root = cc.Root();

    for (auto r : {GetIfPresent(root, "debug", cfg.debug),
                   GetIfPresent(root, "cosign", cfg.cosign),
                   GetIfPresent(root, "cosign-public-key", cfg.cosign_pub_key),
                   GetIfPresent(root, "squash-no-compression", cfg.squashfs_no_compression),
                   GetIfPresent(root, "squash-compression", cfg.squashfs_compression)}) {
        if (!r.is_ok()) return r;
    }

    std::string platform;
    auto r = GetIfPresent(root, "platform", platform);
    if (!r.is_ok()) return r;
    if (!platform.empty()) {
        auto p = Platform::Parse(platform);
        if (!p) return Result::Fail(-1, p.error());
        cfg.platform = *p;
    }

    const YAML::Node factors = root["size-factors"];
    if (HasSizeFactors(factors)) {
        for (auto fr : {GetIfPresent(factors, "docker", cfg.size_factors.docker),
                        GetIfPresent(factors, "ocifile", cfg.size_factors.oci_file),
                        GetIfPresent(factors, "padding", cfg.size_factors.padding_mb)}) {
            if (!fr.is_ok()) return fr.Context("size-factors");
        }
        if (cfg.size_factors.docker <= 0 || cfg.size_factors.oci_file <= 0) {
            return Result::Fail(-1, "size-factors must be positive");
        }
    }
    return Result::Ok();
}

Result OverlayInstallSpec(const YAML::Node& node, InstallSpec& spec) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsMap()) return Result::Fail(-1, "install settings must be a map");

    for (auto r : {GetIfPresent(node, "device", spec.target),
                   GetIfPresent(node, "firmware", spec.firmware),
                   GetIfPresent(node, "part-table", spec.part_table),
                   GetIfPresent(node, "no-format", spec.no_format),
                   GetIfPresent(node, "force", spec.force),
                   GetIfPresent(node, "iso", spec.iso),
                   GetIfPresent(node, "cloud-init", spec.cloud_init),
                   GetIfPresent(node, "encrypted_partitions", spec.encrypted_partitions)}) {
        if (!r.is_ok()) return r.Context("install");
    }

    auto r = OverlayCommon(node, spec.active, spec.grub_def_entry, spec.reboot, spec.poweroff, spec.extra_dirs_rootfs);
    if (!r.is_ok()) return r.Context("install");
    r = OverlayImage(node["recovery-system"], spec.recovery);
    if (!r.is_ok()) return r.Context("install.recovery-system");
    r = OverlayPartitions(node["partitions"], spec.partitions);
    if (!r.is_ok()) return r.Context("install");
    r = OverlayExtraPartitions(node["extra-partitions"], spec.extra_partitions);
    if (!r.is_ok()) return r.Context("install");
    return Result::Ok();
}

Result OverlayUpgradeSpec(const YAML::Node& node, UpgradeSpec& spec) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsMap()) return Result::Fail(-1, "upgrade settings must be a map");

    auto r = GetIfPresent(node, "recovery", spec.recovery_upgrade);
    if (!r.is_ok()) return r.Context("upgrade");
    r = OverlayCommon(node, spec.active, spec.grub_def_entry, spec.reboot, spec.poweroff, spec.extra_dirs_rootfs);
    if (!r.is_ok()) return r.Context("upgrade");
    r = OverlayImage(node["recovery-system"], spec.recovery);
    if (!r.is_ok()) return r.Context("upgrade.recovery-system");
    return Result::Ok();
}

Result OverlayResetSpec(const YAML::Node& node, ResetSpec& spec) {
    if (!node.IsDefined() || node.IsNull()) return Result::Ok();
    if (!node.IsMap()) return Result::Fail(-1, "reset settings must be a map");

    for (auto r : {GetIfPresent(node, "reset-persistent", spec.format_persistent),
                   GetIfPresent(node, "reset-oem", spec.format_oem)}) {
        if (!r.is_ok()) return r.Context("reset");
    }
    auto r = OverlayCommon(node, spec.active, spec.grub_def_entry, spec.reboot, spec.poweroff, spec.extra_dirs_rootfs);
    if (!r.is_ok()) return r.Context("reset");
    return Result::Ok();
}

} // namespace elemental
