#include "state/install_state_store.hpp"

#include "util/constants.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <ctime>

namespace elemental {

namespace {

constexpr const char* kStateHeader = "# Autogenerated file by elemental-agent, do not edit\n\n";

void EmitIfSet(YAML::Emitter& out, const char* key, const std::string& value) {
    if (value.empty()) return;
    out << YAML::Key << key << YAML::Value << value;
}

std::string ScalarOr(const YAML::Node& node, const char* key) {
    const YAML::Node v = node[key];
    if (!v.IsDefined() || v.IsNull()) return {};
    return v.as<std::string>();
}

ImageState ParseImageState(const YAML::Node& node) {
    ImageState img;
    const std::string uri = ScalarOr(node, "source");
    if (!uri.empty()) {
        auto src = ImageSource::FromUri(uri);
        if (!src) throw YAML::Exception(YAML::Mark::null_mark(), src.error());
        img.source = std::move(*src);
    }
    const YAML::Node meta = node["source-metadata"];
    if (meta.IsDefined() && meta.IsMap()) {
        ImageSourceMetadata m;
        m.digest = ScalarOr(meta, "digest");
        const YAML::Node size = meta["size"];
        if (size.IsDefined() && !size.IsNull()) m.size = size.as<std::int64_t>();
        img.source_metadata = m;
    }
    img.label = ScalarOr(node, "label");
    img.fs = ScalarOr(node, "fs");
    return img;
}

} // namespace

InstallStateStore::InstallStateStore(std::shared_ptr<const IFs> fs) : fs_(std::move(fs)) {}

std::string InstallStateStore::Now() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string InstallStateStore::Serialize(const InstallState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "date" << YAML::Value << YAML::DoubleQuoted << state.date;
    for (const auto& [role, part] : state.partitions) {
        out << YAML::Key << role << YAML::Value << YAML::BeginMap;
        EmitIfSet(out, "label", part.fs_label);
        for (const auto& [img_role, img] : part.images) {
            out << YAML::Key << img_role << YAML::Value << YAML::BeginMap;
            EmitIfSet(out, "source", img.source.String());
            if (img.source_metadata) {
                out << YAML::Key << "source-metadata" << YAML::Value << YAML::BeginMap;
                out << YAML::Key << "digest" << YAML::Value << img.source_metadata->digest;
                out << YAML::Key << "size" << YAML::Value << img.source_metadata->size;
                out << YAML::EndMap;
            }
            EmitIfSet(out, "label", img.label);
            EmitIfSet(out, "fs", img.fs);
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return std::string(kStateHeader) + out.c_str() + "\n";
}

std::expected<InstallState, std::string> InstallStateStore::Parse(std::string_view text) {
    InstallState state;
    try {
        const YAML::Node doc = YAML::Load(std::string(text));
        if (!doc.IsMap()) return std::unexpected("install state is not a map");
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            if (key == "date") {
                state.date = it->second.IsNull() ? std::string() : it->second.as<std::string>();
                continue;
            }
            if (!it->second.IsMap()) return std::unexpected("invalid partition state " + key);

            PartitionState part;
            for (auto img = it->second.begin(); img != it->second.end(); ++img) {
                const std::string img_key = img->first.as<std::string>();
                if (img_key == "label") {
                    part.fs_label = img->second.as<std::string>();
                } else if (img->second.IsMap()) {
                    part.images[img_key] = ParseImageState(img->second);
                }
            }
            state.partitions[key] = std::move(part);
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string("invalid install state: ") + e.what());
    }
    return state;
}

Result InstallStateStore::Write(const InstallState& state, const std::vector<std::string>& paths) const {
    const std::string data = Serialize(state);
    for (const auto& path : paths) {
        LogDebug("writing install state to %s", path.c_str());
        auto r = fs_->MkdirAll(DirName(path));
        if (r.is_ok()) r = fs_->WriteFile(path, data);
        if (!r.is_ok()) return r.Context("failed writing install state");
    }
    return Result::Ok();
}

std::expected<InstallState, std::string> InstallStateStore::Load(const std::string& path) const {
    std::string text;
    auto r = fs_->ReadFile(path, text);
    if (!r.is_ok()) return std::unexpected(r.msg);
    auto state = Parse(text);
    if (!state) return std::unexpected(path + ": " + state.error());
    return state;
}

std::expected<InstallState, std::string> InstallStateStore::LoadDefault() const {
    const std::string primary = JoinPath(kRunningStateDir, kInstallStateFile);
    if (fs_->Exists(primary)) return Load(primary);
    return Load(JoinPath(kIsoScanDir, kInstallStateFile));
}

} // namespace elemental
