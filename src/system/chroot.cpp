#include "system/chroot.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <fcntl.h>
#include <filesystem>

namespace elemental {

Chroot::Chroot(std::string path,
               std::shared_ptr<const IMounter> mounter,
               std::shared_ptr<const ISyscall> syscall,
               std::shared_ptr<const IFs> fs)
    : path_(std::move(path)),
      default_mounts_{"/dev", "/dev/pts", "/proc", "/sys"},
      mounter_(std::move(mounter)),
      syscall_(std::move(syscall)),
      fs_(std::move(fs)) {}

Chroot::~Chroot() {
    if (active_mounts_.empty()) return;
    auto r = Close();
    if (!r.is_ok()) LogWarn("%s", r.msg.c_str());
}

void Chroot::SetExtraMounts(std::map<std::string, std::string> extra_mounts) {
    extra_mounts_ = std::move(extra_mounts);
}

Result Chroot::BindMount(const std::string& source, const std::string& target) {
    auto r = fs_->MkdirAll(target);
    if (!r.is_ok()) return r;
    r = mounter_->Mount(source, target, "bind", {"bind"});
    if (!r.is_ok()) return r;
    active_mounts_.push_back(target);
    return Result::Ok();
}

Result Chroot::Prepare() {
    if (!active_mounts_.empty()) {
        return Result::Fail(-1, "there are already active mountpoints for this instance");
    }

    std::vector<std::string> mounts = default_mounts_;
    if (fs_->Exists("/run/systemd/system")) {
        mounts.push_back("/run/systemd/journal");
    }

    Result err = Result::Ok();
    for (const auto& mnt : mounts) {
        err = BindMount(mnt, JoinPath(path_, mnt));
        if (!err.is_ok()) break;
    }

    if (err.is_ok()) {
        // std::map keeps the sources sorted; mount by target order instead.
        std::vector<std::pair<std::string, std::string>> extra(extra_mounts_.begin(), extra_mounts_.end());
        std::sort(extra.begin(), extra.end(),
                  [](const auto& a, const auto& b) { return a.second < b.second; });
        for (const auto& [source, target] : extra) {
            err = BindMount(source, JoinPath(path_, target));
            if (!err.is_ok()) break;
        }
    }

    if (!err.is_ok()) {
        auto c = Close();
        if (!c.is_ok()) LogWarn("%s", c.msg.c_str());
        return err;
    }
    return Result::Ok();
}

Result Chroot::Close() {
    std::vector<std::string> failures;
    std::string failure_msgs;
    for (auto it = active_mounts_.rbegin(); it != active_mounts_.rend(); ++it) {
        LogDebug("unmounting %s from chroot", it->c_str());
        auto r = mounter_->Unmount(*it);
        if (!r.is_ok()) {
            LogError("error unmounting %s: %s", it->c_str(), r.msg.c_str());
            failures.insert(failures.begin(), *it);
            failure_msgs += (failure_msgs.empty() ? "" : ", ") + *it;
        }
    }
    active_mounts_ = failures;
    if (!failures.empty()) {
        return Result::Fail(-1, "failed closing chroot environment. Unmount failures: " + failure_msgs);
    }
    return Result::Ok();
}

Result Chroot::RunCallback(const std::function<Result()>& callback) {
    int old_root = -1;
    auto r = syscall_->Open("/", O_RDONLY, old_root);
    if (!r.is_ok()) return r.Context("can't open current root");

    auto close_old_root = [&]() {
        auto c = syscall_->Close(old_root);
        if (!c.is_ok()) LogWarn("close root fd: %s", c.msg.c_str());
    };

    bool prepared_here = false;
    if (active_mounts_.empty()) {
        r = Prepare();
        if (!r.is_ok()) {
            close_old_root();
            return r.Context("can't mount default mounts");
        }
        prepared_here = true;
    }

    std::error_code ec;
    const std::string cwd = std::filesystem::current_path(ec).string();

    Result err = Result::Ok();
    r = syscall_->Chroot(path_);
    if (!r.is_ok()) {
        err = r.Context("can't chroot to " + path_);
    } else {
        err = callback();

        auto back = syscall_->Fchdir(old_root);
        if (back.is_ok()) back = syscall_->Chroot(".");
        if (!back.is_ok() && err.is_ok()) err = back.Context("can't go back to old root");
    }

    if (!ec && !cwd.empty()) {
        auto cd = syscall_->Chdir(cwd);
        if (!cd.is_ok() && err.is_ok()) err = cd;
    }
    close_old_root();

    if (prepared_here) {
        auto c = Close();
        if (!c.is_ok() && err.is_ok()) err = c;
    }
    return err;
}

Result Chroot::Run(const IRunner& runner,
                   const std::string& cmd,
                   const std::vector<std::string>& args,
                   std::string* output) {
    return RunCallback([&]() { return runner.Run(cmd, args, output); });
}

} // namespace elemental
