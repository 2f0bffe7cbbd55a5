#pragma once

#include "system/fs.hpp"
#include "system/mounter.hpp"
#include "system/runner.hpp"
#include "system/syscall.hpp"
#include "util/result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace elemental {

// Bind mounts the host API filesystems into a root tree and runs callbacks
// or commands inside it.
class Chroot {
  public:
    Chroot(std::string path,
           std::shared_ptr<const IMounter> mounter,
           std::shared_ptr<const ISyscall> syscall,
           std::shared_ptr<const IFs> fs);
    Chroot(const Chroot&) = delete;
    Chroot& operator=(const Chroot&) = delete;
    ~Chroot();

    // Host source -> target inside the chroot. Applied in target order.
    void SetExtraMounts(std::map<std::string, std::string> extra_mounts);

    Result Prepare();
    Result Close();
    Result RunCallback(const std::function<Result()>& callback);
    Result Run(const IRunner& runner,
               const std::string& cmd,
               const std::vector<std::string>& args,
               std::string* output = nullptr);

    const std::vector<std::string>& ActiveMounts() const { return active_mounts_; }

  private:
    Result BindMount(const std::string& source, const std::string& target);

    std::string path_;
    std::vector<std::string> default_mounts_;
    std::map<std::string, std::string> extra_mounts_;
    std::vector<std::string> active_mounts_;
    std::shared_ptr<const IMounter> mounter_;
    std::shared_ptr<const ISyscall> syscall_;
    std::shared_ptr<const IFs> fs_;
};

} // namespace elemental
