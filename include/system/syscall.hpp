#pragma once

#include "util/result.hpp"

#include <string>

namespace elemental {

class ISyscall {
  public:
    virtual ~ISyscall() = default;
    virtual Result Open(const std::string& path, int flags, int& out_fd) const = 0;
    virtual Result Close(int fd) const = 0;
    virtual Result Ioctl(int fd, unsigned long request, unsigned long arg, int* ret = nullptr) const = 0;
    virtual Result Chdir(const std::string& path) const = 0;
    virtual Result Fchdir(int fd) const = 0;
    virtual Result Chroot(const std::string& path) const = 0;
    virtual void Sync() const = 0;
};

class LinuxSyscall final : public ISyscall {
  public:
    Result Open(const std::string& path, int flags, int& out_fd) const override;
    Result Close(int fd) const override;
    Result Ioctl(int fd, unsigned long request, unsigned long arg, int* ret = nullptr) const override;
    Result Chdir(const std::string& path) const override;
    Result Fchdir(int fd) const override;
    Result Chroot(const std::string& path) const override;
    void Sync() const override;
};

} // namespace elemental
