#include "system/loop_device.hpp"

#include "util/logger.hpp"

#include <cstring>
#include <fcntl.h>
#include <linux/loop.h>

namespace elemental {

namespace {

constexpr const char* kLoopControl = "/dev/loop-control";

// Closes a descriptor obtained through ISyscall when going out of scope.
class ScopedSyscallFd {
  public:
    explicit ScopedSyscallFd(const ISyscall& sys) : sys_(sys) {}
    ScopedSyscallFd(const ScopedSyscallFd&) = delete;
    ScopedSyscallFd& operator=(const ScopedSyscallFd&) = delete;
    ~ScopedSyscallFd() {
        if (fd_ < 0) return;
        auto r = sys_.Close(fd_);
        if (!r.is_ok()) LogWarn("close fd %d: %s", fd_, r.msg.c_str());
    }

    int& Ref() { return fd_; }
    int Get() const { return fd_; }

  private:
    const ISyscall& sys_;
    int fd_ = -1;
};

} // namespace

LoopDevice::LoopDevice(std::shared_ptr<const ISyscall> syscall) : syscall_(std::move(syscall)) {}

Result LoopDevice::Attach(const std::string& file, std::string& out_device) const {
    int free_num = -1;
    {
        ScopedSyscallFd ctl(*syscall_);
        auto r = syscall_->Open(kLoopControl, O_RDWR, ctl.Ref());
        if (!r.is_ok()) return r.Context("failed to open loop control");
        r = syscall_->Ioctl(ctl.Get(), LOOP_CTL_GET_FREE, 0, &free_num);
        if (!r.is_ok()) return r.Context("failed to get a free loop device");
    }
    const std::string device = "/dev/loop" + std::to_string(free_num);

    ScopedSyscallFd backing(*syscall_);
    auto r = syscall_->Open(file, O_RDWR, backing.Ref());
    if (!r.is_ok()) return r.Context("failed to open " + file);

    ScopedSyscallFd loop(*syscall_);
    r = syscall_->Open(device, O_RDWR, loop.Ref());
    if (!r.is_ok()) return r.Context("failed to open " + device);

    r = syscall_->Ioctl(loop.Get(), LOOP_SET_FD, static_cast<unsigned long>(backing.Get()));
    if (!r.is_ok()) return r.Context("failed to attach " + file + " to " + device);

    loop_info64 info{};
    info.lo_flags = LO_FLAGS_PARTSCAN;
    std::strncpy(reinterpret_cast<char*>(info.lo_file_name), file.c_str(), LO_NAME_SIZE - 1);
    r = syscall_->Ioctl(loop.Get(), LOOP_SET_STATUS64, reinterpret_cast<unsigned long>(&info));
    if (!r.is_ok()) {
        auto clr = syscall_->Ioctl(loop.Get(), LOOP_CLR_FD, 0);
        if (!clr.is_ok()) LogWarn("failed to detach %s: %s", device.c_str(), clr.msg.c_str());
        return r.Context("failed to set status on " + device);
    }

    LogDebug("attached %s to %s", file.c_str(), device.c_str());
    out_device = device;
    return Result::Ok();
}

Result LoopDevice::Detach(const std::string& device) const {
    ScopedSyscallFd loop(*syscall_);
    auto r = syscall_->Open(device, O_RDWR, loop.Ref());
    if (!r.is_ok()) return r.Context("failed to open " + device);
    r = syscall_->Ioctl(loop.Get(), LOOP_CLR_FD, 0);
    if (!r.is_ok()) return r.Context("failed to detach " + device);
    return Result::Ok();
}

} // namespace elemental
