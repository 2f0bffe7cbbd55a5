#include "system/syscall.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace elemental {

Result LinuxSyscall::Open(const std::string& path, int flags, int& out_fd) const {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) return Result::FromErrno("open " + path);
    out_fd = fd;
    return Result::Ok();
}

Result LinuxSyscall::Close(int fd) const {
    if (::close(fd) != 0) return Result::FromErrno("close");
    return Result::Ok();
}

Result LinuxSyscall::Ioctl(int fd, unsigned long request, unsigned long arg, int* ret) const {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) return Result::FromErrno("ioctl " + std::to_string(request));
    if (ret) *ret = rc;
    return Result::Ok();
}

Result LinuxSyscall::Chdir(const std::string& path) const {
    if (::chdir(path.c_str()) != 0) return Result::FromErrno("chdir " + path);
    return Result::Ok();
}

Result LinuxSyscall::Fchdir(int fd) const {
    if (::fchdir(fd) != 0) return Result::FromErrno("fchdir");
    return Result::Ok();
}

Result LinuxSyscall::Chroot(const std::string& path) const {
    if (::chroot(path.c_str()) != 0) return Result::FromErrno("chroot " + path);
    return Result::Ok();
}

void LinuxSyscall::Sync() const { ::sync(); }

} // namespace elemental
