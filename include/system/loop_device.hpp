#pragma once

#include "system/syscall.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace elemental {

// Attaches files to free loop devices with partition scanning enabled.
class LoopDevice {
  public:
    explicit LoopDevice(std::shared_ptr<const ISyscall> syscall);

    Result Attach(const std::string& file, std::string& out_device) const;
    Result Detach(const std::string& device) const;

  private:
    std::shared_ptr<const ISyscall> syscall_;
};

} // namespace elemental
