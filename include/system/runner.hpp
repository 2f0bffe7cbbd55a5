#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace elemental {

class IRunner {
  public:
    virtual ~IRunner() = default;
    // Runs `cmd` with `args` and waits for it. Combined stdout and stderr
    // are stored in `output` when non-null.
    virtual Result Run(const std::string& cmd,
                       const std::vector<std::string>& args,
                       std::string* output = nullptr) const = 0;
};

// fork/execvp based runner. PATH lookup is done by execvp.
class ExecRunner final : public IRunner {
  public:
    Result Run(const std::string& cmd,
               const std::vector<std::string>& args,
               std::string* output = nullptr) const override;
};

// Renders `cmd arg1 arg2` for log lines.
std::string FormatCommand(const std::string& cmd, const std::vector<std::string>& args);

} // namespace elemental
