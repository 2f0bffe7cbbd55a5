#pragma once

#include "util/result.hpp"

#include <functional>
#include <vector>

namespace elemental {

// LIFO list of undo jobs. Each job runs at most once.
class CleanupStack {
  public:
    using Job = std::function<Result()>;

    CleanupStack() = default;
    CleanupStack(const CleanupStack&) = delete;
    CleanupStack& operator=(const CleanupStack&) = delete;

    void Push(Job job);

    // Runs every pending job in reverse order. A failed `err` is returned
    // unchanged and cleanup failures are only logged. With an ok `err` the
    // first cleanup failure is returned, later ones are appended to it.
    Result Cleanup(Result err);

    std::size_t Size() const { return jobs_.size(); }

  private:
    std::vector<Job> jobs_;
};

} // namespace elemental
