#include "util/cleanup_stack.hpp"

#include "util/logger.hpp"

#include <utility>

namespace elemental {

void CleanupStack::Push(Job job) {
    if (job) jobs_.push_back(std::move(job));
}

Result CleanupStack::Cleanup(Result err) {
    Result cleanup_err = Result::Ok();

    while (!jobs_.empty()) {
        Job job = std::move(jobs_.back());
        jobs_.pop_back();

        Result r = job();
        if (r.is_ok()) continue;

        if (!err.is_ok()) {
            LogWarn("cleanup failed: %s", r.msg.c_str());
        } else if (cleanup_err.is_ok()) {
            cleanup_err = std::move(r);
        } else {
            LogWarn("cleanup failed: %s", r.msg.c_str());
            cleanup_err.msg += "; " + r.msg;
        }
    }

    if (!err.is_ok()) return err;
    return cleanup_err;
}

} // namespace elemental
