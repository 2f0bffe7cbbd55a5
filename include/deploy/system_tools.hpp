#pragma once

#include "system/runner.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace elemental {

// Directories never copied from a live tree.
const std::vector<std::string>& DefaultSyncExcludes();

// rsync `source`/ onto `target`/ keeping ownership, ACLs and xattrs.
Result SyncData(const IRunner& runner,
                const std::string& source,
                const std::string& target,
                const std::vector<std::string>& excludes);

Result CreateSquashFS(const IRunner& runner,
                      const std::string& source,
                      const std::string& target,
                      const std::vector<std::string>& options);

// `cosign verify [--key key] image`. Keyless verification when `pub_key`
// is empty.
Result CosignVerify(const IRunner& runner, const std::string& image, const std::string& pub_key);

} // namespace elemental
