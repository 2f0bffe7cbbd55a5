#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace elemental {

struct DirEntry {
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
};

// Filesystem access through logical absolute paths. Implementations may
// map them below a different root, see RawPath.
class IFs {
  public:
    virtual ~IFs() = default;

    // Host path backing the logical `path`.
    virtual std::string RawPath(std::string_view path) const = 0;

    virtual bool Exists(std::string_view path) const = 0;
    virtual bool IsDir(std::string_view path) const = 0;
    virtual Result MkdirAll(std::string_view path, unsigned mode = 0755) const = 0;
    virtual Result Remove(std::string_view path) const = 0;
    virtual Result RemoveAll(std::string_view path) const = 0;
    virtual Result ReadFile(std::string_view path, std::string& out) const = 0;
    virtual Result WriteFile(std::string_view path, std::string_view data, unsigned mode = 0644) const = 0;
    virtual Result CopyFile(std::string_view src, std::string_view dst) const = 0;
    virtual Result Rename(std::string_view src, std::string_view dst) const = 0;
    virtual Result CreateSparseFile(std::string_view path, std::uint64_t bytes) const = 0;
    virtual Result FileSize(std::string_view path, std::uint64_t& out) const = 0;
    // Creates a fresh directory below /tmp and returns its logical path.
    virtual Result TempDir(std::string_view prefix, std::string& out) const = 0;
    // Resolves every symlink component, result is a logical path.
    virtual Result EvalSymlinks(std::string_view path, std::string& out) const = 0;
    virtual Result ReadDir(std::string_view path, std::vector<DirEntry>& out) const = 0;
};

// std::filesystem backed implementation. A non-empty root confines every
// logical path below it.
class OsFs final : public IFs {
  public:
    OsFs() = default;
    explicit OsFs(std::string root);

    const std::string& Root() const { return root_; }

    std::string RawPath(std::string_view path) const override;
    bool Exists(std::string_view path) const override;
    bool IsDir(std::string_view path) const override;
    Result MkdirAll(std::string_view path, unsigned mode = 0755) const override;
    Result Remove(std::string_view path) const override;
    Result RemoveAll(std::string_view path) const override;
    Result ReadFile(std::string_view path, std::string& out) const override;
    Result WriteFile(std::string_view path, std::string_view data, unsigned mode = 0644) const override;
    Result CopyFile(std::string_view src, std::string_view dst) const override;
    Result Rename(std::string_view src, std::string_view dst) const override;
    Result CreateSparseFile(std::string_view path, std::uint64_t bytes) const override;
    Result FileSize(std::string_view path, std::uint64_t& out) const override;
    Result TempDir(std::string_view prefix, std::string& out) const override;
    Result EvalSymlinks(std::string_view path, std::string& out) const override;
    Result ReadDir(std::string_view path, std::vector<DirEntry>& out) const override;

  private:
    std::string root_;
};

} // namespace elemental
