/**
 * Warden File Store
 *
 * Read-only backing store behind the file capabilities. The virtual store
 * serves the policy's in-memory file table; the host store maps the
 * sandbox root onto a directory of the real filesystem. Both are immutable
 * after construction and may be shared across the isolation boundary.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace warden::runtime {

class FileStore {
public:
    virtual ~FileStore() = default;

    // Content of a normalized absolute path, or nullopt if absent
    virtual std::optional<std::string> read(const std::string& path) const = 0;

    // Sorted normalized paths under a normalized prefix
    virtual std::vector<std::string> list(const std::string& prefix) const = 0;
};

class VirtualFileStore : public FileStore {
public:
    explicit VirtualFileStore(const std::map<std::string, std::string>& files);

    std::optional<std::string> read(const std::string& path) const override;
    std::vector<std::string> list(const std::string& prefix) const override;

    size_t size() const { return files_.size(); }

private:
    std::map<std::string, std::string> files_;
};

class HostFileStore : public FileStore {
public:
    explicit HostFileStore(const std::string& root_path);

    std::optional<std::string> read(const std::string& path) const override;
    std::vector<std::string> list(const std::string& prefix) const override;

    const std::string& root() const { return root_; }

private:
    std::string root_;

    std::string host_path(const std::string& path) const;
};

} // namespace warden::runtime
