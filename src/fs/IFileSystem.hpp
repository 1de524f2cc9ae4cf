#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct DirEntry {
    std::string name;
    bool is_dir;
    bool is_symlink;
    uintmax_t size;
    std::time_t mtime;
    bool readable; // false when size/mtime could not be read
};

struct StatInfo {
    std::string name;
    bool is_dir;
    uintmax_t size;
    uint32_t mode; // raw st_mode, type bits included
    std::time_t atime;
    std::time_t mtime;
    std::time_t ctime;
};

// Filesystem operations the commands are written against. Paths are
// already resolved and absolute. Failures throw std::runtime_error whose
// message is "<reason>: '<path>'".
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool isDirectory(const std::filesystem::path& path) const = 0;
    virtual bool isSymlink(const std::filesystem::path& path) const = 0;

    // Unsorted; "." and ".." are never included.
    virtual std::vector<DirEntry> list(const std::filesystem::path& path) const = 0;
    virtual void touch(const std::filesystem::path& path) = 0;
    virtual void mkdir(const std::filesystem::path& path, bool recursive) = 0;
    // Removes an empty directory only.
    virtual void rmdir(const std::filesystem::path& path) = 0;
    virtual void remove(const std::filesystem::path& path, bool recursive) = 0;
    virtual void copy(const std::filesystem::path& src, const std::filesystem::path& dst, bool recursive) = 0;
    virtual void move(const std::filesystem::path& src, const std::filesystem::path& dst) = 0;
    virtual void chmod(const std::filesystem::path& path, uint32_t mode) = 0;
    virtual StatInfo stat(const std::filesystem::path& path) const = 0;
    virtual uintmax_t fileSize(const std::filesystem::path& path) const = 0;
    virtual std::string readFile(const std::filesystem::path& path) const = 0;
    // Calls sink for each chunk of at most chunk_size bytes.
    virtual void readChunks(const std::filesystem::path& path, size_t chunk_size,
                            const std::function<void(const char*, size_t)>& sink) const = 0;
    virtual void writeFile(const std::filesystem::path& path, const std::string& data, bool append) = 0;
};
