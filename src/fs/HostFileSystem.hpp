#pragma once
#include "IFileSystem.hpp"

// IFileSystem over the real host filesystem.
class HostFileSystem : public IFileSystem {
public:
    bool exists(const std::filesystem::path& path) const override;
    bool isDirectory(const std::filesystem::path& path) const override;
    bool isSymlink(const std::filesystem::path& path) const override;

    std::vector<DirEntry> list(const std::filesystem::path& path) const override;
    void touch(const std::filesystem::path& path) override;
    void mkdir(const std::filesystem::path& path, bool recursive) override;
    void rmdir(const std::filesystem::path& path) override;
    void remove(const std::filesystem::path& path, bool recursive) override;
    void copy(const std::filesystem::path& src, const std::filesystem::path& dst, bool recursive) override;
    void move(const std::filesystem::path& src, const std::filesystem::path& dst) override;
    void chmod(const std::filesystem::path& path, uint32_t mode) override;
    StatInfo stat(const std::filesystem::path& path) const override;
    uintmax_t fileSize(const std::filesystem::path& path) const override;
    std::string readFile(const std::filesystem::path& path) const override;
    void readChunks(const std::filesystem::path& path, size_t chunk_size,
                    const std::function<void(const char*, size_t)>& sink) const override;
    void writeFile(const std::filesystem::path& path, const std::string& data, bool append) override;
};
