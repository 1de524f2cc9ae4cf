#include "HostFileSystem.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

using namespace std::filesystem;

static std::runtime_error fs_error(const std::error_code& ec, const path& p) {
    return std::runtime_error(ec.message() + ": '" + p.string() + "'");
}

static std::runtime_error errno_error(const path& p) {
    return fs_error(std::error_code(errno, std::generic_category()), p);
}

bool HostFileSystem::exists(const path& p) const {
    std::error_code ec;
    return std::filesystem::exists(p, ec);
}

bool HostFileSystem::isDirectory(const path& p) const {
    std::error_code ec;
    return is_directory(p, ec);
}

bool HostFileSystem::isSymlink(const path& p) const {
    std::error_code ec;
    return is_symlink(p, ec);
}

std::vector<DirEntry> HostFileSystem::list(const path& p) const {
    std::error_code ec;
    directory_iterator it(p, ec);
    if (ec) throw fs_error(ec, p);
    std::vector<DirEntry> out;
    for (directory_iterator end; it != end; it.increment(ec)) {
        if (ec) throw fs_error(ec, p);
        const auto& de = *it;
        DirEntry e;
        e.name = de.path().filename().string();
        std::error_code ec2;
        e.is_dir = de.is_directory(ec2);
        e.is_symlink = de.is_symlink(ec2);
        struct ::stat st;
        e.readable = ::stat(de.path().c_str(), &st) == 0;
        e.size = e.readable ? static_cast<uintmax_t>(st.st_size) : 0;
        e.mtime = e.readable ? st.st_mtime : 0;
        out.push_back(std::move(e));
    }
    if (ec) throw fs_error(ec, p);
    return out;
}

void HostFileSystem::touch(const path& p) {
    std::error_code ec;
    if (p.has_parent_path()) create_directories(p.parent_path(), ec);
    if (ec) throw fs_error(ec, p.parent_path());
    {
        std::ofstream ofs(p, std::ios::binary | std::ios::app);
        if (!ofs) throw errno_error(p);
    }
    if (::utimensat(AT_FDCWD, p.c_str(), nullptr, 0) != 0) throw errno_error(p);
}

void HostFileSystem::mkdir(const path& p, bool recursive) {
    std::error_code ec;
    if (recursive) create_directories(p, ec); else create_directory(p, ec);
    if (ec) throw fs_error(ec, p);
}

void HostFileSystem::rmdir(const path& p) {
    if (::rmdir(p.c_str()) != 0) throw errno_error(p);
}

void HostFileSystem::remove(const path& p, bool recursive) {
    std::error_code ec;
    if (recursive) {
        remove_all(p, ec);
    } else {
        std::filesystem::remove(p, ec);
    }
    if (ec) throw fs_error(ec, p);
}

void HostFileSystem::copy(const path& src, const path& dst, bool recursive) {
    std::error_code ec;
    if (is_directory(src, ec)) {
        if (!recursive) throw fs_error(std::make_error_code(std::errc::is_a_directory), src);
        if (std::filesystem::exists(dst, ec)) throw fs_error(std::make_error_code(std::errc::file_exists), dst);
        std::filesystem::copy(src, dst, copy_options::recursive | copy_options::copy_symlinks, ec);
        if (ec) throw fs_error(ec, src);
        return;
    }
    copy_file(src, dst, copy_options::overwrite_existing, ec);
    if (ec) throw fs_error(ec, dst);
    // keep permission bits and modification time, like `cp -p`
    permissions(dst, status(src).permissions(), ec);
    if (ec) throw fs_error(ec, dst);
    last_write_time(dst, last_write_time(src), ec);
    if (ec) throw fs_error(ec, dst);
}

void HostFileSystem::move(const path& src, const path& dst) {
    std::error_code ec;
    rename(src, dst, ec);
    if (ec == std::errc::cross_device_link) {
        copy(src, dst, true);
        remove_all(src, ec);
    }
    if (ec) throw fs_error(ec, src);
}

void HostFileSystem::chmod(const path& p, uint32_t mode) {
    if (::chmod(p.c_str(), static_cast<mode_t>(mode)) != 0) throw errno_error(p);
}

StatInfo HostFileSystem::stat(const path& p) const {
    struct ::stat st;
    if (::stat(p.c_str(), &st) != 0) throw errno_error(p);
    StatInfo s;
    s.name = p.filename().string();
    s.is_dir = S_ISDIR(st.st_mode);
    s.size = static_cast<uintmax_t>(st.st_size);
    s.mode = static_cast<uint32_t>(st.st_mode);
    s.atime = st.st_atime;
    s.mtime = st.st_mtime;
    s.ctime = st.st_ctime;
    return s;
}

uintmax_t HostFileSystem::fileSize(const path& p) const {
    struct ::stat st;
    if (::stat(p.c_str(), &st) != 0) throw errno_error(p);
    return static_cast<uintmax_t>(st.st_size);
}

std::string HostFileSystem::readFile(const path& p) const {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) throw errno_error(p);
    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) throw errno_error(p);
    return data;
}

void HostFileSystem::readChunks(const path& p, size_t chunk_size,
                                const std::function<void(const char*, size_t)>& sink) const {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) throw errno_error(p);
    std::vector<char> buf(chunk_size);
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = static_cast<size_t>(ifs.gcount());
        if (got > 0) sink(buf.data(), got);
    }
    if (ifs.bad()) throw errno_error(p);
}

void HostFileSystem::writeFile(const path& p, const std::string& data, bool append) {
    std::ofstream ofs(p, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!ofs) throw errno_error(p);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) throw errno_error(p);
}
