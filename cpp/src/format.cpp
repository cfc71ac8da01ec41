// chainseg/cpp/src/format.cpp
#include "chainseg/format.h"
#include "chainseg/errors.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chainseg {

static std::string format_utc_now(const char* fmt) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

std::string utc_now_iso() {
    return format_utc_now("%Y-%m-%dT%H:%M:%SZ");
}

static std::string errno_text(int e) {
    return std::string(std::strerror(e)) + " (errno=" + std::to_string(e) + ")";
}

void ensure_dirs(const fs::path& p) {
    if (p.empty()) return;
    std::error_code ec;
    fs::create_directories(p, ec);
    if (ec) throw DurabilityError("mkdir failed: " + p.string() + " err=" + ec.message());
}

void write_all_fd(int fd, const char* data, size_t size, const std::string& what) {
    size_t done = 0;
    while (done < size) {
        const ssize_t n = ::write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw DurabilityError("write failed: " + what + " " + errno_text(errno));
        }
        if (n == 0) throw DurabilityError("write returned 0: " + what);
        done += (size_t)n;
    }
}

void fsync_fd(int fd, const std::string& what) {
    if (::fsync(fd) != 0) {
        throw DurabilityError("fsync failed: " + what + " " + errno_text(errno));
    }
}

void fsync_dir(const fs::path& dir) {
    const fs::path d = dir.empty() ? fs::path(".") : dir;
    const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) throw DurabilityError("open dir failed: " + d.string() + " " + errno_text(errno));
    const int rc = ::fsync(fd);
    const int saved = errno;
    ::close(fd);
    if (rc != 0) throw DurabilityError("dir fsync failed: " + d.string() + " " + errno_text(saved));
}

void atomic_write_file(const fs::path& fin, std::string_view content) {
    ensure_dirs(fin.parent_path());
    const fs::path tmp = fs::path(fin.string() + ".tmp");

    const int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) throw DurabilityError("cannot open " + tmp.string() + " " + errno_text(errno));
    try {
        write_all_fd(fd, content.data(), content.size(), tmp.string());
        fsync_fd(fd, tmp.string());
    } catch (...) {
        ::close(fd);
        throw;
    }
    if (::close(fd) != 0) throw DurabilityError("close failed: " + tmp.string() + " " + errno_text(errno));

    if (::rename(tmp.c_str(), fin.c_str()) != 0) {
        throw DurabilityError("rename failed: " + tmp.string() + " -> " + fin.string() + " " + errno_text(errno));
    }
    fsync_dir(fin.parent_path());
}

bool read_file_to_string(const fs::path& p, std::string& out) {
    out.clear();
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

} // namespace chainseg
