// chainseg/cpp/src/shard_writer.cpp
#include "chainseg/shard_writer.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chainseg {

namespace {

std::string read_range(int fd, uint64_t off, uint64_t len, const std::string& what) {
    std::string out;
    out.resize((size_t)len);
    uint64_t done = 0;
    while (done < len) {
        const ssize_t n = ::pread(fd, &out[(size_t)done], (size_t)(len - done), (off_t)(off + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw DurabilityError("pread failed: " + what + " " + std::strerror(errno));
        }
        if (n == 0) break;
        done += (uint64_t)n;
    }
    out.resize((size_t)done);
    return out;
}

uint64_t fd_size(int fd, const std::string& what) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) throw DurabilityError("fstat failed " + what + ": " + std::strerror(errno));
    return (uint64_t)st.st_size;
}

void truncate_at(int fd, uint64_t len, const std::string& what) {
    if (::ftruncate(fd, (off_t)len) != 0) {
        throw DurabilityError("ftruncate failed " + what + ": " + std::strerror(errno));
    }
    if (::lseek(fd, (off_t)len, SEEK_SET) < 0) {
        throw DurabilityError("lseek failed " + what + ": " + std::strerror(errno));
    }
}

} // namespace

std::string ShardLayout::shard_file_name(uint64_t index) const {
    char num[32];
    std::snprintf(num, sizeof(num), "%0*llu", pad, (unsigned long long)index);
    return prefix + "_" + num + "." + ext;
}

std::vector<uint64_t> list_shard_indices(const ShardLayout& layout) {
    std::vector<uint64_t> out;
    std::error_code ec;
    if (!fs::is_directory(layout.dir, ec)) return out;

    const std::string head = layout.prefix + "_";
    const std::string tail = "." + layout.ext;
    for (const auto& de : fs::directory_iterator(layout.dir, ec)) {
        if (!de.is_regular_file(ec)) continue;
        const std::string name = de.path().filename().string();
        if (name.size() <= head.size() + tail.size()) continue;
        if (name.compare(0, head.size(), head) != 0) continue;
        if (name.compare(name.size() - tail.size(), tail.size(), tail) != 0) continue;

        const std::string digits = name.substr(head.size(), name.size() - head.size() - tail.size());
        if (digits.size() > 19 || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        out.push_back(std::stoull(digits));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<uint64_t> find_footer_offset(int fd, uint64_t size, const ShardLayout& layout) {
    if (size == 0) return std::nullopt;

    const uint64_t window = std::min<uint64_t>(size, layout.tail_window);
    const uint64_t start = size - window;
    const std::string tail = read_range(fd, start, window, "shard tail");
    size_t p = tail.rfind(layout.footer_marker);
    if (p != std::string::npos) return start + p;
    if (start == 0) return std::nullopt;

    // rare: footer further back than the window
    const std::string all = read_range(fd, 0, size, "shard");
    p = all.rfind(layout.footer_marker);
    if (p != std::string::npos) return (uint64_t)p;
    return std::nullopt;
}

ShardWriter::ShardWriter(ShardLayout layout) : layout_(std::move(layout)) {
    if (layout_.prefix.empty()) throw std::invalid_argument("shard prefix must not be empty");
    if (layout_.footer_marker.empty()) throw std::invalid_argument("footer marker must not be empty");
}

ShardWriter::~ShardWriter() {
    if (fd_ < 0) return;
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[chainseg] shard close in destructor failed: " << e.what() << "\n";
    }
}

bool ShardWriter::open_for_append(uint64_t index) {
    if (fd_ >= 0) close();

    ensure_dirs(layout_.dir);
    const fs::path p = layout_.shard_path(index);
    bool created = false;

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        const int cfd = ::open(p.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (cfd >= 0) {
            const std::string doc = layout_.header + layout_.footer;
            try {
                write_all_fd(cfd, doc.data(), doc.size(), p.string());
                fsync_fd(cfd, p.string());
            } catch (...) {
                ::close(cfd);
                throw;
            }
            ::close(cfd);
            fsync_dir(layout_.dir);
            created = true;
        } else if (errno != EEXIST) {
            throw DurabilityError("cannot create shard " + p.string() + ": " + std::strerror(errno));
        }
    }

    const int fd = ::open(p.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) throw DurabilityError("cannot open shard " + p.string() + ": " + std::strerror(errno));

    try {
        uint64_t size = fd_size(fd, p.string());
        std::optional<uint64_t> pos = find_footer_offset(fd, size, layout_);
        if (!pos) {
            size = repair(fd, size, p);
            pos = find_footer_offset(fd, size, layout_);
            if (!pos) throw ShardCorruptError("footer missing and could not be repaired: " + p.string());
        }
        truncate_at(fd, *pos, p.string());
    } catch (...) {
        ::close(fd);
        throw;
    }

    fd_ = fd;
    index_ = index;
    path_ = p;
    buf_.clear();
    entries_buffered_ = 0;
    return created;
}

// Drop a torn trailing entry, then put the footer back.
uint64_t ShardWriter::repair(int fd, uint64_t size, const fs::path& p) {
    const std::string doc = read_range(fd, 0, size, p.string());

    uint64_t keep = size;
    std::string tail;
    const size_t last_close = doc.rfind(layout_.entry_close);
    if (doc.empty()) {
        keep = 0;
        tail = layout_.header;
    } else if (last_close != std::string::npos) {
        keep = last_close + layout_.entry_close.size();
    } else if (doc.compare(0, layout_.header.size(), layout_.header) == 0) {
        keep = layout_.header.size();
    } else if (doc.back() != '\n') {
        tail = "\n";
    }
    tail += layout_.footer;

    truncate_at(fd, keep, p.string());
    write_all_fd(fd, tail.data(), tail.size(), p.string());
    fsync_fd(fd, p.string());
    ++repairs_;

    std::cerr << "[chainseg] shard " << p.filename().string() << ": footer missing, dropped "
              << (size - keep) << " trailing bytes and restored it\n";
    return keep + tail.size();
}

void ShardWriter::append_entry(std::string_view entry) {
    if (fd_ < 0) throw ChainsegException("append_entry without an open shard");
    buf_.append(entry.data(), entry.size());
    ++entries_buffered_;
}

void ShardWriter::close() {
    if (fd_ < 0) return;
    const int fd = fd_;
    fd_ = -1;

    buf_ += layout_.footer;
    try {
        write_all_fd(fd, buf_.data(), buf_.size(), path_.string());
        fsync_fd(fd, path_.string());
    } catch (...) {
        ::close(fd);
        buf_.clear();
        entries_buffered_ = 0;
        throw;
    }
    buf_.clear();
    entries_buffered_ = 0;
    if (::close(fd) != 0) {
        throw DurabilityError("close failed " + path_.string() + ": " + std::strerror(errno));
    }
}

size_t rebuild_sitemap_index(const ShardLayout& layout, const SitemapIndexOptions& opt) {
    const std::vector<uint64_t> shards = list_shard_indices(layout);

    std::string doc = kSitemapIndexHeader;
    auto add = [&doc](const std::string& loc) {
        doc += "  <sitemap>\n    <loc>";
        doc += xml_escape(loc);
        doc += "</loc>\n  </sitemap>\n";
    };
    for (const auto& loc : opt.extra_locs) {
        if (!loc.empty()) add(loc);
    }
    for (uint64_t idx : shards) add(opt.base_url + layout.shard_file_name(idx));
    doc += kSitemapIndexFooter;

    atomic_write_file(opt.index_path, doc);
    return shards.size();
}

} // namespace chainseg
