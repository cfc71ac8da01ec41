// chainseg/cpp/src/segment_writer.cpp
#include "chainseg/segment_writer.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chainseg {

namespace {

// Last newline at or before `limit`, so a cut never leaves a torn record.
uint64_t last_line_boundary(int fd, uint64_t limit, const std::string& what) {
    if (limit == 0) return 0;
    std::vector<char> buf(64 * 1024);
    uint64_t end = limit;
    while (end > 0) {
        const uint64_t begin = end > buf.size() ? end - buf.size() : 0;
        const size_t len = (size_t)(end - begin);
        const ssize_t n = ::pread(fd, buf.data(), len, (off_t)begin);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw DurabilityError("pread failed: " + what + " " + std::strerror(errno));
        }
        if ((size_t)n != len) throw DurabilityError("short pread: " + what);
        for (size_t i = len; i > 0; --i) {
            if (buf[i - 1] == '\n') return begin + i;
        }
        end = begin;
    }
    return 0;
}

} // namespace

SegmentWriter::SegmentWriter(SegmentWriterOptions opt) : opt_(std::move(opt)) {
    if (opt_.segment_size == 0) throw std::invalid_argument("segment_size must be > 0");
    if (opt_.entity.empty()) throw std::invalid_argument("entity must not be empty");
    if (opt_.max_buffered_records == 0) opt_.max_buffered_records = 1;
    buf_.reserve(1u << 20);
}

SegmentWriter::~SegmentWriter() {
    if (fd_ < 0) return;
    // Destructors cannot report; owners call close() on every normal path.
    try {
        close();
    } catch (const std::exception& e) {
        std::cerr << "[chainseg] segment close in destructor failed: " << e.what() << "\n";
    }
}

void SegmentWriter::open_segment(const SegmentRange& r) {
    ensure_dirs(opt_.out_dir);
    const fs::path p = opt_.out_dir / segment_file_name(opt_.entity, r, opt_.ext);

    std::error_code ec;
    const bool existed = fs::exists(p, ec);

    const int fd = ::open(p.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) throw DurabilityError("cannot open segment " + p.string() + ": " + std::strerror(errno));

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        ::close(fd);
        throw DurabilityError("fstat failed " + p.string() + ": " + std::strerror(e));
    }
    if (!existed) fsync_dir(opt_.out_dir);

    fd_ = fd;
    current_ = r;
    current_path_ = p;
    file_bytes_ = (uint64_t)st.st_size;
    durable_bytes_ = file_bytes_;
    ++segments_opened_;
}

uint64_t SegmentWriter::open_for_resume(uint64_t position, std::optional<uint64_t> durable_bytes) {
    if (fd_ >= 0) close();

    const SegmentRange r = segment_range_for(position, opt_.segment_size);
    const fs::path p = opt_.out_dir / segment_file_name(opt_.entity, r, opt_.ext);

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        const uint64_t dropped = durable_bytes ? discard_segments_after(r) : 0;
        open_segment(r);
        return dropped;
    }

    const int fd = ::open(p.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) throw DurabilityError("cannot open segment " + p.string() + ": " + std::strerror(errno));

    uint64_t dropped = 0;
    try {
        struct stat st {};
        if (::fstat(fd, &st) != 0) throw DurabilityError("fstat failed " + p.string());
        const uint64_t size = (uint64_t)st.st_size;

        if (durable_bytes && *durable_bytes > size) {
            throw ChainsegException("segment " + p.string() + " has " + std::to_string(size) +
                                    " bytes, checkpoint claims " + std::to_string(*durable_bytes));
        }
        const uint64_t keep = last_line_boundary(fd, durable_bytes ? *durable_bytes : size, p.string());
        if (keep < size) {
            if (::ftruncate(fd, (off_t)keep) != 0) {
                throw DurabilityError("ftruncate failed " + p.string() + ": " + std::strerror(errno));
            }
            fsync_fd(fd, p.string());
            dropped = size - keep;
        }
    } catch (...) {
        ::close(fd);
        throw;
    }
    ::close(fd);

    if (dropped > 0) {
        std::cerr << "[chainseg] segment " << p.filename().string() << ": dropped " << dropped
                  << " bytes past the last checkpoint\n";
    }
    if (durable_bytes) dropped += discard_segments_after(r);
    open_segment(r);
    return dropped;
}

uint64_t SegmentWriter::discard_segments_after(const SegmentRange& r) {
    uint64_t dropped = 0;
    for (const auto& name : list_segment_files(opt_.out_dir, opt_.entity, opt_.ext)) {
        auto info = parse_segment_file_name(name, opt_.ext);
        if (!info || info->range.start <= r.start) continue;

        const fs::path p = opt_.out_dir / name;
        std::error_code ec;
        const uint64_t size = (uint64_t)fs::file_size(p, ec);
        if (ec) throw DurabilityError("stat failed " + p.string() + ": " + ec.message());
        if (size == 0) continue;

        const int fd = ::open(p.c_str(), O_RDWR | O_CLOEXEC);
        if (fd < 0) throw DurabilityError("cannot open segment " + p.string() + ": " + std::strerror(errno));
        if (::ftruncate(fd, 0) != 0) {
            const int e = errno;
            ::close(fd);
            throw DurabilityError("ftruncate failed " + p.string() + ": " + std::strerror(e));
        }
        try {
            fsync_fd(fd, p.string());
        } catch (...) {
            ::close(fd);
            throw;
        }
        ::close(fd);

        std::cerr << "[chainseg] segment " << name << ": emptied, it only held records past the last checkpoint\n";
        dropped += size;
    }
    return dropped;
}

void SegmentWriter::enter_position(uint64_t position) {
    const SegmentRange r = segment_range_for(position, opt_.segment_size);
    if (current_ && *current_ == r && fd_ >= 0) return;
    if (fd_ >= 0) close();
    open_segment(r);
}

void SegmentWriter::write(uint64_t position, std::string_view line) {
    enter_position(position);
    buf_.append(line.data(), line.size());
    buf_.push_back('\n');
    ++buffered_records_;
    if (buffered_records_ >= opt_.max_buffered_records) flush();
}

void SegmentWriter::flush() {
    if (buf_.empty()) return;
    if (fd_ < 0) throw DurabilityError("flush without open segment");
    write_all_fd(fd_, buf_.data(), buf_.size(), current_path_.string());
    file_bytes_ += buf_.size();
    buf_.clear();
    buffered_records_ = 0;
}

void SegmentWriter::durability_barrier() {
    if (fd_ < 0) return;
    flush();
    fsync_fd(fd_, current_path_.string());
    durable_bytes_ = file_bytes_;
}

void SegmentWriter::close() {
    if (fd_ < 0) return;
    durability_barrier();
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw DurabilityError("close failed " + current_path_.string() + ": " + std::strerror(errno));
    }
    ++segments_closed_;
}

} // namespace chainseg
