// chainseg/cpp/include/chainseg/segment_writer.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "chainseg/segment_name.h"

namespace chainseg {

struct SegmentWriterOptions {
    std::filesystem::path out_dir;
    std::string entity;
    uint64_t segment_size{10000};
    std::string ext{kSegmentExt};

    // buffered records before an automatic flush() (bounds memory)
    uint32_t max_buffered_records{200000};
};

// Owns at most one open segment. Records are newline-terminated lines.
// Every I/O failure throws DurabilityError.
class SegmentWriter {
public:
    explicit SegmentWriter(SegmentWriterOptions opt);
    ~SegmentWriter();

    SegmentWriter(const SegmentWriter&) = delete;
    SegmentWriter& operator=(const SegmentWriter&) = delete;

    // Reopen the segment holding `position` for a resumed stream.
    // With durable_bytes set (the checkpointed length) the file is cut back to it and
    // later segment files are emptied: those bytes were never claimed by a checkpoint.
    // Without it only a torn trailing line is cut. Returns the number of bytes dropped.
    uint64_t open_for_resume(uint64_t position, std::optional<uint64_t> durable_bytes);

    // Rotate to position's segment if needed, without writing a record.
    void enter_position(uint64_t position);

    // `line` without trailing newline
    void write(uint64_t position, std::string_view line);

    void flush();
    void durability_barrier();
    void close();

    bool is_open() const { return fd_ >= 0; }
    std::optional<SegmentRange> current_segment() const { return current_; }
    std::filesystem::path current_path() const { return current_path_; }

    // bytes in the file after the last flush()
    uint64_t file_bytes() const { return file_bytes_; }
    // bytes covered by the last fsync
    uint64_t durable_bytes() const { return durable_bytes_; }

    uint32_t buffered_records() const { return buffered_records_; }
    uint64_t segments_opened() const { return segments_opened_; }
    uint64_t segments_closed() const { return segments_closed_; }

private:
    void open_segment(const SegmentRange& r);
    uint64_t discard_segments_after(const SegmentRange& r);

    SegmentWriterOptions opt_;
    int fd_{-1};
    std::optional<SegmentRange> current_;
    std::filesystem::path current_path_;

    std::string buf_;
    uint32_t buffered_records_{0};

    uint64_t file_bytes_{0};
    uint64_t durable_bytes_{0};
    uint64_t segments_opened_{0};
    uint64_t segments_closed_{0};
};

} // namespace chainseg
