// chainseg/cpp/include/chainseg/shard_writer.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chainseg/sitemap.h"

namespace chainseg {

// Where the shards of one family live and what wraps their entries.
struct ShardLayout {
    std::filesystem::path dir;
    std::string prefix{"sitemap_txids"};
    int pad{6};
    std::string ext{"xml"};

    std::string header{kUrlsetHeader};
    std::string footer{kUrlsetFooter};
    std::string footer_marker{kUrlsetFooterMarker};
    std::string entry_close{kUrlEntryClose};

    uint64_t tail_window{256 * 1024};

    // sitemap_txids_000001.xml
    std::string shard_file_name(uint64_t index) const;
    std::filesystem::path shard_path(uint64_t index) const { return dir / shard_file_name(index); }
};

// Indices of the shards present on disk, ascending.
std::vector<uint64_t> list_shard_indices(const ShardLayout& layout);

// Offset of the last footer marker: tail window first, then the whole file.
std::optional<uint64_t> find_footer_offset(int fd, uint64_t size, const ShardLayout& layout);

// Keeps one shard open between open_for_append() and close(). On disk the shard is
// a complete document (header, entries, footer) except between those two calls.
// I/O failures throw DurabilityError, an unrepairable shard ShardCorruptError.
class ShardWriter {
public:
    explicit ShardWriter(ShardLayout layout);
    ~ShardWriter();

    ShardWriter(const ShardWriter&) = delete;
    ShardWriter& operator=(const ShardWriter&) = delete;

    // Creates the shard (header + footer) if missing, then cuts its footer off.
    // Returns true when the file was created by this call.
    bool open_for_append(uint64_t index);

    // One formatted entry, buffered until close().
    void append_entry(std::string_view entry);

    // Buffered entries + footer in one write, fsync, close.
    void close();

    bool is_open() const { return fd_ >= 0; }
    uint64_t shard_index() const { return index_; }
    uint32_t entries_buffered() const { return entries_buffered_; }
    // repairs done by open_for_append over this writer's lifetime
    uint64_t repairs() const { return repairs_; }

    const ShardLayout& layout() const { return layout_; }

private:
    uint64_t repair(int fd, uint64_t size, const std::filesystem::path& p);

    ShardLayout layout_;
    int fd_{-1};
    uint64_t index_{0};
    std::filesystem::path path_;

    std::string buf_;
    uint32_t entries_buffered_{0};
    uint64_t repairs_{0};
};

struct SitemapIndexOptions {
    std::filesystem::path index_path;
    std::string base_url;              // prefix for every shard file name
    std::vector<std::string> extra_locs; // listed before the shards
};

// Full rewrite of the <sitemapindex>, atomically. Returns the number of shards listed.
size_t rebuild_sitemap_index(const ShardLayout& layout, const SitemapIndexOptions& opt);

} // namespace chainseg
