#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "chainseg/segment_name.h"

using namespace chainseg;

static std::filesystem::path mk_tmp_dir() {
    auto p = std::filesystem::temp_directory_path() / ("chainseg_segname_" + std::to_string(::getpid()));
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
}

int main() {
    // ranges
    auto r = segment_range_for(0, 10000);
    assert(r.start == 0 && r.end == 9999);
    r = segment_range_for(9999, 10000);
    assert(r.start == 0 && r.end == 9999);
    r = segment_range_for(10000, 10000);
    assert(r.start == 10000 && r.end == 19999);
    r = segment_range_for(934567, 10000);
    assert(r.start == 930000 && r.end == 939999);
    r = segment_range_for(7, 1);
    assert(r.start == 7 && r.end == 7);

    for (uint64_t p = 0; p < 50; ++p) {
        auto a = segment_range_for(p, 7);
        assert(a.start == p / 7 * 7 && a.end == a.start + 6);
        assert(a.contains(p));
        if (p > 0) {
            auto b = segment_range_for(p - 1, 7);
            // a boundary is crossed exactly when p is a multiple of the size
            assert((a != b) == (p % 7 == 0));
        }
    }

    bool threw = false;
    try {
        segment_range_for(5, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // names
    assert(segment_file_name("txids", 930000, 939999) == "txids_000930000_000939999.jsonl");
    assert(segment_file_name("blocks", segment_range_for(12, 10000)) == "blocks_000000000_000009999.jsonl");
    assert(segment_file_name("addresses", 0, 9, "ndjson") == "addresses_000000000_000000009.ndjson");
    assert(segment_file_name("txids", 990000, 999999) < segment_file_name("txids", 1000000, 1009999));

    auto info = parse_segment_file_name("txids_000930000_000939999.jsonl");
    assert(info && info->entity == "txids");
    assert(info->range.start == 930000 && info->range.end == 939999);
    info = parse_segment_file_name("addresses_000000000_000009999.jsonl");
    assert(info && info->entity == "addresses");
    assert(!parse_segment_file_name("txids_000930000.jsonl"));
    assert(!parse_segment_file_name("txids_00093x000_000939999.jsonl"));
    assert(!parse_segment_file_name("txids_000930000_000939999.jsonl.tmp"));

    // listing ignores other entities and stray files
    auto dir = mk_tmp_dir();
    for (const char* n : {"txids_000010000_000019999.jsonl", "txids_000000000_000009999.jsonl",
                          "blocks_000000000_000009999.jsonl", "txids_notes.txt"}) {
        std::ofstream(dir / n) << "";
    }
    auto files = list_segment_files(dir, "txids");
    assert(files.size() == 2);
    assert(files[0] == "txids_000000000_000009999.jsonl");
    assert(files[1] == "txids_000010000_000019999.jsonl");
    assert(list_segment_files(dir / "missing", "txids").empty());

    std::filesystem::remove_all(dir);
    return 0;
}
