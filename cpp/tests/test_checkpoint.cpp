#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "chainseg/checkpoint.h"
#include "chainseg/errors.h"
#include "chainseg/format.h"

using namespace chainseg;

static std::filesystem::path mk_tmp_dir() {
    auto p = std::filesystem::temp_directory_path() / ("chainseg_ckpt_" + std::to_string(::getpid()));
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
}

int main() {
    auto dir = mk_tmp_dir();
    auto path = dir / "state" / "txids_checkpoint.json";
    const CheckpointState defaults = default_checkpoint("txids", 10000);
    assert(defaults.last_position_written == -1);
    assert(defaults.next_position() == 0);
    assert(defaults.current_segment_end == 9999);

    // missing -> defaults, persisted
    auto l = load_checkpoint(path, defaults);
    assert(l.created && !l.recovered);
    assert(l.state.last_position_written == -1);
    assert(std::filesystem::exists(path));
    assert(!std::filesystem::exists(path.string() + ".tmp"));

    // round trip
    CheckpointState s = l.state;
    s.last_position_written = 10005;
    s.refresh_segment_for(10005);
    s.records_written_total = 10006;
    s.segments_completed = 1;
    s.segment_bytes_durable = 123;
    save_checkpoint(path, s);
    assert(!s.updated_at.empty());

    l = load_checkpoint(path, defaults);
    assert(!l.created && !l.recovered);
    assert(l.state.last_position_written == 10005);
    assert(l.state.current_segment_start == 10000 && l.state.current_segment_end == 19999);
    assert(l.state.records_written_total == 10006);
    assert(l.state.segment_bytes_durable == 123);
    assert(l.state.segment_bytes_known);
    assert(l.state.next_position() == 10006);

    // corrupt -> reset to defaults, never a partial state
    std::ofstream(path, std::ios::trunc) << "{\"entity\":\"txids\",\"last_position_written\":";
    l = load_checkpoint(path, defaults);
    assert(l.recovered);
    assert(l.state.last_position_written == -1);

    std::ofstream(path, std::ios::trunc) << R"({"entity":"txids","last_position_written":"12"})";
    l = load_checkpoint(path, defaults);
    assert(l.recovered);
    assert(l.state.last_position_written == -1);

    // older state without segment_bytes_durable
    std::ofstream(path, std::ios::trunc) << R"({"entity":"txids","segment_size":10000,"last_position_written":42})";
    l = load_checkpoint(path, defaults);
    assert(!l.recovered);
    assert(l.state.last_position_written == 42);
    assert(!l.state.segment_bytes_known);

    // stream layout mismatch is a configuration error
    bool threw = false;
    try {
        require_checkpoint_matches(l.state, "txids", 5000);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        require_checkpoint_matches(l.state, "blocks", 10000);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    require_checkpoint_matches(l.state, "txids", 10000);

    // present but unreadable: fail, keep the file as it is
    if (::geteuid() != 0) {
        const std::string before = R"({"entity":"txids","segment_size":10000,"last_position_written":42})";
        std::filesystem::permissions(path, std::filesystem::perms::none);
        threw = false;
        try {
            load_checkpoint(path, defaults);
        } catch (const DurabilityError&) {
            threw = true;
        }
        assert(threw);
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
        std::ifstream in(path);
        std::string after((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(after == before);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
