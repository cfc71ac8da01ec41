// chainseg/cpp/tools/chainseg_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "chainseg/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: chainseg_validate <dir> [--segments ENTITY] [--checkpoint FILE] "
                     "[--shards PREFIX] [--max-urls N]\n";
        return 1;
    }

    std::filesystem::path dir = argv[1];
    std::string entity;
    std::string checkpoint;
    std::string shards;
    uint64_t max_urls = 0;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--segments") entity = arg_value(i, argc, argv);
        else if (a == "--checkpoint") checkpoint = arg_value(i, argc, argv);
        else if (a == "--shards") shards = arg_value(i, argc, argv);
        else if (a == "--max-urls") max_urls = std::stoull(arg_value(i, argc, argv));
    }
    if (entity.empty() && shards.empty()) {
        std::cerr << "nothing to validate: pass --segments and/or --shards\n";
        return 1;
    }

    chainseg::ValidationResult vr;
    vr.ok = true;
    nlohmann::json j;

    if (!entity.empty()) {
        auto kind = chainseg::entity_from_name(entity);
        if (!kind) {
            std::cerr << "unknown entity: " << entity << "\n";
            return 1;
        }
        auto r = chainseg::validate_segments(dir, *kind, checkpoint);
        j["records"] = r.items;
        vr.ok = vr.ok && r.ok;
        vr.errors.insert(vr.errors.end(), r.errors.begin(), r.errors.end());
    }
    if (!shards.empty()) {
        chainseg::ShardLayout layout;
        layout.dir = dir;
        layout.prefix = shards;
        auto r = chainseg::validate_shard_dir(layout, max_urls);
        j["urls"] = r.items;
        vr.ok = vr.ok && r.ok;
        vr.errors.insert(vr.errors.end(), r.errors.begin(), r.errors.end());
    }

    j["ok"] = vr.ok;
    j["errors"] = vr.errors;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
