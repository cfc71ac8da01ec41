// chainseg/cpp/tools/chainseg_rebuild_index_main.cpp
#include <iostream>
#include <string>

#include "chainseg/config.h"
#include "chainseg/shard_writer.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string family;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") config_path = arg_value(i, argc, argv);
        else family = a;
    }
    if (config_path.empty() || family.empty()) {
        std::cerr << "Usage: chainseg_rebuild_index --config FILE <family>\n";
        return 1;
    }

    try {
        const auto cfg = chainseg::load_config(config_path);
        const auto& opt = chainseg::find_sitemap(cfg, family);
        if (opt.index.index_path.empty()) {
            std::cerr << "sitemap." << family << " has no index_path\n";
            return 1;
        }
        const size_t n = chainseg::rebuild_sitemap_index(opt.layout, opt.index);
        std::cout << "wrote " << opt.index.index_path.string() << " (" << n << " shards)\n";
    } catch (const std::exception& e) {
        std::cerr << "rebuild failed: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
