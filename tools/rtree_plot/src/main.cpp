#include "rtree_plot/plotter.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "Usage: rtree_plot --index <dir> --output <file.png> [options]\n"
                 "\n"
                 "Options:\n"
                 "  -x, --index <dir>         Directory holding index.dat and index.res\n"
                 "  -o, --output <path>       PNG file to write\n"
                 "  -W, --width <px>          Image width (default: 1024)\n"
                 "  -H, --height <px>         Image height (default: 1024)\n"
                 "  -l, --level <n>           Lowest level drawn, 0 includes data (default: 0)\n"
                 "  -q, --quiet               Suppress progress logging\n"
                 "  -h, --help                Show this help text\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    rtreedb::plot::PlotConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "[rtree_plot] Missing value for " << arg << std::endl;
            return 1;
        }
        const std::string value(argv[++i]);

        try {
            if (arg == "-x" || arg == "--index") {
                config.index_directory = fs::path(value);
            } else if (arg == "-o" || arg == "--output") {
                config.output_png = fs::path(value);
            } else if (arg == "-W" || arg == "--width") {
                config.width = std::stoi(value);
            } else if (arg == "-H" || arg == "--height") {
                config.height = std::stoi(value);
            } else if (arg == "-l" || arg == "--level") {
                config.min_level = std::stoi(value);
            } else {
                std::cerr << "[rtree_plot] Unrecognized argument: " << arg << "\n";
                print_usage();
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "[rtree_plot] Invalid value for " << arg << ": " << value << std::endl;
            return 1;
        }
    }

    return rtreedb::plot::run_plot(config);
}
