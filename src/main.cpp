#include "frontend.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {
void print_usage(const char* program) {
    std::cout << "Usage: " << program
              << " <rom_file.gb> [--model dmg|mgb|sgb|cgb] [--boot <file>] [--scale <n>]" << std::endl;
}

bool parse_model(const std::string& name, Model& model) {
    if (name == "dmg") { model = Model::DMG; return true; }
    if (name == "mgb") { model = Model::MGB; return true; }
    if (name == "sgb") { model = Model::SGB; return true; }
    if (name == "cgb") { model = Model::CGB; return true; }
    if (name == "auto") { model = Model::AUTO; return true; }
    return false;
}

bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}
}

int main(int argc, char* argv[]) {
    FrontendOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--model" && has_value) {
            if (!parse_model(argv[++i], options.config.model)) {
                std::cerr << "Unknown model: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--boot" && has_value) {
            if (!read_file(argv[++i], options.config.boot_rom)) {
                std::cerr << "Failed to read boot ROM: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--scale" && has_value) {
            options.scale = std::atoi(argv[++i]);
            if (options.scale < 1) {
                options.scale = 1;
            }
        } else if (std::strncmp(argv[i], "--", 2) == 0 || !options.rom_path.empty()) {
            print_usage(argv[0]);
            return 1;
        } else {
            options.rom_path = arg;
        }
    }

    if (options.rom_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Frontend frontend;

    if (!frontend.init(options.scale)) {
        std::cerr << "Failed to initialize frontend" << std::endl;
        return 1;
    }

    return frontend.run(options) ? 0 : 1;
}
