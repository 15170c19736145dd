// include/options.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "scheduler.hpp"

struct Options {
    std::string rom_path;
    bool     hex_rom{false};
    int      speed{Scheduler::DEFAULT_SPEED};
    int      scale{10};
    bool     has_seed{false};
    uint32_t seed{0};
    int      frames{600};
};

// Returns false with a message in err on a bad command line.
bool parse_options(const std::vector<std::string>& args, Options& opt, std::string& err);
const char* usage_text();

// Loads fonts and the ROM named by opt into a freshly reset cpu.
bool boot(CPU& cpu, const Options& opt);
