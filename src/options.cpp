#include "options.hpp"
#include <iostream>
#include <stdexcept>
#include "loader.hpp"

static bool parse_int(const std::string& s, long lo, long hi, long& out) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used, 0);
        if (used != s.size() || v < lo || v > hi) return false;
        out = v;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool parse_options(const std::vector<std::string>& args, Options& opt, std::string& err) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto value = [&](long lo, long hi, long& out) -> bool {
            if (i + 1 >= args.size()) { err = a + " needs a value"; return false; }
            if (!parse_int(args[++i], lo, hi, out)) {
                err = "bad value '" + args[i] + "' for " + a;
                return false;
            }
            return true;
        };
        long v = 0;
        if (a == "--hex") {
            opt.hex_rom = true;
        }
        else if (a == "--speed") {
            if (!value(1, 10000, v)) return false;
            opt.speed = static_cast<int>(v);
        }
        else if (a == "--scale") {
            if (!value(1, 64, v)) return false;
            opt.scale = static_cast<int>(v);
        }
        else if (a == "--seed") {
            if (!value(0, 0xFFFFFFFFL, v)) return false;
            opt.seed = static_cast<uint32_t>(v);
            opt.has_seed = true;
        }
        else if (a == "--frames") {
            if (!value(1, 100000000L, v)) return false;
            opt.frames = static_cast<int>(v);
        }
        else if (!a.empty() && a[0] == '-') {
            err = "unknown option '" + a + "'";
            return false;
        }
        else if (opt.rom_path.empty()) {
            opt.rom_path = a;
        }
        else {
            err = "unexpected argument '" + a + "'";
            return false;
        }
    }
    if (opt.rom_path.empty()) {
        err = "missing ROM path";
        return false;
    }
    return true;
}

const char* usage_text() {
    return
R"(usage: chip8vm ROM [options]
  --hex         ROM is a text file of hex bytes
  --speed N     instructions per frame (default 10)
  --scale N     window pixels per display pixel (default 10)
  --seed N      random seed for RND
  --frames N    frames to run headless (default 600)
)";
}

bool boot(CPU& cpu, const Options& opt) {
    std::vector<uint8_t> rom;
    bool ok = opt.hex_rom ? read_file_hexbytes(opt.rom_path, rom)
                          : read_file_binary(opt.rom_path, rom);
    if (!ok) return false;

    cpu.reset();
    if (opt.has_seed) cpu.seed(opt.seed);
    if (!cpu.load_program(rom)) {
        std::cerr << "[chip8] '" << opt.rom_path << "' is " << rom.size()
                  << " bytes, only " << (CPU::MEM_SIZE - CPU::PROG_BEGIN) << " fit\n";
        return false;
    }
    return true;
}
