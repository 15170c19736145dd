#include "loader.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

bool read_file_binary(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if(!f) {
        std::cerr << "[loadbin] cannot open '" << path << "'\n";
        return false;
    }
    f.seekg(0, std::ios::end);
    std::streamsize n = f.tellg();
    if(n < 0) {
        std::cerr << "[loadbin] cannot size '" << path << "'\n";
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize((size_t)n);
    if(n > 0) f.read(reinterpret_cast<char*>(out.data()), n);
    if(!f) {
        std::cerr << "[loadbin] short read from '" << path << "'\n";
        return false;
    }
    if(out.empty()) {
        std::cerr << "[loadbin] '" << path << "' is empty\n";
        return false;
    }
    return true;
}

bool parse_hexbytes(std::istream& in, std::vector<uint8_t>& out) {
    out.clear();
    std::string line;
    size_t lineno = 0;
    auto is_hex = [](char c){
        return (c>='0'&&c<='9')||(c>='a'&&c<='f')||(c>='A'&&c<='F');
    };
    while (std::getline(in, line)) {
        ++lineno;
        // strip comment markers: # ... ; ... // ...
        auto cut = line.find_first_of("#;");
        if (cut != std::string::npos) line.resize(cut);
        cut = line.find("//");
        if (cut != std::string::npos) line.resize(cut);

        std::istringstream iss(line);
        std::string tok;
        while (iss >> tok) {
            tok.erase(std::remove(tok.begin(), tok.end(), ','), tok.end());
            tok.erase(std::remove(tok.begin(), tok.end(), '_'), tok.end());
            if (tok.size() > 2 && tok[0]=='0' && (tok[1]=='x' || tok[1]=='X')) {
                tok = tok.substr(2);
            }
            if (tok.empty()) continue;

            if (!std::all_of(tok.begin(), tok.end(), is_hex)) {
                std::cerr << "[loadhex] non-hex token '" << tok
                          << "' at line " << lineno << "\n";
                return false;
            }
            // a four-digit token is one opcode, stored big-endian
            if (tok.size() == 4) {
                unsigned long w = std::stoul(tok, nullptr, 16);
                out.push_back(static_cast<uint8_t>(w >> 8));
                out.push_back(static_cast<uint8_t>(w & 0xFF));
                continue;
            }
            if (tok.size() > 2) {
                std::cerr << "[loadhex] byte out of range '" << tok
                          << "' at line " << lineno << "\n";
                return false;
            }
            out.push_back(static_cast<uint8_t>(std::stoul(tok, nullptr, 16)));
        }
    }
    if (out.empty()) {
        std::cerr << "[loadhex] no bytes read\n";
        return false;
    }
    return true;
}

bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path);
    if(!f) {
        std::cerr << "[loadhex] cannot open '" << path << "'\n";
        return false;
    }
    if (!parse_hexbytes(f, out)) {
        std::cerr << "[loadhex] failed to parse '" << path << "'\n";
        return false;
    }
    return true;
}
