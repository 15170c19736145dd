// include/loader.hpp
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// ROM image readers. Both log the reason to stderr and return false on failure.
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Hex bytes separated by whitespace, e.g. "60 05 a2 2a". Comments start with #, ; or //.
bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out);
bool parse_hexbytes(std::istream& in, std::vector<uint8_t>& out);
