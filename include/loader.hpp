// include/loader.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "instruction.hpp"

// --- file loaders ---
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Accepts text files containing hex bytes separated by spaces/newlines, e.g.:
//   0C 00 00 00 00 00 00 00 05   # LoadA 5
bool read_file_hexbytes(const std::string& path, std::vector<uint8_t>& out);

// Zeroed image with `bytes` copied in at `origin`. Throws std::out_of_range if they don't fit.
ProgramImage make_image(const std::vector<uint8_t>& bytes, size_t origin = 0);
