#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// "1.50 MB"; binary units up to TB.
std::string format_size(uint64_t bytes);
// "HH:MM:SS"; hours are not wrapped at 24.
std::string format_hms(double seconds);
// File-name column for transfer lines: long names keep 20 leading and 40
// trailing characters, the result is left-justified to 70.
std::string pad_name(const std::string& name);
