#include "utils.hpp"
#include <openssl/sha.h>
#include <cmath>
#include <sstream>
#include <iomanip>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string format_size(uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string format_hms(double seconds){
    if(!(seconds > 0)) seconds = 0;
    auto total = static_cast<uint64_t>(std::llround(seconds));
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << total / 3600 << ":"
        << std::setw(2) << (total / 60) % 60 << ":"
        << std::setw(2) << total % 60;
    return oss.str();
}

std::string pad_name(const std::string& name){
    std::string out = name;
    if(out.size() > 60){
        out = out.substr(0, 20) + "..." + out.substr(out.size() - 40);
    }
    if(out.size() < 70) out.append(70 - out.size(), ' ');
    return out;
}
