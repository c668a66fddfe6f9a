#include "utils.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

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

std::string shell_quote(const std::string& value){
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for(char c : value){
        if(c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string random_hex(std::size_t bytes){
    std::vector<unsigned char> buf(bytes);
    if(RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1){
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        for(auto& b : buf) b = static_cast<unsigned char>(rng() & 0xff);
    }
    return hex_from_bytes(buf);
}

std::string generate_transfer_id(){
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "transfer_" + std::to_string(ms) + "_" + random_hex(5);
}

std::string join_remote_path(const std::string& base, const std::string& relative){
    if(relative.empty()) return base;
    if(base.empty()) return relative;
    std::string rel = relative;
    while(!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    if(base.back() == '/') return base + rel;
    return base + "/" + rel;
}

std::string remote_parent_directory(const std::string& path){
    auto trimmed = path;
    while(trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    auto pos = trimmed.find_last_of('/');
    if(pos == std::string::npos) return ".";
    if(pos == 0) return "/";
    return trimmed.substr(0, pos);
}

std::vector<std::string> split_whitespace(const std::string& text){
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string token;
    while(iss >> token) out.push_back(token);
    return out;
}

std::uint64_t parse_grouped_number(const std::string& digits){
    std::uint64_t value = 0;
    for(char c : digits){
        if(c >= '0' && c <= '9') value = value * 10 + static_cast<std::uint64_t>(c - '0');
        else if(c == ',' || c == '.' || c == '_') continue;
        else break;
    }
    return value;
}

std::string format_bytes(std::uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while(value >= 1024.0 && unit < 4){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << " B";
    else oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}
