#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Single-quote a value for a POSIX shell: abc'd -> 'abc'\''d'
std::string shell_quote(const std::string& value);

std::string random_hex(std::size_t bytes);
std::string generate_transfer_id();

std::string join_remote_path(const std::string& base, const std::string& relative);
std::string remote_parent_directory(const std::string& path);

std::vector<std::string> split_whitespace(const std::string& text);
std::uint64_t parse_grouped_number(const std::string& digits);
std::string format_bytes(std::uint64_t bytes);
