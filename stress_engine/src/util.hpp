#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
uint64_t get_env_u64(const std::string& name, uint64_t default_value);
double get_env_double(const std::string& name, double default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string to_lower(std::string str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

// Random utilities
std::string random_hex(size_t length);
uint64_t random_between(uint64_t low, uint64_t high);
int random_int(int low, int high);

// Base58 (Bitcoin alphabet, as used for Solana addresses)
std::string base58_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base58_decode(const std::string& encoded);

// Semantic version comparison ("0.16.1" < "0.19.0"); missing parts count as zero
int compare_versions(const std::string& lhs, const std::string& rhs);

} // namespace util
