#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <ctime>
#include <cstring>

namespace util {

namespace {

const char* kBase58Alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::mt19937_64& generator() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
}

} // namespace

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for env var " + name + ": " + value);
    }
}

uint64_t get_env_u64(const std::string& name, uint64_t default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid unsigned value for env var " + name + ": " + value);
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid numeric value for env var " + name + ": " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v = to_lower(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso_string);
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Optional ".mmm" fraction
    if (ss.peek() == '.') {
        ss.get();
        int ms = 0;
        ss >> ms;
        if (!ss.fail()) {
            tp += std::chrono::milliseconds(ms);
        }
    }
    return tp;
}

std::string random_hex(size_t length) {
    static const char* digits = "0123456789abcdef";
    std::uniform_int_distribution<int> dis(0, 15);

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(digits[dis(generator())]);
    }
    return out;
}

uint64_t random_between(uint64_t low, uint64_t high) {
    if (high <= low) {
        return low;
    }
    std::uniform_int_distribution<uint64_t> dis(low, high);
    return dis(generator());
}

int random_int(int low, int high) {
    if (high <= low) {
        return low;
    }
    std::uniform_int_distribution<int> dis(low, high);
    return dis(generator());
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // Big-number conversion, most significant digit first
    std::vector<uint8_t> b58((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != b58.end(); ++it) {
        result += kBase58Alphabet[*it];
    }
    return result;
}

std::vector<uint8_t> base58_decode(const std::string& encoded) {
    size_t zeros = 0;
    while (zeros < encoded.size() && encoded[zeros] == '1') {
        ++zeros;
    }

    std::vector<uint8_t> b256((encoded.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < encoded.size(); ++i) {
        const char* p = std::strchr(kBase58Alphabet, encoded[i]);
        if (p == nullptr || *p == '\0') {
            throw std::invalid_argument("Invalid base58 character in: " + encoded);
        }
        int carry = static_cast<int>(p - kBase58Alphabet);
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + (b256.size() - length);
    std::vector<uint8_t> result(zeros, 0);
    result.insert(result.end(), it, b256.end());
    return result;
}

int compare_versions(const std::string& lhs, const std::string& rhs) {
    auto parts_of = [](const std::string& v) {
        std::vector<long> parts;
        for (const auto& p : split_string(v, '.')) {
            try {
                parts.push_back(std::stol(p));
            } catch (const std::exception&) {
                parts.push_back(0);
            }
        }
        return parts;
    };

    auto a = parts_of(lhs);
    auto b = parts_of(rhs);
    size_t n = std::max(a.size(), b.size());
    a.resize(n, 0);
    b.resize(n, 0);

    for (size_t i = 0; i < n; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    return 0;
}

} // namespace util
