#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <random>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace util {

std::string current_utc_date() {
    auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%F");
    return ss.str();
}

std::string current_local_date() {
    // Local zone comes from TZ
    auto itt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream ss;
    ss << std::put_time(std::localtime(&itt), "%F");
    return ss.str();
}

std::string trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(trim(token));
    }
    return tokens;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::optional<double> parse_double(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    const char* begin = s.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

std::optional<std::string> normalize_date(const std::string& str) {
    std::string s = trim(str);
    if (s.size() < 10) return std::nullopt;

    for (size_t i = 0; i < 10; ++i) {
        bool dash = (i == 4 || i == 7);
        if (dash && s[i] != '-') return std::nullopt;
        if (!dash && !std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    return s.substr(0, 10);
}

double random_jitter(double min_s, double max_s) {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::uniform_real_distribution<> dis(min_s, max_s);
    return dis(gen);
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace util
