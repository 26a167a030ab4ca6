#pragma once

#include <string>
#include <vector>
#include <optional>

namespace util {
    std::string current_utc_date();
    std::string current_local_date();

    std::string trim(const std::string& str);
    // Fields are trimmed; empty fields are kept
    std::vector<std::string> split(const std::string& str, char delim);
    std::string join(const std::vector<std::string>& items, const std::string& sep);

    // Lenient numeric coercion: empty, "null", "NaN" or garbage yield nullopt
    std::optional<double> parse_double(const std::string& str);

    // "2024-01-02 00:00:00" -> "2024-01-02"; nullopt if not a YYYY-MM-DD prefix
    std::optional<std::string> normalize_date(const std::string& str);

    double random_jitter(double min_s, double max_s);

    std::string csv_escape(const std::string& field);
}
