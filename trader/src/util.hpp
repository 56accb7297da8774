#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::string trim(const std::string& str);
std::string to_lower(std::string str);
std::string to_upper(std::string str);

// Time utilities
std::string current_iso8601();
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::string format_compact_date(const std::chrono::system_clock::time_point& tp);
int utc_hour(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t epoch_ms);
int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp);

// Parsing utilities
double safe_parse_double(const std::string& str, double default_value = 0.0);
// First "$95,000.50"-style amount found in free text
std::optional<double> extract_dollar_amount(const std::string& text);

// Random utilities
std::string generate_uuid();
double random_jitter(double base_value, double jitter_factor = 0.1);
// Stable across runs and platforms (FNV-1a)
uint64_t stable_hash(const std::string& text);

// Network utilities
bool is_network_error(int http_status);
bool should_retry_request(int http_status, int attempt_count, int max_attempts = 3);

} // namespace util
