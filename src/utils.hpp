#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> random_bytes(std::size_t count);

// Random (version 4) UUID, lowercase and hyphenated.
std::string generate_id();
bool looks_like_id(const std::string& value);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
bool iequals(const std::string& a, const std::string& b);
std::vector<std::string> split_words(const std::string& line);

// UTC ISO-8601, second precision ("2026-01-02T03:04:05Z").
std::string format_timestamp(Timestamp tp);
std::optional<Timestamp> parse_timestamp(const std::string& text);

// "HH:MM" as minutes after midnight.
std::optional<int> parse_time_of_day(const std::string& text);
