#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return out;
}

std::string generate_id(){
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant
    auto hex = hex_from_bytes(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool looks_like_id(const std::string& value){
    if(value.size() != 36) return false;
    for(std::size_t i = 0; i < value.size(); ++i){
        if(i == 8 || i == 13 || i == 18 || i == 23){
            if(value[i] != '-') return false;
        } else if(!std::isxdigit(static_cast<unsigned char>(value[i]))){
            return false;
        }
    }
    return true;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

bool iequals(const std::string& a, const std::string& b){
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){
             return std::tolower(x) == std::tolower(y);
           });
}

// Whitespace split that keeps "double quoted" words together.
std::vector<std::string> split_words(const std::string& line){
    std::vector<std::string> out;
    std::string current;
    bool in_quotes = false;
    bool have_token = false;
    for(char ch : line){
        if(ch == '"'){
            in_quotes = !in_quotes;
            have_token = true;
            continue;
        }
        if(!in_quotes && std::isspace(static_cast<unsigned char>(ch))){
            if(have_token){
                out.push_back(current);
                current.clear();
                have_token = false;
            }
            continue;
        }
        current.push_back(ch);
        have_token = true;
    }
    if(have_token) out.push_back(current);
    return out;
}

std::string format_timestamp(Timestamp tp){
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string& text){
    if(text.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(iss.fail()) return std::nullopt;
    std::time_t t = timegm(&tm);
    if(t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t);
}

std::optional<int> parse_time_of_day(const std::string& text){
    auto colon = text.find(':');
    if(colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) return std::nullopt;
    int parts[2] = {0, 0};
    const std::string fields[2] = {text.substr(0, colon), text.substr(colon + 1)};
    for(int i = 0; i < 2; ++i){
        if(fields[i].size() > 2) return std::nullopt;
        for(char ch : fields[i]){
            if(!std::isdigit(static_cast<unsigned char>(ch))) return std::nullopt;
            parts[i] = parts[i] * 10 + (ch - '0');
        }
    }
    if(parts[0] > 23 || parts[1] > 59) return std::nullopt;
    return parts[0] * 60 + parts[1];
}
