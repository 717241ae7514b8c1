#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cctype>
#include <eosio/eosio.hpp>

namespace idovenue {

using std::string;
using std::string_view;
using std::vector;

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

/// strip leading and trailing spaces
inline string_view trim(string_view sv) {
    const auto first = sv.find_first_not_of(' ');
    if (first == string_view::npos) return string_view();
    const auto last = sv.find_last_not_of(' ');
    return sv.substr(first, last - first + 1);
}

/// memo fields separated by `delim`, each trimmed; empty fields are kept
inline vector<string_view> split(string_view str, char delim) {
    vector<string_view> fields;
    size_t begin = 0;
    for (auto pos = str.find(delim); pos != string_view::npos; pos = str.find(delim, begin)) {
        fields.push_back(trim(str.substr(begin, pos - begin)));
        begin = pos + 1;
    }
    fields.push_back(trim(str.substr(begin)));
    return fields;
}

inline bool is_numeric(string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

inline uint64_t to_uint64(string_view s, const char* err_title) {
    CHECK(is_numeric(s) && s.size() <= 19, string(err_title) + ": not a valid unsigned integer: " + string(s));
    uint64_t result = 0;
    for (char c : s) result = result * 10 + (c - '0');
    return result;
}

inline string symbol_to_str(const eosio::extended_symbol& sym) {
    return std::to_string(sym.get_symbol().precision()) + "," + sym.get_symbol().code().to_string()
         + "@" + sym.get_contract().to_string();
}

} // namespace idovenue
