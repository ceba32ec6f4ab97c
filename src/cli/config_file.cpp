// config_file.cpp — key=value loader for cli::Options

#include "cli/config_file.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string_view>
#include <unordered_map>

namespace cli {

namespace {

std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string lower(const std::string& s) {
    std::string t; t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return t;
}

bool to_u64(std::string_view x, std::uint64_t& out) {
    const char* b = x.data();
    const char* e = b + x.size();
    auto res = std::from_chars(b, e, out);
    return res.ec == std::errc{} && res.ptr == e;
}

void warn(const std::string& key, const std::string& value) {
    std::cerr << "WARN: config " << key << " invalid: '" << value << "'\n";
}

} // namespace

void load_config(std::istream& in, Options& o) {
    std::unordered_map<std::string, std::string> kv;
    std::string line;
    while (std::getline(in, line)) {
        // strip comments
        auto phash = line.find('#'); if (phash != std::string::npos) line = line.substr(0, phash);
        auto psemi = line.find(';'); if (psemi != std::string::npos) line = line.substr(0, psemi);
        line = trim(line);
        if (line.empty()) continue;
        auto peq = line.find('=');
        if (peq == std::string::npos) {
            std::cerr << "WARN: config line without '=': " << line << "\n";
            continue;
        }
        kv[lower(trim(line.substr(0, peq)))] = trim(line.substr(peq + 1));
    }

    for (const auto& [k, v] : kv) {
        std::uint64_t u = 0;
        bool b = false;
        if (k == "start_x") {
            if (to_u64(v, u)) o.start_x = static_cast<std::size_t>(u); else warn(k, v);
        } else if (k == "start_y") {
            if (to_u64(v, u)) o.start_y = static_cast<std::size_t>(u); else warn(k, v);
        } else if (k == "iterations") {
            if (to_u64(v, u)) o.iterations = static_cast<core::count_t>(u); else warn(k, v);
        } else if (k == "seed") {
            if (!parse_seed(v, o.seed)) warn(k, v);
        } else if (k == "max_attempts") {
            if (lower(v) == "none" || lower(v) == "unlimited") o.max_attempts.reset();
            else if (to_u64(v, u) && u > 0) o.max_attempts = static_cast<std::size_t>(u);
            else warn(k, v);
        } else if (k == "progress") {
            if (parse_bool(v, b)) o.progress = b; else warn(k, v);
        } else if (k == "trace") {
            if (to_u64(v, u)) o.trace = static_cast<core::count_t>(u); else warn(k, v);
        } else if (k == "time") {
            if (parse_bool(v, b)) o.time = b; else warn(k, v);
        } else {
            std::cerr << "WARN: unknown config key '" << k << "'\n";
        }
    }
}

bool load_config(const std::string& path, Options& o) {
    std::ifstream fin(path);
    if (!fin) return false;
    load_config(fin, o);
    return true;
}

} // namespace cli
