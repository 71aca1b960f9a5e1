#pragma once

#include "common.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Small helpers shared by the INI-ish loaders (battle config, roster).

inline void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

// Strips comments (# or ;). Quoted strings are not handled.
inline std::string stripIniComment(const std::string& line) {
    const size_t pHash = line.find('#');
    const size_t pSemi = line.find(';');
    size_t cut = line.size();
    if (pHash != std::string::npos) cut = pHash;
    if (pSemi != std::string::npos && pSemi < cut) cut = pSemi;
    return line.substr(0, cut);
}

inline bool parseIniInt(const std::string& v, int& out) {
    const std::string s = trimCopy(v);
    if (s.empty()) return false;
    try {
        size_t idx = 0;
        const long long x = std::stoll(s, &idx, 10);
        if (idx != s.size()) return false;
        if (x < -2147483647LL || x > 2147483647LL) return false;
        out = static_cast<int>(x);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parseIniU32(const std::string& v, uint32_t& out) {
    const std::string s = trimCopy(v);
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t idx = 0;
        const unsigned long long x = std::stoull(s, &idx, 0);
        if (idx != s.size() || x > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(x);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parseIniDouble(const std::string& v, double& out) {
    const std::string s = trimCopy(v);
    if (s.empty()) return false;
    try {
        size_t idx = 0;
        const double x = std::stod(s, &idx);
        if (idx != s.size() || !std::isfinite(x)) return false;
        out = x;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Splits on commas, trimming and dropping empty items.
inline std::vector<std::string> splitIniList(const std::string& v) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : v) {
        if (c == ',') {
            cur = trimCopy(cur);
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cur = trimCopy(cur);
    if (!cur.empty()) out.push_back(cur);
    return out;
}

inline void appendIniWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}
