#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

// Two sides of a battle. Both use the same 1..9 slot numbering.
enum class Team : uint8_t {
    A = 0,
    B = 1,
};

inline Team otherTeam(Team t) {
    return (t == Team::A) ? Team::B : Team::A;
}

inline const char* teamName(Team t) {
    return (t == Team::A) ? "A" : "B";
}

inline bool parseTeam(const std::string& s, Team& out) {
    if (s == "A" || s == "a") {
        out = Team::A;
        return true;
    }
    if (s == "B" || s == "b") {
        out = Team::B;
        return true;
    }
    return false;
}

inline double clampd(double v, double lo, double hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
