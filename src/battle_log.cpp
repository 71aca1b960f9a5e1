#include "battle_log.hpp"

#include <fstream>
#include <ostream>

std::string MemoryLog::exportText() const {
    std::string out;
    for (const std::string& l : lines_) {
        out += l;
        out += '\n';
    }
    return out;
}

bool MemoryLog::exportToFile(const std::string& path, BattleError* err) const {
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        return setError(err, BattleErrorKind::InvalidConfig, "cannot open log file for writing: " + path);
    }
    f << exportText();
    if (!f.good()) {
        return setError(err, BattleErrorKind::InvalidConfig, "failed writing log file: " + path);
    }
    return true;
}

void StreamLog::write(const std::string& line) {
    out_ << line << '\n';
}

std::string logRule() {
    return std::string(42, '=');
}
