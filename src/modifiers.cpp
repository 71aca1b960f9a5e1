#include "modifiers.hpp"
#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

const char* modifierTagName(ModifierTag t) {
    switch (t) {
        case ModifierTag::Base:    return "base";
        case ModifierTag::Inc:     return "inc";
        case ModifierTag::More:    return "more";
        case ModifierTag::Less:    return "less";
        case ModifierTag::Special: return "special";
    }
    return "?";
}

bool parseModifierTag(const std::string& raw, ModifierTag& out) {
    const std::string s = toLower(trimCopy(raw));
    if (s == "base") { out = ModifierTag::Base; return true; }
    if (s == "inc") { out = ModifierTag::Inc; return true; }
    if (s == "more") { out = ModifierTag::More; return true; }
    if (s == "less") { out = ModifierTag::Less; return true; }
    if (s == "special") { out = ModifierTag::Special; return true; }
    return false;
}

double evaluateStat(const std::string& statKey,
                    double baseValue,
                    const std::vector<ModifierLine>& mods,
                    std::optional<double> clampMin,
                    std::optional<double> clampMax) {
    double baseAdd = 0.0;
    double incSum = 0.0;
    double moreMul = 1.0;
    double lessMul = 1.0;

    for (const ModifierLine& m : mods) {
        if (m.stat != statKey) continue;
        switch (m.tag) {
            case ModifierTag::Base:
                baseAdd += m.value;
                break;
            case ModifierTag::Inc:
                incSum += m.value;
                break;
            case ModifierTag::More:
                moreMul *= (1.0 + m.value / 100.0);
                break;
            case ModifierTag::Less: {
                const double v = (m.value <= 0.0) ? m.value : -m.value;
                lessMul *= (1.0 + v / 100.0);
                break;
            }
            case ModifierTag::Special:
                break;
        }
    }

    double out = (baseValue + baseAdd) * (1.0 + incSum / 100.0) * moreMul * lessMul;
    if (clampMin) out = std::max(*clampMin, out);
    if (clampMax) out = std::min(*clampMax, out);
    return out;
}

bool parseModifierLine(const std::string& text, ModifierLine& out, BattleError* err) {
    const std::string s = trimCopy(text);
    const auto c1 = s.find(':');
    const auto c2 = (c1 == std::string::npos) ? std::string::npos : s.find(':', c1 + 1);
    if (c1 == std::string::npos || c2 == std::string::npos) {
        return setError(err, BattleErrorKind::UnsupportedModifierShape,
                        "expected stat:tag:value, got '" + s + "'");
    }

    ModifierLine m;
    m.stat = toLower(trimCopy(s.substr(0, c1)));
    if (m.stat.empty()) {
        return setError(err, BattleErrorKind::UnsupportedModifierShape, "empty stat key in '" + s + "'");
    }

    if (!parseModifierTag(s.substr(c1 + 1, c2 - c1 - 1), m.tag)) {
        return setError(err, BattleErrorKind::UnsupportedModifierShape, "unknown modifier tag in '" + s + "'");
    }

    const std::string valueText = trimCopy(s.substr(c2 + 1));
    try {
        size_t idx = 0;
        m.value = std::stod(valueText, &idx);
        if (idx != valueText.size() || !std::isfinite(m.value)) {
            return setError(err, BattleErrorKind::UnsupportedModifierShape, "bad modifier value in '" + s + "'");
        }
    } catch (const std::exception&) {
        return setError(err, BattleErrorKind::UnsupportedModifierShape, "bad modifier value in '" + s + "'");
    }

    out = std::move(m);
    return true;
}
