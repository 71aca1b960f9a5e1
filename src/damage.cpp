#include "damage.hpp"

#include "rng.hpp"

#include <algorithm>
#include <cmath>

double mitigation(double defense, int k) {
    if (defense <= 0.0) return 0.0;
    const double denom = defense + static_cast<double>(std::max(0, k));
    if (denom <= 0.0) return 0.0;
    return std::clamp(defense / denom, 0.0, MAX_MITIGATION);
}

double applyMitigation(double raw, double mitigationFrac) {
    if (raw <= 0.0) return 0.0;
    return raw * (1.0 - mitigationFrac);
}

double critMultiplier(double critDamagePct) {
    return std::max(0.0, critDamagePct / 100.0);
}

double rawAttackDamage(double attack, double ratio, bool isCrit, double critDamagePct) {
    return attack * ratio * (isCrit ? critMultiplier(critDamagePct) : 1.0);
}

int rollExtraHits(double mhrPct, RNG& rng) {
    const double x = mhrPct / 100.0;
    if (x <= 0.0) return 0;

    const double n = std::floor(x);
    const double f = x - n;
    const double r = rng.roll();
    return static_cast<int>(n) + ((r < f) ? 1 : 0);
}

HitCount totalHits(int baseHits, double mhrPct, RNG& rng) {
    HitCount h;
    h.extra = rollExtraHits(mhrPct, rng);
    h.total = std::max(0, baseHits) + h.extra;
    return h;
}
