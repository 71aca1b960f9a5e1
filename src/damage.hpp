#pragma once

struct RNG;

inline constexpr double MAX_MITIGATION = 0.95;

// defense / (defense + K), clamped to [0, MAX_MITIGATION]. 0 when defense <= 0.
double mitigation(double defense, int k);

// raw * (1 - m); 0 for non-positive raw damage.
double applyMitigation(double raw, double mitigationFrac);

// max(0, critDamagePct / 100).
double critMultiplier(double critDamagePct);

double rawAttackDamage(double attack, double ratio, bool isCrit, double critDamagePct);

// x = mhrPct / 100. x <= 0 -> 0 extra hits without drawing. Otherwise one
// draw r in [0,1): floor(x) + (r < frac(x) ? 1 : 0).
int rollExtraHits(double mhrPct, RNG& rng);

struct HitCount {
    int total = 1;
    int extra = 0;
};

HitCount totalHits(int baseHits, double mhrPct, RNG& rng);
