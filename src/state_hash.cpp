#include "state_hash.hpp"

#include "battle.hpp"
#include "rng.hpp"

#include <cmath>
#include <cstdio>

namespace {

struct Hasher {
    uint64_t h = 14695981039346656037ull;

    void u8(uint8_t v) { h = fnv1a64(&v, 1, h); }

    void u32(uint32_t v) {
        uint8_t b[4];
        for (int i = 0; i < 4; ++i) b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
        h = fnv1a64(b, sizeof(b), h);
    }

    void i32(int v) { u32(static_cast<uint32_t>(v)); }

    // Rounded to 1/1000 so the hash does not depend on float formatting.
    void num(double v) {
        const long long q = std::llround(v * 1000.0);
        const uint64_t x = static_cast<uint64_t>(q);
        u32(static_cast<uint32_t>(x & 0xFFFFFFFFull));
        u32(static_cast<uint32_t>(x >> 32));
    }

    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        h = fnv1a64(s.data(), s.size(), h);
    }
};

} // namespace

uint64_t battleStateHash(const BattleState& state) {
    Hasher hs;
    hs.i32(state.teamTurn);
    hs.u8(static_cast<uint8_t>(state.startTeam));
    hs.u32(state.rng.state);

    for (Team team : {Team::A, Team::B}) {
        for (const auto& kv : state.board.units(team)) {
            const Unit& u = kv.second;
            hs.u8(static_cast<uint8_t>(team));
            hs.i32(u.slot);
            hs.num(u.hp);
            hs.num(u.mp);
            hs.i32(u.ap);

            hs.u32(static_cast<uint32_t>(u.statuses.size()));
            for (const StatusInstance& s : u.statuses) {
                hs.str(s.key);
                hs.i32(s.remaining);
                hs.i32(s.stacks);
            }

            hs.u32(static_cast<uint32_t>(u.cooldowns.size()));
            for (const auto& cd : u.cooldowns) {
                hs.str(cd.first);
                hs.i32(cd.second);
            }
        }
    }
    return hs.h;
}

std::string hashHex(uint64_t h) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return std::string(buf);
}
