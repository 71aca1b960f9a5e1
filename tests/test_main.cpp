#include "actions.hpp"
#include "aoe.hpp"
#include "battle.hpp"
#include "battle_log.hpp"
#include "board.hpp"
#include "catalog.hpp"
#include "damage.hpp"
#include "grid.hpp"
#include "modifiers.hpp"
#include "progression.hpp"
#include "rng.hpp"
#include "roster.hpp"
#include "settings.hpp"
#include "state_hash.hpp"
#include "status.hpp"
#include "targeting.hpp"
#include "turn_order.hpp"
#include "unit.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

// Plain unit: no weapon, no offhand, level 1 (K=4).
Unit makeUnit(Team team, int slot, double str = 100.0, double vit = 10.0) {
    Unit u;
    u.team = team;
    u.slot = slot;
    u.name = makeUid(team, slot);
    u.base.level = 1;
    u.base.str = str;
    u.base.vit = vit;
    u.base.critChance = 0.0;
    return u;
}

bool placeBuilt(Board& board, Unit u, const Catalog& catalog) {
    BattleError err;
    if (!recomputeStats(u, catalog, &err)) return false;
    return board.place(std::move(u), &err);
}

// Takes no action at all; keeps AP and cooldowns untouched.
class IdleStrategy : public ActionStrategy {
public:
    bool act(BattleContext&, Unit&, Team, BattleError*) override { return true; }
};

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    // Certain outcomes never consume a draw.
    const uint32_t before = rng.state;
    expect(!rng.chance(0.0), "chance(0) must fail");
    expect(rng.chance(1.0), "chance(1) must succeed");
    expect(rng.state == before, "chance() at 0/1 should not advance the RNG");

    RNG zero(0u);
    RNG fallback(0x12345678u);
    expect(zero.nextU32() == fallback.nextU32(), "seed 0 runs as the fallback seed");
    zero.reseed(0u);
    expect(zero.state == 0x12345678u, "reseed(0) uses the fallback seed");
}

void test_grid_helpers() {
    expect(isValidSlot(1) && isValidSlot(9), "slots 1 and 9 are valid");
    expect(!isValidSlot(0) && !isValidSlot(10), "slots 0 and 10 are invalid");

    expect(slotRow(5) == 1 && slotCol(5) == 1, "slot 5 is the centre");
    expect(slotLine(7) == 0, "slot 7 sits in line 0");

    expect(behindInLine(1).value_or(0) == 4, "behind slot 1 is slot 4");
    expect(behindInLine(1, 2).value_or(0) == 7, "two behind slot 1 is slot 7");
    expect(!behindInLine(7).has_value(), "nothing behind the back row");

    const std::vector<int> row = rowNeighbors(1);
    expect(row.size() == 1 && row[0] == 2, "slot 1 has one row neighbour (2)");

    const std::vector<int> cross = crossNeighbors(5);
    expect(cross == std::vector<int>({4, 6, 2, 8}), "cross neighbours of 5 are 4,6,2,8");

    expect(slotsInLine(2) == std::vector<int>({3, 6, 9}), "line 2 is 3-6-9");
    expect(slotsInRow(2) == std::vector<int>({7, 8, 9}), "back row is 7-8-9");
    expect(slotsInRow(3).empty(), "row 3 does not exist");
}

void test_modifier_evaluation() {
    const std::vector<ModifierLine> none = {{STAT_ARMOUR, ModifierTag::Base, 50.0, "gear"}};
    expect(near(evaluateStat(STAT_ATTACK, 123.0, none), 123.0), "no matching lines leaves the base value");

    const std::vector<ModifierLine> mods = {
        {STAT_ATTACK, ModifierTag::Base, 20.0, "a"},
        {STAT_ATTACK, ModifierTag::Inc, 30.0, "b"},
        {STAT_ATTACK, ModifierTag::Inc, 20.0, "c"},
        {STAT_ATTACK, ModifierTag::More, 20.0, "d"},
        {STAT_ATTACK, ModifierTag::Less, 20.0, "e"},
        {STAT_ATTACK, ModifierTag::Special, 999.0, "f"},
    };
    // (100 + 20) * 1.5 * 1.2 * 0.8
    expect(near(evaluateStat(STAT_ATTACK, 100.0, mods), 172.8, 1e-6), "stat formula");

    const std::vector<ModifierLine> lessPos = {{STAT_HP, ModifierTag::Less, 25.0, ""}};
    const std::vector<ModifierLine> lessNeg = {{STAT_HP, ModifierTag::Less, -25.0, ""}};
    expect(near(evaluateStat(STAT_HP, 200.0, lessPos), 150.0), "less +25 means 25% less");
    expect(near(evaluateStat(STAT_HP, 200.0, lessNeg), 150.0), "less -25 means 25% less");

    const std::vector<ModifierLine> neg = {{STAT_AP_GAIN, ModifierTag::Base, -500.0, ""}};
    expect(near(evaluateStat(STAT_AP_GAIN, 100.0, neg, 0.0), 0.0), "clampMin holds");
    expect(near(evaluateStat(STAT_AP_GAIN, 100.0, {}, std::nullopt, 50.0), 50.0), "clampMax holds");
}

void test_modifier_line_parse() {
    ModifierLine m;
    BattleError err;
    expect(parseModifierLine(" attack : inc : 10 ", m, &err), "parse attack:inc:10");
    expect(m.stat == "attack" && m.tag == ModifierTag::Inc && near(m.value, 10.0), "parsed fields");

    expect(!parseModifierLine("attack:sideways:10", m, &err), "unknown tag rejected");
    expect(err.kind == BattleErrorKind::UnsupportedModifierShape, "unknown tag -> UnsupportedModifierShape");

    err = BattleError{};
    expect(!parseModifierLine("attack:inc", m, &err), "missing value rejected");
    expect(err.kind == BattleErrorKind::UnsupportedModifierShape, "missing value -> UnsupportedModifierShape");

    err = BattleError{};
    expect(!parseModifierLine("attack:inc:lots", m, &err), "non-numeric value rejected");
}

void test_k_table() {
    int k = 0;
    expect(kForLevel(1, k) && k == 4, "K(1) = 4");
    expect(kForLevel(9, k) && k == 4, "K(9) = 4");
    expect(kForLevel(10, k) && k == 126, "K(10) = 126");
    expect(kForLevel(55, k) && k == 1414, "K(55) = 1414");
    expect(kForLevel(99, k) && k == 3415, "K(99) = 3415");
    expect(kForLevel(100, k) && k == 4000, "K(100) = 4000");
    expect(kForLevel(250, k) && k == 4000, "levels past the table clamp to the last range");

    BattleError err;
    expect(!kForLevel(0, k, &err), "level 0 rejected");
    expect(err.kind == BattleErrorKind::InvalidConfig, "level 0 -> InvalidConfig");
}

void test_aoe_shapes() {
    AoeRatios r;

    const auto single = expandAoe(5, AoeShape::Single, r);
    expect(single.size() == 1 && single[0].slot == 5 && near(single[0].ratio, 1.0), "single is the primary only");

    const auto adj = expandAoe(1, AoeShape::RowAdjacent, r);
    expect(adj.size() == 2 && adj[1].slot == 2 && near(adj[1].ratio, 0.5), "row adjacent from a corner");

    const auto cross = expandAoe(5, AoeShape::Cross, r);
    expect(cross.size() == 5 && cross[0].slot == 5, "cross from the centre hits 5 slots, primary first");

    const auto line = expandAoe(2, AoeShape::Line, r);
    expect(line.size() == 3, "line from the front hits three slots");
    if (line.size() == 3) {
        expect(line[1].slot == 5 && near(line[1].ratio, 0.75), "line near ratio");
        expect(line[2].slot == 8 && near(line[2].ratio, 0.5), "line far ratio");
    }

    const auto lineBack = expandAoe(8, AoeShape::Line, r);
    expect(lineBack.size() == 1, "line from the back row is the primary only");

    AoeRatios spear;
    spear.nearRatio = 0.5;
    const auto behind = expandAoe(3, AoeShape::Behind, spear);
    expect(behind.size() == 2 && behind[1].slot == 6 && near(behind[1].ratio, 0.5), "behind hits one slot back");

    expect(expandAoe(0, AoeShape::Cross, r).empty(), "invalid primary expands to nothing");

    AoeShape s = AoeShape::Single;
    expect(parseAoeShape("plus", s) && s == AoeShape::Cross, "plus alias");
    expect(parseAoeShape("Pierce_1", s) && s == AoeShape::Behind, "pierce_1 alias");
    expect(!parseAoeShape("spiral", s), "unknown shape rejected");
}

void test_catalog_lookups() {
    Catalog c = Catalog::builtin();
    expect(c.weaponKeys().size() == 8, "eight built-in weapons");
    expect(c.offhandKeys().size() == 7, "seven built-in offhands");
    expect(c.findStatus("stun") && c.findStatus("stun")->preventsAction, "stun prevents action");
    expect(c.findSkill("thunderclap") && c.findSkill("thunderclap")->status.has_value(), "thunderclap applies a status");

    BattleError err;
    expect(c.requireWeapon("Trebuchet", &err) == nullptr, "unknown weapon");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown weapon -> UnknownKey");

    StatusDef dup;
    dup.key = "stun";
    err = BattleError{};
    expect(!c.registerStatus(dup, &err), "duplicate status rejected");
    expect(err.kind == BattleErrorKind::InvalidConfig, "duplicate -> InvalidConfig");

    StatusDef fresh;
    fresh.key = "soaked";
    expect(c.registerStatus(fresh), "new status registered");
    expect(c.findStatus("soaked") != nullptr, "registered status is found");
}

void test_catalog_registration() {
    Catalog c = Catalog::builtin();

    WeaponDef flail;
    flail.key = "Flail";
    flail.shape = AoeShape::Cross;
    flail.ratios.splash = 0.25;
    flail.defaultMods = {CatalogModifier{STAT_ATTACK, ModifierTag::Inc, 15.0, std::nullopt, "Flail: default"}};
    expect(c.registerWeapon(flail), "custom weapon registered");
    expect(!c.registerWeapon(flail), "custom weapon registered twice rejected");

    OffhandDef charm;
    charm.key = "Charm";
    charm.ap.morePct = 10.0;
    expect(c.registerOffhand(charm), "custom offhand registered");

    WeaponDef nameless;
    BattleError err;
    expect(!c.registerWeapon(nameless, &err) && err.kind == BattleErrorKind::InvalidConfig, "empty key rejected");

    SkillDef blast;
    blast.key = "blast";
    blast.name = "Blast";
    blast.apCost = 50;
    blast.cooldown = 2;
    blast.ratio = 1.0;
    blast.targeting.location = TargetLocation::Anywhere;
    blast.targeting.scope = TargetScope::Team;
    expect(c.registerSkill(blast), "custom skill registered");
    expect(c.skillKeys().size() == 8, "seven built-in skills plus one");
    expect(c.statusKeys().size() == 16, "sixteen built-in statuses");

    Unit u = makeUnit(Team::A, 1, 100.0);
    u.build.weaponKey = "Flail";
    u.build.offhandKey = "Charm";
    expect(recomputeStats(u, c), "unit with custom gear builds");
    expect(near(u.stats->attack, 115.0), "custom weapon modifier applies");
    expect(near(u.stats->apGain, 110.0), "custom offhand AP adjustment applies");

    Board board;
    placeBuilt(board, makeUnit(Team::A, 1, 100.0), c);
    for (int s : {1, 5, 9}) placeBuilt(board, makeUnit(Team::B, s, 10.0, 10.0), c);
    board.get(Team::A, 1)->base.intel = 10.0;
    recomputeStats(*board.get(Team::A, 1), c);

    BattleConfig cfg;
    BattleState state = makeBattleState(board, cfg);
    BattleContext ctx{state, c, cfg, StatusFrame{}};
    Unit& caster = *state.board.get(Team::A, 1);
    caster.ap = 50;

    ActionResult res;
    expect(castActiveSkill(ctx, caster, "blast", Team::B, 1, res, &err), "team-scope skill casts");
    expect(res.ok && res.targetsHit == 3, "team-scope skill hits every living enemy");
    expect(caster.cooldown("blast") == 2 && caster.ap == 0, "team-scope skill costs");
}

void test_targeting_names() {
    TargetSide side = TargetSide::Enemy;
    TargetLocation loc = TargetLocation::Frontline;
    TargetScope scope = TargetScope::Single;

    expect(parseTargetSide(" Both ", side) && side == TargetSide::Both, "parse side");
    expect(!parseTargetSide("neutral", side), "unknown side rejected");
    expect(parseTargetLocation("anywhere", loc) && loc == TargetLocation::Anywhere, "parse location");
    expect(!parseTargetLocation("backline", loc), "unknown location rejected");
    expect(parseTargetScope("all", scope) && scope == TargetScope::AllAlive, "all is all_alive");
    expect(!parseTargetScope("row", scope), "unknown scope rejected");

    expect(std::string(targetSideName(TargetSide::Ally)) == "ally", "side name");
    expect(std::string(targetLocationName(TargetLocation::Frontline)) == "frontline", "location name");
    expect(std::string(targetScopeName(TargetScope::AllAlive)) == "all_alive", "scope name");
}

void test_unit_recompute() {
    const Catalog catalog = Catalog::builtin();

    Unit u = makeUnit(Team::A, 1, 100.0, 20.0);
    u.base.level = 50;
    u.base.intel = 40.0;
    u.build.weaponKey = "Axe";
    u.build.weaponPassive = 1;
    u.build.offhandKey = "Shield";

    BattleError err;
    expect(recomputeStats(u, catalog, &err), "recompute succeeds: " + err.describe());
    expect(u.stats.has_value(), "stats present after build");
    if (!u.stats) return;

    const UnitStats first = *u.stats;
    expect(first.k == 1414, "level 50 unit uses K=1414");
    expect(near(u.hp, first.hpMax), "HP starts full");
    expect(near(u.mp, first.mpMax), "MP starts full");

    u.hp = 10.0;
    expect(recomputeStats(u, catalog, &err), "second recompute succeeds");
    expect(near(u.stats->attack, first.attack) && near(u.stats->hpMax, first.hpMax) &&
               near(u.stats->apGain, first.apGain) && near(u.stats->armour, first.armour),
           "recompute is idempotent");
    expect(near(u.hp, 10.0), "rebuild does not refill HP");

    u.hp = 0.0;
    expect(recomputeStats(u, catalog, &err), "recompute of a dead unit");
    expect(!u.isAlive(), "rebuild does not revive a dead unit");

    Unit bad = makeUnit(Team::A, 2);
    bad.build.weaponKey = "Axe";
    bad.build.weaponPassive = 7;
    err = BattleError{};
    expect(!recomputeStats(bad, catalog, &err), "invalid passive id rejected");
    expect(err.kind == BattleErrorKind::UnknownKey, "invalid passive -> UnknownKey");

    Unit kOverride = makeUnit(Team::A, 3);
    kOverride.build.kOverride = 777;
    expect(recomputeStats(kOverride, catalog) && kOverride.stats->k == 777, "K override wins over the table");
}

void test_board_placement() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    expect(placeBuilt(board, makeUnit(Team::A, 3), catalog), "place A-3");

    BattleError err;
    Unit again = makeUnit(Team::A, 3);
    expect(!board.place(again, &err), "occupied slot rejected");
    expect(err.kind == BattleErrorKind::InvalidSlot, "occupied slot -> InvalidSlot");

    err = BattleError{};
    Unit off = makeUnit(Team::B, 12);
    expect(!board.place(off, &err), "slot 12 rejected");
    expect(err.kind == BattleErrorKind::InvalidSlot, "slot 12 -> InvalidSlot");

    expect(board.aliveCount(Team::A) == 1 && board.aliveCount(Team::B) == 0, "alive counts");
}

void test_frontline_exposure() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    for (int s = 1; s <= GRID_SLOTS; ++s) placeBuilt(board, makeUnit(Team::B, s), catalog);
    for (int s : {1, 5, 9}) board.get(Team::B, s)->hp = 0.0;

    const std::vector<int> exposed = exposedFrontlineSlots(board, Team::B);
    expect(exposed == std::vector<int>({4, 2, 3}), "dead front exposes the slot behind it");
    expect(exposedInSameLine(board, Team::B, 7).value_or(0) == 4, "line 1-4-7 is exposed at 4");

    expect(isLegalPrimary(board, Team::B, 4, TargetLocation::Frontline), "4 is a legal frontline target");
    expect(!isLegalPrimary(board, Team::B, 1, TargetLocation::Frontline), "dead slot is not legal");
}

void test_target_pick_reasons() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    placeBuilt(board, makeUnit(Team::A, 2), catalog);
    for (int s : {1, 2, 4, 5}) placeBuilt(board, makeUnit(Team::B, s), catalog);
    board.get(Team::B, 1)->hp = 0.0;

    TargetingSpec front;
    TargetPick p = pickPrimaryTarget(board, Team::A, 2, front, std::nullopt, 2);
    expect(p.ok && p.team == Team::B && p.slot == 2 && p.reason == "preferred_ok", "preferred_ok");

    p = pickPrimaryTarget(board, Team::A, 2, front, std::nullopt, 1);
    expect(p.ok && p.slot == 4 && p.reason == "retarget_same_line_exposed", "same-line retarget");

    p = pickPrimaryTarget(board, Team::A, 2, front, std::nullopt, 5);
    expect(p.ok && p.slot == 2 && p.reason == "retarget_same_line_exposed", "blocked slot retargets to its line front");

    TargetingSpec strict = front;
    strict.allowRetarget = false;
    p = pickPrimaryTarget(board, Team::A, 2, strict, std::nullopt, 1);
    expect(!p.ok && p.reason == "preferred_invalid", "no retarget -> preferred_invalid");

    TargetingSpec anywhere;
    anywhere.location = TargetLocation::Anywhere;
    p = pickPrimaryTarget(board, Team::A, 2, anywhere, std::nullopt, 1);
    expect(p.ok && p.slot == 2 && p.reason == "retarget_first", "anywhere retarget without RNG takes the first");

    RNG rng(99u);
    p = pickPrimaryTarget(board, Team::A, 2, anywhere, std::nullopt, std::nullopt, &rng);
    expect(p.ok && p.reason == "random" && board.isAlive(Team::B, p.slot), "random pick is a living enemy");

    TargetingSpec self;
    self.side = TargetSide::Self;
    p = pickPrimaryTarget(board, Team::A, 2, self);
    expect(p.ok && p.team == Team::A && p.slot == 2 && p.reason == "self", "self targeting");

    TargetingSpec ally;
    ally.side = TargetSide::Ally;
    p = pickPrimaryTarget(board, Team::B, 2, ally, std::nullopt, 2);
    expect(p.ok && p.team == Team::B, "ally side stays on the own team");

    Board lonely;
    placeBuilt(lonely, makeUnit(Team::A, 1), catalog);
    p = pickPrimaryTarget(lonely, Team::A, 1, front);
    expect(!p.ok && p.reason == "no_candidates", "no enemies -> no_candidates");

    TargetingSpec all;
    all.scope = TargetScope::AllAlive;
    const auto everyone = resolveTargets(board, Team::A, 2, all);
    expect(everyone.size() == 4 && everyone.front().first == Team::A, "all-alive lists team A first");

    const std::vector<Team> both = resolveTargetTeams(Team::B, TargetSide::Both);
    expect(both.size() == 2 && both[0] == Team::B, "both-sides prefers the own team");
}

void test_multi_hit_average() {
    RNG rng(2024u);
    const int n = 100000;
    long long extra = 0;
    for (int i = 0; i < n; ++i) extra += rollExtraHits(250.0, rng);
    const double avg = static_cast<double>(extra) / n;
    expect(std::fabs(avg - 2.5) < 0.02, "mhr 250 averages 2.5 extra hits (got " + std::to_string(avg) + ")");

    const uint32_t before = rng.state;
    expect(rollExtraHits(0.0, rng) == 0, "mhr 0 gives no extra hits");
    expect(rng.state == before, "mhr 0 does not draw");

    const HitCount h = totalHits(1, 300.0, rng);
    expect(h.total == 4 && h.extra == 3, "mhr 300 is exactly three extra hits");
}

void test_mitigation() {
    expect(near(mitigation(0.0, 1414), 0.0), "no armour, no mitigation");
    expect(near(mitigation(1000.0, 1000), 0.5), "armour == K halves damage");
    expect(near(mitigation(1e9, 4), MAX_MITIGATION), "mitigation caps at 95%");
    expect(near(applyMitigation(200.0, 0.25), 150.0), "applyMitigation");
    expect(near(applyMitigation(-5.0, 0.25), 0.0), "negative raw is zero");
    expect(near(rawAttackDamage(100.0, 0.5, true, 150.0), 75.0), "crit raw damage");
    expect(near(hitChancePct(100.0, 200.0), 5.0), "hit chance floor 5%");
    expect(near(hitChancePct(180.0, 20.0), 100.0), "hit chance cap 100%");
}

void test_status_stacking_and_refresh() {
    Unit u = makeUnit(Team::A, 1);

    StatusDef stacky;
    stacky.key = "poison";
    stacky.stackable = true;
    stacky.maxStacks = 3;
    stacky.defaultDuration = 2;

    for (int i = 0; i < 5; ++i) applyStatus(u, stacky);
    const StatusInstance* s = u.findStatus("poison");
    expect(s && s->stacks == 3, "stacks cap at maxStacks");

    StatusApplyOptions longer;
    longer.duration = 5;
    applyStatus(u, stacky, longer);
    s = u.findStatus("poison");
    expect(s && s->remaining == 5, "refresh extends to the longer duration");

    StatusApplyOptions shorter;
    shorter.duration = 1;
    applyStatus(u, stacky, shorter);
    s = u.findStatus("poison");
    expect(s && s->remaining == 5, "refresh never shortens");

    StatusDef sticky;
    sticky.key = "mark";
    sticky.refreshOnReapply = false;
    sticky.defaultDuration = 1;
    applyStatus(u, sticky);
    applyStatus(u, sticky, longer);
    const StatusInstance* m = u.findStatus("mark");
    expect(m && m->remaining == 1 && m->stacks == 1, "non-refreshing status keeps its duration");

    StatusApplyOptions flood;
    flood.stacksAdd = std::numeric_limits<int>::max();
    applyStatus(u, stacky, flood);
    s = u.findStatus("poison");
    expect(s && s->stacks == 3, "huge stacksAdd stays at maxStacks");

    StatusApplyOptions drain;
    drain.stacksAdd = std::numeric_limits<int>::min();
    applyStatus(u, stacky, drain);
    s = u.findStatus("poison");
    expect(s && s->stacks == 1, "huge negative stacksAdd floors at one stack");

    expect(u.statuses.size() == 2, "one instance per key");
    expect(removeStatus(u, "mark") && !u.hasStatus("mark"), "removeStatus");
    expect(!removeStatus(u, "mark"), "removing twice fails");
}

void test_immunity_blocks_negative_statuses() {
    const Catalog catalog = Catalog::builtin();
    Unit u = makeUnit(Team::B, 5);

    bool applied = false;
    StatusApplyOptions opts;
    expect(applyStatusByKey(u, catalog, "immunity", opts, applied) && applied, "immunity lands");
    expect(applyStatusByKey(u, catalog, "stun", opts, applied), "stun lookup ok");
    expect(!applied && !u.hasStatus("stun"), "immunity blocks stun");

    BattleError err;
    expect(!applyStatusByKey(u, catalog, "petrify", opts, applied, &err), "unknown status key fails");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown status -> UnknownKey");
}

void test_status_frame() {
    const Catalog catalog = Catalog::builtin();
    Unit u = makeUnit(Team::A, 1);

    bool applied = false;
    StatusApplyOptions stun;
    applyStatusByKey(u, catalog, "stun", stun, applied);

    StatusApplyOptions bleed;
    bleed.params["hit_damage"] = 100.0;
    applyStatusByKey(u, catalog, "bleeding", bleed, applied);

    applyStatusByKey(u, catalog, "chill", StatusApplyOptions{}, applied);

    StatusFrame f;
    expect(buildStartTurnFrame(u, catalog, f), "frame builds");
    expect(!f.canAct && !f.canBasicAttack && !f.canUseActiveSkills, "stun locks every action");
    expect(near(f.apGainBaseDelta, -5.0) && near(f.mhrBaseDelta, -10.0), "chill defaults");

    double dot = 0.0;
    bool sawCannotAct = false;
    for (const StatusEvent& ev : f.events) {
        if (ev.kind == StatusEventKind::Damage && ev.statusKey == "bleeding") dot += ev.amount;
        if (ev.kind == StatusEventKind::Log && ev.text == "A-1 cannot act due to status") sawCannotAct = true;
    }
    expect(near(dot, 30.0), "bleeding deals 30% of the triggering hit");
    expect(sawCannotAct, "cannot-act event emitted");

    Unit silenced = makeUnit(Team::A, 2);
    applyStatusByKey(silenced, catalog, "silence", StatusApplyOptions{}, applied);
    StatusApplyOptions brand;
    brand.params["damage_taken_more_pct"] = 20.0;
    applyStatusByKey(silenced, catalog, "brand", brand, applied);
    StatusFrame sf;
    expect(buildStartTurnFrame(silenced, catalog, sf), "silence frame builds");
    expect(sf.canAct && sf.canBasicAttack && !sf.canUseActiveSkills, "silence only locks skills");
    expect(near(sf.damageTakenMult, 1.2), "brand raises damage taken");

    Unit broken = makeUnit(Team::A, 3);
    StatusInstance bogus;
    bogus.key = "mystery";
    bogus.remaining = 2;
    broken.statuses.push_back(bogus);
    StatusFrame bf;
    BattleError err;
    expect(!buildStartTurnFrame(broken, catalog, bf, &err), "unknown active status fails the frame");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown active status -> UnknownKey");
}

void test_tick_expiry() {
    Unit u = makeUnit(Team::A, 1);
    StatusDef one;
    one.key = "stun";
    one.defaultDuration = 1;
    StatusDef two;
    two.key = "slow";
    two.defaultDuration = 2;
    applyStatus(u, one);
    applyStatus(u, two);
    u.cooldowns["power_strike"] = 1;
    u.cooldowns["hex"] = 0;

    const std::vector<std::string> expired = tickUnit(u);
    expect(expired.size() == 1 && expired[0] == "stun", "duration-1 status expires on the first tick");
    expect(!u.hasStatus("stun") && u.hasStatus("slow"), "expired status removed");
    expect(u.cooldown("power_strike") == 0 && u.cooldown("hex") == 0, "cooldowns tick and floor at 0");
    expect(describeStatuses(u) == "slow(1)", "describeStatuses");
}

void test_ap_gain() {
    const Catalog catalog = Catalog::builtin();
    Unit u = makeUnit(Team::A, 1);
    recomputeStats(u, catalog);

    StatusFrame plain;
    expect(computeApGain(u, plain) == 100, "default AP gain is 100");

    StatusFrame slowed;
    slowed.apGainBaseDelta = -20.0;
    expect(computeApGain(u, slowed) == 80, "slow lowers AP gain");

    StatusFrame blocked;
    blocked.blockApGain = true;
    expect(computeApGain(u, blocked) == 0, "blocked AP gain is zero");

    StatusFrame frozen;
    frozen.apGainBaseDelta = -400.0;
    expect(computeApGain(u, frozen) == 0, "AP gain never goes negative");
}

void test_break_ignores_passives() {
    const Catalog catalog = Catalog::builtin();

    Unit bow = makeUnit(Team::A, 1);
    bow.build.weaponKey = "Bow";
    bow.build.weaponPassive = 2;
    expect(recomputeStats(bow, catalog), "bow build");

    StatusFrame plain;
    expect(buildStartTurnFrame(bow, catalog, plain), "plain frame");
    expect(!plain.ignorePassives, "no break, passives count");
    expect(computeApGain(bow, plain) == 105, "bow AP gain with passive");

    bool applied = false;
    expect(applyStatusByKey(bow, catalog, STATUS_BREAK, StatusApplyOptions{}, applied) && applied, "break lands");
    StatusFrame broken;
    expect(buildStartTurnFrame(bow, catalog, broken), "broken frame");
    expect(broken.ignorePassives, "break sets ignorePassives");
    expect(computeApGain(bow, broken) == 95, "broken bow loses the passive AP line");
    expect(bow.stats && near(bow.stats->apGain, 105.0), "built stats keep the passive");

    Unit archer = makeUnit(Team::A, 2);
    archer.build.weaponKey = "Bow";
    archer.build.weaponPassive = 1;
    expect(recomputeStats(archer, catalog), "archer build");
    StatusFrame breakFrame;
    breakFrame.ignorePassives = true;
    const double mhrPlain = effectiveStat(archer, STAT_MHR, StatusFrame{});
    const double mhrBroken = effectiveStat(archer, STAT_MHR, breakFrame);
    expect(near(mhrPlain - mhrBroken, 20.0), "broken bow loses the passive MHR line");

    Unit swordsman = makeUnit(Team::A, 3);
    swordsman.build.weaponKey = "Sword";
    swordsman.build.weaponPassive = 2;
    expect(recomputeStats(swordsman, catalog), "sword build");
    const double atkPlain = effectiveStat(swordsman, STAT_ATTACK, StatusFrame{});
    const double atkBroken = effectiveStat(swordsman, STAT_ATTACK, breakFrame);
    expect(atkBroken > 0.0 && near(atkPlain / atkBroken, 1.1, 1e-9), "broken sword attack uses unboosted STR");
}

void test_turn_rules() {
    expect(actingTeamForTurn(1, Team::A) == Team::A && actingTeamForTurn(2, Team::A) == Team::B,
           "odd turns belong to the starting team");
    expect(actingTeamForTurn(1, Team::B) == Team::B, "start team B");
    expect(!isTickTurn(1) && isTickTurn(2) && !isTickTurn(3) && isTickTurn(4), "ticks on even team-turns");

    const TurnRule t2 = turnRuleFor(2, 100, 5);
    expect(t2.maxActors == 3 && t2.ignoreApThreshold, "team-turn 2 opener rule");
    expect(t2.note() == "ignore AP>=100 (early fairness T2)", "opener note");

    const TurnRule t9 = turnRuleFor(9, 100, 5);
    expect(t9.maxActors == 5 && !t9.ignoreApThreshold && t9.note() == "AP>=100", "normal rule");

    Unit a = makeUnit(Team::A, 1);
    Unit b = makeUnit(Team::A, 2);
    Unit c = makeUnit(Team::A, 3);
    a.hp = b.hp = c.hp = 100.0;
    a.ap = 120;
    b.ap = 150;
    c.ap = 120;
    std::vector<ActorEntry> living = {{&a, StatusFrame{}}, {&b, StatusFrame{}}, {&c, StatusFrame{}}};
    living[2].frame.canAct = false;

    TurnRule rule = turnRuleFor(7, 100, 2);
    std::vector<ActorEntry> picked = selectActors(living, rule);
    expect(picked.size() == 2 && picked[0].unit == &b && picked[1].unit == &a,
           "AP desc, stunned units skipped");
    expect(formatActorList(picked) == "A-2(AP=150), A-1(AP=120)", "actor list text");
    expect(formatActorList({}) == "(none)", "empty actor list text");

    a.ap = 50;
    rule.maxActors = 5;
    picked = selectActors(living, rule);
    expect(picked.size() == 1 && picked[0].unit == &b, "AP threshold gate");
}

void test_opener_actor_counts() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    for (Team t : {Team::A, Team::B}) {
        for (int s = 1; s <= GRID_SLOTS; ++s) placeBuilt(board, makeUnit(t, s), catalog);
    }

    BattleConfig cfg;
    cfg.seed = 5;
    IdleStrategy idle;
    BattleEngine engine(cfg, catalog, idle);
    BattleState state = makeBattleState(board, cfg);

    const std::vector<size_t> expected = {2, 3, 4, 5, 5, 5};
    for (size_t i = 0; i < expected.size(); ++i) {
        TeamTurnReport report;
        BattleError err;
        expect(engine.stepTeamTurn(state, report, &err), "step " + std::to_string(i + 1));
        expect(report.actorUids.size() == expected[i],
               "team-turn " + std::to_string(i + 1) + " actor count " + std::to_string(report.actorUids.size()));
    }
    expect(state.teamTurn == 6, "six team-turns stepped");
}

void test_cooldown_two_turn_tick() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    Unit caster = makeUnit(Team::A, 1);
    caster.build.skills = {"power_strike"};
    placeBuilt(board, caster, catalog);
    placeBuilt(board, makeUnit(Team::B, 1), catalog);

    BattleConfig cfg;
    IdleStrategy idle;
    BattleEngine engine(cfg, catalog, idle);
    BattleState state = makeBattleState(board, cfg);

    const std::vector<int> expected = {3, 2, 2, 1, 1, 0};
    for (size_t i = 0; i < expected.size(); ++i) {
        TeamTurnReport report;
        engine.stepTeamTurn(state, report);
        const int cd = state.board.get(Team::A, 1)->cooldown("power_strike");
        expect(cd == expected[i], "cooldown after team-turn " + std::to_string(i + 1) + " is " + std::to_string(cd));
    }
}

void test_basic_attack_damage() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    placeBuilt(board, makeUnit(Team::A, 1, 100.0), catalog);
    placeBuilt(board, makeUnit(Team::B, 1, 10.0, 10.0), catalog);

    BattleConfig cfg;
    BattleState state = makeBattleState(board, cfg);
    BattleContext ctx{state, catalog, cfg, StatusFrame{}};

    Unit& attacker = *state.board.get(Team::A, 1);
    Unit& target = *state.board.get(Team::B, 1);
    expect(near(target.hp, 500.0), "target starts at 500 HP");

    ActionResult res;
    expect(resolveBasicAttack(ctx, attacker, Team::B, 1, res), "attack without AP is not a defect");
    expect(!res.ok && res.reason.find("not enough AP") == 0, "attack needs AP");

    attacker.ap = 100;
    const uint32_t before = state.rng.state;
    expect(resolveBasicAttack(ctx, attacker, Team::B, 1, res), "attack resolves");
    expect(res.ok && res.targetsHit == 1, "one target hit");
    expect(near(res.totalDamage, 100.0), "unarmoured target takes full attack");
    expect(near(target.hp, 400.0), "HP reduced");
    expect(attacker.ap == 0, "attack spends the action cost");
    expect(state.rng.state == before, "sure hit, no crit chance and no MHR draw nothing");

    target.hp = 0.0;
    attacker.ap = 100;
    expect(resolveBasicAttack(ctx, attacker, Team::B, 1, res), "attack on a dead target");
    expect(!res.ok && res.reason == "target is not alive" && attacker.ap == 100, "dead target costs nothing");

    BattleError err;
    expect(!resolveBasicAttack(ctx, attacker, Team::B, 11, res, &err), "invalid slot is a defect");
    expect(err.kind == BattleErrorKind::InvalidSlot, "invalid slot -> InvalidSlot");
}

void test_skill_cast_checks() {
    const Catalog catalog = Catalog::builtin();
    const SkillDef* strike = catalog.findSkill("power_strike");
    expect(strike != nullptr, "power_strike exists");
    if (!strike) return;

    Unit u = makeUnit(Team::A, 1);
    u.base.intel = 10.0;
    recomputeStats(u, catalog);
    u.ap = 200;

    StatusFrame frame;
    CastCheck c = canCastActive(u, *strike, frame);
    expect(c.ok, "castable with AP and MP");

    u.cooldowns["power_strike"] = 2;
    c = canCastActive(u, *strike, frame);
    expect(!c.ok && c.reason == "cooldown remaining=2", "cooldown blocks the cast");
    u.cooldowns["power_strike"] = 0;

    frame.canUseActiveSkills = false;
    c = canCastActive(u, *strike, frame);
    expect(!c.ok && c.reason == "active skills locked", "silence blocks the cast");
    frame.canUseActiveSkills = true;

    u.mp = 50.0;
    c = canCastActive(u, *strike, frame);
    expect(!c.ok && c.reason.find("not enough MP") == 0, "MP gate");

    u.mp = 1000.0;
    u.ap = 10;
    c = canCastActive(u, *strike, frame);
    expect(!c.ok && c.reason.find("not enough AP") == 0, "AP gate");
}

void test_skill_cast_resolution() {
    const Catalog catalog = Catalog::builtin();
    Board board;
    Unit caster = makeUnit(Team::A, 1);
    caster.base.level = 50;
    caster.base.intel = 100.0;
    caster.build.skills = {"hex"};
    placeBuilt(board, caster, catalog);
    Unit victim = makeUnit(Team::B, 1, 10.0, 100.0);
    victim.base.level = 50;
    placeBuilt(board, victim, catalog);

    BattleConfig cfg;
    BattleState state = makeBattleState(board, cfg);
    BattleContext ctx{state, catalog, cfg, StatusFrame{}};
    Unit& a = *state.board.get(Team::A, 1);
    Unit& b = *state.board.get(Team::B, 1);
    a.ap = 100;
    const double mpBefore = a.mp;
    const double hpBefore = b.hp;

    ActionResult res;
    BattleError err;
    expect(castActiveSkill(ctx, a, "hex", Team::B, 1, res, &err), "hex casts: " + err.describe());
    expect(res.ok, "hex resolved");
    expect(a.ap == 0 && near(a.mp, mpBefore - 200.0), "AP and MP spent");
    expect(a.cooldown("hex") == 4, "cooldown set to the skill's base");
    expect(b.hp < hpBefore, "hex deals damage");
    expect(b.hasStatus("brand"), "hex brands the target");

    err = BattleError{};
    expect(!castActiveSkill(ctx, a, "meteor", Team::B, 1, res, &err), "unknown skill is a defect");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown skill -> UnknownKey");
}

void test_config_parse() {
    BattleConfig cfg;
    std::string warns;
    parseBattleConfigText(
        "\xEF\xBB\xBF# comment\n"
        "max_team_turns = 50\n"
        "normal_max_actors = 20 ; clamped\n"
        "start_team = B\n"
        "bogus = 1\n"
        "seed = 0x10\n"
        "ap_threshold = lots\n",
        cfg, &warns);

    expect(cfg.maxTeamTurns == 50, "max_team_turns parsed");
    expect(cfg.normalMaxActors == 9, "normal_max_actors clamped to 9");
    expect(cfg.startTeam == Team::B, "start_team parsed");
    expect(cfg.seed == 16u, "hex seed parsed");
    expect(cfg.apThreshold == 100, "bad value keeps the default");
    expect(warns.find("Line 5") != std::string::npos, "unknown key warns with its line");
    expect(warns.find("Line 7") != std::string::npos, "bad int warns with its line");

    BattleError err;
    expect(!loadBattleConfig("/nonexistent/gridbattle.ini", cfg, nullptr, &err), "missing config file fails");
    expect(err.kind == BattleErrorKind::InvalidConfig, "missing config -> InvalidConfig");
}

void test_roster_load() {
    const Catalog catalog = Catalog::builtin();

    Board board;
    std::string warns;
    BattleError err;
    expect(loadRosterText(exampleRosterText(), catalog, board, &warns, &err),
           "example roster loads: " + err.describe());
    expect(board.aliveCount(Team::A) == 4 && board.aliveCount(Team::B) == 4, "example roster is 4v4");
    const Unit* vanguard = board.get(Team::A, 1);
    expect(vanguard && vanguard->build.weaponKey == "Axe" && vanguard->name == "Vanguard", "A-1 fields");
    expect(vanguard && vanguard->stats && near(vanguard->hp, vanguard->stats->hpMax), "units are built");

    Board b2;
    err = BattleError{};
    expect(!loadRosterText("[C-1]\nname = x\n", catalog, b2, nullptr, &err), "bad section rejected");
    expect(err.kind == BattleErrorKind::InvalidSlot, "bad section -> InvalidSlot");

    Board b3;
    err = BattleError{};
    expect(!loadRosterText("[A-1]\nlevel = 10\nskills = power_strike, meteor\n", catalog, b3, nullptr, &err),
           "unknown skill rejected");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown skill -> UnknownKey");
    expect(err.message.find("Line 3") == 0, "error names the line: " + err.message);

    Board b4;
    err = BattleError{};
    expect(!loadRosterText("[B-2]\nweapon = Trebuchet\n", catalog, b4, nullptr, &err), "unknown weapon rejected");
    expect(err.kind == BattleErrorKind::UnknownKey, "unknown weapon -> UnknownKey");

    Board b5;
    err = BattleError{};
    expect(!loadRosterText("[A-4]\ngear = armour:wide:10\n", catalog, b5, nullptr, &err), "bad gear rejected");
    expect(err.kind == BattleErrorKind::UnsupportedModifierShape, "bad gear -> UnsupportedModifierShape");

    Board b6;
    warns.clear();
    expect(loadRosterText("[A-4]\nfavourite_colour = red\n", catalog, b6, &warns), "unknown key only warns");
    expect(!warns.empty(), "unknown key warning recorded");
}

void test_battle_deterministic() {
    const Catalog catalog = Catalog::builtin();
    Board roster;
    expect(loadRosterText(exampleRosterText(), catalog, roster), "roster for determinism");

    BattleConfig cfg;
    cfg.seed = 42;

    auto runWith = [&](MemoryLog& log, BattleOutcome& outcome, uint64_t& hash) {
        ReferenceStrategy strategy;
        BattleEngine engine(cfg, catalog, strategy);
        BattleState state = makeBattleState(roster, cfg, &log);
        BattleError err;
        const bool ok = engine.run(state, outcome, &err);
        expect(ok, "battle runs: " + err.describe());
        hash = battleStateHash(state);
    };

    MemoryLog log1;
    MemoryLog log2;
    BattleOutcome o1 = BattleOutcome::Undecided;
    BattleOutcome o2 = BattleOutcome::Undecided;
    uint64_t h1 = 0;
    uint64_t h2 = 0;
    runWith(log1, o1, h1);
    runWith(log2, o2, h2);

    expect(o1 != BattleOutcome::Undecided, "battle reaches an outcome");
    expect(o1 == o2, "same seed, same winner");
    expect(h1 == h2, "same seed, same final state hash");
    expect(log1.lines() == log2.lines(), "same seed, identical logs");
    bool sawStartImmunity = false;
    bool sawFirstHeader = false;
    for (const std::string& line : log1.lines()) {
        if (line == "  [START] A-8 gains immunity for 4 ticks") sawStartImmunity = true;
        if (line == "TEAM TURN 1 - Team A starts") sawFirstHeader = true;
    }
    expect(sawStartImmunity, "Orb grants immunity at battle start");
    expect(sawFirstHeader, "first team-turn header");
}

void test_battle_draw_and_victory() {
    const Catalog catalog = Catalog::builtin();

    // Attack 0 on both sides: nobody can die.
    Board pacifists;
    placeBuilt(pacifists, makeUnit(Team::A, 2, 0.0), catalog);
    placeBuilt(pacifists, makeUnit(Team::B, 2, 0.0), catalog);

    BattleConfig cfg;
    cfg.maxTeamTurns = 6;
    MemoryLog log;
    ReferenceStrategy strategy;
    BattleEngine engine(cfg, catalog, strategy);
    BattleState state = makeBattleState(pacifists, cfg, &log);
    BattleOutcome outcome = BattleOutcome::Undecided;
    expect(engine.run(state, outcome), "pacifist battle runs");
    expect(outcome == BattleOutcome::Draw, "no deaths -> draw");
    expect(state.teamTurn == 6, "draw after maxTeamTurns");
    expect(!log.lines().empty() && log.lines().back() == "==> Draw (no team defeated after 6 team-turns)",
           "draw line");

    Board oneSided;
    placeBuilt(oneSided, makeUnit(Team::B, 5), catalog);
    expect(checkVictory(oneSided, Team::A) == BattleOutcome::TeamBWins, "empty team A loses");

    BattleState s2 = makeBattleState(oneSided, cfg);
    expect(engine.run(s2, outcome) && outcome == BattleOutcome::TeamBWins, "run ends immediately");
    expect(s2.teamTurn == 0, "no team-turn played");
    expect(std::string(battleOutcomeName(BattleOutcome::Draw)) == "DRAW", "outcome names");
}

void test_memory_log_export() {
    MemoryLog log;
    expect(log.exportText().empty(), "empty log exports nothing");
    logLine(&log, "one");
    logLine(&log, "two");
    logLine(nullptr, "ignored");
    expect(log.exportText() == "one\ntwo\n", "log text joined with newlines");
    expect(logRule() == std::string(42, '='), "rule line is 42 '='");

    BattleError err;
    expect(!log.exportToFile("/nonexistent/dir/battle.log", &err), "unwritable log path fails");

    std::ostringstream oss;
    StreamLog stream(oss);
    logLine(&stream, "TEAM TURN 1 - Team A starts");
    expect(oss.str() == "TEAM TURN 1 - Team A starts\n", "stream log forwards lines");
}

} // namespace

int main() {
    std::cout << "Running GridBattle tests...\n";

    test_rng_reproducible();
    test_grid_helpers();
    test_modifier_evaluation();
    test_modifier_line_parse();
    test_k_table();
    test_aoe_shapes();
    test_catalog_lookups();
    test_catalog_registration();
    test_targeting_names();
    test_unit_recompute();
    test_board_placement();
    test_frontline_exposure();
    test_target_pick_reasons();
    test_multi_hit_average();
    test_mitigation();

    test_status_stacking_and_refresh();
    test_immunity_blocks_negative_statuses();
    test_status_frame();
    test_tick_expiry();
    test_ap_gain();

    test_break_ignores_passives();
    test_turn_rules();
    test_opener_actor_counts();
    test_cooldown_two_turn_tick();
    test_basic_attack_damage();
    test_skill_cast_checks();
    test_skill_cast_resolution();

    test_config_parse();
    test_roster_load();
    test_battle_deterministic();
    test_battle_draw_and_victory();
    test_memory_log_export();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
