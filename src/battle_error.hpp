#pragma once

#include <cstdint>
#include <string>
#include <utility>

// Failure categories for validation and catalog problems.
//
// InvalidSlot / UnknownKey / UnsupportedModifierShape / InvalidConfig are
// programming or data defects: the call that detects them fails.
// NoLegalTarget / InsufficientResource are ordinary game conditions; they are
// normally reported through ok/reason result structs and only show up here
// when a caller decides to escalate them.
//
// New categories go at the end.
enum class BattleErrorKind : uint8_t {
    None = 0,
    InvalidSlot,
    UnknownKey,
    InsufficientResource,
    NoLegalTarget,
    UnsupportedModifierShape,
    InvalidConfig,
    ActionFailed,
};

inline const char* battleErrorKindName(BattleErrorKind k) {
    switch (k) {
        case BattleErrorKind::None:                     return "None";
        case BattleErrorKind::InvalidSlot:              return "InvalidSlot";
        case BattleErrorKind::UnknownKey:               return "UnknownKey";
        case BattleErrorKind::InsufficientResource:     return "InsufficientResource";
        case BattleErrorKind::NoLegalTarget:            return "NoLegalTarget";
        case BattleErrorKind::UnsupportedModifierShape: return "UnsupportedModifierShape";
        case BattleErrorKind::InvalidConfig:            return "InvalidConfig";
        case BattleErrorKind::ActionFailed:             return "ActionFailed";
    }
    return "Unknown";
}

struct BattleError {
    BattleErrorKind kind = BattleErrorKind::None;
    std::string message;

    std::string describe() const {
        return std::string(battleErrorKindName(kind)) + ": " + message;
    }
};

// Fills *err when the caller asked for details. Always returns false so
// failing paths can be written as `return setError(err, ...);`.
inline bool setError(BattleError* err, BattleErrorKind kind, std::string message) {
    if (err) {
        err->kind = kind;
        err->message = std::move(message);
    }
    return false;
}
