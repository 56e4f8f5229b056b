#ifndef ATM_DETAIL_TYPES_HPP
#define ATM_DETAIL_TYPES_HPP

#include <cstdint>
#include <variant>
#include <vector>

#include <atm/detail/keypad.hpp>

namespace atm
{

// ----------------------------- Events -----------------------------

// Carries the digest of the correct PIN, computed when the card was enrolled.
struct SwipeCard
{
    std::uint64_t pin_digest{};
    bool operator==(const SwipeCard&) const = default;
};

struct PressKey
{
    Key key{};
    bool operator==(const PressKey&) const = default;
};

using Event = std::variant<SwipeCard, PressKey>;

// ----------------------------- Phases -----------------------------

struct Waiting
{
    bool operator==(const Waiting&) const = default;
};

struct Authenticating
{
    std::uint64_t pin_digest{};
    bool operator==(const Authenticating&) const = default;
};

struct Authenticated
{
    bool operator==(const Authenticated&) const = default;
};

using Phase = std::variant<Waiting, Authenticating, Authenticated>;

enum class PhaseKind { Waiting, Authenticating, Authenticated };

inline PhaseKind kind_of(const Phase& p) noexcept
{
    static_assert(std::variant_size_v<Phase> == 3, "PhaseKind must list every Phase alternative");
    return static_cast<PhaseKind>(p.index());
}

// ------------------------------ State ------------------------------

struct MachineState
{
    std::uint64_t cash_inside = 0;
    Phase phase{};
    std::vector<Key> keystrokes{};

    static MachineState initial(std::uint64_t cash)
    {
        return MachineState{cash, Waiting{}, {}};
    }

    bool operator==(const MachineState&) const = default;
};

// Why a step ended where it did. Kept out of MachineState: both failure
// cases leave the state indistinguishable from an idle machine.
enum class Outcome
{
    CardAccepted,
    CardReswiped,
    KeyIgnored,
    KeyBuffered,
    PinAccepted,
    PinRejected,
    CashDispensed,
    InsufficientFunds
};

struct Step
{
    MachineState state;
    Outcome outcome;
    // The state this step was computed from.
    MachineState from{};
};

struct Report
{
    Outcome outcome{};
    std::uint64_t cash_before = 0;
    std::uint64_t cash_after = 0;

    std::uint64_t dispensed() const noexcept
    {
        return cash_before > cash_after ? cash_before - cash_after : 0;
    }

    bool operator==(const Report&) const = default;
};

} // namespace atm

#endif
