#ifndef ATM_DETAIL_TRANSITION_HPP
#define ATM_DETAIL_TRANSITION_HPP

#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

#include <atm/detail/concepts.hpp>
#include <atm/detail/hash.hpp>
#include <atm/detail/keypad.hpp>
#include <atm/detail/types.hpp>

namespace atm
{
namespace detail
{

inline Step on_swipe(const MachineState& current, const SwipeCard& card)
{
    MachineState next{current.cash_inside, Authenticating{card.pin_digest}, {}};
    if(std::holds_alternative<Authenticating>(current.phase))
    {
        // re-swipe mid-entry keeps the digits typed so far
        next.keystrokes = current.keystrokes;
        return Step{std::move(next), Outcome::CardReswiped};
    }
    return Step{std::move(next), Outcome::CardAccepted};
}

inline Step buffer_key(const MachineState& current, Key key)
{
    MachineState next = current;
    next.keystrokes.push_back(key);
    return Step{std::move(next), Outcome::KeyBuffered};
}

template <class Hasher>
Step submit_pin(const MachineState& current, const Authenticating& auth, const Hasher& hasher)
{
    const std::uint64_t actual = static_cast<std::uint64_t>(hasher(current.keystrokes));
    if(actual == auth.pin_digest)
    {
        return Step{MachineState{current.cash_inside, Authenticated{}, {}}, Outcome::PinAccepted};
    }
    return Step{MachineState{current.cash_inside, Waiting{}, {}}, Outcome::PinRejected};
}

inline Step submit_withdrawal(const MachineState& current)
{
    const std::uint64_t amount = parse_amount(current.keystrokes);
    if(current.cash_inside >= amount)
    {
        return Step{MachineState{current.cash_inside - amount, Waiting{}, {}}, Outcome::CashDispensed};
    }
    return Step{MachineState{current.cash_inside, Waiting{}, {}}, Outcome::InsufficientFunds};
}

template <class Hasher>
Step on_press(const MachineState& current, Key key, const Hasher& hasher)
{
    return std::visit(
        [&](const auto& phase) -> Step {
            using P = std::decay_t<decltype(phase)>;
            if constexpr(std::is_same_v<P, Waiting>)
            {
                return Step{MachineState{current.cash_inside, Waiting{}, {}}, Outcome::KeyIgnored};
            }
            else if constexpr(std::is_same_v<P, Authenticating>)
            {
                if(key == Key::Enter) return submit_pin(current, phase, hasher);
                return buffer_key(current, key);
            }
            else if constexpr(std::is_same_v<P, Authenticated>)
            {
                if(key == Key::Enter) return submit_withdrawal(current);
                return buffer_key(current, key);
            }
            else
            {
                static_assert(always_false<P>::value, "unhandled Phase alternative");
            }
        },
        current.phase);
}

} // namespace detail

template <HasherFor Hasher = hash::Fnv1a>
Step step(const MachineState& current, const Event& event, const Hasher& hasher = {})
{
    Step next = std::visit(
        [&](const auto& ev) -> Step {
            using E = std::decay_t<decltype(ev)>;
            if constexpr(std::is_same_v<E, SwipeCard>)
            {
                return detail::on_swipe(current, ev);
            }
            else if constexpr(std::is_same_v<E, PressKey>)
            {
                return detail::on_press(current, ev.key, hasher);
            }
            else
            {
                static_assert(detail::always_false<E>::value, "unhandled Event alternative");
            }
        },
        event);
    next.from = current;
    return next;
}

template <HasherFor Hasher = hash::Fnv1a>
MachineState next_state(const MachineState& current, const Event& event, const Hasher& hasher = {})
{
    return step(current, event, hasher).state;
}

} // namespace atm

#endif
