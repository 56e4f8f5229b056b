#ifndef ATM_DETAIL_DISPLAY_HPP
#define ATM_DETAIL_DISPLAY_HPP

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include <atm/detail/keypad.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

inline const char* to_cstr(PhaseKind k) noexcept
{
    switch(k)
    {
    case PhaseKind::Waiting: return "Waiting";
    case PhaseKind::Authenticating: return "Authenticating";
    case PhaseKind::Authenticated: return "Authenticated";
    }
    return "?";
}

inline const char* to_cstr(Outcome o) noexcept
{
    switch(o)
    {
    case Outcome::CardAccepted: return "CardAccepted";
    case Outcome::CardReswiped: return "CardReswiped";
    case Outcome::KeyIgnored: return "KeyIgnored";
    case Outcome::KeyBuffered: return "KeyBuffered";
    case Outcome::PinAccepted: return "PinAccepted";
    case Outcome::PinRejected: return "PinRejected";
    case Outcome::CashDispensed: return "CashDispensed";
    case Outcome::InsufficientFunds: return "InsufficientFunds";
    }
    return "?";
}

inline std::ostream& operator<<(std::ostream& os, Key k)
{
    return os << to_cstr(k);
}

inline std::ostream& operator<<(std::ostream& os, PhaseKind k)
{
    return os << to_cstr(k);
}

inline std::ostream& operator<<(std::ostream& os, Outcome o)
{
    return os << to_cstr(o);
}

// Digests are never printed.
inline std::ostream& operator<<(std::ostream& os, const Phase& p)
{
    return os << kind_of(p);
}

inline std::ostream& operator<<(std::ostream& os, const Event& ev)
{
    std::visit(
        [&os](const auto& e) {
            using E = std::decay_t<decltype(e)>;
            if constexpr(std::is_same_v<E, SwipeCard>)
                os << "SwipeCard";
            else
                os << "PressKey(" << e.key << ")";
        },
        ev);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const MachineState& s)
{
    os << s.phase << " cash=" << s.cash_inside << " keys=[";
    for(std::size_t i = 0; i < s.keystrokes.size(); ++i)
    {
        if(i) os << ',';
        os << s.keystrokes[i];
    }
    return os << ']';
}

inline std::ostream& operator<<(std::ostream& os, const Report& r)
{
    os << r.outcome;
    if(r.dispensed()) os << " dispensed=" << r.dispensed();
    return os;
}

inline std::string to_string(const MachineState& s)
{
    std::ostringstream oss;
    oss << s;
    return oss.str();
}

} // namespace atm

#endif
