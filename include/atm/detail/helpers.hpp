#ifndef ATM_DETAIL_HELPERS_HPP
#define ATM_DETAIL_HELPERS_HPP

#include <string_view>
#include <vector>

#include <atm/detail/concepts.hpp>
#include <atm/detail/hash.hpp>
#include <atm/detail/keypad.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

template <HasherFor Hasher = hash::Fnv1a>
Event swipe(std::string_view pin, const Hasher& hasher = {})
{
    return Event{SwipeCard{pin_digest(pin, hasher)}};
}

inline Event press(Key k)
{
    return Event{PressKey{k}};
}

// "14" -> press 1, press 4, press Enter
inline std::vector<Event> type_keys(std::string_view digits, bool submit = true)
{
    std::vector<Event> events;
    for(Key k : keys_from_digits(digits))
    {
        events.push_back(press(k));
    }
    if(submit)
    {
        events.push_back(press(Key::Enter));
    }
    return events;
}

} // namespace atm

#endif
