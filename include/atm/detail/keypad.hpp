#ifndef ATM_DETAIL_KEYPAD_HPP
#define ATM_DETAIL_KEYPAD_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace atm
{

enum class Key { One, Two, Three, Four, Enter };

// Canonical rendering, fed to the hasher and to display code.
inline const char* to_cstr(Key k) noexcept
{
    switch(k)
    {
    case Key::One: return "1";
    case Key::Two: return "2";
    case Key::Three: return "3";
    case Key::Four: return "4";
    case Key::Enter: return "Enter";
    }
    return "?";
}

inline bool is_digit(Key k) noexcept
{
    return k != Key::Enter;
}

inline unsigned digit_value(Key k) noexcept
{
    switch(k)
    {
    case Key::One: return 1;
    case Key::Two: return 2;
    case Key::Three: return 3;
    case Key::Four: return 4;
    case Key::Enter: return 0;
    }
    return 0;
}

inline std::optional<Key> key_from_char(char c) noexcept
{
    switch(c)
    {
    case '1': return Key::One;
    case '2': return Key::Two;
    case '3': return Key::Three;
    case '4': return Key::Four;
    case 'E':
    case 'e': return Key::Enter;
    default: return std::nullopt;
    }
}

// Digit string such as "1234" to keys. Enter is not accepted here.
inline std::vector<Key> keys_from_digits(std::string_view digits)
{
    std::vector<Key> keys;
    keys.reserve(digits.size());
    for(char c : digits)
    {
        auto key = key_from_char(c);
        if(!key || !is_digit(*key))
        {
            throw std::invalid_argument("not a keypad digit: '" + std::string(1, c) + "'");
        }
        keys.push_back(*key);
    }
    return keys;
}

// Reads keys most significant digit first and stops at the first Enter.
// Saturates instead of wrapping, so an oversized request can never be paid out.
inline std::uint64_t parse_amount(std::span<const Key> keys) noexcept
{
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t amount = 0;
    for(Key k : keys)
    {
        if(!is_digit(k)) break;
        const std::uint64_t d = digit_value(k);
        if(amount > (max - d) / 10)
        {
            amount = max;
            continue;
        }
        amount = amount * 10 + d;
    }
    return amount;
}

} // namespace atm

#endif
