#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include <atm/core.hpp>

using atm::Key;

int main()
{
    assert(std::string(atm::to_cstr(Key::One)) == "1");
    assert(std::string(atm::to_cstr(Key::Two)) == "2");
    assert(std::string(atm::to_cstr(Key::Three)) == "3");
    assert(std::string(atm::to_cstr(Key::Four)) == "4");
    assert(std::string(atm::to_cstr(Key::Enter)) == "Enter");

    assert(atm::is_digit(Key::Three));
    assert(!atm::is_digit(Key::Enter));
    assert(atm::digit_value(Key::Four) == 4);
    assert(atm::digit_value(Key::Enter) == 0);

    assert(atm::key_from_char('2') == Key::Two);
    assert(atm::key_from_char('e') == Key::Enter);
    assert(!atm::key_from_char('5'));
    assert(!atm::key_from_char('0'));

    auto keys = atm::keys_from_digits("1234");
    assert((keys == std::vector<Key>{Key::One, Key::Two, Key::Three, Key::Four}));
    assert(atm::keys_from_digits("").empty());

    bool threw = false;
    try
    {
        atm::keys_from_digits("129");
    } catch(const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        atm::keys_from_digits("1E");
    } catch(const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    return 0;
}
