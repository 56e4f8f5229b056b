#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <atm/core.hpp>

using atm::Key;

int main()
{
    atm::hash::Fnv1a h;

    std::vector<Key> one_two{Key::One, Key::Two};
    std::vector<Key> two_one{Key::Two, Key::One};
    assert(h(one_two) == h(one_two));
    assert(h(one_two) != h(two_one));

    // separator keeps prefixes and repeats apart
    assert(h(std::vector<Key>{Key::One}) != h(std::vector<Key>{Key::One, Key::One}));
    assert(h(std::vector<Key>{}) == atm::hash::Fnv1a::offset_basis);

    std::vector<Key> pin{Key::One, Key::Two, Key::Three, Key::Four};
    assert(atm::pin_digest("1234") == h(pin));
    assert(atm::digest_of(pin) == atm::pin_digest("1234"));
    assert(atm::pin_digest("1234") != atm::pin_digest("4321"));
    assert(atm::pin_digest("1234") != atm::pin_digest("123"));

    bool threw = false;
    try
    {
        (void)atm::pin_digest("12a4");
    } catch(const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    return 0;
}
