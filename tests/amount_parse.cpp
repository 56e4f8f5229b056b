#include <cassert>
#include <cstdint>
#include <limits>
#include <vector>

#include <atm/core.hpp>

using atm::Key;

int main()
{
    assert(atm::parse_amount(std::vector<Key>{}) == 0);
    assert(atm::parse_amount(std::vector<Key>{Key::One, Key::Four}) == 14);
    assert(atm::parse_amount(std::vector<Key>{Key::Four, Key::Two, Key::Three}) == 423);
    assert(atm::parse_amount(std::vector<Key>{Key::Three}) == 3);

    // Enter stops accumulation
    assert(atm::parse_amount(std::vector<Key>{Key::Two, Key::Enter, Key::Four}) == 2);
    assert(atm::parse_amount(std::vector<Key>{Key::Enter, Key::One}) == 0);

    // 30 digits cannot fit in 64 bits
    std::vector<Key> huge(30, Key::Four);
    assert(atm::parse_amount(huge) == std::numeric_limits<std::uint64_t>::max());

    return 0;
}
