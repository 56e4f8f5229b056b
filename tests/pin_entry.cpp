#include <cassert>
#include <cstdint>

#include <atm/core.hpp>

using atm::Key;
using atm::MachineState;

int main()
{
    const std::uint64_t digest = atm::pin_digest("1234");

    // digits accumulate
    {
        MachineState start{10, atm::Authenticating{digest}, {}};
        auto end = atm::next_state(start, atm::PressKey{Key::One});
        assert((end == MachineState{10, atm::Authenticating{digest}, {Key::One}}));

        auto end1 = atm::next_state(end, atm::PressKey{Key::Two});
        assert((end1 == MachineState{10, atm::Authenticating{digest}, {Key::One, Key::Two}}));
    }

    // wrong PIN drops the session
    {
        MachineState start{10, atm::Authenticating{digest}, {Key::Three, Key::Three, Key::Three, Key::Three}};
        auto step = atm::step(start, atm::PressKey{Key::Enter});
        assert(step.state == MachineState::initial(10));
        assert(step.outcome == atm::Outcome::PinRejected);
    }

    // digits in the wrong order are a wrong PIN
    {
        MachineState start{10, atm::Authenticating{digest}, {Key::Four, Key::Three, Key::Two, Key::One}};
        assert(atm::next_state(start, atm::PressKey{Key::Enter}) == MachineState::initial(10));
    }

    // correct PIN
    {
        MachineState start{10, atm::Authenticating{digest}, {Key::One, Key::Two, Key::Three, Key::Four}};
        auto step = atm::step(start, atm::PressKey{Key::Enter});
        assert((step.state == MachineState{10, atm::Authenticated{}, {}}));
        assert(step.outcome == atm::Outcome::PinAccepted);
    }

    // Enter with nothing typed only matches the digest of the empty PIN
    {
        MachineState start{10, atm::Authenticating{digest}, {}};
        assert(atm::next_state(start, atm::PressKey{Key::Enter}) == MachineState::initial(10));

        MachineState empty_pin{10, atm::Authenticating{atm::pin_digest("")}, {}};
        assert((atm::next_state(empty_pin, atm::PressKey{Key::Enter}) == MachineState{10, atm::Authenticated{}, {}}));
    }

    return 0;
}
