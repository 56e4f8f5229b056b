#include <iostream>
#include <vector>

#include <atm/core.hpp>

using atm::Key;
using atm::MachineState;

// Drives the pure transition function directly: the caller keeps the only
// copy of the state and replaces it after every event.
static MachineState advance(const MachineState& current, const atm::Event& ev, const char* label)
{
    auto next = atm::step(current, ev);
    std::cout << "[" << label << "] Input=" << ev
              << ", Outcome=" << next.outcome
              << ", State=" << next.state << "\n";
    return next.state;
}

static MachineState run(MachineState state, const std::vector<atm::Event>& events, const char* label)
{
    for(const auto& ev : events)
    {
        state = advance(state, ev, label);
    }
    return state;
}

int main()
{
    MachineState state = MachineState::initial(10);
    std::cout << "start: " << state << "\n";

    state = advance(state, atm::press(Key::Two), "before swipe");
    state = advance(state, atm::swipe("1234"), "swipe");
    state = run(state, atm::type_keys("12", false), "pin");
    state = advance(state, atm::swipe("1234"), "swipe again");
    state = run(state, atm::type_keys("34"), "pin");
    state = run(state, atm::type_keys("14"), "withdraw 14");

    state = advance(state, atm::swipe("1234"), "swipe");
    state = run(state, atm::type_keys("4321"), "wrong pin");

    state = advance(state, atm::swipe("1234"), "swipe");
    state = run(state, atm::type_keys("1234"), "pin");
    state = run(state, atm::type_keys("3"), "withdraw 3");

    std::cout << "end: " << state << "\n";
    return 0;
}
