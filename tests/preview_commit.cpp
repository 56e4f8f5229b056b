#include <cassert>
#include <utility>

#include <atm/core.hpp>

using atm::Key;
using atm::Outcome;

using Teller = atm::Teller<>;

int main()
{
    Teller::Builder builder;
    builder.set_initial(atm::MachineState{10, atm::Authenticated{}, {Key::Four}});
    Teller teller = std::move(builder).build();

    atm::Event enter = atm::press(Key::Enter);
    auto step = teller.preview(enter);
    assert(step.outcome == Outcome::CashDispensed);
    assert(step.state.cash_inside == 6);
    // nothing committed yet
    assert(teller.cash() == 10);
    assert(teller.phase() == atm::PhaseKind::Authenticated);

    auto report = teller.commit(step, &enter);
    assert(report && report->outcome == Outcome::CashDispensed);
    assert(report->dispensed() == 4);
    assert(teller.state() == atm::MachineState::initial(6));

    // a step previewed before another event was committed is refused
    {
        Teller::Builder b;
        b.set_initial(atm::MachineState{10, atm::Authenticated{}, {Key::Four}});
        Teller t = std::move(b).build();

        auto stale = t.preview(atm::press(Key::One));
        assert(stale.from == t.state());
        auto paid = t.dispatch(atm::press(Key::Enter));
        assert(paid && paid->outcome == Outcome::CashDispensed);
        assert(t.cash() == 6);

        assert(!t.commit(stale, nullptr));
        assert(t.state() == atm::MachineState::initial(6));
    }

    // a step from the pure engine commits when computed from the current state
    {
        Teller::Builder b;
        b.set_cash(5);
        Teller t = std::move(b).build();
        atm::Event card = atm::swipe("12");
        auto next = atm::step(t.state(), card);
        auto report = t.commit(next, &card);
        assert(report && report->outcome == Outcome::CardAccepted);
        assert(t.phase() == atm::PhaseKind::Authenticating);
    }

    assert((atm::Report{Outcome::KeyBuffered, 6, 10}.dispensed() == 0));

    return 0;
}
