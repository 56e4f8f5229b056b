#include <cassert>
#include <memory>
#include <variant>

#include <atm/core.hpp>

using atm::Key;
using atm::MachineState;
using atm::PhaseKind;

struct Ctx
{
    int value = 0;
};

using MoveTeller = atm::Teller<Ctx, atm::hash::Fnv1a, atm::policy::move>;

int main()
{
    MoveTeller::Builder builder;
    builder.set_cash(10);
    builder.on_enter(PhaseKind::Authenticated,
                     [payload = std::make_unique<int>(7)](Ctx& ctx, const MachineState&, const MachineState&, const atm::Event*) {
                         ctx.value = *payload;
                     });
    builder.on_exit(PhaseKind::Authenticated,
                    MoveTeller::Hook{[token = std::make_unique<int>(2)](Ctx& ctx, const MachineState&, const MachineState&, const atm::Event*) {
                        ctx.value *= *token;
                    }});

    auto teller = std::move(builder).build({});
    teller.dispatch(atm::swipe("3"));
    for(const auto& ev : atm::type_keys("3"))
    {
        teller.dispatch(ev);
    }
    assert(teller.phase() == PhaseKind::Authenticated);
    assert(teller.context().value == 7);

    for(const auto& ev : atm::type_keys("2"))
    {
        teller.dispatch(ev);
    }
    assert(teller.context().value == 14);
    assert(teller.cash() == 8);

    // the teller itself is movable
    auto moved = std::move(teller);
    assert(moved.cash() == 8);
    assert(moved.phase() == PhaseKind::Waiting);

    return 0;
}
