#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <atm/core.hpp>

using atm::Key;
using atm::MachineState;
using atm::PhaseKind;

// Interactive driver. Commands, one per line:
//   swipe <pin>    insert a card enrolled with <pin> (digits 1-4)
//   press <key>    press 1, 2, 3, 4 or enter
//   type <digits>  press each digit, then Enter
//   state          print the current state
//   quit
struct Context
{
    int sessions = 0;
};

using Teller = atm::Teller<Context>;

static void usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [initial-cash]\n";
}

static void print(const Teller& teller, const atm::Report& r)
{
    std::cout << "  " << r << " -> " << teller.state() << "\n";
}

int main(int argc, char** argv)
{
    std::uint64_t cash = 10;
    if(argc > 2)
    {
        usage(argv[0]);
        return 1;
    }
    if(argc == 2)
    {
        const std::string arg = argv[1];
        try
        {
            std::size_t used = 0;
            if(arg.empty() || arg[0] == '-') throw std::invalid_argument("negative");
            cash = std::stoull(arg, &used);
            if(used != arg.size()) throw std::invalid_argument("trailing characters");
        } catch(const std::logic_error&)
        {
            std::cerr << "invalid initial cash: " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    Teller::Builder builder;
    builder.set_cash(cash)
        .on_enter(PhaseKind::Authenticating, [](Context& ctx, const MachineState& from, const MachineState&, const atm::Event*) {
            if(atm::kind_of(from.phase) != PhaseKind::Authenticating) ++ctx.sessions;
            std::cout << "  [card] enter PIN\n";
        })
        .on_enter(PhaseKind::Authenticated, [](Context&, const MachineState&, const MachineState&, const atm::Event*) {
            std::cout << "  [card] PIN ok, enter amount\n";
        })
        .on_enter(PhaseKind::Waiting, [](Context&, const MachineState&, const MachineState& to, const atm::Event* ev) {
            if(ev) std::cout << "  [card] ejected, cash inside " << to.cash_inside << "\n";
        });
    Teller teller = std::move(builder).build({});

    std::cout << teller.state() << "\n";
    std::string line;
    while(std::getline(std::cin, line))
    {
        std::istringstream in(line);
        std::string cmd;
        std::string arg;
        in >> cmd >> arg;
        if(cmd.empty()) continue;
        if(cmd == "quit") break;

        try
        {
            if(cmd == "swipe")
            {
                print(teller, *teller.dispatch(atm::swipe(arg)));
            }
            else if(cmd == "press")
            {
                const auto key = arg.size() == 1 ? atm::key_from_char(arg[0])
                               : arg == "enter"  ? std::optional<Key>{Key::Enter}
                                                 : std::nullopt;
                if(!key)
                {
                    std::cerr << "unknown key: " << arg << "\n";
                    continue;
                }
                print(teller, *teller.dispatch(atm::press(*key)));
            }
            else if(cmd == "type")
            {
                for(const auto& ev : atm::type_keys(arg))
                {
                    print(teller, *teller.dispatch(ev));
                }
            }
            else if(cmd == "state")
            {
                std::cout << teller.state() << "\n";
            }
            else
            {
                std::cerr << "unknown command: " << cmd << "\n";
            }
        } catch(const std::invalid_argument& e)
        {
            std::cerr << "error: " << e.what() << "\n";
        }
    }

    std::cout << "sessions: " << teller.context().sessions << ", cash inside: " << teller.cash() << "\n";
    return 0;
}
