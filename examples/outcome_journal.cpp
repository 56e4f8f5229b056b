#include <iostream>
#include <vector>

#include <atm/core.hpp>

using atm::Outcome;

// Publisher policy: every dispatch appends its Report to a journal instead of
// returning it. The journal is how a caller tells a wrong PIN apart from a
// refused withdrawal, since both leave the machine Waiting.
using Journal = atm::publisher::Queue<std::vector<atm::Report>>;
using Teller = atm::Teller<std::monostate, atm::hash::Fnv1a, atm::policy::copy, atm::policy::Publisher<Journal>>;

int main()
{
    std::vector<atm::Report> journal;

    Teller::Builder builder;
    builder.set_cash(25).set_publisher(Journal{journal});
    Teller teller = std::move(builder).build();

    auto session = [&teller](const char* pin, const char* typed_pin, const char* amount) {
        teller.enqueue(atm::swipe(pin));
        for(const auto& ev : atm::type_keys(typed_pin))
        {
            teller.enqueue(ev);
        }
        for(const auto& ev : atm::type_keys(amount))
        {
            teller.enqueue(ev);
        }
        teller.dispatch_all();
    };

    session("2143", "2143", "12");
    session("2143", "2144", "1");
    session("2143", "2143", "31");
    session("2143", "2143", "13");

    int denied_pin = 0;
    int denied_funds = 0;
    for(const auto& r : journal)
    {
        switch(r.outcome)
        {
        case Outcome::PinRejected: ++denied_pin; break;
        case Outcome::InsufficientFunds: ++denied_funds; break;
        case Outcome::CashDispensed:
            std::cout << "dispensed " << r.dispensed() << ", left " << r.cash_after << "\n";
            break;
        default: break;
        }
    }

    std::cout << "events=" << journal.size()
              << " wrong_pin=" << denied_pin
              << " insufficient=" << denied_funds
              << " cash=" << teller.cash() << "\n";
    return 0;
}
