#ifndef ATM_DETAIL_TELLER_IMPL_HPP
#define ATM_DETAIL_TELLER_IMPL_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <atm/detail/concepts.hpp>
#include <atm/detail/effect.hpp>
#include <atm/detail/handlers.hpp>
#include <atm/detail/hash.hpp>
#include <atm/detail/transition.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

// Holds the one authoritative MachineState on behalf of an event source and
// replaces it wholesale on every event. Not thread-safe.
template <typename Context = std::monostate,
          HasherFor Hasher = hash::Fnv1a,
          PolicyHasCallableTemplate CallablePolicy = policy::copy,
          typename EffectPolicy = policy::ReturnReport>
class TellerImpl
{
public:
    template <typename Sig>
    using Callable = typename CallablePolicy::template Callable<Sig>;

    using Ctx_t = Context;
    using Hasher_t = Hasher;
    using Effect = detail::EffectBindings<EffectPolicy>;
    using PhaseHandlers = detail::PhaseHandlers<Ctx_t, CallablePolicy>;
    using Hook = typename PhaseHandlers::Hook;
    using Policy = CallablePolicy;
    using Publisher_t = typename Effect::PublisherStorage;

    class Builder
    {
    public:
        using Policy = CallablePolicy;

        Builder& set_cash(std::uint64_t cash)
        {
            initial_ = MachineState::initial(cash);
            return *this;
        }

        // Start from an arbitrary snapshot, e.g. a session already in progress.
        Builder& set_initial(MachineState s)
        {
            initial_ = std::move(s);
            return *this;
        }

        Builder& set_hasher(Hasher h)
        {
            hasher_ = std::move(h);
            return *this;
        }

        template <class P>
        Builder& set_publisher(P&& publisher)
            requires(Effect::has_configurable_publisher)
        {
            publisher_ = Effect::make_publisher_storage(std::forward<P>(publisher));
            return *this;
        }

        Builder& on_enter(PhaseKind k, Hook fn)
        {
            phases_[k].on_enter = std::move(fn);
            return *this;
        }

        Builder& on_exit(PhaseKind k, Hook fn)
        {
            phases_[k].on_exit = std::move(fn);
            return *this;
        }

        // Convenience: default to by_ref binding when tag omitted
        template <class Handler>
            requires PhaseHandlerFor<Handler, Ctx_t>
        Builder& on_state(PhaseKind k, Handler& h)
        {
            return on_state(k, h, detail::by_ref{});
        }

        template <class Handler>
            requires PhaseHandlerFor<Handler, Ctx_t>
        Builder& on_state(PhaseKind k, Handler& h, detail::by_ref tag)
        {
            return merge(k, detail::bind_handler<PhaseHandlers>(h, tag));
        }

        template <class Handler>
            requires PhaseHandlerFor<Handler, Ctx_t>
        Builder& on_state(PhaseKind k, Handler* h, detail::by_ptr tag)
        {
            return merge(k, detail::bind_handler<PhaseHandlers>(h, tag));
        }

        template <class Handler>
            requires PhaseHandlerFor<Handler, Ctx_t>
        Builder& on_state(PhaseKind k, std::shared_ptr<Handler> h, detail::by_shared tag)
        {
            return merge(k, detail::bind_handler<PhaseHandlers>(std::move(h), tag));
        }

        // When true (the default) steps that keep the phase kind, such as a
        // buffered digit or a re-swipe, do not fire exit/enter hooks.
        Builder& suppress_self_transitions(bool v = true)
        {
            suppress_self_ = v;
            return *this;
        }

        TellerImpl build(Ctx_t initial_ctx = {}) &&
        {
            return TellerImpl(std::move(initial_), std::move(hasher_), std::move(phases_),
                              std::move(initial_ctx), take_publisher(), suppress_self_);
        }

    private:
        Builder& merge(PhaseKind k, PhaseHandlers bound)
        {
            auto& slot = phases_[k];
            if(bound.on_enter) slot.on_enter = std::move(bound.on_enter);
            if(bound.on_exit) slot.on_exit = std::move(bound.on_exit);
            return *this;
        }

        Publisher_t take_publisher()
        {
            if(publisher_)
            {
                return std::move(*publisher_);
            }
            return Effect::default_publisher();
        }

        MachineState initial_{};
        Hasher hasher_{};
        std::unordered_map<PhaseKind, PhaseHandlers> phases_;
        std::optional<Publisher_t> publisher_{};
        bool suppress_self_ = true;
    };

    // Successor of the current state, without committing it.
    Step preview(const Event& in) const
    {
        return atm::step(current_, in, hasher_);
    }

    // Refuses a step that was not computed from the current state.
    std::optional<Report> commit(const Step& next, const Event* inptr)
    {
        if(next.from != current_) return std::nullopt;
        Report report{next.outcome, current_.cash_inside, next.state.cash_inside};
        replace_state(next.state, inptr);
        return Effect::deliver(publisher_, std::move(report));
    }

    std::optional<Report> dispatch(const Event& in)
    {
        return commit(preview(in), &in);
    }

    void enqueue(const Event& in)
    {
        pending_inputs_.push_back(in);
    }

    void enqueue(Event&& in)
    {
        pending_inputs_.push_back(std::move(in));
    }

    std::vector<Report> dispatch_all()
    {
        std::vector<Report> reports;
        while(!pending_inputs_.empty())
        {
            Event next = std::move(pending_inputs_.front());
            pending_inputs_.pop_front();
            if(auto report = dispatch(next))
            {
                reports.push_back(std::move(*report));
            }
        }
        return reports;
    }

    std::size_t pending() const noexcept
    {
        return pending_inputs_.size();
    }

    const MachineState& state() const noexcept
    {
        return current_;
    }
    PhaseKind phase() const noexcept
    {
        return kind_of(current_.phase);
    }
    std::uint64_t cash() const noexcept
    {
        return current_.cash_inside;
    }
    Ctx_t& context() noexcept
    {
        return ctx_;
    }
    const Ctx_t& context() const noexcept
    {
        return ctx_;
    }
    const Hasher& hasher() const noexcept
    {
        return hasher_;
    }
    Publisher_t& publisher() noexcept
    {
        return publisher_;
    }
    const Publisher_t& publisher() const noexcept
    {
        return publisher_;
    }

private:
    TellerImpl(MachineState init,
               Hasher hasher,
               std::unordered_map<PhaseKind, PhaseHandlers> handlers,
               Ctx_t ctx,
               Publisher_t publisher,
               bool suppress_self)
        : current_(std::move(init)), hasher_(std::move(hasher)), handlers_(std::move(handlers)), ctx_(std::move(ctx)), publisher_(std::move(publisher)), suppress_self_(suppress_self)
    {
        if(auto it = handlers_.find(phase()); it != handlers_.end())
        {
            if(it->second.on_enter) it->second.on_enter(ctx_, current_, current_, nullptr);
        }
    }

    void replace_state(const MachineState& next, const Event* input)
    {
        const PhaseKind from_kind = phase();
        const PhaseKind to_kind = kind_of(next.phase);
        const bool skip_hooks = suppress_self_ && from_kind == to_kind;

        if(skip_hooks)
        {
            current_ = next;
            return;
        }

        const MachineState from = current_;
        if(auto it = handlers_.find(from_kind); it != handlers_.end())
        {
            if(it->second.on_exit)
            {
                it->second.on_exit(ctx_, from, next, input);
            }
        }

        current_ = next;

        if(auto it = handlers_.find(to_kind); it != handlers_.end())
        {
            if(it->second.on_enter)
            {
                it->second.on_enter(ctx_, from, current_, input);
            }
        }
    }

    MachineState current_{};
    Hasher hasher_{};
    std::unordered_map<PhaseKind, PhaseHandlers> handlers_;
    std::deque<Event> pending_inputs_;
    Ctx_t ctx_;
    Publisher_t publisher_{};
    bool suppress_self_ = true;
};

} // namespace atm

#endif
