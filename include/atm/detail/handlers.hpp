#ifndef ATM_DETAIL_HANDLERS_HPP
#define ATM_DETAIL_HANDLERS_HPP

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <atm/detail/concepts.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

// How phase hooks are stored.
namespace policy
{

struct copy
{
    template <typename Sig>
    using Callable = std::function<Sig>;
};

// Admits move-only hooks, e.g. lambdas owning a unique_ptr.
struct move
{
    template <typename Sig>
    using Callable = std::move_only_function<Sig>;
};

} // namespace policy

namespace detail
{

// Binding tags for handler objects
struct by_ref
{
};
struct by_ptr
{
};
struct by_shared
{
};

template <typename Context, PolicyHasCallableTemplate CallablePolicy>
struct PhaseHandlers
{
    using Ctx_t = Context;
    using HookSig = void(Ctx_t&, const MachineState&, const MachineState&, const Event*);

    template <typename Sig>
    using Callable = typename CallablePolicy::template Callable<Sig>;
    using Hook = Callable<HookSig>;

    Hook on_enter;
    Hook on_exit;
};

// Turn a handler reference, raw pointer or shared pointer into stored hooks.
// Members the handler does not define stay empty.
template <class PH, class Handler, class Ref>
auto bind_on_enter(Ref ref) -> typename PH::Hook
{
    if constexpr(has_on_enter<Handler, typename PH::Ctx_t>)
    {
        return typename PH::Hook{
            [ref = std::move(ref)](typename PH::Ctx_t& ctx, const MachineState& from,
                                   const MachineState& to, const Event* ev) {
                ref->on_enter(ctx, from, to, ev);
            }};
    }
    else
    {
        return typename PH::Hook{};
    }
}

template <class PH, class Handler, class Ref>
auto bind_on_exit(Ref ref) -> typename PH::Hook
{
    if constexpr(has_on_exit<Handler, typename PH::Ctx_t>)
    {
        return typename PH::Hook{
            [ref = std::move(ref)](typename PH::Ctx_t& ctx, const MachineState& from,
                                   const MachineState& to, const Event* ev) {
                ref->on_exit(ctx, from, to, ev);
            }};
    }
    else
    {
        return typename PH::Hook{};
    }
}

template <class PH, class Handler>
PH bind_handler(Handler& h, by_ref)
{
    return PH{bind_on_enter<PH, Handler>(std::addressof(h)), bind_on_exit<PH, Handler>(std::addressof(h))};
}

template <class PH, class Handler>
PH bind_handler(Handler* h, by_ptr)
{
    return PH{bind_on_enter<PH, Handler>(h), bind_on_exit<PH, Handler>(h)};
}

template <class PH, class Handler>
PH bind_handler(std::shared_ptr<Handler> h, by_shared)
{
    auto enter = bind_on_enter<PH, Handler>(h);
    auto exit = bind_on_exit<PH, Handler>(std::move(h));
    return PH{std::move(enter), std::move(exit)};
}

} // namespace detail

namespace bind
{

using by_ref = detail::by_ref;
using by_ptr = detail::by_ptr;
using by_shared = detail::by_shared;

} // namespace bind

} // namespace atm

#endif
