#ifndef ATM_DETAIL_CONCEPTS_HPP
#define ATM_DETAIL_CONCEPTS_HPP

#include <concepts>
#include <cstdint>
#include <type_traits>
#include <vector>

#include <atm/detail/keypad.hpp>
#include <atm/detail/types.hpp>

namespace atm
{

namespace detail
{
template <class T>
struct always_false : std::false_type
{
};
} // namespace detail

template <class H>
concept HasherFor = requires(const H& h, const std::vector<Key>& keys) {
    { h(keys) } -> std::convertible_to<std::uint64_t>;
};

template <class T>
concept PolicyHasCallableTemplate = requires {
    typename T::template Callable<void()>;
};

// Phase handler objects: either member is optional, at least one is required.
template <class T, class Ctx>
concept has_on_enter = requires(T t, Ctx& ctx, const MachineState& from, const MachineState& to, const Event* ev) {
    { t.on_enter(ctx, from, to, ev) } -> std::same_as<void>;
};

template <class T, class Ctx>
concept has_on_exit = requires(T t, Ctx& ctx, const MachineState& from, const MachineState& to, const Event* ev) {
    { t.on_exit(ctx, from, to, ev) } -> std::same_as<void>;
};

template <class T, class Ctx>
concept PhaseHandlerFor = has_on_enter<T, Ctx> || has_on_exit<T, Ctx>;

} // namespace atm

#endif
