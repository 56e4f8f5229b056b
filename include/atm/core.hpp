#pragma once

#include <variant>

#include <atm/detail/display.hpp>
#include <atm/detail/effect.hpp>
#include <atm/detail/handlers.hpp>
#include <atm/detail/hash.hpp>
#include <atm/detail/helpers.hpp>
#include <atm/detail/teller_impl.hpp>
#include <atm/detail/transition.hpp>

namespace atm
{

template <typename Context = std::monostate,
          typename Hasher = hash::Fnv1a,
          typename CallablePolicy = policy::copy,
          typename EffectPolicy = policy::ReturnReport>
using Teller = TellerImpl<Context, Hasher, CallablePolicy, EffectPolicy>;

} // namespace atm
