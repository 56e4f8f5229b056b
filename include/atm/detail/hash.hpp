#ifndef ATM_DETAIL_HASH_HPP
#define ATM_DETAIL_HASH_HPP

#include <cstdint>
#include <span>
#include <string_view>

#include <atm/detail/concepts.hpp>
#include <atm/detail/keypad.hpp>

namespace atm
{
namespace hash
{

// 64-bit FNV-1a over the canonical key renderings. Each key is terminated by a
// unit separator so that multi-character renderings cannot run together.
struct Fnv1a
{
    static constexpr std::uint64_t offset_basis = 14695981039346656037ull;
    static constexpr std::uint64_t prime = 1099511628211ull;
    static constexpr unsigned char separator = 0x1f;

    std::uint64_t operator()(std::span<const Key> keys) const noexcept
    {
        std::uint64_t h = offset_basis;
        auto mix = [&h](unsigned char byte) {
            h ^= byte;
            h *= prime;
        };
        for(Key k : keys)
        {
            for(char c : std::string_view{to_cstr(k)})
            {
                mix(static_cast<unsigned char>(c));
            }
            mix(separator);
        }
        return h;
    }
};

static_assert(HasherFor<Fnv1a>);

} // namespace hash

template <HasherFor Hasher = hash::Fnv1a>
std::uint64_t digest_of(const std::vector<Key>& keys, const Hasher& hasher = {})
{
    return static_cast<std::uint64_t>(hasher(keys));
}

// Enrollment side: the digest a card carries for a PIN typed as "1234".
template <HasherFor Hasher = hash::Fnv1a>
std::uint64_t pin_digest(std::string_view digits, const Hasher& hasher = {})
{
    return digest_of(keys_from_digits(digits), hasher);
}

} // namespace atm

#endif
