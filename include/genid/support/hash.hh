#pragma once

#include <genid/support/integral.hh>

#include <stdint.h>

namespace genid {

using hash_t = uint32_t;

// Specialised for each hashable type, providing operator()(value) and operator()(value, seed).
template <typename>
struct Hash;

constexpr hash_t hash_combine(hash_t seed, hash_t hash) {
    return seed ^ (hash + 0x9e3779b9u + (seed << 6) + (seed >> 2));
}

template <typename T>
constexpr hash_t hash_of(const T &value) {
    return Hash<T>{}(value);
}

template <typename T>
constexpr hash_t hash_of(const T &value, hash_t seed) {
    return Hash<T>{}(value, seed);
}

// Integers go through the splitmix64 finaliser, folded down to 32 bits.
template <Integral T>
struct Hash<T> {
    constexpr hash_t operator()(T value) const {
        auto bits = static_cast<uint64_t>(value);
        bits = (bits ^ (bits >> 30)) * 0xbf58476d1ce4e5b9u;
        bits = (bits ^ (bits >> 27)) * 0x94d049bb133111ebu;
        bits ^= bits >> 31;
        return static_cast<hash_t>(bits ^ (bits >> 32));
    }
    constexpr hash_t operator()(T value, hash_t seed) const { return hash_combine(seed, (*this)(value)); }
};

} // namespace genid
