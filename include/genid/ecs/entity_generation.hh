#pragma once

#include <genid/support/hash.hh>
#include <genid/support/string.hh>

#include <compare>
#include <stdint.h>

namespace genid::ecs {

/**
 * @brief The number of times an entity's index has been recycled.
 *
 * Every 32-bit value is a valid generation.
 */
class EntityGeneration {
    uint32_t m_value{0};

    constexpr explicit EntityGeneration(uint32_t value) : m_value(value) {}

public:
    static consteval EntityGeneration min() { return EntityGeneration(0u); }
    static consteval EntityGeneration max() { return EntityGeneration(0xffffffffu); }

    static constexpr EntityGeneration make(uint32_t value) { return EntityGeneration(value); }
    static constexpr EntityGeneration from_bits(uint32_t bits) { return EntityGeneration(bits); }

    constexpr EntityGeneration() = default;

    constexpr bool operator==(const EntityGeneration &) const = default;
    constexpr auto operator<=>(const EntityGeneration &) const = default;

    constexpr uint32_t get() const { return m_value; }
    constexpr uint32_t to_bits() const { return m_value; }
    String to_string() const;
};

} // namespace genid::ecs

namespace genid {

template <>
struct Hash<ecs::EntityGeneration> {
    constexpr hash_t operator()(ecs::EntityGeneration generation) const { return hash_of(generation.get()); }
    constexpr hash_t operator()(ecs::EntityGeneration generation, hash_t seed) const {
        return hash_of(generation.get(), seed);
    }
};

} // namespace genid
