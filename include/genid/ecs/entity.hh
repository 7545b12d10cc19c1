#pragma once

#include <genid/ecs/entity_generation.hh>
#include <genid/ecs/entity_index.hh>
#include <genid/support/hash.hh>
#include <genid/support/optional.hh>
#include <genid/support/string.hh>

#include <compare>
#include <stdint.h>

namespace genid::ecs {

/**
 * @brief A handle to an entity, made up of an index and a generation.
 *
 * The canonical 64-bit form, as returned by to_bits(), holds the index value in the upper 32 bits and the generation
 * in the lower 32 bits. Entities order as their canonical form does, i.e. by index first and then by generation.
 * Any 64-bit value whose upper 32 bits are not all set decodes to a valid entity.
 */
class alignas(uint64_t) Entity {
    // Same layout as the canonical form, except that the index is stored plus one (see EntityIndex::to_bits). This
    // makes the word never zero.
    uint64_t m_bits;

    static constexpr uint64_t k_index_shift = 32;
    static constexpr uint64_t k_generation_mask = 0xffffffffu;

public:
    static consteval Entity placeholder() { return {EntityIndex::placeholder(), EntityGeneration::min()}; }

    /**
     * @brief Decodes an entity from its canonical 64-bit form.
     *
     * @return the entity, or nullopt if the upper 32 bits hold the reserved index value
     */
    static constexpr Optional<Entity> from_bits(uint64_t bits);

    constexpr Entity();
    constexpr Entity(EntityIndex index, EntityGeneration generation)
        : m_bits((static_cast<uint64_t>(index.to_bits()) << k_index_shift) | generation.to_bits()) {}
    constexpr Entity(EntityGeneration generation, EntityIndex index) : Entity(index, generation) {}

    constexpr Entity with_index(EntityIndex index) const { return {index, generation()}; }
    constexpr Entity with_generation(EntityGeneration generation) const { return {index(), generation}; }

    constexpr bool operator==(const Entity &) const = default;
    constexpr auto operator<=>(const Entity &other) const { return m_bits <=> other.m_bits; }

    constexpr EntityIndex index() const { return EntityIndex(static_cast<uint32_t>(m_bits >> k_index_shift)); }
    constexpr EntityGeneration generation() const {
        return EntityGeneration::make(static_cast<uint32_t>(m_bits & k_generation_mask));
    }

    /**
     * @brief Returns the canonical 64-bit form of this entity, suitable for storing or sending elsewhere.
     */
    constexpr uint64_t to_bits() const { return m_bits - (uint64_t(1) << k_index_shift); }

    /**
     * @brief Returns the internal storage word, which is never zero. Only useful for hashing or debugging.
     */
    constexpr uint64_t raw_bits() const { return m_bits; }

    String to_string() const;
};

static_assert(sizeof(Entity) == sizeof(uint64_t));
static_assert(alignof(Entity) == alignof(uint64_t) && alignof(Entity) == 8);

constexpr Entity::Entity() : Entity(placeholder()) {}

constexpr Optional<Entity> Entity::from_bits(uint64_t bits) {
    const auto index = EntityIndex::make(static_cast<uint32_t>(bits >> k_index_shift));
    if (!index) {
        return genid::nullopt;
    }
    return Entity(*index, EntityGeneration::make(static_cast<uint32_t>(bits & k_generation_mask)));
}

} // namespace genid::ecs

namespace genid {

template <>
struct Hash<ecs::Entity> {
    constexpr hash_t operator()(ecs::Entity entity) const { return hash_of(entity.raw_bits()); }
    constexpr hash_t operator()(ecs::Entity entity, hash_t seed) const { return hash_of(entity.raw_bits(), seed); }
};

} // namespace genid
