#pragma once

#include <genid/support/hash.hh>
#include <genid/support/integral.hh>
#include <genid/support/optional.hh>
#include <genid/support/result.hh>
#include <genid/support/string.hh>
#include <genid/support/string_view.hh>

#include <compare>
#include <stdint.h>

namespace genid::ecs {

class Entity;

enum class IntegerConversionError {
    // The value doesn't fit in the destination type.
    OutOfRange,
    // The value is the reserved all-ones 32-bit pattern.
    ReservedIndex,
};

StringView conversion_error_string(IntegerConversionError error);

inline constexpr uint32_t k_reserved_index_value = 0xffffffffu;

// Integer types whose every value is a valid entity index.
template <typename T>
concept IndexSubrange = NumericIntegral<T> && integral_widens_to<uint32_t, T> &&
                        static_cast<uint32_t>(integral_max<T>) != k_reserved_index_value;

// Integer types able to hold any 32-bit value, and so every entity index.
template <typename T>
concept IndexSuperrange = NumericIntegral<T> && integral_widens_to<T, uint32_t>;

/**
 * @brief The slot that an entity occupies.
 *
 * Valid values are [0, 2^32 - 2]. The value 2^32 - 1 is reserved and can never be constructed; the largest valid
 * value doubles as the placeholder index. Internally the value is stored plus one so that the bit representation is
 * never zero, which is what lets an Entity's storage word never be zero either.
 */
class EntityIndex {
    friend Entity;

    uint32_t m_bits;

    constexpr explicit EntityIndex(uint32_t bits) : m_bits(bits) {}

public:
    static consteval EntityIndex min() { return EntityIndex(1u); }
    static consteval EntityIndex max() { return EntityIndex(k_reserved_index_value); }
    static consteval EntityIndex placeholder() { return max(); }

    /**
     * @brief Creates an index from its value.
     *
     * @return the index, or nullopt if value is the reserved 2^32 - 1
     */
    static constexpr Optional<EntityIndex> make(uint32_t value);

    /**
     * @brief Creates an index from its internal (offset by one) representation, as returned by to_bits().
     *
     * @return the index, or nullopt if bits is zero
     */
    static constexpr Optional<EntityIndex> from_bits(uint32_t bits);

    template <IndexSubrange T>
    static constexpr EntityIndex from(T value);
    template <NumericIntegral T>
    static constexpr Result<EntityIndex, IntegerConversionError> try_from(T value);

    constexpr EntityIndex() : EntityIndex(placeholder()) {}

    template <IndexSuperrange T>
    constexpr T to() const;
    template <NumericIntegral T>
    constexpr Result<T, IntegerConversionError> try_to() const;

    constexpr bool operator==(const EntityIndex &) const = default;
    constexpr auto operator<=>(const EntityIndex &other) const { return get() <=> other.get(); }

    constexpr bool is_placeholder() const { return *this == placeholder(); }
    constexpr uint32_t get() const { return m_bits - 1; }
    constexpr uint32_t to_bits() const { return m_bits; }
    String to_string() const;
};

constexpr Optional<EntityIndex> EntityIndex::make(uint32_t value) {
    // The reserved value wraps around to zero here and gets rejected.
    return from_bits(value + 1);
}

constexpr Optional<EntityIndex> EntityIndex::from_bits(uint32_t bits) {
    if (bits == 0) {
        return genid::nullopt;
    }
    return EntityIndex(bits);
}

template <IndexSubrange T>
constexpr EntityIndex EntityIndex::from(T value) {
    return EntityIndex(static_cast<uint32_t>(value) + 1);
}

template <NumericIntegral T>
constexpr Result<EntityIndex, IntegerConversionError> EntityIndex::try_from(T value) {
    if (!integral_fits<uint32_t>(value)) {
        return IntegerConversionError::OutOfRange;
    }
    auto index = make(static_cast<uint32_t>(value));
    if (!index) {
        return IntegerConversionError::ReservedIndex;
    }
    return *index;
}

template <IndexSuperrange T>
constexpr T EntityIndex::to() const {
    return static_cast<T>(get());
}

template <NumericIntegral T>
constexpr Result<T, IntegerConversionError> EntityIndex::try_to() const {
    if (!integral_fits<T>(get())) {
        return IntegerConversionError::OutOfRange;
    }
    return static_cast<T>(get());
}

} // namespace genid::ecs

namespace genid {

template <>
struct Hash<ecs::EntityIndex> {
    constexpr hash_t operator()(ecs::EntityIndex index) const { return hash_of(index.get()); }
    constexpr hash_t operator()(ecs::EntityIndex index, hash_t seed) const { return hash_of(index.get(), seed); }
};

} // namespace genid
