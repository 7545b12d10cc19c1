#include <genid/ecs/entity.hh>
#include <genid/ecs/entity_index.hh>
#include <genid/support/assert.hh>
#include <genid/support/hash.hh>

#include <stddef.h>
#include <stdint.h>

using namespace genid;

// Assemble words explicitly so that the corpus means the same thing on any host.
static uint64_t read_word(const uint8_t *data) {
    uint64_t bits = 0;
    for (size_t i = 0; i < sizeof(uint64_t); i++) {
        bits |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return bits;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < sizeof(uint64_t)) {
        return -1;
    }

    const uint64_t bits = read_word(data);

    const bool reserved = (bits >> 32) == ecs::k_reserved_index_value;
    auto entity = ecs::Entity::from_bits(bits);
    GENID_ENSURE(entity.has_value() != reserved);
    if (!entity) {
        return 0;
    }

    GENID_ENSURE(entity->to_bits() == bits);
    GENID_ENSURE(entity->raw_bits() != 0);
    GENID_ENSURE(entity->index().get() == static_cast<uint32_t>(bits >> 32));
    GENID_ENSURE(entity->generation().get() == static_cast<uint32_t>(bits));
    GENID_ENSURE(ecs::Entity(entity->generation(), entity->index()) == *entity);

    // A second word, if present, checks that ordering agrees with the canonical form.
    if (size >= 2 * sizeof(uint64_t)) {
        const uint64_t other_bits = read_word(data + sizeof(uint64_t));
        if (auto other = ecs::Entity::from_bits(other_bits)) {
            GENID_ENSURE((*entity < *other) == (bits < other_bits));
            GENID_ENSURE((*entity == *other) == (bits == other_bits));
            GENID_ENSURE(bits != other_bits || hash_of(*entity) == hash_of(*other));
        }
    }
    return 0;
}
