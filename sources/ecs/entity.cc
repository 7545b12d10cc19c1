#include <genid/ecs/entity.hh>

#include <genid/ecs/entity_generation.hh>
#include <genid/ecs/entity_index.hh>
#include <genid/support/assert.hh>
#include <genid/support/string.hh>
#include <genid/support/string_builder.hh>
#include <genid/support/string_view.hh>

namespace genid::ecs {

StringView conversion_error_string(IntegerConversionError error) {
    switch (error) {
    case IntegerConversionError::OutOfRange:
        return "value out of range";
    case IntegerConversionError::ReservedIndex:
        return "reserved index value";
    }
    GENID_ENSURE_NOT_REACHED();
}

String EntityGeneration::to_string() const {
    return genid::format("{}", m_value);
}

String EntityIndex::to_string() const {
    return genid::format("{}", get());
}

String Entity::to_string() const {
    return genid::format("Entity(index: {}, generation: {})", index(), generation());
}

} // namespace genid::ecs
