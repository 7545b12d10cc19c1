#include <genid/container/vector.hh>
#include <genid/core/log.hh>
#include <genid/ecs/entity.hh>
#include <genid/ecs/entity_generation.hh>
#include <genid/ecs/entity_index.hh>
#include <genid/support/args_parser.hh>
#include <genid/support/string.hh>
#include <genid/support/string_view.hh>

#include <stdint.h>
#include <stdlib.h>

using namespace genid;

static bool decode(StringView input) {
    auto bits = ArgsParser::parse_integral<uint64_t>(input);
    if (!bits) {
        genid::error("genid-inspect: '{}' is not a 64-bit integer", input);
        return false;
    }

    auto entity = ecs::Entity::from_bits(*bits);
    if (!entity) {
        genid::error("genid-inspect: {h} uses the reserved index value", *bits);
        return false;
    }
    genid::println("{h} {} {}", *bits, entity->index().get(), entity->generation().get());
    return true;
}

static int encode(uint64_t index_value, uint64_t generation_value) {
    auto index = ecs::EntityIndex::try_from(index_value);
    if (index.is_error()) {
        genid::error("genid-inspect: index {}: {}", index_value, ecs::conversion_error_string(index.error()));
        return EXIT_FAILURE;
    }
    if (generation_value > ecs::EntityGeneration::max().get()) {
        genid::error("genid-inspect: generation {} doesn't fit in 32 bits", generation_value);
        return EXIT_FAILURE;
    }

    ecs::Entity entity(index.value(), ecs::EntityGeneration::make(static_cast<uint32_t>(generation_value)));
    genid::println("{h} {}", entity.to_bits(), entity);
    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    genid::open_log();

    bool colour = false;
    String index_string;
    uint64_t generation = 0;
    Vector<String> inputs;

    ArgsParser args_parser("genid-inspect", "Entity Identifier Inspector", "0.1.0");
    args_parser.add_flag(colour, "Enable coloured log output", "colour");
    args_parser.add_option(index_string, "Encode an entity with this index", "index", 'i');
    args_parser.add_option(generation, "Generation to encode with --index (default 0)", "generation", 'g');
    args_parser.add_arguments(inputs, "bits", false);
    if (auto result = args_parser.parse_args(argc, argv); result != ArgsParseResult::Continue) {
        genid::close_log();
        return result == ArgsParseResult::ExitSuccess ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    genid::set_log_colours_enabled(colour);

    int exit_code = EXIT_SUCCESS;
    if (!index_string.empty()) {
        auto index = ArgsParser::parse_integral<uint64_t>(index_string);
        if (!index) {
            genid::error("genid-inspect: index '{}' is not an unsigned integer", index_string);
            exit_code = EXIT_FAILURE;
        } else if (encode(*index, generation) != EXIT_SUCCESS) {
            exit_code = EXIT_FAILURE;
        }
    } else if (inputs.empty()) {
        genid::error("genid-inspect: nothing to do, pass canonical bits or --index");
        exit_code = EXIT_FAILURE;
    }

    for (const auto &input : inputs) {
        if (!decode(input)) {
            exit_code = EXIT_FAILURE;
        }
    }

    genid::close_log();
    return exit_code;
}
