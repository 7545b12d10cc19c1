#include <genid/container/vector.hh>
#include <genid/ecs/entity.hh>
#include <genid/ecs/entity_generation.hh>
#include <genid/ecs/entity_index.hh>
#include <genid/support/hash.hh>

#include <benchmark/benchmark.h>

#include <stdint.h>

using namespace genid;

namespace {

// Cheap deterministic mix so that every run sees the same words.
uint64_t next_word(uint64_t &state) {
    state += 0x9e3779b97f4a7c15u;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9u;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebu;
    return z ^ (z >> 31);
}

Vector<ecs::Entity> make_entities(int64_t count) {
    Vector<ecs::Entity> entities;
    entities.ensure_capacity(static_cast<uint32_t>(count));
    uint64_t state = 0;
    while (static_cast<int64_t>(entities.size()) < count) {
        if (auto entity = ecs::Entity::from_bits(next_word(state))) {
            entities.push(*entity);
        }
    }
    return entities;
}

void decode_bits(benchmark::State &state) {
    Vector<uint64_t> words;
    uint64_t seed = 0;
    for (int64_t i = 0; i < state.range(); i++) {
        words.push(next_word(seed));
    }
    for (auto _ : state) {
        for (uint64_t word : words) {
            benchmark::DoNotOptimize(ecs::Entity::from_bits(word));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range());
}

void encode_bits(benchmark::State &state) {
    auto entities = make_entities(state.range());
    for (auto _ : state) {
        for (auto entity : entities) {
            benchmark::DoNotOptimize(entity.to_bits());
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range());
}

void compare_entities(benchmark::State &state) {
    auto entities = make_entities(state.range());
    for (auto _ : state) {
        uint32_t less_count = 0;
        for (uint32_t i = 1; i < entities.size(); i++) {
            less_count += entities[i - 1] < entities[i] ? 1u : 0u;
        }
        benchmark::DoNotOptimize(less_count);
    }
    state.SetItemsProcessed(state.iterations() * state.range());
}

void hash_entities(benchmark::State &state) {
    auto entities = make_entities(state.range());
    for (auto _ : state) {
        hash_t hash = 0;
        for (auto entity : entities) {
            hash = hash_of(entity, hash);
        }
        benchmark::DoNotOptimize(hash);
    }
    state.SetItemsProcessed(state.iterations() * state.range());
}

void make_index(benchmark::State &state) {
    for (auto _ : state) {
        for (int64_t i = 0; i < state.range(); i++) {
            benchmark::DoNotOptimize(ecs::EntityIndex::try_from(i));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range());
}

BENCHMARK(decode_bits)->Arg(1000)->Arg(100000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(encode_bits)->Arg(1000)->Arg(100000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(compare_entities)->Arg(1000)->Arg(100000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(hash_entities)->Arg(1000)->Arg(100000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(make_index)->Arg(1000)->Arg(100000)->Unit(benchmark::TimeUnit::kMicrosecond);

} // namespace
