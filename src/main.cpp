#include <benchmark/benchmark.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "linked_deque.hpp"
#include "word_generator.hpp"

namespace {

constexpr std::array<std::size_t, 6> kSizes{10, 100, 1000, 10'000, 100'000, 1'000'000};

using Clock = std::chrono::steady_clock;

constexpr std::size_t kCacheThrashBytes = 2 * 1024 * 1024;

inline void ThrashCache(std::vector<std::uint8_t>& buffer) {
  for (std::size_t i = 0; i < buffer.size(); i += 64) {
    buffer[i] += static_cast<std::uint8_t>(i);
  }
  benchmark::DoNotOptimize(buffer.data());
}

template <typename Container>
std::optional<std::string> take_front(Container& container) {
  if (container.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> value(std::move(container.front()));
  container.pop_front();
  return value;
}

template <>
std::optional<std::string> take_front(LinkedDeque<std::string>& container) {
  return container.pop_front();
}

template <typename Container>
std::optional<std::string> take_back(Container& container) {
  if (container.empty()) {
    return std::nullopt;
  }
  std::optional<std::string> value(std::move(container.back()));
  container.pop_back();
  return value;
}

template <>
std::optional<std::string> take_back(LinkedDeque<std::string>& container) {
  return container.pop_back();
}

template <typename Container>
Container make_container(const std::vector<std::string>& words) {
  Container out;
  for (const auto& word : words) {
    out.push_back(word);
  }
  return out;
}

template <typename Container>
void RunSteadyPushPopBenchmark(benchmark::State& state, bool time_push_back) {
  const std::size_t size = static_cast<std::size_t>(state.range(0));
  WordGenerator base_gen(100'000 + size);
  Container container = make_container<Container>(base_gen.generate(size));

  WordGenerator op_gen(180'000 + size);

  std::vector<std::uint8_t> cache_buffer(kCacheThrashBytes, 0);
  for (auto _ : state) {
    ThrashCache(cache_buffer);
    auto word = op_gen.next_word();
    const auto start = Clock::now();
    if (time_push_back) {
      container.push_back(std::move(word));
    } else {
      auto popped = take_front(container);
      benchmark::DoNotOptimize(popped);
    }
    const auto end = Clock::now();
    state.SetIterationTime(std::chrono::duration<double>(end - start).count());
    if (time_push_back) {
      auto popped = take_front(container);
      benchmark::DoNotOptimize(popped);
    } else {
      container.push_back(std::move(word));
    }
  }
  state.SetItemsProcessed(state.iterations());
  state.SetComplexityN(static_cast<long>(size));
}

// Evens to the front, odds to the back, then pops alternately from both ends.
template <typename Container>
void RunMixedEndsBenchmark(benchmark::State& state) {
  const std::size_t size = static_cast<std::size_t>(state.range(0));
  WordGenerator gen(7 + size);
  auto words = gen.generate(size);

  for (auto _ : state) {
    Container container;
    for (std::size_t i = 0; i < words.size(); ++i) {
      if (i % 2 == 0) {
        container.push_front(words[i]);
      } else {
        container.push_back(words[i]);
      }
    }
    std::size_t total = 0;
    for (bool from_front = true; !container.empty(); from_front = !from_front) {
      auto popped = from_front ? take_front(container) : take_back(container);
      total += popped->size();
    }
    benchmark::DoNotOptimize(total);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(size));
  state.SetComplexityN(static_cast<long>(size));
}

template <typename Container>
void RunTeardownBenchmark(benchmark::State& state) {
  const std::size_t size = static_cast<std::size_t>(state.range(0));
  WordGenerator gen(300 + size);
  auto words = gen.generate(size);

  for (auto _ : state) {
    state.PauseTiming();
    auto container = std::make_unique<Container>(make_container<Container>(words));
    state.ResumeTiming();
    container.reset();
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(size));
  state.SetComplexityN(static_cast<long>(size));
}

template <typename Container>
void RunDrainBenchmark(benchmark::State& state) {
  const std::size_t size = static_cast<std::size_t>(state.range(0));
  WordGenerator gen(900 + size);
  auto words = gen.generate(size);

  for (auto _ : state) {
    state.PauseTiming();
    Container container = make_container<Container>(words);
    state.ResumeTiming();
    std::size_t total = 0;
    if constexpr (std::is_same_v<Container, LinkedDeque<std::string>>) {
      for (const auto& word : container.drain()) {
        total += word.size();
      }
    } else {
      while (auto word = take_front(container)) {
        total += word->size();
      }
    }
    benchmark::DoNotOptimize(total);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(size));
  state.SetComplexityN(static_cast<long>(size));
}

template <typename Container>
void RegisterSteadyPushPopBenchmarks(const std::string& prefix) {
  auto* push_back = benchmark::RegisterBenchmark(
      (prefix + "/Steady/PushBack").c_str(),
      [](benchmark::State& state) {
        RunSteadyPushPopBenchmark<Container>(state, true);
      });
  push_back->UseManualTime();
  auto* pop_front = benchmark::RegisterBenchmark(
      (prefix + "/Steady/PopFront").c_str(),
      [](benchmark::State& state) {
        RunSteadyPushPopBenchmark<Container>(state, false);
      });
  pop_front->UseManualTime();
  for (auto size : kSizes) {
    push_back->Arg(static_cast<int>(size));
    pop_front->Arg(static_cast<int>(size));
  }
}

template <typename Container>
void RegisterBulkBenchmarks(const std::string& prefix) {
  auto* mixed = benchmark::RegisterBenchmark(
      (prefix + "/MixedEnds").c_str(),
      [](benchmark::State& state) { RunMixedEndsBenchmark<Container>(state); });
  auto* teardown = benchmark::RegisterBenchmark(
      (prefix + "/Teardown").c_str(),
      [](benchmark::State& state) { RunTeardownBenchmark<Container>(state); });
  auto* drain = benchmark::RegisterBenchmark(
      (prefix + "/Drain").c_str(),
      [](benchmark::State& state) { RunDrainBenchmark<Container>(state); });
  for (auto size : kSizes) {
    mixed->Arg(static_cast<int>(size));
    teardown->Arg(static_cast<int>(size));
    drain->Arg(static_cast<int>(size));
  }
  mixed->Complexity(benchmark::oN);
  teardown->Complexity(benchmark::oN);
  drain->Complexity(benchmark::oN);
}
}  // namespace

int main(int argc, char** argv) {
  ::benchmark::Initialize(&argc, argv);

  RegisterSteadyPushPopBenchmarks<std::deque<std::string>>("Deque");
  RegisterSteadyPushPopBenchmarks<std::list<std::string>>("List");
  RegisterSteadyPushPopBenchmarks<LinkedDeque<std::string>>("LinkedDeque");

  RegisterBulkBenchmarks<std::deque<std::string>>("Deque");
  RegisterBulkBenchmarks<std::list<std::string>>("List");
  RegisterBulkBenchmarks<LinkedDeque<std::string>>("LinkedDeque");

  ::benchmark::RunSpecifiedBenchmarks();
  ::benchmark::Shutdown();
  return 0;
}
