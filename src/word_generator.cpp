#include "word_generator.hpp"

#include <algorithm>
#include <random>

WordGenerator::WordGenerator(std::uint64_t seed, std::size_t max_length)
    : rng_{seed}, maxLength_{std::max<std::size_t>(1, max_length)} {}

std::string WordGenerator::next_word() {
  const std::size_t length = 1 + static_cast<std::size_t>(rng_() % maxLength_);
  std::string word;
  word.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    word.push_back(static_cast<char>('a' + rng_() % 26));
  }
  return word;
}

std::vector<std::string> WordGenerator::generate(std::size_t count) {
  std::vector<std::string> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(next_word());
  }
  return out;
}

std::string make_text(const std::vector<std::string>& words, std::mt19937_64& rng) {
  static constexpr char kSeparators[] = {' ', ' ', ' ', '\t', '\n'};
  std::uniform_int_distribution<std::size_t> run_dist(1, 3);
  std::uniform_int_distribution<std::size_t> sep_dist(0, sizeof(kSeparators) - 1);
  std::string text;
  for (const auto& word : words) {
    const std::size_t run = run_dist(rng);
    for (std::size_t i = 0; i < run; ++i) {
      text.push_back(kSeparators[sep_dist(rng)]);
    }
    text += word;
  }
  return text;
}
