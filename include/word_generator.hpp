#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

class WordGenerator {
 public:
  explicit WordGenerator(std::uint64_t seed = 42, std::size_t max_length = 8);

  // Lowercase ASCII, length in [1, max_length].
  std::string next_word();

  std::vector<std::string> generate(std::size_t count);

 private:
  std::mt19937_64 rng_;
  std::size_t maxLength_;
};

// Joins words with a random run of spaces, tabs and newlines between them.
std::string make_text(const std::vector<std::string>& words, std::mt19937_64& rng);
