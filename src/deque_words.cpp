#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/status/status.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "linked_deque.hpp"
#include "prefix_trie.hpp"
#include "tokenizer.hpp"

ABSL_FLAG(std::string, input, "", "Text file to tokenize.");
ABSL_FLAG(bool, reverse, false, "Print tokens back to front.");
ABSL_FLAG(bool, strip_punctuation, false, "Drop ASCII punctuation before splitting.");
ABSL_FLAG(std::vector<std::string>, query, {},
          "Comma-separated words to look up among the input's tokens.");

namespace {

int Fail(const absl::Status& status) {
  std::cerr << status.ToString() << '\n';
  return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage("Tokenizes a text file, prints its tokens and looks words up.");
  absl::ParseCommandLine(argc, argv);

  const std::string input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    return Fail(absl::InvalidArgumentError("--input is required"));
  }

  const Tokenizer tokenizer = absl::GetFlag(FLAGS_strip_punctuation)
                                  ? Tokenizer(&Tokenizer::is_not_punctuation)
                                  : Tokenizer();
  auto tokens = tokenizer.from_file(input);
  if (!tokens.ok()) {
    return Fail(tokens.status());
  }

  // Printing consumes the deque, so the trie gets its own copy of the tokens.
  LinkedDeque<std::string> for_index;
  for (const auto& token : *tokens) {
    for_index.push_back(token);
  }

  std::cout << "tokens: " << tokens->size() << '\n';
  if (absl::GetFlag(FLAGS_reverse)) {
    for (const auto& token : tokens->drain_back()) {
      std::cout << token << '\n';
    }
  } else {
    for (const auto& token : tokens->drain()) {
      std::cout << token << '\n';
    }
  }

  PrefixTrie index;
  index.insert_all(std::move(for_index));
  std::cout << "trie nodes: " << index.size() << '\n';
  for (const auto& word : absl::GetFlag(FLAGS_query)) {
    std::cout << word << ": " << (index.contains(word) ? "found" : "missing") << '\n';
  }
  return EXIT_SUCCESS;
}
