#pragma once

#include "linked_deque.hpp"

#include <absl/status/statusor.h>

#include <functional>
#include <istream>
#include <string>
#include <string_view>

// Splits text into whitespace-separated tokens. Characters rejected by the
// validator are dropped from a line before it is split.
class Tokenizer {
 public:
  using Validator = std::function<bool(char)>;

  Tokenizer();
  explicit Tokenizer(Validator validator);

  // Stock validator: drops ASCII punctuation. Works per byte, so the bytes of
  // multi-byte UTF-8 characters are always kept.
  static bool is_not_punctuation(char c);

  // Appends the tokens of text to the back of out, in reading order.
  void tokenize(std::string_view text, LinkedDeque<std::string>& out) const;

  // DataLossError if the stream fails with a read error (badbit).
  absl::StatusOr<LinkedDeque<std::string>> from_stream(std::istream& in) const;

  // NotFoundError when the file cannot be opened, DataLossError when it opens
  // but cannot be read (a directory, for one).
  absl::StatusOr<LinkedDeque<std::string>> from_file(const std::string& path) const;

 private:
  Validator validator_;
};
