#include "tokenizer.hpp"

#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include <fstream>
#include <utility>

Tokenizer::Tokenizer() : validator_{[](char) { return true; }} {}

Tokenizer::Tokenizer(Validator validator) : validator_{std::move(validator)} {}

bool Tokenizer::is_not_punctuation(char c) {
  return !absl::ascii_ispunct(static_cast<unsigned char>(c));
}

void Tokenizer::tokenize(std::string_view text, LinkedDeque<std::string>& out) const {
  std::string kept;
  kept.reserve(text.size());
  for (char c : text) {
    if (validator_(c)) {
      kept.push_back(c);
    }
  }
  for (absl::string_view token :
       absl::StrSplit(kept, absl::ByAnyChar(" \t\n\v\f\r"), absl::SkipWhitespace())) {
    out.emplace_back(token);
  }
}

absl::StatusOr<LinkedDeque<std::string>> Tokenizer::from_stream(std::istream& in) const {
  LinkedDeque<std::string> tokens;
  std::string line;
  while (std::getline(in, line)) {
    tokenize(line, tokens);
  }
  if (in.bad()) {
    return absl::DataLossError(
        absl::StrCat("read failed after ", tokens.size(), " tokens"));
  }
  return tokens;
}

absl::StatusOr<LinkedDeque<std::string>> Tokenizer::from_file(const std::string& path) const {
  std::ifstream in(path);
  if (!in.is_open()) {
    return absl::NotFoundError(absl::StrCat("cannot open ", path));
  }
  auto tokens = from_stream(in);
  if (!tokens.ok()) {
    return absl::DataLossError(absl::StrCat("cannot read ", path, ": ", tokens.status().message()));
  }
  return tokens;
}
