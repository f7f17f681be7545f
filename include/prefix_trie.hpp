#pragma once

#include "linked_deque.hpp"

#include <absl/container/flat_hash_map.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// Trie of whole words, one node per byte. A word is contained only if it was
// inserted; prefixes of inserted words are not. UTF-8 text is stored as its
// bytes, so a multi-byte character takes one node per byte.
class PrefixTrie {
 public:
  PrefixTrie() = default;
  PrefixTrie(const PrefixTrie&) = delete;
  PrefixTrie& operator=(const PrefixTrie&) = delete;
  ~PrefixTrie();

  void insert(std::string_view word);

  // Drains tokens front to back into the trie. Returns how many were consumed.
  std::size_t insert_all(LinkedDeque<std::string>&& tokens);

  bool contains(std::string_view word) const;

  // Number of byte nodes, the root excluded.
  std::size_t size() const;

 private:
  struct Node {
    bool end_of_word{false};
    absl::flat_hash_map<char, std::unique_ptr<Node>> children;
  };

  Node root_;
};
