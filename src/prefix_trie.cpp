#include "prefix_trie.hpp"

#include "linked_stack.hpp"

#include <utility>

PrefixTrie::~PrefixTrie() {
  // Detach every subtree before it is destroyed so teardown depth stays flat.
  LinkedStack<std::unique_ptr<Node>> pending;
  for (auto& [c, child] : root_.children) {
    pending.push(std::move(child));
  }
  root_.children.clear();
  while (auto node = pending.pop()) {
    for (auto& [c, child] : (*node)->children) {
      pending.push(std::move(child));
    }
  }
}

void PrefixTrie::insert(std::string_view word) {
  Node* node = &root_;
  for (char c : word) {
    auto& child = node->children[c];
    if (!child) {
      child = std::make_unique<Node>();
    }
    node = child.get();
  }
  if (node != &root_) {
    node->end_of_word = true;
  }
}

std::size_t PrefixTrie::insert_all(LinkedDeque<std::string>&& tokens) {
  std::size_t consumed = 0;
  for (const std::string& token : tokens.drain()) {
    insert(token);
    ++consumed;
  }
  return consumed;
}

bool PrefixTrie::contains(std::string_view word) const {
  if (word.empty()) {
    return false;
  }
  const Node* node = &root_;
  for (char c : word) {
    auto it = node->children.find(c);
    if (it == node->children.end()) {
      return false;
    }
    node = it->second.get();
  }
  return node->end_of_word;
}

std::size_t PrefixTrie::size() const {
  std::size_t count = 0;
  LinkedStack<const Node*> pending;
  pending.push(&root_);
  while (auto node = pending.pop()) {
    for (const auto& [c, child] : (*node)->children) {
      pending.push(child.get());
      ++count;
    }
  }
  return count;
}
