#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "linked_deque.hpp"
#include "prefix_trie.hpp"

namespace {

TEST(PrefixTrieTest, InsertAndContains) {
  PrefixTrie trie;
  EXPECT_EQ(trie.size(), 0u);
  EXPECT_FALSE(trie.contains(""));
  EXPECT_FALSE(trie.contains("a"));
  EXPECT_FALSE(trie.contains("apple"));

  trie.insert("apple");
  EXPECT_EQ(trie.size(), 5u);
  EXPECT_FALSE(trie.contains(""));
  EXPECT_FALSE(trie.contains("a"));
  EXPECT_FALSE(trie.contains("ap"));
  EXPECT_FALSE(trie.contains("app"));
  EXPECT_FALSE(trie.contains("appl"));
  EXPECT_TRUE(trie.contains("apple"));
  EXPECT_FALSE(trie.contains("apples"));

  trie.insert("orange");
  EXPECT_EQ(trie.size(), 11u);
  EXPECT_TRUE(trie.contains("apple"));
  EXPECT_FALSE(trie.contains("o"));
  EXPECT_FALSE(trie.contains("orang"));
  EXPECT_TRUE(trie.contains("orange"));
  EXPECT_FALSE(trie.contains("oranges"));
  EXPECT_FALSE(trie.contains("pear"));

  trie.insert("oranges");
  EXPECT_EQ(trie.size(), 12u);
  EXPECT_FALSE(trie.contains("orang"));
  EXPECT_TRUE(trie.contains("orange"));
  EXPECT_TRUE(trie.contains("oranges"));
}

TEST(PrefixTrieTest, EmptyWordIsIgnored) {
  PrefixTrie trie;
  trie.insert("");
  EXPECT_EQ(trie.size(), 0u);
  EXPECT_FALSE(trie.contains(""));
}

TEST(PrefixTrieTest, InsertAllDrainsTokens) {
  LinkedDeque<std::string> tokens{"la", "la", "lune", "oh"};
  PrefixTrie trie;
  EXPECT_EQ(trie.insert_all(std::move(tokens)), 4u);
  EXPECT_TRUE(tokens.empty());
  EXPECT_EQ(trie.size(), 7u);
  EXPECT_TRUE(trie.contains("la"));
  EXPECT_TRUE(trie.contains("lune"));
  EXPECT_TRUE(trie.contains("oh"));
  EXPECT_FALSE(trie.contains("l"));
}

TEST(PrefixTrieTest, Utf8WordsTakeOneNodePerByte) {
  PrefixTrie trie;
  const std::string ete = "\xC3\xA9t\xC3\xA9";
  trie.insert(ete);
  EXPECT_EQ(trie.size(), ete.size());
  EXPECT_TRUE(trie.contains(ete));
  EXPECT_FALSE(trie.contains("\xC3\xA9t"));
  EXPECT_FALSE(trie.contains("\xC3"));

  trie.insert("\xC3\xA9" "cole");
  EXPECT_EQ(trie.size(), ete.size() + 4);
}

TEST(PrefixTrieTest, DeepWordTeardown) {
  PrefixTrie trie;
  trie.insert(std::string(200'000, 'z'));
  EXPECT_EQ(trie.size(), 200'000u);
  EXPECT_TRUE(trie.contains(std::string(200'000, 'z')));
}

}  // namespace
