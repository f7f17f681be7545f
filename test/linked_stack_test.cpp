#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "linked_stack.hpp"

namespace {

struct Pair {
  int number;
  std::string text;

  bool operator==(const Pair&) const = default;
};

TEST(LinkedStackTest, PushPopSingle) {
  LinkedStack<int> stack;
  EXPECT_FALSE(stack.pop().has_value());
  EXPECT_EQ(stack.size(), 0u);
  EXPECT_EQ(stack.top(), nullptr);
  stack.push(1);
  EXPECT_EQ(stack.size(), 1u);
  EXPECT_EQ(stack.pop(), 1);
  EXPECT_EQ(stack.size(), 0u);
  EXPECT_FALSE(stack.pop().has_value());
}

TEST(LinkedStackTest, PopsInReverseOrder) {
  LinkedStack<Pair> stack;
  for (int i = 1; i < 10; ++i) {
    stack.push(Pair{i, std::to_string(i)});
    ASSERT_EQ(stack.size(), static_cast<std::size_t>(i));
  }
  for (int i = 9; i >= 1; --i) {
    ASSERT_EQ(stack.pop(), (Pair{i, std::to_string(i)}));
    ASSERT_EQ(stack.size(), static_cast<std::size_t>(i - 1));
  }
  EXPECT_TRUE(stack.empty());
}

TEST(LinkedStackTest, TopDoesNotRemove) {
  LinkedStack<std::string> stack;
  stack.push("Hello");
  ASSERT_NE(stack.top(), nullptr);
  EXPECT_EQ(*stack.top(), "Hello");
  EXPECT_EQ(*stack.top(), "Hello");
  EXPECT_EQ(stack.size(), 1u);
  stack.emplace("World");
  EXPECT_EQ(stack.size(), 2u);
  const std::string peeked = *stack.top();
  EXPECT_EQ(stack.pop(), peeked);
}

TEST(LinkedStackTest, DrainConsumesTopToBottom) {
  LinkedStack<std::string> stack;
  for (int i = 0; i < 100; ++i) {
    stack.push(std::to_string(i));
  }
  int expected = 99;
  for (const auto& s : stack.drain()) {
    EXPECT_EQ(s, std::to_string(expected));
    --expected;
  }
  EXPECT_EQ(expected, -1);
  EXPECT_TRUE(stack.empty());
}

struct ThrowOnMove {
  ThrowOnMove(int v, bool armed) : value(v), armed(armed) {}
  ThrowOnMove(const ThrowOnMove&) = delete;
  ThrowOnMove(ThrowOnMove&& other) : value(other.value), armed(other.armed) {
    if (other.armed) {
      throw std::runtime_error("move");
    }
  }
  int value;
  bool armed;
};

TEST(LinkedStackTest, ThrowingPopKeepsTopElement) {
  LinkedStack<ThrowOnMove> stack;
  stack.emplace(1, false);
  stack.emplace(2, true);
  EXPECT_THROW(stack.pop(), std::runtime_error);
  EXPECT_EQ(stack.size(), 2u);
  ASSERT_NE(stack.top(), nullptr);
  EXPECT_EQ(stack.top()->value, 2);

  stack.top()->armed = false;
  EXPECT_EQ(stack.pop()->value, 2);
  EXPECT_EQ(stack.pop()->value, 1);
  EXPECT_TRUE(stack.empty());
}

TEST(LinkedStackTest, DrainWorksWithRangesAlgorithms) {
  static_assert(std::input_iterator<LinkedStack<int>::drain_range::iterator>);
  LinkedStack<int> stack;
  for (int i = 0; i < 5; ++i) {
    stack.push(i);
  }
  std::vector<int> out;
  std::ranges::copy(stack.drain(), std::back_inserter(out));
  EXPECT_EQ(out, (std::vector<int>{4, 3, 2, 1, 0}));
  EXPECT_TRUE(stack.empty());
}

TEST(LinkedStackTest, MoveLeavesSourceEmpty) {
  LinkedStack<int> source;
  source.push(1);
  source.push(2);
  LinkedStack<int> target(std::move(source));
  EXPECT_TRUE(source.empty());
  EXPECT_EQ(target.size(), 2u);
  source = std::move(target);
  EXPECT_EQ(source.pop(), 2);
  EXPECT_EQ(source.pop(), 1);
}

TEST(LinkedStackTest, LongStackTeardown) {
  LinkedStack<int> stack;
  for (int i = 0; i < 1'000'000; ++i) {
    stack.push(i);
  }
  EXPECT_EQ(stack.size(), 1'000'000u);
  stack.clear();
  EXPECT_TRUE(stack.empty());
  for (int i = 0; i < 100'000; ++i) {
    stack.push(i);
  }
}

}  // namespace
