#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

// Singly-linked LIFO. Each node owns its successor; clear() unlinks the chain
// one node at a time so long stacks are torn down without recursion.
template <typename T>
class LinkedStack {
  struct Node {
    template <typename... Args>
    explicit Node(Node* below, Args&&... args) : next(below), element(std::forward<Args>(args)...) {}

    Node* next;
    T element;
  };

 public:
  using value_type = T;
  using size_type = std::size_t;

  LinkedStack() = default;
  LinkedStack(const LinkedStack&) = delete;
  LinkedStack& operator=(const LinkedStack&) = delete;

  LinkedStack(LinkedStack&& other) noexcept { move_from(std::move(other)); }
  LinkedStack& operator=(LinkedStack&& other) noexcept {
    if (this != &other) {
      clear();
      move_from(std::move(other));
    }
    return *this;
  }

  ~LinkedStack() { clear(); }

  bool empty() const { return size_ == 0; }
  size_type size() const { return size_; }

  void clear() {
    Node* node = head_;
    while (node) {
      Node* next = node->next;
      delete node;
      node = next;
    }
    head_ = nullptr;
    size_ = 0;
  }

  // nullptr when empty.
  T* top() { return head_ ? &head_->element : nullptr; }
  const T* top() const { return head_ ? &head_->element : nullptr; }

  void push(const T& value) { emplace(value); }
  void push(T&& value) { emplace(std::move(value)); }

  template <typename... Args>
  T& emplace(Args&&... args) {
    head_ = new Node(head_, std::forward<Args>(args)...);
    ++size_;
    return head_->element;
  }

  std::optional<T> pop() {
    if (!head_) {
      return std::nullopt;
    }
    // Move out before unlinking: a throwing move leaves the stack intact.
    std::optional<T> value(std::move(head_->element));
    Node* node = head_;
    head_ = node->next;
    --size_;
    delete node;
    return value;
  }

  class drain_range {
   public:
    class iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using reference = T&;
      using pointer = T*;

      iterator() = default;
      explicit iterator(LinkedStack* owner) : owner_(owner), current_(owner->pop()) {}

      reference operator*() const { return *current_; }
      pointer operator->() const { return &*current_; }

      iterator& operator++() {
        current_ = owner_->pop();
        return *this;
      }
      void operator++(int) { ++(*this); }

      friend bool operator==(const iterator& a, const iterator& b) {
        return !a.current_.has_value() && !b.current_.has_value();
      }
      friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

     private:
      LinkedStack* owner_{nullptr};
      mutable std::optional<T> current_;
    };

    explicit drain_range(LinkedStack& owner) : owner_(&owner) {}

    iterator begin() { return iterator(owner_); }
    iterator end() { return iterator(); }

   private:
    LinkedStack* owner_;
  };

  // Pops top to bottom as the range is consumed.
  drain_range drain() { return drain_range(*this); }

 private:
  void move_from(LinkedStack&& other) {
    head_ = other.head_;
    size_ = other.size_;
    other.head_ = nullptr;
    other.size_ = 0;
  }

  Node* head_{nullptr};
  size_type size_{0};
};
