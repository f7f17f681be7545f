#pragma once

#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

// A doubly-linked deque whose nodes live in a single table and link to each
// other by index. Push/pop at either end are O(1); popped slots go onto a free
// list and are reused. Teardown is a table clear, so destroying a long chain
// never recurses.
template <typename T>
class LinkedDeque {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using reference = value_type&;
  using const_reference = const value_type&;

  LinkedDeque() = default;

  LinkedDeque(std::initializer_list<T> init) : LinkedDeque(init.begin(), init.end()) {}

  template <typename InputIt>
  LinkedDeque(InputIt first, InputIt last) {
    for (; first != last; ++first) {
      emplace_back(*first);
    }
  }

  LinkedDeque(const LinkedDeque&) = delete;
  LinkedDeque& operator=(const LinkedDeque&) = delete;

  LinkedDeque(LinkedDeque&& other) noexcept { move_from(std::move(other)); }
  LinkedDeque& operator=(LinkedDeque&& other) noexcept {
    if (this != &other) {
      clear();
      move_from(std::move(other));
    }
    return *this;
  }

  ~LinkedDeque() { clear(); }

  bool empty() const { return size_ == 0; }
  size_type size() const { return size_; }

  void clear() {
    nodes_.clear();
    head_ = tail_ = free_ = kNil;
    size_ = 0;
  }

  reference front() {
    assert(!empty());
    return *nodes_[head_].element;
  }
  const_reference front() const {
    assert(!empty());
    return *nodes_[head_].element;
  }

  reference back() {
    assert(!empty());
    return *nodes_[tail_].element;
  }
  const_reference back() const {
    assert(!empty());
    return *nodes_[tail_].element;
  }

  void push_front(const T& value) { emplace_front(value); }
  void push_front(T&& value) { emplace_front(std::move(value)); }

  template <typename... Args>
  reference emplace_front(Args&&... args) {
    const size_type idx = acquire_node(std::forward<Args>(args)...);
    if (head_ == kNil) {
      head_ = tail_ = idx;
    } else {
      nodes_[idx].next = head_;
      nodes_[head_].prev = idx;
      head_ = idx;
    }
    ++size_;
    return *nodes_[idx].element;
  }

  void push_back(const T& value) { emplace_back(value); }
  void push_back(T&& value) { emplace_back(std::move(value)); }

  template <typename... Args>
  reference emplace_back(Args&&... args) {
    const size_type idx = acquire_node(std::forward<Args>(args)...);
    if (tail_ == kNil) {
      head_ = tail_ = idx;
    } else {
      nodes_[idx].prev = tail_;
      nodes_[tail_].next = idx;
      tail_ = idx;
    }
    ++size_;
    return *nodes_[idx].element;
  }

  std::optional<T> pop_front() {
    if (head_ == kNil) {
      return std::nullopt;
    }
    const size_type old_head = head_;
    std::optional<T> value(std::move(nodes_[old_head].element));
    head_ = nodes_[old_head].next;
    if (head_ != kNil) {
      nodes_[head_].prev = kNil;
    } else {
      tail_ = kNil;
    }
    release_node(old_head);
    return value;
  }

  std::optional<T> pop_back() {
    if (tail_ == kNil) {
      return std::nullopt;
    }
    const size_type old_tail = tail_;
    std::optional<T> value(std::move(nodes_[old_tail].element));
    tail_ = nodes_[old_tail].prev;
    if (tail_ != kNil) {
      nodes_[tail_].next = kNil;
    } else {
      head_ = kNil;
    }
    release_node(old_tail);
    return value;
  }

  // Non-destructive walk over the chain. Any push or pop invalidates iterators.
  template <bool IsConst>
  class iterator_base {
    using owner_pointer = std::conditional_t<IsConst, const LinkedDeque*, LinkedDeque*>;

   public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = LinkedDeque::value_type;
    using difference_type = std::ptrdiff_t;
    using reference = std::conditional_t<IsConst, const value_type&, value_type&>;
    using pointer = std::conditional_t<IsConst, const value_type*, value_type*>;

    iterator_base() = default;

    template <bool B = IsConst, typename = std::enable_if_t<B>>
    iterator_base(const iterator_base<false>& other) : owner_(other.owner_), index_(other.index_) {}

    reference operator*() const { return *owner_->nodes_[index_].element; }
    pointer operator->() const { return &*owner_->nodes_[index_].element; }

    iterator_base& operator++() {
      index_ = owner_->nodes_[index_].next;
      return *this;
    }
    iterator_base operator++(int) {
      iterator_base tmp = *this;
      ++(*this);
      return tmp;
    }

    // Decrementing end() lands on the tail.
    iterator_base& operator--() {
      index_ = (index_ == kNil) ? owner_->tail_ : owner_->nodes_[index_].prev;
      return *this;
    }
    iterator_base operator--(int) {
      iterator_base tmp = *this;
      --(*this);
      return tmp;
    }

    friend bool operator==(const iterator_base& a, const iterator_base& b) {
      return a.owner_ == b.owner_ && a.index_ == b.index_;
    }
    friend bool operator!=(const iterator_base& a, const iterator_base& b) { return !(a == b); }

   private:
    friend class LinkedDeque;
    template <bool>
    friend class iterator_base;

    iterator_base(owner_pointer owner, size_type index) : owner_(owner), index_(index) {}

    owner_pointer owner_{nullptr};
    size_type index_{kNil};
  };

  using iterator = iterator_base<false>;
  using const_iterator = iterator_base<true>;

  iterator begin() { return iterator(this, head_); }
  iterator end() { return iterator(this, kNil); }
  const_iterator begin() const { return const_iterator(this, head_); }
  const_iterator end() const { return const_iterator(this, kNil); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  // Single-pass range that pops an element each time it advances. Consuming
  // it empties the deque; a second begin() continues where the first stopped.
  template <bool FromBack>
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
      explicit iterator(LinkedDeque* owner) : owner_(owner) { advance(); }

      reference operator*() const { return *current_; }
      pointer operator->() const { return &*current_; }

      iterator& operator++() {
        advance();
        return *this;
      }
      void operator++(int) { advance(); }

      // Only exhausted iterators compare equal.
      friend bool operator==(const iterator& a, const iterator& b) {
        return !a.current_.has_value() && !b.current_.has_value();
      }
      friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

     private:
      void advance() {
        if constexpr (FromBack) {
          current_ = owner_->pop_back();
        } else {
          current_ = owner_->pop_front();
        }
      }

      LinkedDeque* owner_{nullptr};
      // Mutable: dereferencing a const iterator still yields T&.
      mutable std::optional<T> current_;
    };

    explicit drain_range(LinkedDeque& owner) : owner_(&owner) {}

    iterator begin() { return iterator(owner_); }
    iterator end() { return iterator(); }

   private:
    LinkedDeque* owner_;
  };

  drain_range<false> drain() { return drain_range<false>(*this); }
  drain_range<true> drain_back() { return drain_range<true>(*this); }

  // Walks the chain from both ends and the free list. True when head/tail/size
  // agree, every forward link is mirrored by a back link, and every table slot
  // is either on the chain or on the free list exactly once.
  bool check_invariants() const {
    if ((size_ == 0) != (head_ == kNil) || (size_ == 0) != (tail_ == kNil)) {
      return false;
    }
    if (size_ == 0) {
      return free_ == kNil && nodes_.empty();
    }
    if (nodes_[head_].prev != kNil || nodes_[tail_].next != kNil) {
      return false;
    }
    size_type steps = 0;
    size_type last = kNil;
    for (size_type idx = head_; idx != kNil; idx = nodes_[idx].next) {
      if (++steps > size_ || nodes_[idx].prev != last || !nodes_[idx].element) {
        return false;
      }
      last = idx;
    }
    if (steps != size_ || last != tail_) {
      return false;
    }
    steps = 0;
    for (size_type idx = tail_; idx != kNil; idx = nodes_[idx].prev) {
      if (++steps > size_) {
        return false;
      }
      last = idx;
    }
    if (steps != size_ || last != head_) {
      return false;
    }
    const auto free_count = count_free();
    return free_count && *free_count + size_ == nodes_.size();
  }

 private:
  static constexpr size_type kNil = std::numeric_limits<size_type>::max();

  struct Node {
    std::optional<T> element;
    size_type prev{kNil};
    size_type next{kNil};
  };

  // The element is built before the table can grow, so arguments that refer
  // into this deque stay valid.
  template <typename... Args>
  size_type acquire_node(Args&&... args) {
    if (free_ != kNil) {
      const size_type idx = free_;
      Node& node = nodes_[idx];
      node.element.emplace(std::forward<Args>(args)...);
      free_ = node.next;
      node.prev = node.next = kNil;
      return idx;
    }
    Node node;
    node.element.emplace(std::forward<Args>(args)...);
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
  }

  // Caller has already moved the element out and unlinked idx from its
  // neighbours. The element is moved out first so a throwing move leaves the
  // chain untouched.
  void release_node(size_type idx) {
    --size_;
    if (size_ == 0) {
      clear();
      return;
    }
    Node& node = nodes_[idx];
    node.element.reset();
    node.prev = kNil;
    node.next = free_;
    free_ = idx;
  }

  // nullopt if the free list is cyclic or holds a live slot.
  std::optional<size_type> count_free() const {
    size_type count = 0;
    for (size_type idx = free_; idx != kNil; idx = nodes_[idx].next) {
      if (++count > nodes_.size() || nodes_[idx].element) {
        return std::nullopt;
      }
    }
    return count;
  }

  void move_from(LinkedDeque&& other) {
    nodes_ = std::move(other.nodes_);
    head_ = other.head_;
    tail_ = other.tail_;
    free_ = other.free_;
    size_ = other.size_;
    other.nodes_.clear();
    other.head_ = other.tail_ = other.free_ = kNil;
    other.size_ = 0;
  }

  std::vector<Node> nodes_;
  size_type head_{kNil};
  size_type tail_{kNil};
  size_type free_{kNil};
  size_type size_{0};
};
