#pragma once
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace multistep::ring_buffer {

// Fixed capacity FIFO window. Pushing into a full buffer evicts the oldest
// element. Indexing is chronological, index 0 is the oldest element.
template <typename T> class RingBuffer {
private:
  std::vector<T> data_;
  size_t capacity_;
  size_t head_ = 0;
  size_t size_ = 0;

public:
  explicit RingBuffer(size_t capacity) : data_(capacity), capacity_(capacity) {
    if (capacity_ == 0)
      throw std::invalid_argument("Capacity must be greater than 0.");
  }

  void push_back(T item) {
    data_[(head_ + size_) % capacity_] = std::move(item);
    if (size_ < capacity_)
      size_++;
    else
      head_ = (head_ + 1) % capacity_;
  }

  const T &operator[](size_t index) const {
    return data_[(head_ + index) % capacity_];
  }

  const T &back() const {
    if (size_ == 0)
      throw std::out_of_range("Ring buffer is empty.");
    return (*this)[size_ - 1];
  }

  // The `n` most recent elements, oldest first. Returns everything when fewer
  // than `n` elements are stored.
  std::vector<T> tail(size_t n) const {
    n = std::min(n, size_);
    std::vector<T> items;
    items.reserve(n);
    for (size_t i = size_ - n; i < size_; ++i)
      items.push_back((*this)[i]);
    return items;
  }

  size_t size() const { return size_; }
  size_t capacity() const { return capacity_; }
  bool empty() const { return size_ == 0; }
};

} // namespace multistep::ring_buffer
