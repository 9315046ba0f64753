#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace beergame {

    /// Fixed-capacity ring buffer. Pushing into a full window evicts the
    /// oldest element. Index 0 is the oldest retained value.
    template <typename T, size_t Capacity>
    class RollingWindow {
        static_assert(Capacity > 0, "RollingWindow capacity must be positive");

    public:
        void push(const T& value) {
            if (size_ < Capacity) {
                data_[(head_ + size_) % Capacity] = value;
                ++size_;
            }
            else {
                data_[head_] = value;
                head_ = (head_ + 1) % Capacity;
            }
        }

        const T& operator[](size_t i) const {
            return data_[(head_ + i) % Capacity];
        }

        const T& at(size_t i) const {
            if (i >= size_) {
                throw std::out_of_range("RollingWindow index out of range");
            }
            return (*this)[i];
        }

        const T& front() const { return at(0); }
        const T& back() const { return at(size_ - 1); }

        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }
        bool full() const { return size_ == Capacity; }
        static constexpr size_t capacity() { return Capacity; }

        void clear() {
            head_ = 0;
            size_ = 0;
        }

        T sum() const {
            T total{};
            for (size_t i = 0; i < size_; ++i) {
                total += (*this)[i];
            }
            return total;
        }

        // Oldest first
        std::vector<T> toVector() const {
            std::vector<T> out;
            out.reserve(size_);
            for (size_t i = 0; i < size_; ++i) {
                out.push_back((*this)[i]);
            }
            return out;
        }

    private:
        std::array<T, Capacity> data_{};
        size_t head_ = 0;
        size_t size_ = 0;
    };

} // namespace beergame
