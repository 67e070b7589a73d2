#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>

// RingBuffer<T, N>: история фиксированной ёмкости.
// Хранение в std::array, вытеснение самого старого элемента по индексу
// (без сдвигов и аллокаций). Индекс 0 = самый старый, size()-1 = самый новый.
template<typename T, std::size_t N>
class RingBuffer {
    static_assert(N > 0, "RingBuffer capacity must be positive");

public:
    RingBuffer() = default;

    // Добавляет элемент. При переполнении вытесняет самый старый.
    void push_back(const T& v) {
        slots_[(head_ + size_) % N] = v;
        if (size_ < N) {
            ++size_;
        } else {
            head_ = (head_ + 1) % N;
        }
    }

    const T& operator[](std::size_t i) const {
        return slots_[(head_ + i) % N];
    }

    T& operator[](std::size_t i) {
        return slots_[(head_ + i) % N];
    }

    const T& at(std::size_t i) const {
        if (i >= size_) throw std::out_of_range("RingBuffer::at");
        return (*this)[i];
    }

    // back_at(0) = самый новый, back_at(1) = предыдущий и т.д.
    const T& back_at(std::size_t i) const {
        return (*this)[size_ - 1 - i];
    }

    const T& back() const { return back_at(0); }
    const T& front() const { return (*this)[0]; }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    static constexpr std::size_t capacity() { return N; }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::array<T, N> slots_{};
    std::size_t head_ = 0;
    std::size_t size_ = 0;
};
