#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace NOdin {
namespace NActors {

/**
 * @brief FIFO ring over a single vector.
 *
 * Storage size is a power of two so wrapping is a mask. The ring doubles
 * when it becomes full and never shrinks; Clear() only resets the indices
 * and destroys the stored values. Capacity limits are the caller's business
 * (see TMailbox). Slots are optionals, so T need not be default
 * constructible.
 */
template<typename T>
class TRingQueue {
public:
    explicit TRingQueue(size_t capacity = 16)
        : Data_(RoundUp(capacity + 1))
        , Mask_(Data_.size() - 1)
    { }

    void Push(T&& item) {
        if (Size() == Mask_) [[unlikely]] {
            Grow();
        }
        Data_[Tail_].emplace(std::move(item));
        Tail_ = (Tail_ + 1) & Mask_;
    }

    T& Front() {
        return *Data_[Head_];
    }

    /// Moves the front element out. The queue must not be empty.
    T Take() {
        T item = std::move(*Data_[Head_]);
        Data_[Head_].reset();
        Head_ = (Head_ + 1) & Mask_;
        return item;
    }

    size_t Size() const {
        return (Tail_ - Head_) & Mask_;
    }

    bool Empty() const {
        return Head_ == Tail_;
    }

    void Clear() {
        while (!Empty()) {
            Take();
        }
        Head_ = Tail_ = 0;
    }

private:
    static size_t RoundUp(size_t value) {
        size_t power = 2;
        while (power < value) {
            power <<= 1;
        }
        return power;
    }

    void Grow() {
        std::vector<std::optional<T>> data(Data_.size() * 2);
        size_t size = Size();
        for (size_t i = 0; i < size; ++i) {
            data[i] = std::move(Data_[(Head_ + i) & Mask_]);
        }
        Data_ = std::move(data);
        Mask_ = Data_.size() - 1;
        Head_ = 0;
        Tail_ = size;
    }

    std::vector<std::optional<T>> Data_;
    size_t Mask_;
    size_t Head_ = 0;
    size_t Tail_ = 0;
};

} // namespace NActors
} // namespace NOdin
