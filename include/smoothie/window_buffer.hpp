#pragma once

#include <cstddef>
#include <optional>
#include <smoothie/error.hpp>
#include <span>
#include <vector>

namespace smoothie
{

// ─── WindowBuffer ───────────────────────────────────────────────────────────
// Fixed-capacity FIFO of the most recent samples.
//
// Storage is mirrored: every sample is written at slot i and at slot
// i + capacity, so the live window [start, start + count) is always one
// contiguous run. contents() therefore returns a span view, oldest-first,
// without copying or allocating. All memory is reserved at construction.
//
// Not synchronised: one writer, one reader.

template <typename T>
class WindowBuffer
{
   public:
    explicit WindowBuffer(std::size_t capacity) : capacity_(capacity)
    {
        if (capacity_ == 0)
            detail::throw_configuration_error("WindowBuffer", "window size must be at least 1");
        if (capacity_ > storage_.max_size() / 2)
            detail::throw_configuration_error("WindowBuffer", "window size is too large");
        storage_.resize(2 * capacity_);
    }

    // Appends a sample. When the buffer was already full the oldest sample
    // is evicted and returned.
    std::optional<T> push(const T& sample)
    {
        if (count_ < capacity_)
        {
            write_slot((start_ + count_) % capacity_, sample);
            ++count_;
            return std::nullopt;
        }

        T evicted = storage_[start_];
        write_slot(start_, sample);
        start_ = (start_ + 1) % capacity_;
        return evicted;
    }

    // Buffered samples, oldest first. Invalidated by the next push/clear.
    std::span<const T> contents() const
    {
        return std::span<const T>(storage_.data() + start_, count_);
    }

    // Oldest-first indexing; i < count().
    const T& operator[](std::size_t i) const { return storage_[start_ + i]; }

    const T& oldest() const { return storage_[start_]; }
    const T& newest() const { return storage_[start_ + count_ - 1]; }

    std::size_t count() const { return count_; }
    std::size_t capacity() const { return capacity_; }
    bool        empty() const { return count_ == 0; }
    bool        full() const { return count_ == capacity_; }

    void clear()
    {
        start_ = 0;
        count_ = 0;
    }

   private:
    void write_slot(std::size_t slot, const T& sample)
    {
        storage_[slot]             = sample;
        storage_[slot + capacity_] = sample;
    }

    std::size_t    capacity_;
    std::size_t    start_ = 0;
    std::size_t    count_ = 0;
    std::vector<T> storage_;
};

}   // namespace smoothie
