#pragma once
// Sequences.hpp – Zero-copy views over the payload of a range-qualified object.
//
// A view holds the payload bytes (borrowed from the fragment), the first index
// and the item count.  It keeps no iteration state: item k is located from
// (k, item size) on every access, so a view can be iterated any number of
// times or indexed directly.
//
// Lifetime: a view borrows the buffer the ReadCursor was built on.  The buffer
// must outlive every view derived from it and must not be modified meanwhile.
//
// Byte consumption for a range of count c:
//   SingleBitField     ceil(c / 8)       bit k ↔ index start+k, LSB-first
//   DoubleBitField     ceil(c * 2 / 8)   2 bits per index, LSB-first
//   FixedSize(n)       c * n
//   SizedByVariation   c * variation

#include "ReadCursor.hpp"
#include "Types.hpp"
#include "Values.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>

namespace dnp3 {

// ─── (index, value) pair produced by every view ───────────────────────────────
template <typename T>
struct Indexed {
    uint32_t index{0};
    T        value{};
};

// ─── Layout policies ──────────────────────────────────────────────────────────
// Each policy answers two questions: how many bytes c items take, and how to
// read item k out of the payload.  item_size is unused by the packed layouts.

struct PackedBits {
    using value_type = bool;

    static constexpr uint64_t bytesFor(uint64_t count, uint16_t) noexcept {
        return (count + 7) / 8;
    }
    static bool at(std::span<const uint8_t> data, uint64_t k, uint16_t) noexcept {
        return ((data[k / 8] >> (k % 8)) & 0x01u) != 0;
    }
};

struct PackedDoubleBits {
    using value_type = DoubleBit;

    static constexpr uint64_t bytesFor(uint64_t count, uint16_t) noexcept {
        return (count * 2 + 7) / 8;
    }
    static DoubleBit at(std::span<const uint8_t> data, uint64_t k, uint16_t) noexcept {
        return doubleBitFrom(static_cast<uint8_t>(data[k / 4] >> (2 * (k % 4))));
    }
};

struct FixedRecords {
    using value_type = std::span<const uint8_t>;

    static constexpr uint64_t bytesFor(uint64_t count, uint16_t item_size) noexcept {
        return count * item_size;
    }
    static std::span<const uint8_t> at(std::span<const uint8_t> data, uint64_t k,
                                       uint16_t item_size) noexcept {
        return data.subspan(static_cast<size_t>(k * item_size), item_size);
    }
};

// Same layout as FixedRecords; a distinct type so octet strings and ordinary
// fixed records stay distinguishable in a DecodedObject.
struct OctetRecords : FixedRecords {};

// ─────────────────────────────────────────────────────────────────────────────
//  RangedSequence
// ─────────────────────────────────────────────────────────────────────────────
template <typename Layout>
class RangedSequence {
public:
    using value_type = typename Layout::value_type;

    // ── Iteration ────────────────────────────────────────────────────────────
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Indexed<typename Layout::value_type>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = value_type;

        Iterator() = default;
        Iterator(const RangedSequence* seq, uint64_t pos) noexcept : seq_(seq), pos_(pos) {}

        value_type operator*() const {
            return {static_cast<uint32_t>(seq_->start_ + pos_), seq_->valueAt(pos_)};
        }
        Iterator& operator++() noexcept { ++pos_; return *this; }
        Iterator  operator++(int) noexcept { Iterator tmp = *this; ++pos_; return tmp; }

        bool operator==(const Iterator& o) const noexcept {
            return seq_ == o.seq_ && pos_ == o.pos_;
        }

    private:
        const RangedSequence* seq_{nullptr};
        uint64_t pos_{0};
    };

    RangedSequence() = default;

    // Consume the payload for `range` from the cursor.  Throws ReadError (and
    // consumes nothing) if the cursor holds fewer bytes than required.
    [[nodiscard]] static RangedSequence parse(Range range, ReadCursor& cursor,
                                              uint16_t item_size = 0) {
        const uint64_t count = range.count();
        const auto     bytes = cursor.readBytes(Layout::bytesFor(count, item_size));
        return RangedSequence{bytes, range.start, count, item_size};
    }

    // Header-only form: no items, no bytes.  `start` keeps the requested
    // first index for callers that address items relative to the request.
    [[nodiscard]] static RangedSequence empty(uint16_t item_size = 0,
                                              uint32_t start = 0) noexcept {
        return RangedSequence{{}, start, 0, item_size};
    }

    [[nodiscard]] uint64_t itemCount() const noexcept { return count_; }
    [[nodiscard]] bool     isEmpty()   const noexcept { return count_ == 0; }
    [[nodiscard]] uint32_t start()     const noexcept { return start_; }
    [[nodiscard]] uint16_t itemSize()  const noexcept { return item_size_; }

    // Raw payload, exactly as consumed from the cursor.
    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return data_; }

    // Value stored for wire index `index`.  Asking for an index outside the
    // view is a programming error and throws std::out_of_range.
    [[nodiscard]] value_type itemAt(uint32_t index) const {
        if (index < start_ || uint64_t{index} - start_ >= count_)
            throw std::out_of_range("RangedSequence::itemAt – index " +
                                    std::to_string(index) + " outside view");
        return valueAt(uint64_t{index} - start_);
    }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator{this, 0}; }
    [[nodiscard]] Iterator end()   const noexcept { return Iterator{this, count_}; }

    bool operator==(const RangedSequence& o) const noexcept {
        return start_ == o.start_ && count_ == o.count_ && item_size_ == o.item_size_ &&
               data_.data() == o.data_.data() && data_.size() == o.data_.size();
    }

private:
    RangedSequence(std::span<const uint8_t> data, uint32_t start, uint64_t count,
                   uint16_t item_size) noexcept
        : data_(data), start_(start), count_(count), item_size_(item_size) {}

    value_type valueAt(uint64_t k) const { return Layout::at(data_, k, item_size_); }

    std::span<const uint8_t> data_;
    uint32_t start_{0};
    uint64_t count_{0};
    uint16_t item_size_{0};
};

using BitSequence       = RangedSequence<PackedBits>;
using DoubleBitSequence = RangedSequence<PackedDoubleBits>;
using FixedSequence     = RangedSequence<FixedRecords>;
using OctetSequence     = RangedSequence<OctetRecords>;

} // namespace dnp3
