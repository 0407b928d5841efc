#pragma once
// ReadCursor.hpp – Forward-only, bounds-checked reader over a DNP3 fragment.
//
// DNP3 wire format rules:
//   • Multi-byte integers are little-endian (least significant octet first).
//   • Floating-point values are IEEE-754, also little-endian.
//   • Time values are 48-bit unsigned milliseconds since 1970-01-01 UTC.
//
// A read that would pass the end of the buffer throws ReadError and leaves the
// cursor where it was.

#include <bit>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace dnp3 {

// Thrown when fewer bytes remain than a read requires.
class ReadError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// ─────────────────────────────────────────────────────────────────────────────
//  ReadCursor
// ─────────────────────────────────────────────────────────────────────────────
// Reads bytes sequentially from a read-only byte span.  Spans handed out by
// readBytes() borrow the same buffer as the cursor.
class ReadCursor {
public:
    explicit ReadCursor(std::span<const uint8_t> buf) noexcept
        : buf_(buf), pos_(0) {}

    // ── Position queries ─────────────────────────────────────────────────────

    [[nodiscard]] size_t position()  const noexcept { return pos_; }
    [[nodiscard]] size_t remaining() const noexcept { return buf_.size() - pos_; }
    [[nodiscard]] bool   isEmpty()   const noexcept { return pos_ == buf_.size(); }
    [[nodiscard]] bool   canRead(uint64_t n) const noexcept {
        return n <= remaining();
    }

    // ── Byte-aligned reads ───────────────────────────────────────────────────

    // Borrow the next n bytes and advance past them.
    [[nodiscard]] std::span<const uint8_t> readBytes(uint64_t n) {
        boundsCheck(n, "readBytes");
        const size_t start = pos_;
        pos_ += static_cast<size_t>(n);
        return buf_.subspan(start, static_cast<size_t>(n));
    }

    [[nodiscard]] uint8_t readU8() {
        boundsCheck(1, "readU8");
        return buf_[pos_++];
    }

    [[nodiscard]] uint16_t readU16() { return static_cast<uint16_t>(readLE(2, "readU16")); }
    [[nodiscard]] uint32_t readU32() { return static_cast<uint32_t>(readLE(4, "readU32")); }
    [[nodiscard]] uint64_t readU48() { return readLE(6, "readU48"); }

    [[nodiscard]] int16_t readI16() { return static_cast<int16_t>(readU16()); }
    [[nodiscard]] int32_t readI32() { return static_cast<int32_t>(readU32()); }

    [[nodiscard]] float  readF32() { return std::bit_cast<float>(readU32()); }
    [[nodiscard]] double readF64() { return std::bit_cast<double>(readLE(8, "readF64")); }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};

    // Assemble an n-byte little-endian unsigned value, n ≤ 8.
    uint64_t readLE(size_t n, const char* where) {
        boundsCheck(n, where);
        uint64_t value = 0;
        for (size_t i = 0; i < n; ++i)
            value |= uint64_t{buf_[pos_ + i]} << (8 * i);
        pos_ += n;
        return value;
    }

    void boundsCheck(uint64_t n, const char* where) const {
        if (!canRead(n))
            throw ReadError(std::string("ReadCursor::") + where + " – need " +
                            std::to_string(n) + " byte(s), " +
                            std::to_string(remaining()) + " remaining");
    }
};

} // namespace dnp3
