#pragma once
// Values.hpp – Small value types carried inside DNP3 objects: double-bit
// states, control codes (CROB / PCB) and 48-bit timestamps.

#include <cstdint>
#include <optional>
#include <string>

namespace dnp3 {

// ─── Double-bit binary state (low two bits of a packed pair) ──────────────────
enum class DoubleBit : uint8_t {
    Intermediate  = 0b00,
    DeterminedOff = 0b01,
    DeterminedOn  = 0b10,
    Indeterminate = 0b11,
};

[[nodiscard]] constexpr DoubleBit doubleBitFrom(uint8_t x) noexcept {
    return static_cast<DoubleBit>(x & 0b0000'0011u);
}

const char* doubleBitName(DoubleBit d) noexcept;

// ─── Control code (first octet of g12v1 / g12v2) ──────────────────────────────
//   bits 7-6  trip/close code
//   bit  5    clear
//   bit  4    queue
//   bits 3-0  operation type
enum class TripCloseCode : uint8_t { Nul = 0, Close = 1, Trip = 2, Reserved = 3 };

// Values 5..15 are undefined by the standard but still round-trip.
enum class OpType : uint8_t { Nul = 0, PulseOn = 1, PulseOff = 2, LatchOn = 3, LatchOff = 4 };

const char* tripCloseCodeName(TripCloseCode c) noexcept;
const char* opTypeName(OpType op) noexcept;

struct ControlCode {
    TripCloseCode tcc{TripCloseCode::Nul};
    bool          clear{false};
    bool          queue{false};
    OpType        op_type{OpType::Nul};

    static constexpr uint8_t TCC_MASK = 0b1100'0000;
    static constexpr uint8_t CR_MASK  = 0b0010'0000;
    static constexpr uint8_t QU_MASK  = 0b0001'0000;
    static constexpr uint8_t OP_MASK  = 0b0000'1111;

    [[nodiscard]] static constexpr ControlCode fromByte(uint8_t x) noexcept {
        return ControlCode{
            static_cast<TripCloseCode>((x & TCC_MASK) >> 6),
            (x & CR_MASK) != 0,
            (x & QU_MASK) != 0,
            static_cast<OpType>(x & OP_MASK),
        };
    }

    [[nodiscard]] constexpr uint8_t toByte() const noexcept {
        uint8_t x = static_cast<uint8_t>(static_cast<uint8_t>(tcc) << 6);
        if (clear) x |= CR_MASK;
        if (queue) x |= QU_MASK;
        x |= static_cast<uint8_t>(static_cast<uint8_t>(op_type) & OP_MASK);
        return x;
    }

    bool operator==(const ControlCode&) const = default;

    // "Trip|CR|QU|LatchOff"
    [[nodiscard]] std::string toString() const;
};

// ─── DNP3 timestamp: 48-bit milliseconds since 1970-01-01T00:00:00Z ───────────
class Timestamp {
public:
    static constexpr uint64_t MAX_VALUE = 0x0000'FFFF'FFFF'FFFFull;

    constexpr Timestamp() noexcept = default;
    constexpr explicit Timestamp(uint64_t value) noexcept : value_(value & MAX_VALUE) {}

    [[nodiscard]] static constexpr Timestamp min() noexcept { return Timestamp{0}; }
    [[nodiscard]] static constexpr Timestamp max() noexcept { return Timestamp{MAX_VALUE}; }

    [[nodiscard]] constexpr uint64_t value() const noexcept { return value_; }

    // Add a 16-bit relative offset (g2v3 / g4v3 against a g51 CTO).
    // Empty if the result would leave the 48-bit range.
    [[nodiscard]] constexpr std::optional<Timestamp> checkedAdd(uint16_t x) const noexcept {
        if (uint64_t{x} > MAX_VALUE - value_) return std::nullopt;
        return Timestamp{value_ + x};
    }

    // RFC 3339 UTC with milliseconds, e.g. "1970-01-01T00:00:00.000Z".
    // Years past 9999 are prefixed with '+'.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Timestamp&) const = default;

private:
    uint64_t value_{0};
};

} // namespace dnp3
