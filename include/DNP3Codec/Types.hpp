#pragma once
// Types.hpp – Object-library metadata and index ranges for the DNP3 codec.
// Every decoded object header is described by one Variation from the catalog.

#include <compare>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dnp3 {

// ─── Wire shape of a variation ────────────────────────────────────────────────
// The shape alone determines how many bytes an object header's payload takes
// and how the payload is represented once decoded.
enum class Shape {
    AnyVariation,     // No payload (default / wildcard requests)
    SingleBitField,   // 1 bit per index, packed LSB-first
    DoubleBitField,   // 2 bits per index, packed LSB-first
    FixedSize,        // record_size bytes per index
    SizedByVariation, // variation number = bytes per index; 0 = unspecified
};

// ─── Role of the owning group ─────────────────────────────────────────────────
enum class GroupType { Static, Event, Command, Class, Time, Iin, Other };

// ─── Primitive type of one field inside a fixed-size record ───────────────────
enum class FieldType { U8, U16, U32, U48, I16, I32, F32, F64 };

// ─── How a field's raw value is rendered for diagnostics ──────────────────────
enum class FieldEncoding {
    Raw,       // Plain number
    Hex,       // Bit flags, shown as 0x..
    Table,     // Raw integer → name from a table
    Timestamp,   // 48-bit milliseconds since 1970-01-01 UTC
    ControlCode, // CROB / PCB control octet, e.g. "Close|PulseOn"
};

// Width in bytes of a field type on the wire.
[[nodiscard]] constexpr uint16_t fieldWidth(FieldType t) noexcept {
    switch (t) {
    case FieldType::U8:  return 1;
    case FieldType::U16: return 2;
    case FieldType::I16: return 2;
    case FieldType::U32: return 4;
    case FieldType::I32: return 4;
    case FieldType::F32: return 4;
    case FieldType::U48: return 6;
    case FieldType::F64: return 8;
    }
    return 0;
}

// ─── One field of a fixed-size record ─────────────────────────────────────────
struct FieldDef {
    std::string   name;     // "flags", "value", "time", …
    FieldType     type{FieldType::U8};
    FieldEncoding encoding{FieldEncoding::Raw};

    // Table encoding – raw value → description string
    std::map<uint64_t, std::string> table;
};

// ─── (group, variation) identity as it appears in an object header ───────────
struct GroupVar {
    uint8_t group{0};
    uint8_t variation{0};

    auto operator<=>(const GroupVar&) const = default;

    // "g30v1"
    [[nodiscard]] std::string toString() const {
        return "g" + std::to_string(group) + "v" + std::to_string(variation);
    }
};

// ─── One entry of the object library ──────────────────────────────────────────
struct Variation {
    uint8_t     group{0};
    uint8_t     variation{0};
    std::string name;        // "AnalogInput.Int32WithFlag"
    GroupType   group_type{GroupType::Other};
    Shape       shape{Shape::AnyVariation};

    // FixedSize: bytes per record (sum of field widths, filled by the loader).
    // SizedByVariation: equal to the variation number.
    uint16_t record_size{0};

    // FixedSize: record layout, in wire order.  May be empty for ad-hoc
    // variations that only declare a size.
    std::vector<FieldDef> fields;

    [[nodiscard]] GroupVar id() const noexcept { return {group, variation}; }

    // Whether an object header of this variation can be addressed with a
    // start/stop range qualifier.  Packed bit fields are index-addressed in
    // every group; everything else only in static groups.
    [[nodiscard]] bool allowsRangeQualifier() const noexcept {
        switch (shape) {
        case Shape::SingleBitField:
        case Shape::DoubleBitField:
            return true;
        case Shape::AnyVariation:
        case Shape::FixedSize:
        case Shape::SizedByVariation:
            return group_type == GroupType::Static;
        }
        return false;
    }
};

// ─── Inclusive index interval decoded from a start/stop qualifier ─────────────
// stop < start never comes off the wire legitimately; valid() reports it and
// the decoder rejects such a range.  count() is 64-bit so that {0, 0xFFFFFFFF}
// does not wrap.
struct Range {
    uint32_t start{0};
    uint32_t stop{0};

    [[nodiscard]] constexpr bool valid() const noexcept { return stop >= start; }

    [[nodiscard]] constexpr uint64_t count() const noexcept {
        return valid() ? uint64_t{stop} - start + 1 : 0;
    }

    bool operator==(const Range&) const = default;
};

const char* groupTypeName(GroupType t) noexcept;

} // namespace dnp3
