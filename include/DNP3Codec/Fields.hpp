#pragma once
// Fields.hpp – Interpretation of one fixed-size record using the field layout
// declared for its variation in the object library.
//
// The sequence views hand out raw records; measurement ingestion and logging
// use decodeFields() when they need the values inside.

#include "Types.hpp"
#include "Values.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace dnp3 {

struct FieldValue {
    const FieldDef* def{nullptr};                 // borrowed from the catalog
    std::variant<uint64_t, int64_t, double> value;

    [[nodiscard]] const std::string& name() const noexcept { return def->name; }

    // Numeric value as unsigned, for flags, counters and times.  Floats are
    // truncated toward zero.  Empty when the value is negative, NaN or does
    // not fit in 64 bits.
    [[nodiscard]] std::optional<uint64_t> asUnsigned() const noexcept;

    // Rendered according to the field's encoding:
    //   raw → "42" / "-7" / "1.5"
    //   hex → "0x81"
    //   table → "Success" (or the number when the table has no entry)
    //   timestamp → "2021-03-01T12:00:00.000Z"
    //   control_code → "Close|PulseOn"
    [[nodiscard]] std::string toString() const;
};

// Decode `record` (exactly variation.record_size bytes) into its declared
// fields, in wire order.  Throws ReadError if the record is shorter than the
// layout; returns an empty vector when the variation declares no fields.
[[nodiscard]] std::vector<FieldValue> decodeFields(const Variation& variation,
                                                   std::span<const uint8_t> record);

// Time of an event record.  An absolute `time` field is returned as is; a
// 16-bit relative `time` (g2v3, g4v3) is added to `cto`, the common time of
// occurrence from the preceding g51 object.  Empty when the record carries no
// time or the sum leaves the 48-bit range.  Throws ReadError on a short record.
[[nodiscard]] std::optional<Timestamp> eventTime(const Variation& variation,
                                                 std::span<const uint8_t> record,
                                                 Timestamp cto);

// "flags=0x01 value=42", or the record as hex when no layout is declared.
[[nodiscard]] std::string formatRecord(const Variation& variation,
                                       std::span<const uint8_t> record);

// "0A 0B 0C"
[[nodiscard]] std::string hexString(std::span<const uint8_t> bytes);

} // namespace dnp3
