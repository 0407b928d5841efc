#pragma once
// Decoder.hpp – Public decode API for range-qualified DNP3 object headers.
//
// Usage example:
//   VariationCatalog catalog = loadCatalog("specs/dnp3_objects.xml");
//   ObjectDecoder decoder{catalog};
//
//   // Decode the object section of a response fragment:
//   HeaderCollection headers = decoder.parseHeaders(object_bytes, ParseMode::NonRead);
//   for (const auto& h : headers.headers)
//       if (auto* seq = std::get_if<FixedSequence>(&h.object.payload))
//           for (auto [index, record] : *seq) { … }
//
// Decoded objects borrow both the fragment bytes and the catalog; neither may
// be destroyed or modified while the objects are in use.

#include "Catalog.hpp"
#include "ReadCursor.hpp"
#include "Sequences.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace dnp3 {

// ─── Payload forms ────────────────────────────────────────────────────────────
struct NoPayload {                 // AnyVariation
    bool operator==(const NoPayload&) const = default;
};
struct OctetVar0 {                 // size-by-variation group at variation 0
    bool operator==(const OctetVar0&) const = default;
};

using ObjectPayload = std::variant<NoPayload,
                                   BitSequence,
                                   DoubleBitSequence,
                                   FixedSequence,
                                   OctetSequence,
                                   OctetVar0>;

// ─── One decoded object header ────────────────────────────────────────────────
// Immutable once produced.  `range` is absent for read-mode objects decoded
// without a request range.
struct DecodedObject {
    const Variation*     variation{nullptr};
    std::optional<Range> range;
    ObjectPayload        payload;

    // True for the payload-bearing shapes (bit, double-bit, fixed, octet).
    [[nodiscard]] bool hasSequence() const noexcept {
        return !std::holds_alternative<NoPayload>(payload) &&
               !std::holds_alternative<OctetVar0>(payload);
    }
};

// ─── Error taxonomy ───────────────────────────────────────────────────────────
enum class DecodeError {
    None = 0,
    InsufficientBytes,            // payload shorter than count × item size
    InvalidQualifierForVariation, // variation unknown or not range-addressable
    ZeroLengthOctetData,          // size-by-variation variation 0 with data
    InvalidRange,                 // stop < start
    UnsupportedQualifier,         // header qualifier is not a start/stop range
};

const char* errorString(DecodeError e) noexcept;

// ─── Result of one decode call ────────────────────────────────────────────────
// Exactly one of `object` / `error != None` is set.  `variation` identifies
// the object header that failed.
struct DecodeResult {
    std::optional<DecodedObject> object;
    DecodeError error{DecodeError::None};
    GroupVar    variation{};
    std::string message;

    [[nodiscard]] bool valid() const noexcept { return error == DecodeError::None; }
};

// ─── Shape dispatch (no catalog needed) ───────────────────────────────────────

// Decode a data-bearing object header.  Consumes exactly the payload bytes
// on success and nothing on failure.
[[nodiscard]] DecodeResult decodeNonRead(const Variation& variation, Range range,
                                         ReadCursor& cursor);

// Decode a read-request object header.  Never touches a cursor; the payload
// is an empty view (or NoPayload / OctetVar0).
[[nodiscard]] DecodeResult decodeRead(const Variation& variation);
[[nodiscard]] DecodeResult decodeRead(const Variation& variation, Range range);

// ─── Header parsing ───────────────────────────────────────────────────────────
enum class ParseMode {
    Read,    // request headers: no object data follows
    NonRead, // responses, writes, operates: object data follows each header
};

enum class RangeQualifier : uint8_t {
    OneByteStartStop = 0x00,
    TwoByteStartStop = 0x01,
};

struct RangedHeader {
    GroupVar       id;
    RangeQualifier qualifier{RangeQualifier::OneByteStartStop};
    DecodedObject  object;
};

struct HeaderResult {
    std::optional<RangedHeader> header;
    DecodeError error{DecodeError::None};
    GroupVar    variation{};
    std::string message;

    [[nodiscard]] bool valid() const noexcept { return error == DecodeError::None; }
};

// All headers of one object section, in wire order.  Parsing stops at the
// first failure; the headers before it are kept.
struct HeaderCollection {
    std::vector<RangedHeader> headers;
    bool        valid{true};
    DecodeError error{DecodeError::None};
    GroupVar    variation{};
    std::string message;
};

// ─────────────────────────────────────────────────────────────────────────────
//  ObjectDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Resolves (group, variation) against a catalog, then dispatches on shape.
// Holds no mutable state; one instance may be shared between threads.
class ObjectDecoder {
public:
    explicit ObjectDecoder(const VariationCatalog& catalog) noexcept : catalog_(&catalog) {}

    [[nodiscard]] const VariationCatalog& catalog() const noexcept { return *catalog_; }

    // Unknown (group, variation) → InvalidQualifierForVariation.
    [[nodiscard]] DecodeResult decodeNonRead(GroupVar id, Range range, ReadCursor& cursor) const;
    [[nodiscard]] DecodeResult decodeRead(GroupVar id) const;
    [[nodiscard]] DecodeResult decodeRead(GroupVar id, Range range) const;

    // Read one header: group, variation, qualifier, start/stop, then (in
    // NonRead mode) the object data.  The cursor is left after the header.
    [[nodiscard]] HeaderResult parseHeader(ReadCursor& cursor, ParseMode mode) const;

    // Read headers until the buffer is exhausted or one fails.
    [[nodiscard]] HeaderCollection parseHeaders(std::span<const uint8_t> objects,
                                                ParseMode mode) const;

private:
    const VariationCatalog* catalog_;
};

} // namespace dnp3
