// Decoder.cpp – Shape dispatch and header parsing for range-qualified objects.
//
// Wire-format reminder:
//   Object header = [GROUP 1B][VARIATION 1B][QUALIFIER 1B][RANGE][DATA…]
//   Qualifier 0x00 : RANGE = [START 1B][STOP 1B]
//   Qualifier 0x01 : RANGE = [START 2B][STOP 2B]   (little-endian)
//   DATA is present only in non-read function codes; its length follows from
//   the variation's shape and the range count.

#include "DNP3Codec/Decoder.hpp"

#include <cstdio>
#include <string>

namespace dnp3 {

const char* errorString(DecodeError e) noexcept {
    switch (e) {
    case DecodeError::None:                         return "None";
    case DecodeError::InsufficientBytes:            return "Insufficient bytes";
    case DecodeError::InvalidQualifierForVariation: return "Invalid qualifier for variation";
    case DecodeError::ZeroLengthOctetData:          return "Zero-length octet data";
    case DecodeError::InvalidRange:                 return "Invalid range";
    case DecodeError::UnsupportedQualifier:         return "Unsupported qualifier";
    }
    return "Unknown error";
}

// ─────────────────────────────────────────────────────────────────────────────
//  Result helpers
// ─────────────────────────────────────────────────────────────────────────────

static DecodeResult success(const Variation& v, std::optional<Range> range,
                            ObjectPayload payload) {
    DecodeResult r;
    r.variation = v.id();
    r.object    = DecodedObject{&v, range, std::move(payload)};
    return r;
}

static DecodeResult failure(DecodeError e, GroupVar id, std::string detail = {}) {
    DecodeResult r;
    r.error     = e;
    r.variation = id;
    r.message   = id.toString() + ": " + errorString(e);
    if (!detail.empty()) r.message += " (" + detail + ")";
    return r;
}

static std::string rangeText(Range range) {
    return "start=" + std::to_string(range.start) + " stop=" + std::to_string(range.stop);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Shape dispatch
// ─────────────────────────────────────────────────────────────────────────────

DecodeResult decodeNonRead(const Variation& v, Range range, ReadCursor& cursor) {
    if (!range.valid())
        return failure(DecodeError::InvalidRange, v.id(), rangeText(range));

    if (!v.allowsRangeQualifier())
        return failure(DecodeError::InvalidQualifierForVariation, v.id(),
                       std::string(groupTypeName(v.group_type)) + " group");

    try {
        switch (v.shape) {

        // ── No data regardless of the range ─────────────────────────────────
        case Shape::AnyVariation:
            return success(v, range, NoPayload{});

        case Shape::SingleBitField:
            return success(v, range, BitSequence::parse(range, cursor));

        case Shape::DoubleBitField:
            return success(v, range, DoubleBitSequence::parse(range, cursor));

        case Shape::FixedSize:
            return success(v, range, FixedSequence::parse(range, cursor, v.record_size));

        // ── Variation number is the item length ──────────────────────────────
        case Shape::SizedByVariation:
            if (v.variation == 0)
                return failure(DecodeError::ZeroLengthOctetData, v.id());
            return success(v, range, OctetSequence::parse(range, cursor, v.variation));
        }
    } catch (const ReadError& ex) {
        return failure(DecodeError::InsufficientBytes, v.id(), ex.what());
    }

    return failure(DecodeError::InvalidQualifierForVariation, v.id(), "unknown shape");
}

static DecodeResult decodeReadImpl(const Variation& v, std::optional<Range> range) {
    const uint32_t start = range ? range->start : 0;

    switch (v.shape) {
    case Shape::AnyVariation:
        return success(v, range, NoPayload{});
    case Shape::SingleBitField:
        return success(v, range, BitSequence::empty(0, start));
    case Shape::DoubleBitField:
        return success(v, range, DoubleBitSequence::empty(0, start));
    case Shape::FixedSize:
        return success(v, range, FixedSequence::empty(v.record_size, start));
    case Shape::SizedByVariation:
        if (v.variation == 0)
            return success(v, range, OctetVar0{});
        return success(v, range, OctetSequence::empty(v.variation, start));
    }
    return failure(DecodeError::InvalidQualifierForVariation, v.id(), "unknown shape");
}

DecodeResult decodeRead(const Variation& v) {
    return decodeReadImpl(v, std::nullopt);
}

DecodeResult decodeRead(const Variation& v, Range range) {
    if (!range.valid())
        return failure(DecodeError::InvalidRange, v.id(), rangeText(range));
    return decodeReadImpl(v, range);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Catalog-resolving entry points
// ─────────────────────────────────────────────────────────────────────────────

DecodeResult ObjectDecoder::decodeNonRead(GroupVar id, Range range, ReadCursor& cursor) const {
    const Variation* v = catalog_->lookup(id);
    if (!v)
        return failure(DecodeError::InvalidQualifierForVariation, id, "not in object library");
    return dnp3::decodeNonRead(*v, range, cursor);
}

DecodeResult ObjectDecoder::decodeRead(GroupVar id) const {
    const Variation* v = catalog_->lookup(id);
    if (!v)
        return failure(DecodeError::InvalidQualifierForVariation, id, "not in object library");
    return dnp3::decodeRead(*v);
}

DecodeResult ObjectDecoder::decodeRead(GroupVar id, Range range) const {
    const Variation* v = catalog_->lookup(id);
    if (!v)
        return failure(DecodeError::InvalidQualifierForVariation, id, "not in object library");
    return dnp3::decodeRead(*v, range);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Header parsing
// ─────────────────────────────────────────────────────────────────────────────

static HeaderResult headerFailure(DecodeError e, GroupVar id, std::string message) {
    HeaderResult r;
    r.error     = e;
    r.variation = id;
    r.message   = std::move(message);
    return r;
}

HeaderResult ObjectDecoder::parseHeader(ReadCursor& cursor, ParseMode mode) const {
    const size_t start_pos = cursor.position();
    GroupVar id;
    RangeQualifier qualifier{};
    Range range;

    // ── Step 1: fixed header and range ──────────────────────────────────────
    try {
        id.group     = cursor.readU8();
        id.variation = cursor.readU8();
        const uint8_t q = cursor.readU8();

        switch (q) {
        case 0x00:
            qualifier   = RangeQualifier::OneByteStartStop;
            range.start = cursor.readU8();
            range.stop  = cursor.readU8();
            break;
        case 0x01:
            qualifier   = RangeQualifier::TwoByteStartStop;
            range.start = cursor.readU16();
            range.stop  = cursor.readU16();
            break;
        default: {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "0x%02X", q);
            return headerFailure(DecodeError::UnsupportedQualifier, id,
                                 id.toString() + ": " +
                                 errorString(DecodeError::UnsupportedQualifier) + " " + buf +
                                 " at offset " + std::to_string(start_pos));
        }
        }
    } catch (const ReadError& ex) {
        return headerFailure(DecodeError::InsufficientBytes, id,
                             std::string("Truncated object header at offset ") +
                             std::to_string(start_pos) + " (" + ex.what() + ")");
    }

    // ── Step 2: object data ─────────────────────────────────────────────────
    DecodeResult dr = (mode == ParseMode::NonRead)
        ? decodeNonRead(id, range, cursor)
        : decodeRead(id, range);

    if (!dr.valid())
        return headerFailure(dr.error, dr.variation, std::move(dr.message));

    HeaderResult r;
    r.variation = id;
    r.header    = RangedHeader{id, qualifier, std::move(*dr.object)};
    return r;
}

HeaderCollection ObjectDecoder::parseHeaders(std::span<const uint8_t> objects,
                                             ParseMode mode) const {
    HeaderCollection out;
    ReadCursor cursor{objects};

    while (!cursor.isEmpty()) {
        HeaderResult hr = parseHeader(cursor, mode);
        if (!hr.valid()) {
            out.valid     = false;
            out.error     = hr.error;
            out.variation = hr.variation;
            out.message   = std::move(hr.message);
            break;
        }
        out.headers.push_back(std::move(*hr.header));
    }

    return out;
}

} // namespace dnp3
