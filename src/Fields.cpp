// Fields.cpp – Field-level decoding of fixed-size DNP3 records.

#include "DNP3Codec/Fields.hpp"
#include "DNP3Codec/ReadCursor.hpp"
#include "DNP3Codec/Values.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace dnp3 {

// ─── FieldValue ───────────────────────────────────────────────────────────────

std::optional<uint64_t> FieldValue::asUnsigned() const noexcept {
    if (auto u = std::get_if<uint64_t>(&value)) return *u;
    if (auto s = std::get_if<int64_t>(&value)) {
        if (*s < 0) return std::nullopt;
        return static_cast<uint64_t>(*s);
    }

    // 2^64 is exact as a double; anything at or above it does not convert.
    const double d = std::get<double>(value);
    if (!std::isfinite(d) || d < 0.0 || d >= 18446744073709551616.0)
        return std::nullopt;
    return static_cast<uint64_t>(d);
}

std::string FieldValue::toString() const {
    char buf[64];

    if (auto d = std::get_if<double>(&value)) {
        std::snprintf(buf, sizeof(buf), "%g", *d);
        return buf;
    }
    if (auto s = std::get_if<int64_t>(&value))
        return std::to_string(*s);

    const uint64_t raw = std::get<uint64_t>(value);
    switch (def->encoding) {
    case FieldEncoding::Hex:
        std::snprintf(buf, sizeof(buf), "0x%02llX", static_cast<unsigned long long>(raw));
        return buf;
    case FieldEncoding::Table: {
        auto it = def->table.find(raw);
        return it != def->table.end() ? it->second : std::to_string(raw);
    }
    case FieldEncoding::Timestamp:
        return Timestamp{raw}.toString();
    case FieldEncoding::ControlCode:
        return ControlCode::fromByte(static_cast<uint8_t>(raw)).toString();
    case FieldEncoding::Raw:
        break;
    }
    return std::to_string(raw);
}

// ─── Record decoding ──────────────────────────────────────────────────────────

static FieldValue readField(const FieldDef& def, ReadCursor& cur) {
    FieldValue fv;
    fv.def = &def;
    switch (def.type) {
    case FieldType::U8:  fv.value = uint64_t{cur.readU8()};  break;
    case FieldType::U16: fv.value = uint64_t{cur.readU16()}; break;
    case FieldType::U32: fv.value = uint64_t{cur.readU32()}; break;
    case FieldType::U48: fv.value = cur.readU48();           break;
    case FieldType::I16: fv.value = int64_t{cur.readI16()};  break;
    case FieldType::I32: fv.value = int64_t{cur.readI32()};  break;
    case FieldType::F32: fv.value = double{cur.readF32()};   break;
    case FieldType::F64: fv.value = cur.readF64();           break;
    }
    return fv;
}

std::vector<FieldValue> decodeFields(const Variation& variation,
                                     std::span<const uint8_t> record) {
    std::vector<FieldValue> out;
    out.reserve(variation.fields.size());

    ReadCursor cur{record};
    for (const auto& f : variation.fields)
        out.push_back(readField(f, cur));
    return out;
}

std::optional<Timestamp> eventTime(const Variation& variation,
                                   std::span<const uint8_t> record, Timestamp cto) {
    for (const auto& fv : decodeFields(variation, record)) {
        const auto* raw = std::get_if<uint64_t>(&fv.value);
        if (fv.name() != "time" || !raw) continue;

        if (fv.def->encoding == FieldEncoding::Timestamp)
            return Timestamp{*raw};
        if (fv.def->type == FieldType::U16)
            return cto.checkedAdd(static_cast<uint16_t>(*raw));
    }
    return std::nullopt;
}

std::string hexString(std::span<const uint8_t> bytes) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string s;
    s.reserve(bytes.size() * 3);
    for (uint8_t b : bytes) {
        if (!s.empty()) s += ' ';
        s += digits[b >> 4];
        s += digits[b & 0x0F];
    }
    return s;
}

std::string formatRecord(const Variation& variation, std::span<const uint8_t> record) {
    if (variation.fields.empty())
        return hexString(record);

    std::string s;
    for (const auto& fv : decodeFields(variation, record)) {
        if (!s.empty()) s += ' ';
        s += fv.name();
        s += '=';
        s += fv.toString();
    }
    return s;
}

} // namespace dnp3
