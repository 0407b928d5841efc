// Values.cpp – Names and text forms of the DNP3 value types.

#include "DNP3Codec/Values.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace dnp3 {

const char* doubleBitName(DoubleBit d) noexcept {
    switch (d) {
    case DoubleBit::Intermediate:  return "Intermediate";
    case DoubleBit::DeterminedOff: return "DeterminedOff";
    case DoubleBit::DeterminedOn:  return "DeterminedOn";
    case DoubleBit::Indeterminate: return "Indeterminate";
    }
    return "Indeterminate";
}

const char* tripCloseCodeName(TripCloseCode c) noexcept {
    switch (c) {
    case TripCloseCode::Nul:      return "Nul";
    case TripCloseCode::Close:    return "Close";
    case TripCloseCode::Trip:     return "Trip";
    case TripCloseCode::Reserved: return "Reserved";
    }
    return "Reserved";
}

const char* opTypeName(OpType op) noexcept {
    switch (op) {
    case OpType::Nul:      return "Nul";
    case OpType::PulseOn:  return "PulseOn";
    case OpType::PulseOff: return "PulseOff";
    case OpType::LatchOn:  return "LatchOn";
    case OpType::LatchOff: return "LatchOff";
    }
    return "Undefined";
}

std::string ControlCode::toString() const {
    std::string s = tripCloseCodeName(tcc);
    if (clear) s += "|CR";
    if (queue) s += "|QU";
    s += '|';
    s += opTypeName(op_type);
    return s;
}

// ─── Timestamp formatting ─────────────────────────────────────────────────────
// 48 bits of milliseconds reach the year 10889, well inside std::chrono::year.

std::string Timestamp::toString() const {
    using namespace std::chrono;

    const uint64_t days_since_epoch = value_ / 86'400'000u;
    const uint64_t ms_of_day        = value_ % 86'400'000u;

    const year_month_day ymd{sys_days{days{static_cast<int64_t>(days_since_epoch)}}};

    const int      y   = static_cast<int>(ymd.year());
    const unsigned mon = static_cast<unsigned>(ymd.month());
    const unsigned d   = static_cast<unsigned>(ymd.day());
    const unsigned h   = static_cast<unsigned>(ms_of_day / 3'600'000u);
    const unsigned min = static_cast<unsigned>((ms_of_day / 60'000u) % 60u);
    const unsigned sec = static_cast<unsigned>((ms_of_day / 1'000u) % 60u);
    const unsigned ms  = static_cast<unsigned>(ms_of_day % 1'000u);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s%04d-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  y > 9999 ? "+" : "", y, mon, d, h, min, sec, ms);
    return buf;
}

} // namespace dnp3
