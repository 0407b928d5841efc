// Logging.cpp – Log emission for decoded objects.

#include "DNP3Codec/Logging.hpp"
#include "DNP3Codec/Fields.hpp"
#include "DNP3Codec/Values.hpp"

#include <ostream>
#include <string>
#include <type_traits>

namespace dnp3 {

const char* levelName(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

void StreamSink::write(const LogRecord& record) {
    *os_ << levelName(record.level) << ' ' << record.variation.toString()
         << " index=" << record.index << ' ' << record.value << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
//  Per-shape value rendering
// ─────────────────────────────────────────────────────────────────────────────

template <typename Layout, typename Format>
static void logItems(const RangedSequence<Layout>& seq, const Variation& v,
                     LogLevel level, const Logger& logger, Format format) {
    for (const auto& item : seq) {
        LogRecord rec;
        rec.level     = level;
        rec.variation = v.id();
        rec.name      = v.name;
        rec.index     = item.index;
        rec.value     = format(item.value);
        logger.write(rec);
    }
}

void logObject(const DecodedObject& object, LogLevel level, const Logger& logger) {
    if (!object.variation || !logger.isEnabled(level)) return;
    const Variation& v = *object.variation;

    std::visit([&](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;

        if constexpr (std::is_same_v<T, NoPayload> || std::is_same_v<T, OctetVar0> ||
                      std::is_same_v<T, OctetSequence>) {
            // Any, Var0 and VarX objects: nothing per item to report.
        } else if constexpr (std::is_same_v<T, BitSequence>) {
            logItems(payload, v, level, logger,
                     [](bool b) { return std::string(b ? "1" : "0"); });
        } else if constexpr (std::is_same_v<T, DoubleBitSequence>) {
            logItems(payload, v, level, logger,
                     [](DoubleBit d) { return std::string(doubleBitName(d)); });
        } else if constexpr (std::is_same_v<T, FixedSequence>) {
            logItems(payload, v, level, logger,
                     [&v](std::span<const uint8_t> rec) { return formatRecord(v, rec); });
        }
    }, object.payload);
}

} // namespace dnp3
