#pragma once
// Logging.hpp – Structured diagnostic records for decoded objects.
//
// The codec never formats output lines itself beyond one record per item;
// where the records end up is decided by the LogSink the caller installs.
//
//   StreamSink sink{std::clog};
//   Logger     logger{sink, LogLevel::Debug};
//   logObject(object, LogLevel::Info, logger);

#include "Decoder.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace dnp3 {

// Lower value = more severe.
enum class LogLevel { Error = 0, Warn, Info, Debug, Trace };

const char* levelName(LogLevel level) noexcept;

// ─── One (index, value) pair of one object header ─────────────────────────────
struct LogRecord {
    LogLevel    level{LogLevel::Info};
    GroupVar    variation{};
    std::string name;        // "BinaryInput.Packed"
    uint32_t    index{0};
    std::string value;       // "1", "DeterminedOn", "flags=0x01 value=42"
};

// ─── Destination for records ──────────────────────────────────────────────────
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

// One line per record: "INFO  g1v2 index=3 flags=0x01"
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& os) noexcept : os_(&os) {}
    void write(const LogRecord& record) override;

private:
    std::ostream* os_;
};

// Keeps every record in memory.
class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override { records_.push_back(record); }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept { return records_; }
    void clear() noexcept { records_.clear(); }

private:
    std::vector<LogRecord> records_;
};

// ─── Level filter in front of a sink ──────────────────────────────────────────
class Logger {
public:
    Logger(LogSink& sink, LogLevel max_level) noexcept : sink_(&sink), max_level_(max_level) {}

    [[nodiscard]] bool isEnabled(LogLevel level) const noexcept {
        return static_cast<int>(level) <= static_cast<int>(max_level_);
    }
    void setLevel(LogLevel level) noexcept { max_level_ = level; }

    void write(const LogRecord& record) const {
        if (isEnabled(record.level)) sink_->write(record);
    }

private:
    LogSink* sink_;
    LogLevel max_level_;
};

// Emit one record per item of a payload-bearing object, in ascending index
// order, at `level`.  AnyVariation, octet-string objects (variation 0 and
// variation x alike) and read-mode empty views emit nothing.
void logObject(const DecodedObject& object, LogLevel level, const Logger& logger);

} // namespace dnp3
