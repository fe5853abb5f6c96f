#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace util {

enum class TraceLevel {
    info,
    warn,
    error
};

/**
 * Receiver for codec diagnostics. Components report as "ValueDecoder"
 * (rejected fields), "LiteralEncoder" (type mismatches) and
 * "SessionTimezone" (observed zone changes).
 * Installed process-wide; nullptr disables tracing.
 */
class TraceSink {
public:
    virtual ~TraceSink() = default;
    virtual void log(TraceLevel level,
                     std::string_view component,
                     std::string_view message) = 0;
};

void setTraceSink(TraceSink* sink);
TraceSink* getTraceSink();

void traceMessage(TraceLevel level,
                  std::string_view component,
                  std::string_view message);

std::string_view traceLevelName(TraceLevel level);

/**
 * Installs a sink for the lifetime of the object and restores the
 * previously installed one afterwards.
 */
class ScopedTraceSink {
public:
    explicit ScopedTraceSink(TraceSink* sink) : previous_(getTraceSink()) {
        setTraceSink(sink);
    }
    ~ScopedTraceSink() { setTraceSink(previous_); }

    ScopedTraceSink(const ScopedTraceSink&) = delete;
    ScopedTraceSink& operator=(const ScopedTraceSink&) = delete;

private:
    TraceSink* previous_;
};

// The formatter only runs when a sink is installed
template<typename Formatter>
inline void trace(TraceLevel level,
                  std::string_view component,
                  Formatter&& formatter) {
    if (auto* sink = getTraceSink()) {
        std::ostringstream oss;
        formatter(oss);
        sink->log(level, component, oss.str());
    }
}

} // namespace util
