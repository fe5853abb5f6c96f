#include <vcodec_util/trace.h>

#include <atomic>

namespace util {
namespace {
std::atomic<TraceSink*> g_traceSink{nullptr};
} // namespace

void setTraceSink(TraceSink* sink) {
    g_traceSink.store(sink, std::memory_order_release);
}

TraceSink* getTraceSink() {
    return g_traceSink.load(std::memory_order_acquire);
}

void traceMessage(TraceLevel level,
                  std::string_view component,
                  std::string_view message) {
    if (auto* sink = getTraceSink()) {
        sink->log(level, component, message);
    }
}

std::string_view traceLevelName(TraceLevel level) {
    switch (level) {
        case TraceLevel::info: return "info";
        case TraceLevel::warn: return "warn";
        case TraceLevel::error: return "error";
    }
    return "unknown";
}

} // namespace util
