#pragma once

#include <mcn_ls/core/log.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcn_ls::testing {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

// ---------------------------------------------------------------------------
// CaptureSink: records every message written to it.
//
// Usage with the global logger:
//   auto sink = std::make_unique<CaptureSink>();
//   auto* captured = sink.get();
//   InitGlobalLogger(std::move(sink), LogLevel::Debug);
//   ... exercise code ...
//   CHECK(captured->Contains("applying only the first"));
// ---------------------------------------------------------------------------
class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back({level, std::string(component), std::string(message)});
    }

    [[nodiscard]] bool Contains(std::string_view fragment) const {
        for (const auto& m : messages) {
            if (m.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<CapturedMessage> messages;
};

// Installs a CaptureSink as the global logger for the lifetime of the guard.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(LogLevel level = LogLevel::Debug) {
        auto sink = std::make_unique<CaptureSink>();
        sink_ = sink.get();
        InitGlobalLogger(std::move(sink), level);
    }
    ~ScopedLogCapture() {
        InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    [[nodiscard]] const CaptureSink& Sink() const { return *sink_; }

private:
    CaptureSink* sink_;
};

} // namespace mcn_ls::testing
