#pragma once
// ============================================================================
// LOG CAPTURE
// ============================================================================
// Swaps the default spdlog logger for one writing into a string buffer, and
// restores the previous logger on destruction.
// ============================================================================

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>

namespace RpcExtractor {
namespace Testing {

class LogCapture {
public:
    LogCapture()
        : previous_(spdlog::default_logger()),
          sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
        sink_->set_pattern("%v");
        auto logger = std::make_shared<spdlog::logger>("capture", sink_);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() {
        spdlog::set_default_logger(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    // Read only once the threads that log have gone quiet
    size_t count(const std::string& needle) const {
        const std::string text = stream_.str();
        size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

} // namespace Testing
} // namespace RpcExtractor
