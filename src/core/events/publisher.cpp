#include <rpcextractor/core/events/publisher.hpp>
#include <rpcextractor/core/events/event_factory.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace RpcExtractor {

std::string Publisher::subjectFor(const std::string& method) {
    std::string subject = method;
    std::transform(subject.begin(), subject.end(), subject.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return subject;
}

std::optional<PublishError> Publisher::publish(const Event& event) {
    const std::string subject = subjectFor(event.method);

    std::string envelope;
    try {
        envelope = EventFactory::toEnvelope(event);
    } catch (const std::exception& e) {
        total_failed_.fetch_add(1, std::memory_order_relaxed);
        return PublishError{subject, std::string("serialization failed: ") + e.what()};
    }

    auto err = bus_.publish(subject, envelope);
    if (err) {
        total_failed_.fetch_add(1, std::memory_order_relaxed);
        return err;
    }

    total_published_.fetch_add(1, std::memory_order_relaxed);
    spdlog::trace("[Publisher] event id={} -> {} ({} bytes)", event.id, subject, envelope.size());
    return std::nullopt;
}

} // namespace RpcExtractor
