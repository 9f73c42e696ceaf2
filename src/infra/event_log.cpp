#include "daicgate/infra/event_log.hpp"

#include "daicgate/core/logger.hpp"
#include "daicgate/core/utils.hpp"

#include <fstream>

namespace daicgate::infra {

EventLog::EventLog(std::filesystem::path file, bool enabled)
    : file_(std::move(file))
    , enabled_(enabled) {}

void EventLog::append(json event) const {
    if (!enabled_) return;

    if (!event.is_object()) {
        event = json{{"event", std::move(event)}};
    }
    if (!event.contains("timestamp")) {
        event["timestamp"] = utils::timestamp_iso();
    }

    std::error_code ec;
    std::filesystem::create_directories(file_.parent_path(), ec);
    if (ec) {
        LOG_DEBUG("Event log directory unavailable: {}", ec.message());
        return;
    }

    std::ofstream out(file_, std::ios::app);
    if (!out.is_open()) {
        LOG_DEBUG("Cannot open event log {}", file_.string());
        return;
    }
    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    if (!out.good()) {
        LOG_DEBUG("Failed to append to event log {}", file_.string());
    }
}

} // namespace daicgate::infra
