#include "xrd_match/core/events.hpp"
#include "xrd_match/core/utils.hpp"

namespace xrd_match::core {

namespace {

// Later keys win; the envelope fields (type, run_id, ts) are never replaced.
void merge_extra(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (auto& [key, value] : extra.items()) {
        if (key == "type" || key == "run_id" || key == "ts") continue;
        event[key] = value;
    }
}

void set_stage(json& event, Stage stage) {
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
}

} // namespace

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage, std::ostream& out) {
    json event = base_event("stage_start", run_id);
    set_stage(event, stage);
    emit(event, out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("stage_end", run_id);
    set_stage(event, stage);
    event["status"] = status;
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, Stage stage, const std::string& message,
                           const json& extra, std::ostream& out) {
    json event = base_event("warning", run_id);
    set_stage(event, stage);
    event["message"] = message;
    merge_extra(event, extra);
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace xrd_match::core
