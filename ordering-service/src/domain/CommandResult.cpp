#include "domain/CommandResult.hpp"
#include <nlohmann/json.hpp>

namespace ordering::domain {

namespace {

std::optional<ErrorKind> parseErrorKind(const std::string& str) {
    if (str == "VALIDATION") return ErrorKind::VALIDATION;
    if (str == "INVALID_TRANSITION") return ErrorKind::INVALID_TRANSITION;
    if (str == "CONCURRENCY_CONFLICT") return ErrorKind::CONCURRENCY_CONFLICT;
    if (str == "NOT_FOUND") return ErrorKind::NOT_FOUND;
    return std::nullopt;
}

} // namespace

std::string CommandResult::toJson() const {
    nlohmann::json j;
    j["success"] = success;
    j["order_id"] = orderId;
    if (status) {
        j["status"] = toString(*status);
    }
    if (error) {
        nlohmann::json e;
        e["kind"] = toString(error->kind);
        e["transition"] = error->transition;
        e["message"] = error->message;
        if (error->currentStatus) {
            e["current_status"] = toString(*error->currentStatus);
        }
        j["error"] = e;
    }
    return j.dump();
}

CommandResult CommandResult::fromJson(const std::string& json) {
    auto j = nlohmann::json::parse(json);

    CommandResult r;
    r.success = j.value("success", false);
    r.orderId = j.value("order_id", "");
    if (j.contains("status")) {
        r.status = parseOrderStatus(j["status"].get<std::string>());
    }
    if (j.contains("error")) {
        const auto& e = j["error"];
        DomainError error;
        error.kind = parseErrorKind(e.value("kind", "")).value_or(ErrorKind::VALIDATION);
        error.transition = e.value("transition", "");
        error.message = e.value("message", "");
        if (e.contains("current_status")) {
            error.currentStatus = parseOrderStatus(e["current_status"].get<std::string>());
        }
        r.error = error;
    }
    return r;
}

} // namespace ordering::domain
