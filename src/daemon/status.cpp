#include "status.hpp"

std::optional<Status> status_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) return std::nullopt;

    auto it = doc.find("status");
    if (it == doc.end() || !it->is_string()) return std::nullopt;

    Status st;
    st.status = it->get<std::string>();

    for (auto& [key, value] : doc.items()) {
        if (key == "status") continue;
        if (key == "message" && value.is_string()) {
            st.message = value.get<std::string>();
        } else if (key == "timestamp" && value.is_string()) {
            st.timestamp = value.get<std::string>();
        } else {
            st.extra[key] = value;
        }
    }
    return st;
}

std::optional<Status> parse_status(std::string_view text) {
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) return std::nullopt;
    return status_from_json(doc);
}

nlohmann::json to_json(const Status& st) {
    nlohmann::json j = st.extra.is_object() ? st.extra : nlohmann::json::object();
    j["status"] = st.status;
    j["message"] = st.message;
    j["timestamp"] = st.timestamp;
    return j;
}
