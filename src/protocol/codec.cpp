#include "codec.hpp"

#include <cctype>

namespace udplogd {
namespace {
bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_category_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}
}  // namespace

const char* decode_status_name(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::Ok: return "ok";
        case DecodeStatus::InvalidCategory: return "invalid_category";
        case DecodeStatus::InvalidPayload: return "invalid_payload";
    }
    return "?";
}

bool valid_category(std::string_view category) {
    if (category.empty()) return false;
    for (char c : category) {
        if (!is_category_char(c)) return false;
    }
    return true;
}

DecodeStatus decode(std::string_view datagram, Event& out) {
    while (!datagram.empty() && is_space(datagram.back())) datagram.remove_suffix(1);

    auto colon = datagram.find(':');
    if (colon == std::string_view::npos) return DecodeStatus::InvalidCategory;
    std::string_view category = datagram.substr(0, colon);
    if (!valid_category(category)) return DecodeStatus::InvalidCategory;

    std::string_view payload = datagram.substr(colon + 1);
    if (!payload.empty() && is_space(payload.front())) payload.remove_prefix(1);

    auto fields = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (fields.is_discarded() || !fields.is_object()) return DecodeStatus::InvalidPayload;

    out = Event(std::string(category), std::move(fields));
    return DecodeStatus::Ok;
}

std::string encode(const Event& ev) {
    std::string out = ev.category();
    out += ": ";
    out += ev.fields().dump();
    return out;
}
}  // namespace udplogd
