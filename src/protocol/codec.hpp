#pragma once
#include <string>
#include <string_view>

#include "../core/event.hpp"

namespace udplogd {
enum class DecodeStatus { Ok, InvalidCategory, InvalidPayload };

const char* decode_status_name(DecodeStatus s);

// True when the category is non-empty and only uses [0-9A-Za-z_].
bool valid_category(std::string_view category);

// Parses "<category>:<optional whitespace><json object>". The timestamp is
// left untouched; defaulting it is up to the caller.
DecodeStatus decode(std::string_view datagram, Event& out);

// "<category>: <json object>"
std::string encode(const Event& ev);
}  // namespace udplogd
