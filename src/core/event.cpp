#include "event.hpp"

#include <cstdlib>

namespace udplogd {
double Event::timestamp() const {
    if (!has_timestamp()) return 0.0;
    const auto& ts = fields_.at("timestamp");
    if (ts.is_number()) return ts.get<double>();
    if (ts.is_string()) {
        const std::string& s = ts.get_ref<const std::string&>();
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str()) return v;
    }
    return 0.0;
}

nlohmann::json Event::record() const {
    nlohmann::json out = fields_;
    out["category"] = category_;
    return out;
}
}  // namespace udplogd
