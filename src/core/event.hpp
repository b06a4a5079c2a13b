#pragma once
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace udplogd {
// One decoded log record. Never modified after construction; sinks share it
// through EventPtr.
class Event {
   public:
    Event() : fields_(nlohmann::json::object()) {}
    Event(std::string category, nlohmann::json fields)
        : category_(std::move(category)), fields_(std::move(fields)) {}

    const std::string& category() const { return category_; }
    const nlohmann::json& fields() const { return fields_; }

    bool has_timestamp() const { return fields_.is_object() && fields_.contains("timestamp"); }

    // Timestamp in seconds since the epoch. Accepts the numeric and the
    // string form; 0 when absent or unparsable.
    double timestamp() const;

    // Fields plus the category, the shape most backends store.
    nlohmann::json record() const;

    bool operator==(const Event& o) const {
        return category_ == o.category_ && fields_ == o.fields_;
    }
    bool operator!=(const Event& o) const { return !(*this == o); }

   private:
    std::string category_;
    nlohmann::json fields_;
};

using EventPtr = std::shared_ptr<const Event>;
}  // namespace udplogd
