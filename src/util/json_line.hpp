#pragma once
#include <map>
#include <string>

namespace nlm {
struct JsonScalar {
    enum class Kind { Null, Bool, Number, String };
    Kind kind{Kind::Null};
    bool boolean{false};
    // Raw token for numbers, decoded text for strings.
    std::string text;
};

using JsonFields = std::map<std::string, JsonScalar>;

std::string json_escape(const std::string& s);

// Shortest text that reads back as the same double; non-finite becomes null.
std::string json_double(double v);

// Strict reader for one flat JSON object (scalar values only). Used for the
// line-delimited event log, where each line must be exactly one object.
bool parse_flat_object(const std::string& line, JsonFields& out, std::string& err);
}  // namespace nlm
