#include "json_line.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace nlm {
namespace {
class Reader {
   public:
    Reader(const std::string& s, std::string& err) : s_(s), err_(err) {}

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
    }

    bool consume(char c) {
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool at_end() {
        skip_ws();
        return pos_ >= s_.size();
    }

    bool fail(const std::string& what) {
        err_ = what + " at column " + std::to_string(pos_ + 1);
        return false;
    }

    bool read_string(std::string& out) {
        skip_ws();
        if (pos_ >= s_.size() || s_[pos_] != '"') return fail("expected string");
        ++pos_;
        out.clear();
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= s_.size()) break;
            char e = s_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    unsigned cp = 0;
                    if (!read_hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        unsigned lo = 0;
                        if (pos_ + 1 >= s_.size() || s_[pos_] != '\\' || s_[pos_ + 1] != 'u')
                            return fail("unpaired surrogate");
                        pos_ += 2;
                        if (!read_hex4(lo)) return false;
                        if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid surrogate pair");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(cp, out);
                    break;
                }
                default: return fail("invalid escape");
            }
        }
        return fail("unterminated string");
    }

    bool read_scalar(JsonScalar& v) {
        skip_ws();
        if (pos_ >= s_.size()) return fail("expected value");
        char c = s_[pos_];
        if (c == '"') {
            v.kind = JsonScalar::Kind::String;
            return read_string(v.text);
        }
        if (c == '{' || c == '[') return fail("nested values are not supported");
        if (s_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            v.kind = JsonScalar::Kind::Null;
            return true;
        }
        if (s_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            v.kind = JsonScalar::Kind::Bool;
            v.boolean = true;
            return true;
        }
        if (s_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            v.kind = JsonScalar::Kind::Bool;
            v.boolean = false;
            return true;
        }
        size_t start = pos_;
        if (s_[pos_] == '-') ++pos_;
        while (pos_ < s_.size() && (std::isdigit(static_cast<unsigned char>(s_[pos_])) ||
                                    s_[pos_] == '.' || s_[pos_] == 'e' || s_[pos_] == 'E' ||
                                    s_[pos_] == '+' || s_[pos_] == '-'))
            ++pos_;
        if (pos_ == start || (pos_ == start + 1 && s_[start] == '-')) return fail("invalid value");
        v.kind = JsonScalar::Kind::Number;
        v.text = s_.substr(start, pos_ - start);
        return true;
    }

   private:
    bool read_hex4(unsigned& out) {
        if (pos_ + 4 > s_.size()) return fail("truncated unicode escape");
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = s_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9')
                out |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f')
                out |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F')
                out |= static_cast<unsigned>(h - 'A' + 10);
            else
                return fail("invalid unicode escape");
        }
        return true;
    }

    static void append_utf8(unsigned cp, std::string& out) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    const std::string& s_;
    std::string& err_;
    size_t pos_{0};
};
}  // namespace

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string json_double(double v) {
    if (!std::isfinite(v)) return "null";
    char buf[64];
    int prec = 1;
    for (; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    // %g switches to exponent form for short mantissas (20 -> 2e+01); write
    // those in fixed notation unless the magnitude is extreme.
    double mag = std::fabs(v);
    if (std::strchr(buf, 'e') != nullptr && mag >= 1e-9 && mag < 1e16) {
        int exp10 = static_cast<int>(std::floor(std::log10(mag)));
        for (int decimals = std::max(0, prec - 1 - exp10); decimals <= 30; ++decimals) {
            std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
            if (std::strtod(buf, nullptr) == v) break;
        }
    }
    std::string out(buf);
    if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
    return out;
}

bool parse_flat_object(const std::string& line, JsonFields& out, std::string& err) {
    Reader r(line, err);
    out.clear();
    if (!r.consume('{')) return r.fail("expected '{'");
    if (!r.consume('}')) {
        do {
            std::string key;
            if (!r.read_string(key)) return false;
            if (!r.consume(':')) return r.fail("expected ':'");
            JsonScalar v;
            if (!r.read_scalar(v)) return false;
            out[key] = v;
        } while (r.consume(','));
        if (!r.consume('}')) return r.fail("expected ',' or '}'");
    }
    if (!r.at_end()) return r.fail("trailing characters");
    return true;
}
}  // namespace nlm
