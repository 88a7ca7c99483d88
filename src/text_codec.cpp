#include "jdata/jdata.hpp"

#include "internal.hpp"
#include "jdata/log.hpp"

#include <charconv>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace jdata {

using internal::Annotation;
using internal::Node;

// ------------------------------
// Parser: JSON text -> Node tree
// ------------------------------

namespace {

class TextParser {
public:
    TextParser(std::string_view s, const ReadOptions& o) : s_(s), o_(o) {}

    Node parse() {
        // UTF-8 byte order mark
        if (s_.substr(0, 3) == "\xEF\xBB\xBF") pos_ = 3;
        skip_ws();
        Node out = parse_value(0);
        skip_ws();
        if (pos_ != s_.size()) fail("trailing data after JSON value");
        return out;
    }

private:
    std::string_view s_;
    const ReadOptions& o_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& msg) const {
        throw JdataError(ErrorKind::MalformedStream, msg, pos_);
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) fail("unexpected end of JSON");
        return s_[pos_++];
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint <= 0x7F) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    std::string parse_string() {
        // assumes opening quote already consumed
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (c == '\\') {
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned u = parse_hex4();
                        if (u >= 0xD800 && u <= 0xDBFF) {
                            if (get() != '\\' || get() != 'u') fail("invalid surrogate pair");
                            unsigned u2 = parse_hex4();
                            if (u2 < 0xDC00 || u2 > 0xDFFF) fail("invalid surrogate pair");
                            append_utf8(out, 0x10000 + (((u - 0xD800) << 10) | (u2 - 0xDC00)));
                        } else {
                            append_utf8(out, u);
                        }
                        break;
                    }
                    default:
                        fail("invalid escape in JSON string");
                }
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    // Decimal exponent of the leading significant digit, used to tell
    // overflow from underflow when from_chars reports out of range.
    static long long leading_exponent(std::string_view lit) {
        long long e10 = 0;
        std::size_t i = 0;
        long long int_digits = 0;
        long long frac_zeros = 0;
        bool seen_nonzero = false;
        while (i < lit.size() && lit[i] >= '0' && lit[i] <= '9') {
            if (lit[i] != '0' || seen_nonzero) {
                seen_nonzero = true;
                ++int_digits;
            }
            ++i;
        }
        if (i < lit.size() && lit[i] == '.') {
            ++i;
            while (i < lit.size() && lit[i] >= '0' && lit[i] <= '9') {
                if (!seen_nonzero) {
                    if (lit[i] == '0') ++frac_zeros;
                    else seen_nonzero = true;
                }
                ++i;
            }
        }
        if (i < lit.size() && (lit[i] == 'e' || lit[i] == 'E')) {
            ++i;
            bool neg = false;
            if (i < lit.size() && (lit[i] == '+' || lit[i] == '-')) neg = lit[i++] == '-';
            long long e = 0;
            while (i < lit.size() && lit[i] >= '0' && lit[i] <= '9') {
                if (e < 100000000) e = e * 10 + (lit[i] - '0');
                ++i;
            }
            e10 = neg ? -e : e;
        }
        return int_digits > 0 ? e10 + int_digits - 1 : e10 - frac_zeros - 1;
    }

    Node parse_number() {
        Node n;
        n.begin = pos_;
        bool negative = false;
        if (peek() == '-' || peek() == '+') negative = get() == '-';
        const std::size_t digits_at = pos_;
        if (!(peek() >= '0' && peek() <= '9')) fail("invalid number in JSON");
        bool is_int = true;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c >= '0' && c <= '9') { ++pos_; continue; }
            if (c == '.') { is_int = false; ++pos_; continue; }
            if (c == 'e' || c == 'E') {
                is_int = false;
                ++pos_;
                if (peek() == '+' || peek() == '-') ++pos_;
                if (!(peek() >= '0' && peek() <= '9')) fail("invalid exponent in JSON number");
                continue;
            }
            break;
        }
        n.end = pos_;
        const std::string_view body = s_.substr(digits_at, pos_ - digits_at);

        if (is_int) {
            std::string digits = negative ? "-" + std::string(body) : std::string(body);
            if (auto i = internal::parse_decimal(digits)) {
                n.leaf = Value::make_int(*i);
            } else {
                // Normalize leading zeros for the big-integer form.
                std::size_t nz = digits.find_first_not_of('0', negative ? 1 : 0);
                if (nz != std::string::npos && nz > (negative ? 1u : 0u)) {
                    digits.erase(negative ? 1 : 0, nz - (negative ? 1 : 0));
                }
                n.leaf = Value::make_bigint(digits);
            }
            return n;
        }

        double v = 0.0;
        auto r = std::from_chars(body.data(), body.data() + body.size(), v);
        if (r.ec == std::errc::result_out_of_range) {
            v = leading_exponent(body) >= 0 ? std::numeric_limits<double>::infinity() : 0.0;
        } else if (r.ec != std::errc() || r.ptr != body.data() + body.size()) {
            fail("invalid number in JSON");
        }
        n.leaf = Value::make_double(negative ? -v : v);
        return n;
    }

    Node parse_array(std::size_t depth) {
        // assumes '[' consumed
        Node out;
        out.kind = Node::Kind::Array;
        skip_ws();
        if (peek() == ']') {
            get();
            return out;
        }
        while (true) {
            skip_ws();
            out.items.push_back(parse_value(depth + 1));
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') {
                --pos_;
                fail("expected ',' in array");
            }
        }
        return out;
    }

    Node parse_object(std::size_t depth) {
        // assumes '{' consumed
        Node out;
        out.kind = Node::Kind::Object;
        skip_ws();
        if (peek() == '}') {
            get();
            return out;
        }
        while (true) {
            skip_ws();
            if (get() != '"') {
                --pos_;
                fail("expected string key");
            }
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') {
                --pos_;
                fail("expected ':' in object");
            }
            skip_ws();
            out.fields.emplace_back(std::move(key), parse_value(depth + 1));
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') {
                --pos_;
                fail("expected ',' in object");
            }
        }
        return out;
    }

    Node parse_value(std::size_t depth) {
        skip_ws();
        if (depth > o_.max_depth) fail("nesting deeper than " + std::to_string(o_.max_depth) + " levels");
        const std::size_t begin = pos_;
        Node n;
        char c = peek();
        if (c == '"') {
            get();
            std::string s = parse_string();
            if (s == o_.nan_text) {
                n.leaf = Value::make_double(std::numeric_limits<double>::quiet_NaN());
            } else if (s == o_.inf_text) {
                n.leaf = Value::make_double(std::numeric_limits<double>::infinity());
            } else if (s == o_.neg_inf_text) {
                n.leaf = Value::make_double(-std::numeric_limits<double>::infinity());
            } else {
                n.leaf = Value::make_text(std::move(s));
            }
        } else if (c == '{') {
            get();
            n = parse_object(depth);
        } else if (c == '[') {
            get();
            n = parse_array(depth);
        } else if (c == 't') {
            expect("true");
            n.leaf = Value::make_bool(true);
        } else if (c == 'f') {
            expect("false");
            n.leaf = Value::make_bool(false);
        } else if (c == 'n') {
            expect("null");
        } else if (c == '\0' && pos_ >= s_.size()) {
            fail("unexpected end of JSON");
        } else {
            n = parse_number();
        }
        n.begin = begin;
        n.end = pos_;
        return n;
    }

    void expect(const char* lit) {
        std::size_t n = std::strlen(lit);
        if (pos_ + n > s_.size() || s_.substr(pos_, n) != lit) {
            fail(std::string("expected '") + lit + "'");
        }
        pos_ += n;
    }
};

// ------------------------------
// Writer: Value -> JSON text
// ------------------------------

void json_escape_string(std::ostream& os, const std::string& s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setw(0);
                } else {
                    os << static_cast<char>(c);
                }
        }
    }
    os << '"';
}

bool is_container(const Value& v) {
    return v.is_list() || v.is_record() || v.is_array() || v.is_complex() || v.is_sparse();
}

class TextWriter {
public:
    explicit TextWriter(const WriteOptions& o) : o_(o) { os_.imbue(std::locale::classic()); }

    std::string run(const Value& v) {
        if (v.is_bool() || v.is_int() || v.is_bigint() || v.is_float()) {
            os_ << '[';
            write(v, 0);
            os_ << ']';
        } else {
            write(v, 0);
        }
        return os_.str();
    }

private:
    const WriteOptions& o_;
    std::ostringstream os_;

    void newline(std::size_t depth) {
        if (o_.compact) return;
        os_ << '\n';
        for (std::size_t i = 0; i < depth; ++i) os_ << o_.indent;
    }

    void key(const std::string& k, bool first, std::size_t depth) {
        if (!first) os_ << ',';
        newline(depth);
        json_escape_string(os_, k);
        os_ << (o_.compact ? ":" : ": ");
    }

    void write_double(double d, ElementType t, bool scalar) {
        if (std::isnan(d)) {
            json_escape_string(os_, o_.nan_text);
            return;
        }
        if (std::isinf(d)) {
            json_escape_string(os_, d > 0 ? o_.inf_text : o_.neg_inf_text);
            return;
        }
        char buf[64];
        std::to_chars_result r = t == ElementType::Single
            ? std::to_chars(buf, buf + sizeof(buf), static_cast<float>(d))
            : std::to_chars(buf, buf + sizeof(buf), d);
        std::string_view lit(buf, static_cast<std::size_t>(r.ptr - buf));
        os_ << lit;
        // Negative zero keeps its fraction so it does not read back as the integer 0.
        const bool keep_fraction = scalar || (d == 0 && std::signbit(d));
        if (keep_fraction && lit.find_first_of(".e") == std::string_view::npos) os_ << ".0";
    }

    void write_int(const Int& i) {
        if (i.negative) os_ << '-';
        os_ << i.magnitude;
    }

    void write_elem(const NDArray& a, std::size_t i) {
        if (is_float(a.type)) {
            write_double(element_as_double(a, i), a.type, false);
        } else {
            write_int(element_as_int(a, i));
        }
    }

    // Row-major walk of `a`; the innermost dimension stays on one line.
    void write_nested(const NDArray& a, std::size_t dim, std::size_t& pos, std::size_t depth) {
        os_ << '[';
        const std::size_t n = a.shape[dim];
        if (dim + 1 == a.shape.size()) {
            for (std::size_t i = 0; i < n; ++i) {
                if (i) os_ << ',';
                write_elem(a, pos++);
            }
        } else {
            for (std::size_t i = 0; i < n; ++i) {
                if (i) os_ << ',';
                newline(depth + 1);
                write_nested(a, dim + 1, pos, depth + 1);
            }
            if (n) newline(depth);
        }
        os_ << ']';
    }

    void write_sizes(const std::vector<std::size_t>& sizes) {
        os_ << '[';
        for (std::size_t i = 0; i < sizes.size(); ++i) {
            if (i) os_ << ',';
            os_ << sizes[i];
        }
        os_ << ']';
    }

    bool plain(const NDArray& a) const {
        if (a.type != ElementType::Double) return false;
        if (a.shape.empty() || (a.shape.size() == 1 && a.shape[0] == 1)) return false;
        if (a.shape.size() > 2 && !o_.nest_array) return false;
        for (std::size_t d : a.shape) {
            if (d == 0) return false;
        }
        if (internal::should_compress(a.data.size(), o_)) return false;
        return !internal::layout_for(a, o_);
    }

    void write_array(const NDArray& a, std::size_t depth) {
        if (a.shape.empty()) {
            os_ << "[]";
            return;
        }
        if (plain(a)) {
            std::size_t pos = 0;
            if (o_.format_version == FormatVersion::Legacy && a.shape.size() >= 2) {
                write_nested(reverse_axes(a), 0, pos, depth);
            } else {
                write_nested(a, 0, pos, depth);
            }
            return;
        }
        write_annotation(internal::annotate(Value::make_array(a), o_), depth);
    }

    void write_annotation(const Annotation& an, std::size_t depth) {
        os_ << '{';
        key(std::string(internal::kArrayType), true, depth + 1);
        json_escape_string(os_, to_string(an.type));
        key(std::string(internal::kArraySize), false, depth + 1);
        write_sizes(an.size);
        if (an.is_complex) {
            key(std::string(internal::kArrayIsComplex), false, depth + 1);
            os_ << "true";
        }
        if (an.is_sparse) {
            key(std::string(internal::kArrayIsSparse), false, depth + 1);
            os_ << "true";
        }
        if (!an.zip_size.empty()) {
            key(std::string(internal::kArrayZipSize), false, depth + 1);
            write_sizes(an.zip_size);
        }
        if (an.shape) {
            key(std::string(internal::kArrayShape), false, depth + 1);
            const auto params = shape_params(*an.shape);
            if (params.empty()) {
                json_escape_string(os_, shape_name(*an.shape));
            } else {
                os_ << '[';
                json_escape_string(os_, shape_name(*an.shape));
                for (std::size_t p : params) os_ << ',' << p;
                os_ << ']';
            }
        }
        if (an.zip) {
            key(std::string(internal::kArrayZipType), false, depth + 1);
            json_escape_string(os_, to_string(an.zip->codec));
            key(std::string(internal::kArrayZipData), false, depth + 1);
            json_escape_string(os_, base64_encode(an.zip->bytes));
        } else {
            key(std::string(internal::kArrayData), false, depth + 1);
            if (an.data.empty()) {
                os_ << "[]";
            } else {
                std::size_t pos = 0;
                write_nested(an.data, 0, pos, depth + 1);
            }
        }
        newline(depth);
        os_ << '}';
    }

    void write_list(const Value::List& items, std::size_t depth) {
        if (items.empty()) {
            os_ << "[]";
            return;
        }
        bool multiline = false;
        for (const auto& item : items) multiline = multiline || is_container(item);
        os_ << '[';
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) os_ << ',';
            if (multiline) newline(depth + 1);
            write(items[i], depth + 1);
        }
        if (multiline) newline(depth);
        os_ << ']';
    }

    void write_record(const Record& r, std::size_t depth) {
        if (r.empty()) {
            os_ << "{}";
            return;
        }
        os_ << '{';
        bool first = true;
        for (const auto& [k, v] : r) {
            key(internal::output_key(k, o_), first, depth + 1);
            first = false;
            write(v, depth + 1);
        }
        newline(depth);
        os_ << '}';
    }

    void write(const Value& v, std::size_t depth) {
        if (v.is_null()) {
            os_ << (o_.empty_array_as_null ? "null" : "[]");
        } else if (v.is_bool()) {
            os_ << (v.as_bool() ? "true" : "false");
        } else if (v.is_int()) {
            const ElementType t = v.as_int().type;
            if (t != ElementType::Int64 && t != ElementType::UInt64) {
                JDATA_LOG_INFO("text", to_string(t) << " scalar is written without its width");
            }
            write_int(v.as_int());
        } else if (v.is_bigint()) {
            os_ << v.as_bigint().digits;
        } else if (v.is_float()) {
            write_double(v.as_float().value, v.as_float().type, true);
        } else if (v.is_text()) {
            json_escape_string(os_, v.as_text());
        } else if (v.is_list()) {
            write_list(v.as_list(), depth);
        } else if (v.is_record()) {
            write_record(v.as_record(), depth);
        } else if (v.is_array()) {
            write_array(v.as_array(), depth);
        } else {
            write_annotation(internal::annotate(v, o_), depth);
        }
    }
};

} // namespace

std::string encode_text(const Value& v, const WriteOptions& opts) {
    TextWriter w(opts);
    std::string out = w.run(v);
    JDATA_LOG_DEBUG("text", "encoded " << v.describe() << " to " << out.size() << " bytes");
    return out;
}

Value decode_text(std::string_view text, const ReadOptions& opts, PositionIndex* index) {
    TextParser p(text, opts);
    Node root = p.parse();
    Value out = internal::materialize(root, opts, internal::Dialect::Text, index);
    JDATA_LOG_DEBUG("text", "decoded " << text.size() << " bytes to " << out.describe());
    return out;
}

} // namespace jdata
