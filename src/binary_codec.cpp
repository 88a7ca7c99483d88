#include "jdata/jdata.hpp"

#include "internal.hpp"
#include "jdata/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace jdata {

using internal::Annotation;
using internal::Node;

namespace {

// Items of an optimized Z/T/F array carry no payload, so their count cannot be
// checked against the remaining input.
constexpr std::size_t kMaxPayloadFreeItems = std::size_t{1} << 24;

float half_to_float(std::uint16_t h) {
    const bool negative = (h & 0x8000u) != 0;
    const std::uint32_t exp = (h >> 10) & 0x1Fu;
    const std::uint32_t mant = h & 0x3FFu;
    float f = 0.0f;
    if (exp == 0) {
        f = std::ldexp(static_cast<float>(mant), -24);
    } else if (exp == 31) {
        f = mant ? std::numeric_limits<float>::quiet_NaN() : std::numeric_limits<float>::infinity();
    } else {
        const std::uint32_t bits = ((exp + 112u) << 23) | (mant << 13);
        std::memcpy(&f, &bits, sizeof(f));
    }
    return negative ? -f : f;
}

// ------------------------------
// Writer
// ------------------------------

class BinaryWriter {
public:
    explicit BinaryWriter(const WriteOptions& o)
        : o_(o), swap_((o.endian == Endian::Little) != internal::host_is_little_endian()) {}

    std::vector<std::uint8_t> run(const Value& v) {
        write(v);
        return std::move(out_);
    }

private:
    const WriteOptions& o_;
    bool swap_;
    std::vector<std::uint8_t> out_;

    void put(Marker m) { out_.push_back(static_cast<std::uint8_t>(to_char(m))); }

    template <typename T>
    void put_raw(T v) {
        std::uint8_t b[sizeof(T)];
        std::memcpy(b, &v, sizeof(T));
        if (swap_) std::reverse(b, b + sizeof(T));
        out_.insert(out_.end(), b, b + sizeof(T));
    }

    // Payload of an integer marker; the value is known to fit.
    void put_int_payload(Marker m, const Int& v) {
        switch (m) {
            case Marker::UInt8: put_raw(static_cast<std::uint8_t>(v.to_u64())); break;
            case Marker::Int8: put_raw(static_cast<std::int8_t>(v.to_i64())); break;
            case Marker::UInt16: put_raw(static_cast<std::uint16_t>(v.to_u64())); break;
            case Marker::Int16: put_raw(static_cast<std::int16_t>(v.to_i64())); break;
            case Marker::UInt32: put_raw(static_cast<std::uint32_t>(v.to_u64())); break;
            case Marker::Int32: put_raw(static_cast<std::int32_t>(v.to_i64())); break;
            case Marker::UInt64: put_raw(v.to_u64()); break;
            case Marker::Int64: put_raw(v.to_i64()); break;
            default:
                throw JdataError(ErrorKind::TypeMismatch, std::string("'") + to_char(m) + "' is not an integer marker");
        }
    }

    void put_float_payload(Marker m, double d) {
        if (m == Marker::Float32) {
            put_raw(static_cast<float>(d));
        } else {
            put_raw(d);
        }
    }

    void put_length(std::size_t n) {
        const Marker m = choose_int_marker(false, n, o_.flavor);
        put(m);
        put_int_payload(m, Int::from_u64(n));
    }

    void put_bytes(const std::string& s) {
        put_length(s.size());
        out_.insert(out_.end(), s.begin(), s.end());
    }

    void put_text(const std::string& s) {
        put(Marker::String);
        put_bytes(s);
    }

    void put_decimal(const std::string& digits) {
        put(Marker::HighPrecision);
        put_bytes(digits);
    }

    void put_int(const Int& i, bool keep_type) {
        const Marker m = choose_marker(Value::make_int(i), keep_type, o_.flavor);
        if (m == Marker::HighPrecision) {
            put_decimal((i.negative ? "-" : "") + std::to_string(i.magnitude));
            return;
        }
        put(m);
        put_int_payload(m, i);
    }

    void put_element(const NDArray& a, std::size_t i, Marker m) {
        if (is_integer_marker(m)) {
            put_int_payload(m, element_as_int(a, i));
        } else {
            put_float_payload(m, element_as_double(a, i));
        }
    }

    void put_dims(const std::vector<std::size_t>& dims) {
        NDArray d = zeros(ElementType::UInt64, {dims.size()});
        for (std::size_t i = 0; i < dims.size(); ++i) set_element_int(d, i, Int::from_u64(dims[i]));
        write_payload(d);
    }

    // `[$m#n` (1-D) or `[$m#[dims]` (N-D) followed by the elements in row-major order.
    void write_block(const NDArray& a, Marker m) {
        put(Marker::ArrayBegin);
        put(Marker::Type);
        put(m);
        put(Marker::Count);
        if (a.shape.size() == 1) {
            put_length(a.shape[0]);
        } else {
            put_dims(a.shape);
        }
        const std::size_t n = a.size();
        if (marker_element_type(m) == a.type && a.type != ElementType::Logical) {
            const std::size_t es = bytes_per_elem(a.type);
            const std::size_t at = out_.size();
            out_.insert(out_.end(), a.data.begin(), a.data.end());
            if (swap_) internal::bswap_inplace(out_.data() + at, es, n);
            return;
        }
        for (std::size_t i = 0; i < n; ++i) put_element(a, i, m);
    }

    // Heterogeneous nesting with one marker per element.
    void write_nested(const NDArray& a, std::size_t dim, std::size_t& pos, Marker m) {
        put(Marker::ArrayBegin);
        for (std::size_t i = 0; i < a.shape[dim]; ++i) {
            if (dim + 1 == a.shape.size()) {
                if (m == Marker::HighPrecision) {
                    put_int(element_as_int(a, pos++), false);
                } else {
                    put(m);
                    put_element(a, pos++, m);
                }
            } else {
                write_nested(a, dim + 1, pos, m);
            }
        }
        put(Marker::ArrayEnd);
    }

    // Annotation payloads narrowed to the smallest marker that holds them.
    void write_payload(const NDArray& a) {
        if (a.empty()) {
            put(Marker::Null);
            return;
        }
        const Marker m = choose_block_marker(a, o_.keep_type, o_.flavor);
        if (m == Marker::HighPrecision) {
            std::size_t pos = 0;
            write_nested(a, 0, pos, m);
            return;
        }
        write_block(a, m);
    }

    void put_key(std::string_view k) { put_bytes(std::string(k)); }

    void write_annotation(const Annotation& an) {
        put(Marker::ObjectBegin);
        put_key(internal::kArrayType);
        put_text(to_string(an.type));
        put_key(internal::kArraySize);
        put_dims(an.size);
        if (an.is_complex) {
            put_key(internal::kArrayIsComplex);
            put(Marker::True);
        }
        if (an.is_sparse) {
            put_key(internal::kArrayIsSparse);
            put(Marker::True);
        }
        if (!an.zip_size.empty()) {
            put_key(internal::kArrayZipSize);
            put_dims(an.zip_size);
        }
        if (an.shape) {
            put_key(internal::kArrayShape);
            const auto params = shape_params(*an.shape);
            if (params.empty()) {
                put_text(shape_name(*an.shape));
            } else {
                put(Marker::ArrayBegin);
                put_text(shape_name(*an.shape));
                for (std::size_t p : params) put_int(Int::from_u64(p), false);
                put(Marker::ArrayEnd);
            }
        }
        if (an.zip) {
            put_key(internal::kArrayZipType);
            put_text(to_string(an.zip->codec));
            put_key(internal::kArrayZipData);
            NDArray bytes;
            bytes.type = ElementType::UInt8;
            bytes.shape = {an.zip->bytes.size()};
            bytes.data = an.zip->bytes;
            write_block(bytes, Marker::UInt8);
        } else {
            put_key(internal::kArrayData);
            write_payload(an.data);
        }
        put(Marker::ObjectEnd);
    }

    bool blockable(const NDArray& a) const {
        if (a.type == ElementType::Logical || !element_marker(a.type, o_.flavor)) return false;
        if (internal::should_compress(a.data.size(), o_)) return false;
        return !internal::layout_for(a, o_);
    }

    void write_array(const NDArray& a) {
        if (a.shape.empty()) {
            put(Marker::Null);
            return;
        }
        const bool single = a.shape.size() == 1 && a.shape[0] == 1;
        const bool has_zero = std::find(a.shape.begin(), a.shape.end(), std::size_t{0}) != a.shape.end();
        if (o_.nest_array && !single && !has_zero && blockable(a)) {
            std::size_t pos = 0;
            const Marker m = *element_marker(a.type, o_.flavor);
            if (o_.format_version == FormatVersion::Legacy && a.shape.size() >= 2) {
                write_nested(reverse_axes(a), 0, pos, m);
            } else {
                write_nested(a, 0, pos, m);
            }
            return;
        }
        if (a.shape.size() <= 2 && blockable(a)) {
            write_block(a, *element_marker(a.type, o_.flavor));
            return;
        }
        write_annotation(internal::annotate(Value::make_array(a), o_));
    }

    void write(const Value& v) {
        if (v.is_null()) {
            put(Marker::Null);
        } else if (v.is_bool()) {
            put(v.as_bool() ? Marker::True : Marker::False);
        } else if (v.is_int()) {
            put_int(v.as_int(), o_.keep_type);
        } else if (v.is_bigint()) {
            put_decimal(v.as_bigint().digits);
        } else if (v.is_float()) {
            const Marker m = choose_marker(v, o_.keep_type, o_.flavor);
            put(m);
            put_float_payload(m, v.as_float().value);
        } else if (v.is_text()) {
            const std::string& s = v.as_text();
            if (s.size() == 1) {
                put(Marker::Char);
                out_.push_back(static_cast<std::uint8_t>(s[0]));
            } else {
                put_text(s);
            }
        } else if (v.is_list()) {
            put(Marker::ArrayBegin);
            for (const auto& item : v.as_list()) write(item);
            put(Marker::ArrayEnd);
        } else if (v.is_record()) {
            put(Marker::ObjectBegin);
            for (const auto& [k, field] : v.as_record()) {
                put_bytes(internal::output_key(k, o_));
                write(field);
            }
            put(Marker::ObjectEnd);
        } else if (v.is_array()) {
            write_array(v.as_array());
        } else {
            write_annotation(internal::annotate(v, o_));
        }
    }
};

// ------------------------------
// Parser: BJData bytes -> Node tree
// ------------------------------

class BinaryParser {
public:
    BinaryParser(const std::uint8_t* data, std::size_t size, const ReadOptions& o)
        : p_(data), size_(size), o_(o),
          swap_((o.endian == Endian::Little) != internal::host_is_little_endian()) {}

    Node parse() {
        Node out = parse_value(0);
        skip_noop();
        if (pos_ != size_) fail("trailing data after value");
        return out;
    }

private:
    const std::uint8_t* p_;
    std::size_t size_;
    const ReadOptions& o_;
    bool swap_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& msg) const {
        throw JdataError(ErrorKind::MalformedStream, msg, pos_);
    }

    std::size_t remaining() const { return size_ - pos_; }

    void need(std::size_t n) const {
        if (remaining() < n) fail("unexpected end of data (need " + std::to_string(n) + " bytes)");
    }

    void skip_noop() {
        while (pos_ < size_ && p_[pos_] == static_cast<std::uint8_t>('N')) ++pos_;
    }

    char peek() {
        skip_noop();
        return pos_ < size_ ? static_cast<char>(p_[pos_]) : '\0';
    }

    Marker read_marker() {
        skip_noop();
        need(1);
        const char c = static_cast<char>(p_[pos_]);
        auto m = marker_from_char(c);
        if (!m) {
            const unsigned code = static_cast<unsigned char>(c);
            fail("unknown marker 0x" + std::string(1, "0123456789ABCDEF"[code >> 4]) +
                 std::string(1, "0123456789ABCDEF"[code & 0xF]));
        }
        ++pos_;
        return *m;
    }

    template <typename T>
    T get_raw() {
        need(sizeof(T));
        std::uint8_t b[sizeof(T)];
        std::memcpy(b, p_ + pos_, sizeof(T));
        if (swap_) std::reverse(b, b + sizeof(T));
        pos_ += sizeof(T);
        T v;
        std::memcpy(&v, b, sizeof(T));
        return v;
    }

    Int read_int_payload(Marker m) {
        switch (m) {
            case Marker::UInt8: return Int::from_u64(get_raw<std::uint8_t>(), ElementType::UInt8);
            case Marker::Byte: return Int::from_u64(get_raw<std::uint8_t>(), ElementType::UInt8);
            case Marker::Int8: return Int::from_i64(get_raw<std::int8_t>(), ElementType::Int8);
            case Marker::UInt16: return Int::from_u64(get_raw<std::uint16_t>(), ElementType::UInt16);
            case Marker::Int16: return Int::from_i64(get_raw<std::int16_t>(), ElementType::Int16);
            case Marker::UInt32: return Int::from_u64(get_raw<std::uint32_t>(), ElementType::UInt32);
            case Marker::Int32: return Int::from_i64(get_raw<std::int32_t>(), ElementType::Int32);
            case Marker::UInt64: return Int::from_u64(get_raw<std::uint64_t>(), ElementType::UInt64);
            case Marker::Int64: return Int::from_i64(get_raw<std::int64_t>(), ElementType::Int64);
            default: break;
        }
        fail(std::string("'") + to_char(m) + "' is not an integer marker");
    }

    double read_float_payload(Marker m) {
        if (m == Marker::Float16) return half_to_float(get_raw<std::uint16_t>());
        if (m == Marker::Float32) return get_raw<float>();
        return get_raw<double>();
    }

    std::size_t read_length() {
        const std::size_t at = pos_;
        const Marker m = read_marker();
        if (!is_integer_marker(m)) {
            pos_ = at;
            fail(std::string("expected an integer length, found '") + to_char(m) + "'");
        }
        const Int n = read_int_payload(m);
        if (n.negative) {
            pos_ = at;
            fail("negative length");
        }
        if (n.magnitude > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
            pos_ = at;
            fail("length too large");
        }
        return static_cast<std::size_t>(n.magnitude);
    }

    std::string read_bytes() {
        const std::size_t n = read_length();
        need(n);
        std::string s(reinterpret_cast<const char*>(p_ + pos_), n);
        pos_ += n;
        return s;
    }

    Value read_high_precision() {
        const std::size_t at = pos_;
        std::string digits = read_bytes();
        if (auto i = internal::parse_decimal(digits)) return Value::make_int(*i);
        try {
            return Value::make_bigint(digits);
        } catch (const JdataError& e) {
            throw JdataError(ErrorKind::MalformedStream, e.what(), at);
        }
    }

    // Value whose marker has been consumed.
    Node parse_body(Marker m, std::size_t depth) {
        Node n;
        switch (m) {
            case Marker::Null:
                break;
            case Marker::True:
            case Marker::False:
                n.leaf = Value::make_bool(m == Marker::True);
                break;
            case Marker::UInt8: case Marker::Int8: case Marker::UInt16: case Marker::Int16:
            case Marker::UInt32: case Marker::Int32: case Marker::UInt64: case Marker::Int64:
            case Marker::Byte:
                n.leaf = Value::make_int(read_int_payload(m));
                break;
            case Marker::Float16:
            case Marker::Float32:
                n.leaf = Value{Float{ElementType::Single, read_float_payload(m)}};
                break;
            case Marker::Float64:
                n.leaf = Value::make_double(read_float_payload(m));
                break;
            case Marker::Char:
                need(1);
                n.leaf = Value::make_text(std::string(1, static_cast<char>(p_[pos_++])));
                break;
            case Marker::String:
                n.leaf = Value::make_text(read_bytes());
                break;
            case Marker::HighPrecision:
                n.leaf = read_high_precision();
                break;
            case Marker::ArrayBegin:
                n = parse_array(depth);
                break;
            case Marker::ObjectBegin:
                n = parse_object(depth);
                break;
            default:
                --pos_;
                fail(std::string("unexpected '") + to_char(m) + "'");
        }
        return n;
    }

    Node parse_value(std::size_t depth) {
        if (depth > o_.max_depth) fail("nesting deeper than " + std::to_string(o_.max_depth) + " levels");
        skip_noop();
        const std::size_t begin = pos_;
        Node n = parse_body(read_marker(), depth);
        n.begin = begin;
        n.end = pos_;
        return n;
    }

    // Values of an optimized container share the marker from its `$` header.
    Node parse_typed_item(Marker t, std::size_t depth) {
        if (depth > o_.max_depth) fail("nesting deeper than " + std::to_string(o_.max_depth) + " levels");
        const std::size_t begin = pos_;
        Node n = parse_body(t, depth);
        n.begin = begin;
        n.end = pos_;
        return n;
    }

    // `#` count: an integer, or a dims block for N-D arrays.
    std::vector<std::size_t> read_count(std::size_t depth) {
        if (peek() != '[') return {read_length()};
        const std::size_t at = pos_;
        Node dims = parse_value(depth + 1);
        std::vector<std::size_t> out;
        try {
            out = internal::node_to_sizes(dims);
        } catch (const JdataError& e) {
            throw JdataError(ErrorKind::MalformedStream, std::string("bad dimension header: ") + e.what(), at);
        }
        if (out.empty()) {
            pos_ = at;
            fail("empty dimension header");
        }
        return out;
    }

    static std::size_t total_of(const std::vector<std::size_t>& dims, bool& ok) {
        std::size_t total = 1;
        ok = true;
        for (std::size_t d : dims) ok = ok && internal::checked_mul_size(total, d, total);
        return total;
    }

    Node read_block(Marker t, const std::vector<std::size_t>& dims) {
        Node n;
        bool ok = false;
        const std::size_t count = total_of(dims, ok);
        const std::size_t width = *marker_payload_size(t);
        std::size_t bytes = 0;
        if (!ok || !internal::checked_mul_size(count, width, bytes) || bytes > remaining()) {
            fail("block of " + std::to_string(count) + " elements exceeds the remaining input");
        }
        NDArray a;
        a.type = *marker_element_type(t);
        a.shape = dims;
        if (t == Marker::Float16) {
            a = zeros(ElementType::Single, dims);
            for (std::size_t i = 0; i < count; ++i) {
                set_element_double(a, i, half_to_float(get_raw<std::uint16_t>()));
            }
        } else {
            a.data.assign(p_ + pos_, p_ + pos_ + bytes);
            pos_ += bytes;
            if (swap_) internal::bswap_inplace(a.data.data(), width, count);
        }
        n.leaf = Value::make_array(std::move(a));
        return n;
    }

    Node parse_optimized_array(std::size_t depth) {
        // '$' consumed
        const std::size_t type_at = pos_;
        const Marker t = read_marker();
        if (read_marker() != Marker::Count) {
            --pos_;
            fail("optimized array without '#' count");
        }
        const std::vector<std::size_t> dims = read_count(depth);
        bool ok = false;
        const std::size_t count = total_of(dims, ok);
        if (!ok) fail("element count overflows");

        if (marker_element_type(t)) return read_block(t, dims);

        Node n;
        switch (t) {
            case Marker::Char: {
                if (count > remaining()) fail("string block exceeds the remaining input");
                n.leaf = Value::make_text(std::string(reinterpret_cast<const char*>(p_ + pos_), count));
                pos_ += count;
                return n;
            }
            case Marker::Null:
            case Marker::True:
            case Marker::False:
                if (count > kMaxPayloadFreeItems) fail("element count " + std::to_string(count) + " too large");
                break;
            case Marker::String:
            case Marker::HighPrecision:
            case Marker::ArrayBegin:
            case Marker::ObjectBegin:
                if (count > remaining()) fail("element count " + std::to_string(count) + " exceeds the remaining input");
                break;
            default:
                pos_ = type_at;
                fail(std::string("invalid optimized element type '") + to_char(t) + "'");
        }
        n.kind = Node::Kind::Array;
        n.items.reserve(count);
        for (std::size_t i = 0; i < count; ++i) n.items.push_back(parse_typed_item(t, depth + 1));
        return n;
    }

    Node parse_array(std::size_t depth) {
        // '[' consumed
        const char c = peek();
        if (c == '$') {
            ++pos_;
            return parse_optimized_array(depth);
        }
        Node n;
        n.kind = Node::Kind::Array;
        if (c == '#') {
            ++pos_;
            const std::size_t count = read_length();
            if (count > remaining()) fail("element count " + std::to_string(count) + " exceeds the remaining input");
            n.items.reserve(count);
            for (std::size_t i = 0; i < count; ++i) n.items.push_back(parse_value(depth + 1));
            return n;
        }
        while (true) {
            if (peek() == ']') {
                ++pos_;
                return n;
            }
            if (pos_ >= size_) fail("unterminated array");
            n.items.push_back(parse_value(depth + 1));
        }
    }

    Node parse_object(std::size_t depth) {
        // '{' consumed
        Node n;
        n.kind = Node::Kind::Object;
        char c = peek();
        std::optional<Marker> t;
        if (c == '$') {
            ++pos_;
            t = read_marker();
            c = peek();
            if (c != '#') fail("optimized object without '#' count");
        }
        if (c == '#') {
            ++pos_;
            const std::size_t count = read_length();
            if (count > remaining()) fail("field count " + std::to_string(count) + " exceeds the remaining input");
            n.fields.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                std::string key = read_bytes();
                n.fields.emplace_back(std::move(key), t ? parse_typed_item(*t, depth + 1) : parse_value(depth + 1));
            }
            return n;
        }
        while (true) {
            if (peek() == '}') {
                ++pos_;
                return n;
            }
            if (pos_ >= size_) fail("unterminated object");
            std::string key = read_bytes();
            n.fields.emplace_back(std::move(key), parse_value(depth + 1));
        }
    }
};

} // namespace

std::vector<std::uint8_t> encode_binary(const Value& v, const WriteOptions& opts) {
    BinaryWriter w(opts);
    std::vector<std::uint8_t> out = w.run(v);
    JDATA_LOG_DEBUG("binary", "encoded " << v.describe() << " to " << out.size() << " bytes");
    return out;
}

Value decode_binary(const std::uint8_t* data, std::size_t size, const ReadOptions& opts, PositionIndex* index) {
    if (!data && size) throw JdataError(ErrorKind::InvalidArgument, "null input buffer");
    BinaryParser p(data, size, opts);
    Node root = p.parse();
    Value out = internal::materialize(root, opts, internal::Dialect::Binary, index);
    JDATA_LOG_DEBUG("binary", "decoded " << size << " bytes to " << out.describe());
    return out;
}

Value decode_binary(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts, PositionIndex* index) {
    return decode_binary(bytes.data(), bytes.size(), opts, index);
}

} // namespace jdata
