#include "jdata/value.hpp"

#include "internal.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>
#include <sstream>

namespace jdata {

JdataError::JdataError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

JdataError::JdataError(ErrorKind k, const std::string& msg, std::size_t offset)
    : std::runtime_error(msg + " (at byte " + std::to_string(offset) + ")"), kind_(k), offset_(offset) {}

ErrorKind JdataError::kind() const noexcept { return kind_; }

std::optional<std::size_t> JdataError::offset() const noexcept { return offset_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::MalformedStream: return "malformed-stream";
        case ErrorKind::ShapeMismatch: return "shape-mismatch";
        case ErrorKind::TypeMismatch: return "type-mismatch";
        case ErrorKind::CompressionError: return "compression-error";
        case ErrorKind::CodecUnavailable: return "codec-unavailable";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

// ------------------------------
// Element type helpers
// ------------------------------

std::string to_string(ElementType t) {
    switch (t) {
        case ElementType::Double: return "double";
        case ElementType::Single: return "single";
        case ElementType::Int8: return "int8";
        case ElementType::UInt8: return "uint8";
        case ElementType::Int16: return "int16";
        case ElementType::UInt16: return "uint16";
        case ElementType::Int32: return "int32";
        case ElementType::UInt32: return "uint32";
        case ElementType::Int64: return "int64";
        case ElementType::UInt64: return "uint64";
        case ElementType::Logical: return "logical";
        default: return "unknown";
    }
}

ElementType element_type_from_string(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "double") return ElementType::Double;
    if (t == "single") return ElementType::Single;
    if (t == "int8") return ElementType::Int8;
    if (t == "uint8") return ElementType::UInt8;
    if (t == "int16") return ElementType::Int16;
    if (t == "uint16") return ElementType::UInt16;
    if (t == "int32") return ElementType::Int32;
    if (t == "uint32") return ElementType::UInt32;
    if (t == "int64") return ElementType::Int64;
    if (t == "uint64") return ElementType::UInt64;
    if (t == "logical") return ElementType::Logical;
    return ElementType::Unknown;
}

std::size_t bytes_per_elem(ElementType t) {
    switch (t) {
        case ElementType::Double: return 8;
        case ElementType::Single: return 4;
        case ElementType::Int8: return 1;
        case ElementType::UInt8: return 1;
        case ElementType::Int16: return 2;
        case ElementType::UInt16: return 2;
        case ElementType::Int32: return 4;
        case ElementType::UInt32: return 4;
        case ElementType::Int64: return 8;
        case ElementType::UInt64: return 8;
        case ElementType::Logical: return 1;
        default: return 1;
    }
}

bool is_integer(ElementType t) noexcept {
    switch (t) {
        case ElementType::Int8:
        case ElementType::UInt8:
        case ElementType::Int16:
        case ElementType::UInt16:
        case ElementType::Int32:
        case ElementType::UInt32:
        case ElementType::Int64:
        case ElementType::UInt64:
            return true;
        default:
            return false;
    }
}

bool is_signed_integer(ElementType t) noexcept {
    return t == ElementType::Int8 || t == ElementType::Int16 ||
           t == ElementType::Int32 || t == ElementType::Int64;
}

bool is_float(ElementType t) noexcept {
    return t == ElementType::Double || t == ElementType::Single;
}

std::size_t numel(const std::vector<std::size_t>& shape) {
    if (shape.empty()) return 0;
    std::size_t n = 1;
    for (auto d : shape) {
        std::size_t tmp = 0;
        if (!internal::checked_mul_size(n, d, tmp)) {
            throw JdataError(ErrorKind::ShapeMismatch, "shape size overflow");
        }
        n = tmp;
    }
    return n;
}

// ------------------------------
// Int
// ------------------------------

static constexpr std::uint64_t kI64Max = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());

Int Int::from_i64(std::int64_t v, ElementType t) {
    Int out;
    out.type = t;
    out.negative = v < 0;
    out.magnitude = v < 0 ? static_cast<std::uint64_t>(-(v + 1)) + 1u : static_cast<std::uint64_t>(v);
    return out;
}

Int Int::from_u64(std::uint64_t v, ElementType t) {
    Int out;
    out.type = t;
    out.negative = false;
    out.magnitude = v;
    return out;
}

bool Int::fits_i64() const noexcept {
    return negative ? magnitude <= kI64Max + 1u : magnitude <= kI64Max;
}

std::int64_t Int::to_i64() const {
    if (!fits_i64()) {
        throw JdataError(ErrorKind::TypeMismatch, "integer does not fit int64");
    }
    if (!negative) return static_cast<std::int64_t>(magnitude);
    if (magnitude == kI64Max + 1u) return (std::numeric_limits<std::int64_t>::min)();
    return -static_cast<std::int64_t>(magnitude);
}

std::uint64_t Int::to_u64() const {
    if (!fits_u64()) {
        throw JdataError(ErrorKind::TypeMismatch, "negative integer does not fit uint64");
    }
    return magnitude;
}

double Int::to_double() const noexcept {
    double d = static_cast<double>(magnitude);
    return negative ? -d : d;
}

namespace internal {

bool int_fits(bool negative, std::uint64_t magnitude, ElementType t) noexcept {
    if (magnitude == 0) return is_integer(t) || t == ElementType::Logical;
    switch (t) {
        case ElementType::UInt8: return !negative && magnitude <= 0xFFu;
        case ElementType::UInt16: return !negative && magnitude <= 0xFFFFu;
        case ElementType::UInt32: return !negative && magnitude <= 0xFFFFFFFFu;
        case ElementType::UInt64: return !negative;
        case ElementType::Int8: return negative ? magnitude <= 0x80u : magnitude <= 0x7Fu;
        case ElementType::Int16: return negative ? magnitude <= 0x8000u : magnitude <= 0x7FFFu;
        case ElementType::Int32: return negative ? magnitude <= 0x80000000u : magnitude <= 0x7FFFFFFFu;
        case ElementType::Int64: return negative ? magnitude <= kI64Max + 1u : magnitude <= kI64Max;
        case ElementType::Logical: return !negative && magnitude == 1;
        default: return false;
    }
}

bool double_to_int(double d, Int& out) noexcept {
    if (!std::isfinite(d) || std::trunc(d) != d) return false;
    // 2^64 is exactly representable; anything at or beyond it does not fit.
    if (std::fabs(d) >= 18446744073709551616.0) return false;
    out.negative = d < 0;
    out.magnitude = static_cast<std::uint64_t>(std::fabs(d));
    if (out.magnitude == 0) out.negative = false;
    out.type = out.negative ? ElementType::Int64 : ElementType::UInt64;
    return true;
}

} // namespace internal

// ------------------------------
// Element access
// ------------------------------

template <typename T>
static T load_elem(const NDArray& a, std::size_t i) {
    T v;
    std::memcpy(&v, a.data.data() + i * sizeof(T), sizeof(T));
    return v;
}

template <typename T>
static void store_elem(NDArray& a, std::size_t i, T v) {
    std::memcpy(a.data.data() + i * sizeof(T), &v, sizeof(T));
}

static void check_index(const NDArray& a, std::size_t i) {
    if ((i + 1) * bytes_per_elem(a.type) > a.data.size()) {
        throw JdataError(ErrorKind::ShapeMismatch, "element index " + std::to_string(i) + " out of range");
    }
}

double element_as_double(const NDArray& a, std::size_t i) {
    check_index(a, i);
    switch (a.type) {
        case ElementType::Double: return load_elem<double>(a, i);
        case ElementType::Single: return static_cast<double>(load_elem<float>(a, i));
        case ElementType::Int8: return static_cast<double>(load_elem<std::int8_t>(a, i));
        case ElementType::UInt8: return static_cast<double>(load_elem<std::uint8_t>(a, i));
        case ElementType::Int16: return static_cast<double>(load_elem<std::int16_t>(a, i));
        case ElementType::UInt16: return static_cast<double>(load_elem<std::uint16_t>(a, i));
        case ElementType::Int32: return static_cast<double>(load_elem<std::int32_t>(a, i));
        case ElementType::UInt32: return static_cast<double>(load_elem<std::uint32_t>(a, i));
        case ElementType::Int64: return static_cast<double>(load_elem<std::int64_t>(a, i));
        case ElementType::UInt64: return static_cast<double>(load_elem<std::uint64_t>(a, i));
        case ElementType::Logical: return load_elem<std::uint8_t>(a, i) ? 1.0 : 0.0;
        default: break;
    }
    throw JdataError(ErrorKind::TypeMismatch, "unknown element type");
}

Int element_as_int(const NDArray& a, std::size_t i) {
    check_index(a, i);
    switch (a.type) {
        case ElementType::Int8: return Int::from_i64(load_elem<std::int8_t>(a, i), a.type);
        case ElementType::UInt8: return Int::from_u64(load_elem<std::uint8_t>(a, i), a.type);
        case ElementType::Int16: return Int::from_i64(load_elem<std::int16_t>(a, i), a.type);
        case ElementType::UInt16: return Int::from_u64(load_elem<std::uint16_t>(a, i), a.type);
        case ElementType::Int32: return Int::from_i64(load_elem<std::int32_t>(a, i), a.type);
        case ElementType::UInt32: return Int::from_u64(load_elem<std::uint32_t>(a, i), a.type);
        case ElementType::Int64: return Int::from_i64(load_elem<std::int64_t>(a, i), a.type);
        case ElementType::UInt64: return Int::from_u64(load_elem<std::uint64_t>(a, i), a.type);
        case ElementType::Logical: return Int::from_u64(load_elem<std::uint8_t>(a, i) ? 1u : 0u, a.type);
        case ElementType::Double:
        case ElementType::Single: {
            Int out;
            if (!internal::double_to_int(element_as_double(a, i), out)) {
                throw JdataError(ErrorKind::TypeMismatch, "element is not an integral value");
            }
            return out;
        }
        default: break;
    }
    throw JdataError(ErrorKind::TypeMismatch, "unknown element type");
}

void set_element_int(NDArray& a, std::size_t i, const Int& v) {
    check_index(a, i);
    if (is_float(a.type)) {
        set_element_double(a, i, v.to_double());
        return;
    }
    if (!internal::int_fits(v.negative, v.magnitude, a.type)) {
        throw JdataError(ErrorKind::TypeMismatch,
                         "value " + std::string(v.negative ? "-" : "") + std::to_string(v.magnitude) +
                         " out of range for " + to_string(a.type));
    }
    switch (a.type) {
        case ElementType::Int8: store_elem<std::int8_t>(a, i, static_cast<std::int8_t>(v.to_i64())); break;
        case ElementType::UInt8: store_elem<std::uint8_t>(a, i, static_cast<std::uint8_t>(v.magnitude)); break;
        case ElementType::Int16: store_elem<std::int16_t>(a, i, static_cast<std::int16_t>(v.to_i64())); break;
        case ElementType::UInt16: store_elem<std::uint16_t>(a, i, static_cast<std::uint16_t>(v.magnitude)); break;
        case ElementType::Int32: store_elem<std::int32_t>(a, i, static_cast<std::int32_t>(v.to_i64())); break;
        case ElementType::UInt32: store_elem<std::uint32_t>(a, i, static_cast<std::uint32_t>(v.magnitude)); break;
        case ElementType::Int64: store_elem<std::int64_t>(a, i, v.to_i64()); break;
        case ElementType::UInt64: store_elem<std::uint64_t>(a, i, v.magnitude); break;
        case ElementType::Logical: store_elem<std::uint8_t>(a, i, static_cast<std::uint8_t>(v.magnitude)); break;
        default: throw JdataError(ErrorKind::TypeMismatch, "unknown element type");
    }
}

void set_element_double(NDArray& a, std::size_t i, double v) {
    check_index(a, i);
    if (a.type == ElementType::Double) {
        store_elem<double>(a, i, v);
        return;
    }
    if (a.type == ElementType::Single) {
        store_elem<float>(a, i, static_cast<float>(v));
        return;
    }
    Int iv;
    if (!internal::double_to_int(v, iv)) {
        throw JdataError(ErrorKind::TypeMismatch,
                         "non-integral value cannot be stored as " + to_string(a.type));
    }
    set_element_int(a, i, iv);
}

NDArray zeros(ElementType t, std::vector<std::size_t> shape) {
    NDArray a;
    a.type = t;
    a.shape = std::move(shape);
    std::size_t nbytes = 0;
    if (!internal::checked_mul_size(numel(a.shape), bytes_per_elem(t), nbytes)) {
        throw JdataError(ErrorKind::ShapeMismatch, "array byte size overflow");
    }
    a.data.assign(nbytes, 0);
    return a;
}

NDArray convert_array(const NDArray& a, ElementType to) {
    if (a.type == to) return a;
    NDArray out = zeros(to, a.shape);
    out.structure = a.structure;
    const std::size_t n = a.size();
    const bool src_int = is_integer(a.type) || a.type == ElementType::Logical;
    for (std::size_t i = 0; i < n; ++i) {
        if (src_int && !is_float(to)) {
            set_element_int(out, i, element_as_int(a, i));
        } else {
            set_element_double(out, i, element_as_double(a, i));
        }
    }
    return out;
}

NDArray reverse_axes(const NDArray& a) {
    NDArray out;
    out.type = a.type;
    out.shape.assign(a.shape.rbegin(), a.shape.rend());
    out.data.resize(a.data.size());
    const std::size_t n = a.size();
    const std::size_t es = bytes_per_elem(a.type);
    const std::size_t nd = a.shape.size();
    if (n == 0) return out;

    // Column-major strides of the input: the row-major offset in the reversed shape.
    std::vector<std::size_t> cstride(nd, 1);
    for (std::size_t d = 1; d < nd; ++d) cstride[d] = cstride[d - 1] * a.shape[d - 1];

    std::vector<std::size_t> idx(nd, 0);
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t j = 0;
        for (std::size_t d = 0; d < nd; ++d) j += idx[d] * cstride[d];
        std::memcpy(out.data.data() + j * es, a.data.data() + i * es, es);
        for (std::size_t d = nd; d-- > 0;) {
            if (++idx[d] < a.shape[d]) break;
            idx[d] = 0;
        }
    }
    return out;
}

NDArray sparse_to_dense(const SparseMatrix& s) {
    if (s.is_complex) {
        throw JdataError(ErrorKind::TypeMismatch, "sparse_to_dense requires a real sparse matrix");
    }
    validate(s);
    NDArray out = zeros(ElementType::Double, {s.rows, s.cols});
    for (const auto& e : s.entries) {
        set_element_double(out, e.row * s.cols + e.col, e.re);
    }
    return out;
}

// ------------------------------
// Validation
// ------------------------------

bool operator==(const ShapeDescriptor& a, const ShapeDescriptor& b) {
    return a.kind == b.kind && a.lower == b.lower && a.upper == b.upper;
}

void validate(const NDArray& a) {
    if (a.type == ElementType::Unknown) {
        throw JdataError(ErrorKind::TypeMismatch, "array has unknown element type");
    }
    std::size_t nbytes = 0;
    if (!internal::checked_mul_size(numel(a.shape), bytes_per_elem(a.type), nbytes) || nbytes != a.data.size()) {
        throw JdataError(ErrorKind::ShapeMismatch,
                         "array data holds " + std::to_string(a.data.size()) + " bytes, shape requires " +
                         std::to_string(nbytes));
    }
    if (a.type == ElementType::Logical) {
        for (std::uint8_t b : a.data) {
            if (b > 1) throw JdataError(ErrorKind::TypeMismatch, "logical array holds a value other than 0/1");
        }
    }
    if (a.structure && a.shape.size() != 2) {
        throw JdataError(ErrorKind::ShapeMismatch, "structured layout requires a 2-D array");
    }
}

void validate(const ComplexArray& c) {
    validate(c.real);
    validate(c.imag);
    if (c.real.type != c.imag.type || c.real.shape != c.imag.shape) {
        throw JdataError(ErrorKind::ShapeMismatch, "complex real and imaginary parts differ in type or shape");
    }
    if (c.real.type == ElementType::Logical) {
        throw JdataError(ErrorKind::TypeMismatch, "complex arrays cannot be logical");
    }
}

void validate(const SparseMatrix& s) {
    for (const auto& e : s.entries) {
        if (e.row >= s.rows || e.col >= s.cols) {
            throw JdataError(ErrorKind::ShapeMismatch,
                             "sparse entry (" + std::to_string(e.row) + "," + std::to_string(e.col) +
                             ") outside " + std::to_string(s.rows) + "x" + std::to_string(s.cols));
        }
        if (e.re == 0.0 && e.im == 0.0) {
            throw JdataError(ErrorKind::ShapeMismatch, "sparse entry holds an explicit zero");
        }
        if (!s.is_complex && e.im != 0.0) {
            throw JdataError(ErrorKind::TypeMismatch, "real sparse matrix entry has an imaginary part");
        }
    }
}

// ------------------------------
// Record
// ------------------------------

std::size_t Record::size() const noexcept { return fields_.size(); }

bool Record::empty() const noexcept { return fields_.empty(); }

Record::const_iterator Record::begin() const { return fields_.begin(); }

Record::const_iterator Record::end() const { return fields_.end(); }

bool Record::contains(std::string_view key) const { return find(key) != nullptr; }

const Value* Record::find(std::string_view key) const {
    for (const auto& f : fields_) {
        if (f.first == key) return &f.second;
    }
    return nullptr;
}

Value* Record::find(std::string_view key) {
    for (auto& f : fields_) {
        if (f.first == key) return &f.second;
    }
    return nullptr;
}

const Value& Record::at(std::string_view key) const {
    const Value* v = find(key);
    if (!v) throw JdataError(ErrorKind::NotFound, "record has no field '" + std::string(key) + "'");
    return *v;
}

void Record::set(std::string key, Value v) {
    if (Value* slot = find(key)) {
        *slot = std::move(v);
        return;
    }
    fields_.emplace_back(std::move(key), std::move(v));
}

bool Record::erase(std::string_view key) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const Field& f) { return f.first == key; });
    if (it == fields_.end()) return false;
    fields_.erase(it);
    return true;
}

std::vector<std::string> Record::keys() const {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& f : fields_) out.push_back(f.first);
    return out;
}

// ------------------------------
// Value
// ------------------------------

Value Value::make_null() { return Value{Null{}}; }

Value Value::make_bool(bool b) { return Value{b}; }

Value Value::make_int(const Int& i) {
    if (!is_integer(i.type)) {
        throw JdataError(ErrorKind::TypeMismatch, "Int requires an integer element type, got " + to_string(i.type));
    }
    if (!internal::int_fits(i.negative, i.magnitude, i.type)) {
        throw JdataError(ErrorKind::TypeMismatch, "integer out of range for " + to_string(i.type));
    }
    Int n = i;
    if (n.magnitude == 0) n.negative = false;
    return Value{n};
}

Value Value::make_int64(std::int64_t i) { return Value{Int::from_i64(i)}; }

Value Value::make_uint64(std::uint64_t u) { return Value{Int::from_u64(u)}; }

Value Value::make_bigint(const std::string& digits) {
    std::size_t start = (!digits.empty() && digits[0] == '-') ? 1 : 0;
    if (digits.size() <= start) {
        throw JdataError(ErrorKind::TypeMismatch, "big integer has no digits");
    }
    for (std::size_t i = start; i < digits.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(digits[i]))) {
            throw JdataError(ErrorKind::TypeMismatch, "big integer contains non-digit '" + digits + "'");
        }
    }
    return Value{BigInt{digits}};
}

Value Value::make_double(double d) { return Value{Float{ElementType::Double, d}}; }

Value Value::make_single(float f) { return Value{Float{ElementType::Single, static_cast<double>(f)}}; }

Value Value::make_text(std::string s) { return Value{std::move(s)}; }

Value Value::make_list(List l) { return Value{std::move(l)}; }

Value Value::make_record(Record r) { return Value{std::move(r)}; }

Value Value::make_array(NDArray a) {
    validate(a);
    return Value{std::move(a)};
}

Value Value::make_complex(ComplexArray c) {
    validate(c);
    return Value{std::move(c)};
}

Value Value::make_sparse(SparseMatrix s) {
    validate(s);
    return Value{std::move(s)};
}

bool Value::is_null() const noexcept { return std::holds_alternative<Null>(v); }
bool Value::is_bool() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_int() const noexcept { return std::holds_alternative<Int>(v); }
bool Value::is_bigint() const noexcept { return std::holds_alternative<BigInt>(v); }
bool Value::is_float() const noexcept { return std::holds_alternative<Float>(v); }
bool Value::is_number() const noexcept { return is_int() || is_float(); }
bool Value::is_text() const noexcept { return std::holds_alternative<std::string>(v); }
bool Value::is_list() const noexcept { return std::holds_alternative<List>(v); }
bool Value::is_record() const noexcept { return std::holds_alternative<Record>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<NDArray>(v); }
bool Value::is_complex() const noexcept { return std::holds_alternative<ComplexArray>(v); }
bool Value::is_sparse() const noexcept { return std::holds_alternative<SparseMatrix>(v); }

template <typename T>
static const T& get_or_throw(const Value& val, const char* what) {
    if (const T* p = std::get_if<T>(&val.v)) return *p;
    throw JdataError(ErrorKind::TypeMismatch, std::string("value is ") + val.describe() + ", not " + what);
}

template <typename T>
static T& get_or_throw(Value& val, const char* what) {
    if (T* p = std::get_if<T>(&val.v)) return *p;
    throw JdataError(ErrorKind::TypeMismatch, std::string("value is ") + val.describe() + ", not " + what);
}

bool Value::as_bool() const { return get_or_throw<bool>(*this, "a bool"); }
const Int& Value::as_int() const { return get_or_throw<Int>(*this, "an integer"); }
const BigInt& Value::as_bigint() const { return get_or_throw<BigInt>(*this, "a big integer"); }
const Float& Value::as_float() const { return get_or_throw<Float>(*this, "a float"); }
const std::string& Value::as_text() const { return get_or_throw<std::string>(*this, "text"); }
const Value::List& Value::as_list() const { return get_or_throw<List>(*this, "a list"); }
Value::List& Value::as_list() { return get_or_throw<List>(*this, "a list"); }
const Record& Value::as_record() const { return get_or_throw<Record>(*this, "a record"); }
Record& Value::as_record() { return get_or_throw<Record>(*this, "a record"); }
const NDArray& Value::as_array() const { return get_or_throw<NDArray>(*this, "an array"); }
NDArray& Value::as_array() { return get_or_throw<NDArray>(*this, "an array"); }
const ComplexArray& Value::as_complex() const { return get_or_throw<ComplexArray>(*this, "a complex array"); }
const SparseMatrix& Value::as_sparse() const { return get_or_throw<SparseMatrix>(*this, "a sparse matrix"); }

double Value::to_double() const {
    if (const Int* i = std::get_if<Int>(&v)) return i->to_double();
    if (const Float* f = std::get_if<Float>(&v)) return f->value;
    throw JdataError(ErrorKind::TypeMismatch, "value is " + describe() + ", not a number");
}

static std::string shape_string(const std::vector<std::size_t>& shape) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << 'x';
        oss << shape[i];
    }
    return oss.str();
}

std::string Value::describe() const {
    if (is_null()) return "null";
    if (is_bool()) return "bool";
    if (is_int()) return to_string(as_int().type);
    if (is_bigint()) return "bigint";
    if (is_float()) return to_string(as_float().type);
    if (is_text()) return "text";
    if (is_list()) return "list{" + std::to_string(as_list().size()) + "}";
    if (is_record()) return "record{" + std::to_string(as_record().size()) + "}";
    if (is_array()) {
        const auto& a = as_array();
        return to_string(a.type) + "[" + shape_string(a.shape) + "]";
    }
    if (is_complex()) {
        const auto& c = as_complex();
        return "complex " + to_string(c.real.type) + "[" + shape_string(c.real.shape) + "]";
    }
    const auto& s = as_sparse();
    return std::string("sparse") + (s.is_complex ? " complex" : "") + "[" + std::to_string(s.rows) + "x" +
           std::to_string(s.cols) + ", nnz=" + std::to_string(s.entries.size()) + "]";
}

// ------------------------------
// Equality
// ------------------------------

static bool same_double(double a, double b) {
    if (std::isnan(a) && std::isnan(b)) return true;
    return a == b;
}

bool operator==(const NDArray& a, const NDArray& b) {
    return a.type == b.type && a.shape == b.shape && a.data == b.data;
}

bool operator==(const Record& a, const Record& b) {
    if (a.size() != b.size()) return false;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
        if (ia->first != ib->first || !(ia->second == ib->second)) return false;
    }
    return true;
}

bool operator==(const Value& a, const Value& b) {
    if (a.v.index() != b.v.index()) return false;
    if (a.is_null()) return true;
    if (a.is_bool()) return a.as_bool() == b.as_bool();
    if (a.is_int()) {
        const Int& x = a.as_int();
        const Int& y = b.as_int();
        return x.type == y.type && x.negative == y.negative && x.magnitude == y.magnitude;
    }
    if (a.is_bigint()) return a.as_bigint().digits == b.as_bigint().digits;
    if (a.is_float()) {
        return a.as_float().type == b.as_float().type && same_double(a.as_float().value, b.as_float().value);
    }
    if (a.is_text()) return a.as_text() == b.as_text();
    if (a.is_list()) return a.as_list() == b.as_list();
    if (a.is_record()) return a.as_record() == b.as_record();
    if (a.is_array()) return a.as_array() == b.as_array();
    if (a.is_complex()) {
        return a.as_complex().real == b.as_complex().real && a.as_complex().imag == b.as_complex().imag;
    }
    const SparseMatrix& x = a.as_sparse();
    const SparseMatrix& y = b.as_sparse();
    if (x.rows != y.rows || x.cols != y.cols || x.is_complex != y.is_complex ||
        x.entries.size() != y.entries.size()) {
        return false;
    }
    for (std::size_t i = 0; i < x.entries.size(); ++i) {
        const auto& p = x.entries[i];
        const auto& q = y.entries[i];
        if (p.row != q.row || p.col != q.col || !same_double(p.re, q.re) || !same_double(p.im, q.im)) {
            return false;
        }
    }
    return true;
}

} // namespace jdata
