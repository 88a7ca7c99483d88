
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jdata {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    MalformedStream,
    ShapeMismatch,
    TypeMismatch,
    CompressionError,
    CodecUnavailable,
    NotFound,
    InvalidArgument,
};

std::string to_string(ErrorKind k);

class JdataError : public std::runtime_error {
public:
    JdataError(ErrorKind k, const std::string& msg);
    // Stream errors carry the byte offset where decoding stopped.
    JdataError(ErrorKind k, const std::string& msg, std::size_t offset);
    ErrorKind kind() const noexcept;
    std::optional<std::size_t> offset() const noexcept;

private:
    ErrorKind kind_;
    std::optional<std::size_t> offset_;
};

// ------------------------------
// Element types
// ------------------------------

enum class ElementType {
    Double,
    Single,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Logical,
    Unknown,
};

// Names match the `_ArrayType_` spellings ("double", "uint8", "logical", ...).
std::string to_string(ElementType t);
ElementType element_type_from_string(const std::string& s);

std::size_t bytes_per_elem(ElementType t);
bool is_integer(ElementType t) noexcept;
bool is_signed_integer(ElementType t) noexcept;
bool is_float(ElementType t) noexcept;

std::size_t numel(const std::vector<std::size_t>& shape);

// ------------------------------
// Scalars
// ------------------------------

struct Null {};

// Integer scalar of a declared width, stored as sign + magnitude so that the
// full int64 and uint64 ranges are representable.
struct Int {
    ElementType type{ElementType::Int64};
    bool negative{false};
    std::uint64_t magnitude{0};

    static Int from_i64(std::int64_t v, ElementType t = ElementType::Int64);
    static Int from_u64(std::uint64_t v, ElementType t = ElementType::UInt64);

    bool fits_i64() const noexcept;
    bool fits_u64() const noexcept { return !negative || magnitude == 0; }
    std::int64_t to_i64() const;
    std::uint64_t to_u64() const;
    double to_double() const noexcept;
};

// Integers beyond 64 bits: decimal digits with an optional leading '-'.
struct BigInt {
    std::string digits{};
};

struct Float {
    ElementType type{ElementType::Double};
    double value{0.0};
};

// ------------------------------
// Arrays
// ------------------------------

enum class ShapeKind {
    Diagonal,
    Lower,
    Upper,
    LowerBand,
    UpperBand,
    Band,
    SymmetricBand,
};

struct ShapeDescriptor {
    ShapeKind kind{ShapeKind::Diagonal};
    std::size_t lower{0}; // lower bandwidth (LowerBand, Band, SymmetricBand)
    std::size_t upper{0}; // upper bandwidth (UpperBand, Band)
};

bool operator==(const ShapeDescriptor& a, const ShapeDescriptor& b);
inline bool operator!=(const ShapeDescriptor& a, const ShapeDescriptor& b) { return !(a == b); }

struct NDArray {
    ElementType type{ElementType::Double};
    // Dimensions, slowest varying first. [] is the empty array.
    std::vector<std::size_t> shape{};
    // Host-order element bytes, row-major (last index fastest).
    std::vector<std::uint8_t> data{};
    // Structured layout. Set by the decoder, honored by the encoder.
    std::optional<ShapeDescriptor> structure{};

    std::size_t size() const { return numel(shape); }
    bool empty() const { return size() == 0; }
};

struct ComplexArray {
    NDArray real{};
    NDArray imag{};
};

struct SparseEntry {
    std::size_t row{0};
    std::size_t col{0};
    double re{0.0};
    double im{0.0};
};

struct SparseMatrix {
    std::size_t rows{0};
    std::size_t cols{0};
    // Nonzero entries, 0-based. Order is preserved through encode/decode.
    std::vector<SparseEntry> entries{};
    bool is_complex{false};
};

// Invariant checks; throw JdataError(ShapeMismatch / TypeMismatch).
void validate(const NDArray& a);
void validate(const ComplexArray& c);
void validate(const SparseMatrix& s);

// Element access on a real array (row-major linear index).
double element_as_double(const NDArray& a, std::size_t i);
Int element_as_int(const NDArray& a, std::size_t i);
void set_element_double(NDArray& a, std::size_t i, double v);
void set_element_int(NDArray& a, std::size_t i, const Int& v);

// Allocates a zero-filled array.
NDArray zeros(ElementType t, std::vector<std::size_t> shape);
// Element-wise conversion; integer targets throw TypeMismatch on out-of-range
// or non-integral values.
NDArray convert_array(const NDArray& a, ElementType to);
// Reverses the axis order (generalized transpose).
NDArray reverse_axes(const NDArray& a);

NDArray sparse_to_dense(const SparseMatrix& s);

// ------------------------------
// Value
// ------------------------------

struct Value;

// Ordered string-keyed record with unique keys.
class Record {
public:
    using Field = std::pair<std::string, Value>;
    using const_iterator = std::vector<Field>::const_iterator;

    Record() = default;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    bool contains(std::string_view key) const;
    const Value* find(std::string_view key) const;
    Value* find(std::string_view key);
    const Value& at(std::string_view key) const;

    // Inserts at the end, or replaces the value in place if the key exists.
    void set(std::string key, Value v);
    bool erase(std::string_view key);

    const_iterator begin() const;
    const_iterator end() const;
    const std::vector<Field>& fields() const noexcept { return fields_; }
    std::vector<std::string> keys() const;

private:
    std::vector<Field> fields_;
};

struct Value {
    using List = std::vector<Value>;

    std::variant<
        Null,
        bool,
        Int,
        BigInt,
        Float,
        std::string,
        List,
        Record,
        NDArray,
        ComplexArray,
        SparseMatrix
    > v;

    // Convenience constructors
    static Value make_null();
    static Value make_bool(bool b);
    static Value make_int(const Int& i);
    static Value make_int64(std::int64_t i);
    static Value make_uint64(std::uint64_t u);
    static Value make_bigint(const std::string& digits);
    static Value make_double(double d);
    static Value make_single(float f);
    static Value make_text(std::string s);
    static Value make_list(List l = {});
    static Value make_record(Record r = {});
    static Value make_array(NDArray a);
    static Value make_complex(ComplexArray c);
    static Value make_sparse(SparseMatrix s);

    bool is_null() const noexcept;
    bool is_bool() const noexcept;
    bool is_int() const noexcept;
    bool is_bigint() const noexcept;
    bool is_float() const noexcept;
    bool is_number() const noexcept; // Int or Float
    bool is_text() const noexcept;
    bool is_list() const noexcept;
    bool is_record() const noexcept;
    bool is_array() const noexcept;
    bool is_complex() const noexcept;
    bool is_sparse() const noexcept;

    bool as_bool() const;
    const Int& as_int() const;
    const BigInt& as_bigint() const;
    const Float& as_float() const;
    const std::string& as_text() const;
    const List& as_list() const;
    List& as_list();
    const Record& as_record() const;
    Record& as_record();
    const NDArray& as_array() const;
    NDArray& as_array();
    const ComplexArray& as_complex() const;
    const SparseMatrix& as_sparse() const;

    // Numeric scalar as double (Int or Float); TypeMismatch otherwise.
    double to_double() const;

    // Short description for diagnostics: "record{3}", "double[2x3]", ...
    std::string describe() const;
};

// Deep equality. NaN equals NaN; NDArray::structure is not compared.
bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }
bool operator==(const Record& a, const Record& b);
bool operator==(const NDArray& a, const NDArray& b);

} // namespace jdata
