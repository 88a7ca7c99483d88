#pragma once

#include "jdata/jdata.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jdata::internal {

// ------------------------------
// Small helpers
// ------------------------------

inline bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::size_t>::max)() / b) return false;
    out = a * b;
    return true;
}

inline bool host_is_little_endian() {
    const std::uint16_t x = 1;
    return *reinterpret_cast<const std::uint8_t*>(&x) == 1;
}

inline void bswap_inplace(std::uint8_t* buf, std::size_t elem_size, std::size_t n_elems) {
    if (!buf || elem_size <= 1 || n_elems == 0) return;
    for (std::size_t i = 0; i < n_elems; ++i) {
        std::uint8_t* p = buf + i * elem_size;
        for (std::size_t a = 0, b = elem_size - 1; a < b; ++a, --b) {
            std::uint8_t t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
}

bool int_fits(bool negative, std::uint64_t magnitude, ElementType t) noexcept;
// Integral, finite doubles that fit 64 bits; the result is typed int64 or uint64.
bool double_to_int(double d, Int& out) noexcept;

inline bool int_less(const Int& a, const Int& b) noexcept {
    if (a.negative != b.negative) return a.negative;
    return a.negative ? a.magnitude > b.magnitude : a.magnitude < b.magnitude;
}

// Decimal digits to Int when they fit 64 bits (int64 preferred), else nullopt.
std::optional<Int> parse_decimal(std::string_view digits);

// Smallest integer type covering both (double when none does, or when either is a float).
ElementType promote(ElementType a, ElementType b);

// Element bytes in little-endian order (compressed payloads are always little-endian).
std::vector<std::uint8_t> to_little_endian(const NDArray& a);
NDArray from_little_endian(ElementType t, std::vector<std::size_t> shape, std::vector<std::uint8_t> bytes);

// ------------------------------
// Reserved annotation keys
// ------------------------------

inline constexpr std::string_view kArrayType = "_ArrayType_";
inline constexpr std::string_view kArraySize = "_ArraySize_";
inline constexpr std::string_view kArrayIsComplex = "_ArrayIsComplex_";
inline constexpr std::string_view kArrayIsSparse = "_ArrayIsSparse_";
inline constexpr std::string_view kArrayZipSize = "_ArrayZipSize_";
inline constexpr std::string_view kArrayShape = "_ArrayShape_";
inline constexpr std::string_view kArrayZipType = "_ArrayZipType_";
inline constexpr std::string_view kArrayZipData = "_ArrayZipData_";
inline constexpr std::string_view kArrayData = "_ArrayData_";

// ------------------------------
// Parse tree shared by both decoders
// ------------------------------

struct Node {
    enum class Kind { Leaf, Array, Object };

    Kind kind{Kind::Leaf};
    // Scalars, strings, and (binary) typed blocks as NDArray.
    Value leaf{};
    std::vector<Node> items{};
    // Keys as they appear on the wire, in document order.
    std::vector<std::pair<std::string, Node>> fields{};
    // Byte span of the value in the input.
    std::size_t begin{0};
    std::size_t end{0};
};

// Last field with the given key, or nullptr.
const Node* find_field(const Node& obj, std::string_view key);

// Number of numeric elements below a node (scalars, block elements, bools).
std::size_t count_numbers(const Node& n);
// Stores the numeric elements below a node into `out` starting at `pos`.
void fill_numbers(const Node& n, NDArray& out, std::size_t& pos);
// Non-negative integers below a node, e.g. `_ArraySize_`.
std::vector<std::size_t> node_to_sizes(const Node& n);

// ------------------------------
// Annotated arrays
// ------------------------------

// Wire-neutral form of an annotated array; each codec serializes it in key order.
struct Annotation {
    ElementType type{ElementType::Double};
    std::vector<std::size_t> size{};
    bool is_complex{false};
    bool is_sparse{false};
    std::vector<std::size_t> zip_size{};
    std::optional<ShapeDescriptor> shape{};
    std::optional<CompressionEnvelope> zip{};
    // Uncompressed payload: flat [n], or [rows, n] for complex and sparse data.
    NDArray data{};
};

bool should_compress(std::size_t raw_bytes, const WriteOptions& o);
// Shape descriptor the encoder applies to an array, if any.
std::optional<ShapeDescriptor> layout_for(const NDArray& a, const WriteOptions& o);
// `v` is an NDArray, ComplexArray or SparseMatrix.
Annotation annotate(const Value& v, const WriteOptions& o);

// Record keys as written: optionally unpacked, then optionally escaped.
std::string output_key(const std::string& key, const WriteOptions& o);

// ------------------------------
// Materialization
// ------------------------------

enum class Dialect { Text, Binary };

// Turns a parse tree into a Value (or only an index under mmap_only), decoding
// annotations, simplifying numeric arrays and recording the position index.
Value materialize(const Node& root, const ReadOptions& o, Dialect d, PositionIndex* index);

} // namespace jdata::internal
