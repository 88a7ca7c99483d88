#include "internal.hpp"

#include "jdata/log.hpp"

#include <array>
#include <cctype>
#include <cstring>

namespace jdata::internal {

// ------------------------------
// Numeric helpers
// ------------------------------

std::optional<Int> parse_decimal(std::string_view digits) {
    bool negative = false;
    std::size_t i = 0;
    if (i < digits.size() && (digits[i] == '-' || digits[i] == '+')) {
        negative = digits[i] == '-';
        ++i;
    }
    if (i == digits.size()) return std::nullopt;
    std::uint64_t mag = 0;
    for (; i < digits.size(); ++i) {
        char c = digits[i];
        if (c < '0' || c > '9') return std::nullopt;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (mag > ((std::numeric_limits<std::uint64_t>::max)() - d) / 10) return std::nullopt;
        mag = mag * 10 + d;
    }
    Int out;
    out.negative = negative && mag != 0;
    out.magnitude = mag;
    if (out.fits_i64()) {
        out.type = ElementType::Int64;
    } else if (!out.negative) {
        out.type = ElementType::UInt64;
    } else {
        return std::nullopt;
    }
    return out;
}

static Int type_min(ElementType t) {
    switch (t) {
        case ElementType::Int8: return Int{t, true, 0x80u};
        case ElementType::Int16: return Int{t, true, 0x8000u};
        case ElementType::Int32: return Int{t, true, 0x80000000u};
        case ElementType::Int64: return Int{t, true, 0x8000000000000000u};
        default: return Int{t, false, 0};
    }
}

static Int type_max(ElementType t) {
    switch (t) {
        case ElementType::Int8: return Int{t, false, 0x7Fu};
        case ElementType::UInt8: return Int{t, false, 0xFFu};
        case ElementType::Int16: return Int{t, false, 0x7FFFu};
        case ElementType::UInt16: return Int{t, false, 0xFFFFu};
        case ElementType::Int32: return Int{t, false, 0x7FFFFFFFu};
        case ElementType::UInt32: return Int{t, false, 0xFFFFFFFFu};
        case ElementType::Int64: return Int{t, false, 0x7FFFFFFFFFFFFFFFu};
        case ElementType::UInt64: return Int{t, false, 0xFFFFFFFFFFFFFFFFu};
        default: return Int{t, false, 1};
    }
}

static bool covers(ElementType t, ElementType s) {
    Int lo = type_min(s);
    Int hi = type_max(s);
    return int_fits(lo.negative, lo.magnitude, t) && int_fits(hi.negative, hi.magnitude, t);
}

ElementType promote(ElementType a, ElementType b) {
    if (a == b) return a;
    if (is_float(a) || is_float(b)) return ElementType::Double;
    static constexpr std::array<ElementType, 8> kOrder = {
        ElementType::UInt8, ElementType::Int8, ElementType::UInt16, ElementType::Int16,
        ElementType::UInt32, ElementType::Int32, ElementType::UInt64, ElementType::Int64,
    };
    for (ElementType t : kOrder) {
        if (covers(t, a) && covers(t, b)) return t;
    }
    return ElementType::Double;
}

std::vector<std::uint8_t> to_little_endian(const NDArray& a) {
    std::vector<std::uint8_t> out = a.data;
    if (!host_is_little_endian()) {
        bswap_inplace(out.data(), bytes_per_elem(a.type), a.size());
    }
    return out;
}

NDArray from_little_endian(ElementType t, std::vector<std::size_t> shape, std::vector<std::uint8_t> bytes) {
    NDArray a;
    a.type = t;
    a.shape = std::move(shape);
    a.data = std::move(bytes);
    if (!host_is_little_endian()) {
        bswap_inplace(a.data.data(), bytes_per_elem(t), a.size());
    }
    validate(a);
    return a;
}

// ------------------------------
// Parse tree queries
// ------------------------------

const Node* find_field(const Node& obj, std::string_view key) {
    for (auto it = obj.fields.rbegin(); it != obj.fields.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

std::size_t count_numbers(const Node& n) {
    switch (n.kind) {
        case Node::Kind::Leaf: {
            const Value& v = n.leaf;
            if (v.is_array()) return v.as_array().size();
            if (v.is_null()) return 0;
            return 1;
        }
        case Node::Kind::Array: {
            std::size_t c = 0;
            for (const auto& item : n.items) c += count_numbers(item);
            return c;
        }
        case Node::Kind::Object:
            break;
    }
    throw JdataError(ErrorKind::TypeMismatch, "object found where numeric data was expected", n.begin);
}

void fill_numbers(const Node& n, NDArray& out, std::size_t& pos) {
    if (n.kind == Node::Kind::Array) {
        for (const auto& item : n.items) fill_numbers(item, out, pos);
        return;
    }
    if (n.kind == Node::Kind::Object) {
        throw JdataError(ErrorKind::TypeMismatch, "object found where numeric data was expected", n.begin);
    }
    const Value& v = n.leaf;
    if (v.is_null()) return;
    if (v.is_int()) {
        set_element_int(out, pos++, v.as_int());
    } else if (v.is_float()) {
        set_element_double(out, pos++, v.as_float().value);
    } else if (v.is_bool()) {
        set_element_int(out, pos++, Int::from_u64(v.as_bool() ? 1u : 0u));
    } else if (v.is_bigint()) {
        auto i = parse_decimal(v.as_bigint().digits);
        if (!i) {
            throw JdataError(ErrorKind::TypeMismatch,
                             "integer " + v.as_bigint().digits + " does not fit " + to_string(out.type), n.begin);
        }
        set_element_int(out, pos++, *i);
    } else if (v.is_array()) {
        const NDArray& block = v.as_array();
        const bool exact_int = (is_integer(block.type) || block.type == ElementType::Logical) && !is_float(out.type);
        if (block.type == out.type) {
            const std::size_t es = bytes_per_elem(block.type);
            std::memcpy(out.data.data() + pos * es, block.data.data(), block.data.size());
            pos += block.size();
        } else {
            for (std::size_t i = 0; i < block.size(); ++i) {
                if (exact_int) {
                    set_element_int(out, pos++, element_as_int(block, i));
                } else {
                    set_element_double(out, pos++, element_as_double(block, i));
                }
            }
        }
    } else {
        throw JdataError(ErrorKind::TypeMismatch, "non-numeric value (" + v.describe() + ") in numeric data",
                         n.begin);
    }
}

std::vector<std::size_t> node_to_sizes(const Node& n) {
    NDArray tmp = zeros(ElementType::UInt64, {count_numbers(n)});
    std::size_t pos = 0;
    fill_numbers(n, tmp, pos);
    std::vector<std::size_t> out;
    out.reserve(pos);
    for (std::size_t i = 0; i < pos; ++i) {
        std::uint64_t v = element_as_int(tmp, i).to_u64();
        if (v > static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max)())) {
            throw JdataError(ErrorKind::ShapeMismatch, "dimension too large", n.begin);
        }
        out.push_back(static_cast<std::size_t>(v));
    }
    return out;
}

// ------------------------------
// Encoding: Value -> Annotation
// ------------------------------

bool should_compress(std::size_t raw_bytes, const WriteOptions& o) {
    return o.compression != Codec::None && o.compress_array_size > 0 && raw_bytes >= o.compress_array_size;
}

std::optional<ShapeDescriptor> layout_for(const NDArray& a, const WriteOptions& o) {
    if (a.structure) {
        // Only honored when the array really has that structure.
        NDArray back = reconstruct(reduce(a, *a.structure), *a.structure, a.shape);
        if (back.data != a.data) {
            throw JdataError(ErrorKind::ShapeMismatch,
                             "array does not have its declared \"" + shape_name(*a.structure) + "\" structure");
        }
        return a.structure;
    }
    if (o.use_array_shape) return detect(a);
    return std::nullopt;
}

// Row-major (revised) or column-major (legacy) element order.
static NDArray ordered(const NDArray& a, FormatVersion fv) {
    if (fv == FormatVersion::Legacy && a.shape.size() >= 2) return reverse_axes(a);
    return a;
}

static void copy_row(NDArray& dst, std::size_t row, const NDArray& src) {
    const std::size_t es = bytes_per_elem(src.type);
    std::memcpy(dst.data.data() + row * src.size() * es, src.data.data(), src.data.size());
}

Annotation annotate(const Value& v, const WriteOptions& o) {
    Annotation an;
    if (v.is_array()) {
        const NDArray& a = v.as_array();
        an.type = a.type;
        an.size = a.shape;
        if (auto desc = layout_for(a, o)) {
            NDArray z = reduce(a, *desc);
            if (is_banded(desc->kind)) an.zip_size = z.shape;
            z.shape = {z.size()};
            an.shape = desc;
            an.data = std::move(z);
        } else {
            an.data = ordered(a, o.format_version);
            an.data.structure.reset();
            an.data.shape = {a.size()};
        }
    } else if (v.is_complex()) {
        const ComplexArray& c = v.as_complex();
        an.type = c.real.type;
        an.size = c.real.shape;
        an.is_complex = true;
        const std::size_t n = c.real.size();
        an.data = zeros(c.real.type, {2, n});
        copy_row(an.data, 0, ordered(c.real, o.format_version));
        copy_row(an.data, 1, ordered(c.imag, o.format_version));
    } else if (v.is_sparse()) {
        const SparseMatrix& s = v.as_sparse();
        an.type = ElementType::Double;
        an.size = {s.rows, s.cols};
        an.is_sparse = true;
        an.is_complex = s.is_complex;
        // Vectors store a single 1-based index row.
        const bool vector = s.cols == 1 || s.rows == 1;
        const std::size_t k = (vector ? 2 : 3) + (s.is_complex ? 1 : 0);
        const std::size_t nnz = s.entries.size();
        an.data = zeros(ElementType::Double, {k, nnz});
        for (std::size_t i = 0; i < nnz; ++i) {
            const SparseEntry& e = s.entries[i];
            std::size_t r = 0;
            if (vector) {
                set_element_double(an.data, i, static_cast<double>((s.cols == 1 ? e.row : e.col) + 1));
            } else {
                set_element_double(an.data, i, static_cast<double>(e.row + 1));
                set_element_double(an.data, nnz + i, static_cast<double>(e.col + 1));
                r = 1;
            }
            set_element_double(an.data, (r + 1) * nnz + i, e.re);
            if (s.is_complex) set_element_double(an.data, (r + 2) * nnz + i, e.im);
        }
    } else {
        throw JdataError(ErrorKind::TypeMismatch, "cannot annotate " + v.describe());
    }

    if (should_compress(an.data.data.size(), o)) {
        CompressionEnvelope env;
        env.codec = o.compression;
        if (!an.zip_size.empty()) {
            env.raw_shape = an.zip_size;
        } else if (an.data.shape.size() == 2) {
            env.raw_shape = an.data.shape;
        } else {
            env.raw_shape = {1, an.data.size()};
        }
        env.bytes = compress(o.compression, to_little_endian(an.data), o.compression_level);
        JDATA_LOG_DEBUG("annotate", "compressed " << to_string(an.type) << " payload of "
                                                  << an.data.data.size() << " bytes with " << to_string(env.codec));
        an.zip_size = env.raw_shape;
        an.zip = std::move(env);
        an.data.data.clear();
        an.data.shape = {0};
    }
    return an;
}

std::string output_key(const std::string& key, const WriteOptions& o) {
    std::string k = o.unpack_hex ? unescape_key(key) : key;
    return o.escape_keys ? escape_key(k) : k;
}

// ------------------------------
// Decoding: annotated object -> Value
// ------------------------------

static const Node& required_field(const Node& obj, std::string_view key) {
    const Node* n = find_field(obj, key);
    if (!n) {
        throw JdataError(ErrorKind::MalformedStream, "annotated array lacks " + std::string(key), obj.begin);
    }
    return *n;
}

static const std::string& text_of(const Node& n, std::string_view what) {
    if (n.kind != Node::Kind::Leaf || !n.leaf.is_text()) {
        throw JdataError(ErrorKind::MalformedStream, std::string(what) + " must be a string", n.begin);
    }
    return n.leaf.as_text();
}

static bool flag_of(const Node* n) {
    if (!n) return false;
    if (n->kind == Node::Kind::Leaf) {
        if (n->leaf.is_bool()) return n->leaf.as_bool();
        if (n->leaf.is_int()) return n->leaf.as_int().magnitude != 0;
    }
    throw JdataError(ErrorKind::MalformedStream, "annotation flag must be a boolean", n->begin);
}

static ShapeDescriptor shape_of(const Node& n) {
    if (n.kind == Node::Kind::Leaf) {
        return shape_from_wire(text_of(n, kArrayShape), {});
    }
    if (n.kind == Node::Kind::Array && !n.items.empty()) {
        const std::string& name = text_of(n.items.front(), kArrayShape);
        std::vector<std::size_t> params;
        for (std::size_t i = 1; i < n.items.size(); ++i) {
            auto part = node_to_sizes(n.items[i]);
            params.insert(params.end(), part.begin(), part.end());
        }
        return shape_from_wire(name, params);
    }
    throw JdataError(ErrorKind::MalformedStream, "malformed _ArrayShape_", n.begin);
}

static std::vector<std::uint8_t> zip_bytes_of(const Node& n) {
    if (n.kind == Node::Kind::Leaf && n.leaf.is_text()) return base64_decode(n.leaf.as_text());
    NDArray tmp = zeros(ElementType::UInt8, {count_numbers(n)});
    std::size_t pos = 0;
    fill_numbers(n, tmp, pos);
    return std::move(tmp.data);
}

// Reshapes flat wire-order data to `shape`, undoing the legacy column-major order.
static NDArray shaped(NDArray flat, const std::vector<std::size_t>& shape, FormatVersion fv) {
    if (fv == FormatVersion::Legacy && shape.size() >= 2) {
        flat.shape.assign(shape.rbegin(), shape.rend());
        return reverse_axes(flat);
    }
    flat.shape = shape;
    return flat;
}

static NDArray sub_range(const NDArray& a, std::size_t first, std::size_t count) {
    const std::size_t es = bytes_per_elem(a.type);
    NDArray out;
    out.type = a.type;
    out.shape = {count};
    out.data.assign(a.data.begin() + static_cast<std::ptrdiff_t>(first * es),
                    a.data.begin() + static_cast<std::ptrdiff_t>((first + count) * es));
    return out;
}

static std::size_t sparse_index(const NDArray& payload, std::size_t i, std::size_t limit, std::size_t at) {
    Int v = element_as_int(payload, i);
    if (v.negative || v.magnitude == 0 || v.magnitude > limit) {
        throw JdataError(ErrorKind::ShapeMismatch, "sparse index out of range", at);
    }
    return static_cast<std::size_t>(v.magnitude - 1);
}

static std::size_t bounded_numel(const std::vector<std::size_t>& dims, std::string_view key, const ReadOptions& o,
                                 std::size_t at) {
    std::size_t n = 0;
    try {
        n = numel(dims);
    } catch (const JdataError&) {
        throw JdataError(ErrorKind::ShapeMismatch, std::string(key) + " overflows", at);
    }
    if (n > o.max_elements) {
        throw JdataError(ErrorKind::ShapeMismatch,
                         std::string(key) + " declares " + std::to_string(n) + " elements, limit is " +
                         std::to_string(o.max_elements), at);
    }
    return n;
}

static Value decode_annotation(const Node& obj, const ReadOptions& o) {
    const ElementType type = element_type_from_string(text_of(required_field(obj, kArrayType), kArrayType));
    if (type == ElementType::Unknown) {
        throw JdataError(ErrorKind::TypeMismatch,
                         "unsupported _ArrayType_ \"" + required_field(obj, kArrayType).leaf.as_text() + "\"",
                         obj.begin);
    }
    const std::vector<std::size_t> size = node_to_sizes(required_field(obj, kArraySize));
    const bool is_complex = flag_of(find_field(obj, kArrayIsComplex));
    const bool is_sparse = flag_of(find_field(obj, kArrayIsSparse));
    const Node* shape_node = find_field(obj, kArrayShape);
    const Node* zip_size_node = find_field(obj, kArrayZipSize);
    const Node* zip_data_node = find_field(obj, kArrayZipData);
    const ElementType payload_type = is_sparse ? ElementType::Double : type;
    for (const auto& [key, child] : obj.fields) {
        if (key.rfind("_Array", 0) == 0 && key != kArrayType && key != kArraySize && key != kArrayIsComplex &&
            key != kArrayIsSparse && key != kArrayZipSize && key != kArrayShape && key != kArrayZipType &&
            key != kArrayZipData && key != kArrayData) {
            JDATA_LOG_INFO("annotate", "ignoring unknown annotation key " << key << " at offset " << child.begin);
        }
    }

    NDArray payload;
    if (zip_data_node) {
        const Codec codec = codec_from_string(text_of(required_field(obj, kArrayZipType), kArrayZipType));
        if (codec == Codec::None) {
            throw JdataError(ErrorKind::CodecUnavailable, "_ArrayZipType_ names no codec", obj.begin);
        }
        if (!zip_size_node) {
            throw JdataError(ErrorKind::MalformedStream, "compressed array lacks _ArrayZipSize_", obj.begin);
        }
        const std::vector<std::size_t> zip_size = node_to_sizes(*zip_size_node);
        const std::size_t zip_count = bounded_numel(zip_size, kArrayZipSize, o, zip_size_node->begin);
        std::size_t raw_len = 0;
        if (!checked_mul_size(zip_count, bytes_per_elem(payload_type), raw_len)) {
            throw JdataError(ErrorKind::ShapeMismatch, "_ArrayZipSize_ overflows", obj.begin);
        }
        payload = from_little_endian(payload_type, {zip_count},
                                     decompress(codec, zip_bytes_of(*zip_data_node), raw_len));
    } else {
        const Node& data = required_field(obj, kArrayData);
        payload = zeros(payload_type, {count_numbers(data)});
        std::size_t pos = 0;
        fill_numbers(data, payload, pos);
    }

    if (shape_node) {
        if (is_complex || is_sparse) {
            throw JdataError(ErrorKind::TypeMismatch, "_ArrayShape_ applies only to real dense arrays", obj.begin);
        }
        const ShapeDescriptor desc = shape_of(*shape_node);
        bounded_numel(size, kArraySize, o, obj.begin);
        return Value::make_array(reconstruct(payload, desc, size));
    }

    if (is_sparse) {
        if (size.size() != 2) {
            throw JdataError(ErrorKind::ShapeMismatch, "sparse _ArraySize_ must have two dimensions", obj.begin);
        }
        SparseMatrix s;
        s.rows = size[0];
        s.cols = size[1];
        s.is_complex = is_complex;
        const bool vector = s.cols == 1 || s.rows == 1;
        const std::size_t k = (vector ? 2 : 3) + (is_complex ? 1 : 0);
        if (payload.size() % k != 0) {
            throw JdataError(ErrorKind::ShapeMismatch,
                             "sparse data holds " + std::to_string(payload.size()) + " values, not a multiple of " +
                             std::to_string(k), obj.begin);
        }
        const std::size_t nnz = payload.size() / k;
        s.entries.reserve(nnz);
        for (std::size_t i = 0; i < nnz; ++i) {
            SparseEntry e;
            std::size_t r = 0;
            if (vector) {
                const std::size_t idx = sparse_index(payload, i, s.cols == 1 ? s.rows : s.cols, obj.begin);
                if (s.cols == 1) e.row = idx; else e.col = idx;
            } else {
                e.row = sparse_index(payload, i, s.rows, obj.begin);
                e.col = sparse_index(payload, nnz + i, s.cols, obj.begin);
                r = 1;
            }
            e.re = element_as_double(payload, (r + 1) * nnz + i);
            if (is_complex) e.im = element_as_double(payload, (r + 2) * nnz + i);
            s.entries.push_back(e);
        }
        return Value::make_sparse(std::move(s));
    }

    const std::size_t n = bounded_numel(size, kArraySize, o, obj.begin);
    if (is_complex) {
        if (payload.size() != 2 * n) {
            throw JdataError(ErrorKind::ShapeMismatch,
                             "complex data holds " + std::to_string(payload.size()) + " values, _ArraySize_ needs " +
                             std::to_string(2 * n), obj.begin);
        }
        ComplexArray c;
        c.real = shaped(sub_range(payload, 0, n), size, o.format_version);
        c.imag = shaped(sub_range(payload, n, n), size, o.format_version);
        return Value::make_complex(std::move(c));
    }
    if (payload.size() != n) {
        throw JdataError(ErrorKind::ShapeMismatch,
                         "array data holds " + std::to_string(payload.size()) + " values, _ArraySize_ needs " +
                         std::to_string(n), obj.begin);
    }
    return Value::make_array(shaped(std::move(payload), size, o.format_version));
}

// ------------------------------
// Materialization
// ------------------------------

namespace {

struct PlainShape {
    std::vector<std::size_t> shape;
    ElementType type{ElementType::Double};
};

class Materializer {
public:
    Materializer(const ReadOptions& o, Dialect d, PositionIndex* index)
        : o_(o), dialect_(d), index_(index) {}

    Value build(const Node& n, const std::string& path) {
        record(n, path);
        switch (n.kind) {
            case Node::Kind::Leaf:
                return n.leaf;
            case Node::Kind::Object: {
                if (o_.jdata_decode && annotated(n)) return decode_annotation(n, o_);
                Record r;
                for (const auto& [raw_key, child] : n.fields) {
                    std::string key = o_.unpack_hex ? unescape_key(raw_key) : raw_key;
                    std::string child_path = field_path(path, key);
                    r.set(std::move(key), build(child, child_path));
                }
                return Value::make_record(std::move(r));
            }
            case Node::Kind::Array: {
                if (o_.simplify_array) {
                    if (auto p = plain(n)) return collapse(n, *p);
                    if (boxed_scalar(n)) {
                        record(n.items.front(), item_path(path, 0));
                        return n.items.front().leaf;
                    }
                }
                Value::List items;
                items.reserve(n.items.size());
                for (std::size_t i = 0; i < n.items.size(); ++i) {
                    items.push_back(build(n.items[i], item_path(path, i)));
                }
                return Value::make_list(std::move(items));
            }
        }
        return Value::make_null();
    }

    void walk(const Node& n, const std::string& path) {
        record(n, path);
        if (n.kind == Node::Kind::Object) {
            if (o_.jdata_decode && annotated(n)) return;
            for (const auto& [raw_key, child] : n.fields) {
                walk(child, field_path(path, o_.unpack_hex ? unescape_key(raw_key) : raw_key));
            }
        } else if (n.kind == Node::Kind::Array) {
            if (o_.simplify_array && plain(n)) return;
            for (std::size_t i = 0; i < n.items.size(); ++i) walk(n.items[i], item_path(path, i));
        }
    }

private:
    const ReadOptions& o_;
    Dialect dialect_;
    PositionIndex* index_;

    void record(const Node& n, const std::string& path) {
        if (index_) index_->push_back(IndexEntry{path, Span{n.begin, n.end - n.begin}});
    }

    static bool annotated(const Node& n) {
        const Node* t = find_field(n, kArrayType);
        return t && t->kind == Node::Kind::Leaf && t->leaf.is_text() && find_field(n, kArraySize) &&
               (find_field(n, kArrayData) || find_field(n, kArrayZipData));
    }

    // Root booleans and big integers are written as one-element text arrays.
    // They unwrap at any depth, the way a one-element numeric array does, so a
    // sliced sub-document decodes to the same value as its place in the whole.
    bool boxed_scalar(const Node& n) const {
        if (dialect_ != Dialect::Text || n.items.size() != 1) return false;
        const Node& item = n.items.front();
        return item.kind == Node::Kind::Leaf && (item.leaf.is_bool() || item.leaf.is_bigint());
    }

    // Shape and element type of an array that collapses into an NDArray:
    // numeric scalars, or equally shaped arrays that themselves collapse.
    std::optional<PlainShape> plain(const Node& n) const {
        if (n.kind == Node::Kind::Leaf && n.leaf.is_array()) {
            // Typed binary blocks stack like nested numeric arrays.
            const NDArray& a = n.leaf.as_array();
            if (a.shape.empty() || a.empty() || a.type == ElementType::Logical) return std::nullopt;
            return PlainShape{a.shape, dialect_ == Dialect::Text ? ElementType::Double : a.type};
        }
        if (n.kind != Node::Kind::Array || n.items.empty()) return std::nullopt;
        PlainShape out;
        if (n.items.front().kind == Node::Kind::Leaf && !n.items.front().leaf.is_array()) {
            bool first = true;
            for (const auto& item : n.items) {
                if (item.kind != Node::Kind::Leaf || !item.leaf.is_number()) return std::nullopt;
                const ElementType t = item.leaf.is_int() ? item.leaf.as_int().type : item.leaf.as_float().type;
                out.type = first ? t : promote(out.type, t);
                first = false;
            }
            out.shape = {n.items.size()};
        } else {
            std::optional<PlainShape> child;
            for (const auto& item : n.items) {
                auto p = plain(item);
                if (!p || (child && p->shape != child->shape)) return std::nullopt;
                if (child) p->type = promote(child->type, p->type);
                child = std::move(p);
            }
            out.type = child->type;
            out.shape = {n.items.size()};
            out.shape.insert(out.shape.end(), child->shape.begin(), child->shape.end());
        }
        if (dialect_ == Dialect::Text) out.type = ElementType::Double;
        return out;
    }

    Value collapse(const Node& n, const PlainShape& p) const {
        if (p.shape.size() == 1 && p.shape[0] == 1) return n.items.front().leaf;
        NDArray a = zeros(p.type, p.shape);
        std::size_t pos = 0;
        fill_numbers(n, a, pos);
        if (o_.format_version == FormatVersion::Legacy && a.shape.size() >= 2) a = reverse_axes(a);
        return Value::make_array(std::move(a));
    }
};

} // namespace

Value materialize(const Node& root, const ReadOptions& o, Dialect d, PositionIndex* index) {
    if (index) index->clear();
    Materializer m(o, d, index);
    Value out;
    if (o.mmap_only) {
        if (index) m.walk(root, "$");
    } else {
        out = m.build(root, "$");
    }
    if (index && (!o.mmap_include.empty() || !o.mmap_exclude.empty())) {
        PositionIndex kept;
        for (auto& e : *index) {
            bool keep = o.mmap_include.empty();
            for (const auto& s : o.mmap_include) keep = keep || e.path.find(s) != std::string::npos;
            for (const auto& s : o.mmap_exclude) keep = keep && e.path.find(s) == std::string::npos;
            if (keep) kept.push_back(std::move(e));
        }
        *index = std::move(kept);
    }
    return out;
}

} // namespace jdata::internal
