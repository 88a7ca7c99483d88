#pragma once

#include "jdata/value.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace jdata::easy {

namespace detail {

template <typename T>
constexpr ElementType element_type_of() {
    if constexpr (std::is_same_v<T, double>) return ElementType::Double;
    else if constexpr (std::is_same_v<T, float>) return ElementType::Single;
    else if constexpr (std::is_same_v<T, std::int8_t>) return ElementType::Int8;
    else if constexpr (std::is_same_v<T, std::uint8_t>) return ElementType::UInt8;
    else if constexpr (std::is_same_v<T, std::int16_t>) return ElementType::Int16;
    else if constexpr (std::is_same_v<T, std::uint16_t>) return ElementType::UInt16;
    else if constexpr (std::is_same_v<T, std::int32_t>) return ElementType::Int32;
    else if constexpr (std::is_same_v<T, std::uint32_t>) return ElementType::UInt32;
    else if constexpr (std::is_same_v<T, std::int64_t>) return ElementType::Int64;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return ElementType::UInt64;
    else static_assert(sizeof(T) == 0, "unsupported element type");
}

} // namespace detail

// Pack a typed vector into host-order element bytes.
template <typename T>
inline std::vector<std::uint8_t> pack(const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>, "pack requires trivially copyable types");
    std::vector<std::uint8_t> out(sizeof(T) * v.size());
    if (!out.empty()) {
        std::memcpy(out.data(), v.data(), out.size());
    }
    return out;
}

// Row-major data: for shape {2,3}, element (r,c) is data[r*3 + c].
template <typename T>
inline NDArray make_array(std::vector<std::size_t> shape, const std::vector<T>& data_rowmajor) {
    NDArray a;
    a.type = detail::element_type_of<T>();
    a.shape = std::move(shape);
    a.data = pack(data_rowmajor);
    validate(a);
    return a;
}

inline NDArray make_logical(std::vector<std::size_t> shape, const std::vector<bool>& data_rowmajor) {
    NDArray a;
    a.type = ElementType::Logical;
    a.shape = std::move(shape);
    a.data.reserve(data_rowmajor.size());
    for (bool b : data_rowmajor) a.data.push_back(b ? 1 : 0);
    validate(a);
    return a;
}

// Unpack an array of exactly type T (no conversion).
template <typename T>
inline std::vector<T> values(const NDArray& a) {
    if (a.type != detail::element_type_of<T>()) {
        throw JdataError(ErrorKind::TypeMismatch, "array holds " + to_string(a.type));
    }
    std::vector<T> out(a.data.size() / sizeof(T));
    if (!out.empty()) {
        std::memcpy(out.data(), a.data.data(), out.size() * sizeof(T));
    }
    return out;
}

inline ComplexArray make_complex(std::vector<std::size_t> shape,
                                 const std::vector<double>& re,
                                 const std::vector<double>& im) {
    ComplexArray c;
    c.real = make_array(shape, re);
    c.imag = make_array(std::move(shape), im);
    return c;
}

inline void set(Record& root, std::string key, Value v) {
    root.set(std::move(key), std::move(v));
}

} // namespace jdata::easy
