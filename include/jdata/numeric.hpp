#pragma once

#include "jdata/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace jdata {

// ------------------------------
// BJData / UBJSON markers
// ------------------------------

enum class Marker : char {
    Null = 'Z',
    NoOp = 'N',
    True = 'T',
    False = 'F',
    Char = 'C',
    Byte = 'B',
    UInt8 = 'U',
    Int8 = 'i',
    UInt16 = 'u',
    Int16 = 'I',
    UInt32 = 'm',
    Int32 = 'l',
    UInt64 = 'M',
    Int64 = 'L',
    HighPrecision = 'H',
    Float16 = 'h',
    Float32 = 'd',
    Float64 = 'D',
    String = 'S',
    ArrayBegin = '[',
    ArrayEnd = ']',
    ObjectBegin = '{',
    ObjectEnd = '}',
    Type = '$',
    Count = '#',
};

// UBJSON (draft 12) lacks the unsigned 16/32/64-bit and half-precision markers.
enum class Flavor {
    BJData,
    UBJSON,
};

inline char to_char(Marker m) { return static_cast<char>(m); }
std::optional<Marker> marker_from_char(char c);

// Fixed payload width of a scalar marker (0 for Z/T/F/N, nullopt for variable-size markers).
std::optional<std::size_t> marker_payload_size(Marker m);
bool is_integer_marker(Marker m);

// Element type stored by a numeric marker (h widens to single, B is uint8).
std::optional<ElementType> marker_element_type(Marker m);
// The marker that stores an element type exactly, if the flavor has one.
std::optional<Marker> element_marker(ElementType t, Flavor f = Flavor::BJData);

// Narrowest ladder marker that holds the integer; H when nothing fixed-width does.
// Ladder: U i u I m l M L (BJData) / U i I l L (UBJSON).
Marker choose_int_marker(bool negative, std::uint64_t magnitude, Flavor f = Flavor::BJData);

// Marker for a scalar value. With keep_type an Int uses the marker of its
// declared width (falling back to the ladder where the flavor has none).
// Throws TypeMismatch for container values.
Marker choose_marker(const Value& v, bool keep_type, Flavor f = Flavor::BJData);

// Marker for a homogeneous payload block. Integer blocks (and float blocks whose
// values are all finite and integral) narrow to the smallest marker covering
// their range; other float blocks keep d/D. Returns H when an integer block
// fits no fixed-width marker of the flavor.
Marker choose_block_marker(const NDArray& a, bool keep_type, Flavor f = Flavor::BJData);

} // namespace jdata
