#include "jdata/numeric.hpp"

#include "internal.hpp"

#include <array>
#include <cmath>

namespace jdata {

std::optional<Marker> marker_from_char(char c) {
    switch (c) {
        case 'Z': case 'N': case 'T': case 'F': case 'C': case 'B':
        case 'U': case 'i': case 'u': case 'I': case 'm': case 'l': case 'M': case 'L':
        case 'H': case 'h': case 'd': case 'D': case 'S':
        case '[': case ']': case '{': case '}': case '$': case '#':
            return static_cast<Marker>(c);
        default:
            return std::nullopt;
    }
}

std::optional<std::size_t> marker_payload_size(Marker m) {
    switch (m) {
        case Marker::Null:
        case Marker::NoOp:
        case Marker::True:
        case Marker::False:
            return 0;
        case Marker::Char:
        case Marker::Byte:
        case Marker::UInt8:
        case Marker::Int8:
            return 1;
        case Marker::UInt16:
        case Marker::Int16:
        case Marker::Float16:
            return 2;
        case Marker::UInt32:
        case Marker::Int32:
        case Marker::Float32:
            return 4;
        case Marker::UInt64:
        case Marker::Int64:
        case Marker::Float64:
            return 8;
        default:
            return std::nullopt;
    }
}

bool is_integer_marker(Marker m) {
    switch (m) {
        case Marker::UInt8:
        case Marker::Int8:
        case Marker::UInt16:
        case Marker::Int16:
        case Marker::UInt32:
        case Marker::Int32:
        case Marker::UInt64:
        case Marker::Int64:
            return true;
        default:
            return false;
    }
}

std::optional<ElementType> marker_element_type(Marker m) {
    switch (m) {
        case Marker::UInt8: return ElementType::UInt8;
        case Marker::Byte: return ElementType::UInt8;
        case Marker::Int8: return ElementType::Int8;
        case Marker::UInt16: return ElementType::UInt16;
        case Marker::Int16: return ElementType::Int16;
        case Marker::UInt32: return ElementType::UInt32;
        case Marker::Int32: return ElementType::Int32;
        case Marker::UInt64: return ElementType::UInt64;
        case Marker::Int64: return ElementType::Int64;
        case Marker::Float16: return ElementType::Single;
        case Marker::Float32: return ElementType::Single;
        case Marker::Float64: return ElementType::Double;
        default: return std::nullopt;
    }
}

std::optional<Marker> element_marker(ElementType t, Flavor f) {
    const bool bj = f == Flavor::BJData;
    switch (t) {
        case ElementType::UInt8: return Marker::UInt8;
        case ElementType::Int8: return Marker::Int8;
        case ElementType::UInt16: return bj ? std::optional<Marker>(Marker::UInt16) : std::nullopt;
        case ElementType::Int16: return Marker::Int16;
        case ElementType::UInt32: return bj ? std::optional<Marker>(Marker::UInt32) : std::nullopt;
        case ElementType::Int32: return Marker::Int32;
        case ElementType::UInt64: return bj ? std::optional<Marker>(Marker::UInt64) : std::nullopt;
        case ElementType::Int64: return Marker::Int64;
        case ElementType::Single: return Marker::Float32;
        case ElementType::Double: return Marker::Float64;
        default: return std::nullopt;
    }
}

// ------------------------------
// Downcast ladder
// ------------------------------

static constexpr std::array<Marker, 8> kBjdataLadder = {
    Marker::UInt8, Marker::Int8, Marker::UInt16, Marker::Int16,
    Marker::UInt32, Marker::Int32, Marker::UInt64, Marker::Int64,
};

static constexpr std::array<Marker, 5> kUbjsonLadder = {
    Marker::UInt8, Marker::Int8, Marker::Int16, Marker::Int32, Marker::Int64,
};

template <typename Pred>
static Marker first_on_ladder(Flavor f, Pred fits) {
    if (f == Flavor::BJData) {
        for (Marker m : kBjdataLadder) {
            if (fits(*marker_element_type(m))) return m;
        }
    } else {
        for (Marker m : kUbjsonLadder) {
            if (fits(*marker_element_type(m))) return m;
        }
    }
    return Marker::HighPrecision;
}

Marker choose_int_marker(bool negative, std::uint64_t magnitude, Flavor f) {
    return first_on_ladder(f, [&](ElementType t) { return internal::int_fits(negative, magnitude, t); });
}

Marker choose_marker(const Value& v, bool keep_type, Flavor f) {
    if (v.is_null()) return Marker::Null;
    if (v.is_bool()) return v.as_bool() ? Marker::True : Marker::False;
    if (v.is_int()) {
        const Int& i = v.as_int();
        if (keep_type) {
            if (auto m = element_marker(i.type, f)) return *m;
        }
        return choose_int_marker(i.negative, i.magnitude, f);
    }
    if (v.is_bigint()) return Marker::HighPrecision;
    if (v.is_float()) {
        return v.as_float().type == ElementType::Single ? Marker::Float32 : Marker::Float64;
    }
    if (v.is_text()) return v.as_text().size() == 1 ? Marker::Char : Marker::String;
    throw JdataError(ErrorKind::TypeMismatch, "no scalar marker for " + v.describe());
}

Marker choose_block_marker(const NDArray& a, bool keep_type, Flavor f) {
    if (a.type == ElementType::Logical) return Marker::UInt8;
    if (keep_type) {
        if (auto m = element_marker(a.type, f)) return *m;
    }
    const std::size_t n = a.size();
    if (n == 0) {
        if (auto m = element_marker(a.type, f)) return *m;
        return Marker::UInt8;
    }

    // Range of the block as (negative, magnitude) pairs.
    Int lo;
    Int hi;
    bool integral = true;
    for (std::size_t i = 0; i < n && integral; ++i) {
        Int v;
        if (is_float(a.type)) {
            // -0.0 has no integer form.
            const double d = element_as_double(a, i);
            integral = !(d == 0 && std::signbit(d)) && internal::double_to_int(d, v);
            if (!integral) break;
        } else {
            v = element_as_int(a, i);
        }
        if (i == 0 || internal::int_less(v, lo)) lo = v;
        if (i == 0 || internal::int_less(hi, v)) hi = v;
    }

    if (integral) {
        Marker m = first_on_ladder(f, [&](ElementType t) {
            return internal::int_fits(lo.negative, lo.magnitude, t) &&
                   internal::int_fits(hi.negative, hi.magnitude, t);
        });
        if (m != Marker::HighPrecision || !is_float(a.type)) return m;
    }
    return a.type == ElementType::Single ? Marker::Float32 : Marker::Float64;
}

} // namespace jdata
