#include "jdata/shape.hpp"

#include "jdata/log.hpp"

#include "internal.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace jdata {

std::string to_string(ShapeKind k) {
    switch (k) {
        case ShapeKind::Diagonal: return "diag";
        case ShapeKind::Lower: return "lower";
        case ShapeKind::Upper: return "upper";
        case ShapeKind::LowerBand: return "lowerband";
        case ShapeKind::UpperBand: return "upperband";
        case ShapeKind::Band: return "band";
        case ShapeKind::SymmetricBand: return "lowersymmband";
    }
    return "unknown";
}

std::string shape_name(const ShapeDescriptor& d) { return to_string(d.kind); }

std::vector<std::size_t> shape_params(const ShapeDescriptor& d) {
    switch (d.kind) {
        case ShapeKind::LowerBand: return {d.lower};
        case ShapeKind::UpperBand: return {d.upper};
        case ShapeKind::Band: return {d.upper, d.lower};
        case ShapeKind::SymmetricBand: return {d.lower};
        default: return {};
    }
}

ShapeDescriptor shape_from_wire(const std::string& name, const std::vector<std::size_t>& params) {
    auto want = [&](std::size_t n) {
        if (params.size() != n) {
            throw JdataError(ErrorKind::TypeMismatch,
                             "_ArrayShape_ \"" + name + "\" takes " + std::to_string(n) + " parameter(s), got " +
                             std::to_string(params.size()));
        }
    };
    ShapeDescriptor d;
    if (name == "diag") {
        want(0);
        d.kind = ShapeKind::Diagonal;
    } else if (name == "lower") {
        want(0);
        d.kind = ShapeKind::Lower;
    } else if (name == "upper") {
        want(0);
        d.kind = ShapeKind::Upper;
    } else if (name == "lowerband") {
        want(1);
        d.kind = ShapeKind::LowerBand;
        d.lower = params[0];
    } else if (name == "upperband") {
        want(1);
        d.kind = ShapeKind::UpperBand;
        d.upper = params[0];
    } else if (name == "band") {
        want(2);
        d.kind = ShapeKind::Band;
        d.upper = params[0];
        d.lower = params[1];
    } else if (name == "lowersymmband") {
        want(1);
        d.kind = ShapeKind::SymmetricBand;
        d.lower = params[0];
    } else {
        throw JdataError(ErrorKind::TypeMismatch, "unknown _ArrayShape_ \"" + name + "\"");
    }
    return d;
}

bool is_banded(ShapeKind k) noexcept {
    return k == ShapeKind::LowerBand || k == ShapeKind::UpperBand ||
           k == ShapeKind::Band || k == ShapeKind::SymmetricBand;
}

// Diagonal offsets stored by a banded descriptor, from +upper down to -lower.
static std::vector<long long> band_offsets(const ShapeDescriptor& d) {
    long long hi = 0;
    long long lo = 0;
    switch (d.kind) {
        case ShapeKind::LowerBand:
        case ShapeKind::SymmetricBand:
            lo = static_cast<long long>(d.lower);
            break;
        case ShapeKind::UpperBand:
            hi = static_cast<long long>(d.upper);
            break;
        case ShapeKind::Band:
            hi = static_cast<long long>(d.upper);
            lo = static_cast<long long>(d.lower);
            break;
        default:
            break;
    }
    std::vector<long long> out;
    for (long long k = hi; k >= -lo; --k) out.push_back(k);
    return out;
}

static std::size_t mul_or_throw(std::size_t a, std::size_t b) {
    std::size_t out = 0;
    if (!internal::checked_mul_size(a, b, out)) {
        throw JdataError(ErrorKind::ShapeMismatch, "shape element count overflows");
    }
    return out;
}

static std::size_t add_or_throw(std::size_t a, std::size_t b) {
    if (a > (std::numeric_limits<std::size_t>::max)() - b) {
        throw JdataError(ErrorKind::ShapeMismatch, "shape element count overflows");
    }
    return a + b;
}

// 1 + 2 + ... + k
static std::size_t triangle(std::size_t k) {
    return k % 2 == 0 ? mul_or_throw(k / 2, k + 1) : mul_or_throw(k, k / 2 + 1);
}

// Row i of the lower triangle holds min(i + 1, n) elements.
static std::size_t lower_count(std::size_t m, std::size_t n) {
    if (m <= n) return triangle(m);
    return add_or_throw(triangle(n), mul_or_throw(m - n, n));
}

// Row i < min(m, n) of the upper triangle holds n - i elements.
static std::size_t upper_count(std::size_t m, std::size_t n) {
    const std::size_t k = std::min(m, n);
    if (k == 0) return 0;
    return mul_or_throw(k, n) - triangle(k - 1);
}

static std::size_t band_count(const ShapeDescriptor& d) {
    switch (d.kind) {
        case ShapeKind::LowerBand:
        case ShapeKind::SymmetricBand: return add_or_throw(d.lower, 1);
        case ShapeKind::UpperBand: return add_or_throw(d.upper, 1);
        case ShapeKind::Band: return add_or_throw(add_or_throw(d.upper, d.lower), 1);
        default: return 0;
    }
}

std::size_t stored_count(const ShapeDescriptor& d, std::size_t m, std::size_t n) {
    switch (d.kind) {
        case ShapeKind::Diagonal: return std::min(m, n);
        case ShapeKind::Lower: return lower_count(m, n);
        case ShapeKind::Upper: return upper_count(m, n);
        default: return mul_or_throw(band_count(d), m);
    }
}

static bool is_zero_at(const NDArray& a, std::size_t i, std::size_t es) {
    const std::uint8_t* p = a.data.data() + i * es;
    for (std::size_t b = 0; b < es; ++b) {
        if (p[b] != 0) return false;
    }
    return true;
}

std::optional<ShapeDescriptor> detect(const NDArray& a) {
    if (a.shape.size() != 2 || a.shape[0] < 2 || a.shape[1] < 2) return std::nullopt;
    const std::size_t m = a.shape[0];
    const std::size_t n = a.shape[1];
    const std::size_t es = bytes_per_elem(a.type);

    // Bandwidths from the nonzero pattern. A zero is an all-zero-bytes element,
    // so -0.0 and NaN count as stored values.
    std::size_t L = 0;
    std::size_t U = 0;
    bool any_zero = false;
    for (std::size_t i = 0; i < m; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            if (is_zero_at(a, i * n + j, es)) {
                any_zero = true;
                continue;
            }
            if (i > j) L = std::max(L, i - j);
            if (j > i) U = std::max(U, j - i);
        }
    }
    if (!any_zero) return std::nullopt;

    bool symmetric = (m == n);
    for (std::size_t i = 0; i < m && symmetric; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            if (std::memcmp(a.data.data() + (i * n + j) * es, a.data.data() + (j * n + i) * es, es) != 0) {
                symmetric = false;
                break;
            }
        }
    }

    std::vector<ShapeDescriptor> candidates;
    if (L == 0 && U == 0) candidates.push_back({ShapeKind::Diagonal, 0, 0});
    if (symmetric) candidates.push_back({ShapeKind::SymmetricBand, L, 0});
    if (U == 0) candidates.push_back({ShapeKind::LowerBand, L, 0});
    if (L == 0) candidates.push_back({ShapeKind::UpperBand, 0, U});
    candidates.push_back({ShapeKind::Band, L, U});
    if (U == 0) candidates.push_back({ShapeKind::Lower, 0, 0});
    if (L == 0) candidates.push_back({ShapeKind::Upper, 0, 0});

    std::optional<ShapeDescriptor> best;
    std::size_t best_cost = m * n;
    for (const auto& c : candidates) {
        std::size_t cost = stored_count(c, m, n);
        if (cost < best_cost || (!best && cost == best_cost)) {
            best = c;
            best_cost = cost;
        }
    }
    if (best) {
        JDATA_LOG_DEBUG("shape", "detected " << shape_name(*best) << " for " << m << "x" << n << " "
                                              << to_string(a.type) << " array, storing " << best_cost
                                              << " of " << m * n << " elements");
    }
    return best;
}

static void copy_elem(NDArray& dst, std::size_t di, const NDArray& src, std::size_t si, std::size_t es) {
    std::memcpy(dst.data.data() + di * es, src.data.data() + si * es, es);
}

NDArray reduce(const NDArray& a, const ShapeDescriptor& d) {
    if (a.shape.size() != 2) {
        throw JdataError(ErrorKind::ShapeMismatch, "shape coding requires a 2-D array");
    }
    const std::size_t m = a.shape[0];
    const std::size_t n = a.shape[1];
    const std::size_t es = bytes_per_elem(a.type);

    if (is_banded(d.kind)) {
        const auto offsets = band_offsets(d);
        NDArray out = zeros(a.type, {offsets.size(), m});
        for (std::size_t r = 0; r < offsets.size(); ++r) {
            for (std::size_t i = 0; i < m; ++i) {
                long long j = static_cast<long long>(i) + offsets[r];
                if (j < 0 || j >= static_cast<long long>(n)) continue;
                copy_elem(out, r * m + i, a, i * n + static_cast<std::size_t>(j), es);
            }
        }
        return out;
    }

    NDArray out = zeros(a.type, {stored_count(d, m, n)});
    std::size_t k = 0;
    if (d.kind == ShapeKind::Diagonal) {
        for (std::size_t i = 0; i < std::min(m, n); ++i) copy_elem(out, k++, a, i * n + i, es);
    } else if (d.kind == ShapeKind::Lower) {
        for (std::size_t i = 0; i < m; ++i) {
            for (std::size_t j = 0; j <= i && j < n; ++j) copy_elem(out, k++, a, i * n + j, es);
        }
    } else {
        for (std::size_t i = 0; i < std::min(m, n); ++i) {
            for (std::size_t j = i; j < n; ++j) copy_elem(out, k++, a, i * n + j, es);
        }
    }
    return out;
}

NDArray reconstruct(const NDArray& zipped, const ShapeDescriptor& d, const std::vector<std::size_t>& full_shape) {
    if (full_shape.size() != 2) {
        throw JdataError(ErrorKind::ShapeMismatch, "_ArrayShape_ requires a 2-D _ArraySize_");
    }
    const std::size_t m = full_shape[0];
    const std::size_t n = full_shape[1];
    const std::size_t want = stored_count(d, m, n);
    if (zipped.size() != want) {
        throw JdataError(ErrorKind::ShapeMismatch,
                         "\"" + shape_name(d) + "\" data holds " + std::to_string(zipped.size()) +
                         " elements, expected " + std::to_string(want));
    }
    const std::size_t es = bytes_per_elem(zipped.type);
    NDArray out = zeros(zipped.type, full_shape);
    out.structure = d;

    if (is_banded(d.kind)) {
        const auto offsets = band_offsets(d);
        for (std::size_t r = 0; r < offsets.size(); ++r) {
            for (std::size_t i = 0; i < m; ++i) {
                long long j = static_cast<long long>(i) + offsets[r];
                if (j < 0 || j >= static_cast<long long>(n)) continue;
                const auto ju = static_cast<std::size_t>(j);
                copy_elem(out, i * n + ju, zipped, r * m + i, es);
                if (d.kind == ShapeKind::SymmetricBand && ju < m && i < n) {
                    copy_elem(out, ju * n + i, zipped, r * m + i, es);
                }
            }
        }
        return out;
    }

    std::size_t k = 0;
    if (d.kind == ShapeKind::Diagonal) {
        for (std::size_t i = 0; i < std::min(m, n); ++i) copy_elem(out, i * n + i, zipped, k++, es);
    } else if (d.kind == ShapeKind::Lower) {
        for (std::size_t i = 0; i < m; ++i) {
            for (std::size_t j = 0; j <= i && j < n; ++j) copy_elem(out, i * n + j, zipped, k++, es);
        }
    } else {
        for (std::size_t i = 0; i < std::min(m, n); ++i) {
            for (std::size_t j = i; j < n; ++j) copy_elem(out, i * n + j, zipped, k++, es);
        }
    }
    return out;
}

} // namespace jdata
