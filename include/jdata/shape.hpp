#pragma once

#include "jdata/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jdata {

// ------------------------------
// Structured-matrix shape codec
// ------------------------------

// Wire names: "diag", "lower", "upper", "lowerband", "upperband", "band", "lowersymmband".
std::string to_string(ShapeKind k);
std::string shape_name(const ShapeDescriptor& d);
// Wire parameters: [L] for lowerband/lowersymmband, [U] for upperband, [U, L] for band.
std::vector<std::size_t> shape_params(const ShapeDescriptor& d);
// Throws TypeMismatch for unknown names or wrong parameter counts.
ShapeDescriptor shape_from_wire(const std::string& name, const std::vector<std::size_t>& params);

// True for the banded kinds, whose zipped form is an [ndiag, rows] matrix.
bool is_banded(ShapeKind k) noexcept;

// Number of elements the descriptor stores for an m-by-n matrix.
std::size_t stored_count(const ShapeDescriptor& d, std::size_t m, std::size_t n);

// Picks the cheapest descriptor for a 2-D, non-vector, real array holding at
// least one zero; nullopt when dense storage is no worse than every candidate
// except on ties, which favor the descriptor.
std::optional<ShapeDescriptor> detect(const NDArray& a);

// Extracts the stored elements. Banded kinds yield shape [ndiag, rows] with
// diagonals ordered from +upper down to -lower, row i of diagonal d holding
// A(i, i+d) (0 where outside the matrix). Other kinds yield a flat vector.
NDArray reduce(const NDArray& a, const ShapeDescriptor& d);

// Inverse of reduce. `zipped` may be flat; only its element count and order
// matter. Throws ShapeMismatch if the element count disagrees.
NDArray reconstruct(const NDArray& zipped, const ShapeDescriptor& d, const std::vector<std::size_t>& full_shape);

} // namespace jdata
