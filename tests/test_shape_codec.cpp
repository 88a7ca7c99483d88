#include "test_util.hpp"

using namespace jdata;

static NDArray mat(std::size_t m, std::size_t n, const std::vector<double>& rowmajor) {
    return easy::make_array<double>({m, n}, rowmajor);
}

int main() {
    // Lower band of width 1: diagonals from +0 down to -1, each m long.
    {
        NDArray a = mat(4, 4, {
            1, 0, 0, 0,
            5, 2, 0, 0,
            0, 6, 3, 0,
            0, 0, 7, 4,
        });
        auto d = detect(a);
        CHECK(d.has_value());
        CHECK(d->kind == ShapeKind::LowerBand);
        CHECK(d->lower == 1);
        CHECK(shape_name(*d) == "lowerband");
        CHECK(shape_params(*d) == (std::vector<std::size_t>{1}));

        NDArray z = reduce(a, *d);
        CHECK(z.shape == (std::vector<std::size_t>{2, 4}));
        CHECK(easy::values<double>(z) == (std::vector<double>{1, 2, 3, 4, 0, 5, 6, 7}));

        NDArray back = reconstruct(z, *d, a.shape);
        CHECK(back == a);
        CHECK(back.structure == d);
    }

    // Diagonal.
    {
        NDArray a = mat(3, 3, {1, 0, 0, 0, 2, 0, 0, 0, 3});
        auto d = detect(a);
        CHECK(d && d->kind == ShapeKind::Diagonal);
        CHECK(easy::values<double>(reduce(a, *d)) == (std::vector<double>{1, 2, 3}));
        CHECK(reconstruct(reduce(a, *d), *d, a.shape) == a);
    }

    // Symmetric tridiagonal prefers the symmetric band.
    {
        NDArray a = mat(4, 4, {
            2, 1, 0, 0,
            1, 2, 1, 0,
            0, 1, 2, 1,
            0, 0, 1, 2,
        });
        auto d = detect(a);
        CHECK(d && d->kind == ShapeKind::SymmetricBand && d->lower == 1);
        NDArray z = reduce(a, *d);
        CHECK(z.size() == 8);
        CHECK(reconstruct(z, *d, a.shape) == a);
    }

    // Full triangles.
    {
        NDArray lower = mat(3, 3, {1, 0, 0, 2, 3, 0, 4, 5, 6});
        auto dl = detect(lower);
        CHECK(dl && dl->kind == ShapeKind::Lower);
        CHECK(easy::values<double>(reduce(lower, *dl)) == (std::vector<double>{1, 2, 3, 4, 5, 6}));
        CHECK(reconstruct(reduce(lower, *dl), *dl, lower.shape) == lower);

        NDArray upper = mat(3, 3, {1, 2, 3, 0, 4, 5, 0, 0, 6});
        auto du = detect(upper);
        CHECK(du && du->kind == ShapeKind::Upper);
        CHECK(easy::values<double>(reduce(upper, *du)) == (std::vector<double>{1, 2, 3, 4, 5, 6}));
        CHECK(reconstruct(reduce(upper, *du), *du, upper.shape) == upper);
    }

    // General band keeps zeros outside the matrix corners.
    {
        NDArray a = mat(4, 4, {
            1, 2, 3, 0,
            4, 5, 6, 7,
            0, 8, 9, 1,
            0, 0, 2, 3,
        });
        auto d = detect(a);
        CHECK(d && d->kind == ShapeKind::Band && d->upper == 2 && d->lower == 1);
        CHECK(shape_params(*d) == (std::vector<std::size_t>{2, 1}));
        NDArray z = reduce(a, *d);
        CHECK(z.shape == (std::vector<std::size_t>{4, 4}));
        CHECK(reconstruct(z, *d, a.shape) == a);
    }

    // Nothing to gain.
    {
        CHECK(!detect(mat(2, 2, {1, 2, 3, 4})));
        CHECK(!detect(easy::make_array<double>({4}, {1, 0, 0, 2})));
        CHECK(!detect(mat(1, 3, {1, 0, 0})));
    }

    // Wire names.
    {
        ShapeDescriptor b = shape_from_wire("band", {2, 1});
        CHECK(b.kind == ShapeKind::Band && b.upper == 2 && b.lower == 1);
        CHECK(shape_from_wire("diag", {}).kind == ShapeKind::Diagonal);
        CHECK(shape_from_wire("lowersymmband", {3}).lower == 3);
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)shape_from_wire("toeplitz", {}); }));
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)shape_from_wire("lowerband", {}); }));
        CHECK(stored_count(ShapeDescriptor{ShapeKind::Upper, 0, 0}, 2, 4) == 7);
        CHECK(stored_count(ShapeDescriptor{ShapeKind::Lower, 0, 0}, 4, 2) == 7);
    }

    // Reconstruction checks the element count.
    {
        ShapeDescriptor d{ShapeKind::Diagonal, 0, 0};
        NDArray z = easy::make_array<double>({2}, {1, 2});
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)reconstruct(z, d, {3, 3}); }));
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)reconstruct(z, d, {2}); }));
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)reduce(z, d); }));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
