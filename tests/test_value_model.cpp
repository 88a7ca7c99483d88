#include "test_util.hpp"

#include "jdata/log.hpp"

#include <cmath>
#include <limits>

using namespace jdata;

int main() {
    // Int keeps sign and magnitude over the full 64-bit ranges.
    {
        Int a = Int::from_i64((std::numeric_limits<std::int64_t>::min)());
        CHECK(a.negative);
        CHECK(a.magnitude == 0x8000000000000000ull);
        CHECK(a.fits_i64());
        CHECK(a.to_i64() == (std::numeric_limits<std::int64_t>::min)());
        CHECK(!a.fits_u64());

        Int b = Int::from_u64((std::numeric_limits<std::uint64_t>::max)());
        CHECK(!b.fits_i64());
        CHECK(b.to_u64() == (std::numeric_limits<std::uint64_t>::max)());
        CHECK(throws_kind(ErrorKind::TypeMismatch, [&] { (void)b.to_i64(); }));

        CHECK(Int::from_i64(-42).to_double() == -42.0);
    }

    // make_int validates the declared width.
    {
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_int(Int{ElementType::Int8, false, 200}); }));
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_int(Int{ElementType::UInt16, true, 1}); }));
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_int(Int{ElementType::Double, false, 1}); }));
        Value v = Value::make_int(Int{ElementType::Int8, true, 128});
        CHECK(v.as_int().to_i64() == -128);
        // -0 normalizes to 0.
        CHECK(!Value::make_int(Int{ElementType::Int32, true, 0}).as_int().negative);
    }

    // BigInt digits are validated.
    {
        CHECK(Value::make_bigint("-123456789012345678901234567890").is_bigint());
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_bigint("12a"); }));
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_bigint("-"); }));
    }

    // Element type names.
    {
        CHECK(to_string(ElementType::UInt16) == "uint16");
        CHECK(to_string(ElementType::Logical) == "logical");
        CHECK(element_type_from_string("single") == ElementType::Single);
        CHECK(element_type_from_string("int64") == ElementType::Int64);
        CHECK(element_type_from_string("quad") == ElementType::Unknown);
        CHECK(bytes_per_elem(ElementType::Double) == 8);
        CHECK(bytes_per_elem(ElementType::Int16) == 2);
        CHECK(numel({}) == 0);
        CHECK(numel({2, 0, 3}) == 0);
        CHECK(numel({2, 3, 4}) == 24);
    }

    // NDArray invariants and element access.
    {
        NDArray a = easy::make_array<std::int16_t>({2, 3}, {1, -2, 3, -4, 5, -6});
        CHECK(a.size() == 6);
        CHECK(element_as_double(a, 1) == -2.0);
        CHECK(element_as_int(a, 3).to_i64() == -4);
        set_element_int(a, 0, Int::from_i64(300));
        CHECK(element_as_int(a, 0).to_i64() == 300);
        CHECK(throws_kind(ErrorKind::TypeMismatch, [&] { set_element_int(a, 0, Int::from_i64(40000)); }));
        CHECK(throws_kind(ErrorKind::TypeMismatch, [&] { set_element_double(a, 0, 1.5); }));
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)element_as_double(a, 6); }));

        NDArray bad;
        bad.type = ElementType::Double;
        bad.shape = {2, 2};
        bad.data.resize(3 * sizeof(double));
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { validate(bad); }));

        NDArray logical;
        logical.type = ElementType::Logical;
        logical.shape = {2};
        logical.data = {1, 2};
        CHECK(throws_kind(ErrorKind::TypeMismatch, [&] { validate(logical); }));
    }

    // convert_array and reverse_axes.
    {
        NDArray a = easy::make_array<double>({2, 3}, {1, 2, 3, 4, 5, 6});
        NDArray b = convert_array(a, ElementType::UInt8);
        CHECK(b.type == ElementType::UInt8);
        CHECK(easy::values<std::uint8_t>(b) == (std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6}));
        CHECK(throws_kind(ErrorKind::TypeMismatch,
                          [] { (void)convert_array(easy::make_array<double>({1, 1}, {-1}), ElementType::UInt8); }));

        NDArray t = reverse_axes(a);
        CHECK(t.shape == (std::vector<std::size_t>{3, 2}));
        CHECK(easy::values<double>(t) == (std::vector<double>{1, 4, 2, 5, 3, 6}));
        CHECK(reverse_axes(t) == a);

        NDArray c = easy::make_array<double>({2, 3, 2}, {1, 7, 3, 9, 5, 11, 2, 8, 4, 10, 6, 12});
        NDArray ct = reverse_axes(c);
        CHECK(ct.shape == (std::vector<std::size_t>{2, 3, 2}));
        CHECK(easy::values<double>(ct) == (std::vector<double>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}));
    }

    // Complex and sparse invariants.
    {
        ComplexArray c = easy::make_complex({2}, {1, 2}, {3, 4});
        CHECK(Value::make_complex(c).is_complex());
        c.imag = easy::make_array<double>({3}, {1, 2, 3});
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)Value::make_complex(c); }));

        SparseMatrix s;
        s.rows = 2;
        s.cols = 3;
        s.entries.push_back({1, 2, 5.0, 0.0});
        NDArray dense = sparse_to_dense(s);
        CHECK(dense.shape == (std::vector<std::size_t>{2, 3}));
        CHECK(easy::values<double>(dense) == (std::vector<double>{0, 0, 0, 0, 0, 5}));

        s.entries.push_back({2, 0, 1.0, 0.0});
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)Value::make_sparse(s); }));
        s.entries.back() = {0, 0, 0.0, 0.0};
        CHECK(throws_kind(ErrorKind::ShapeMismatch, [&] { (void)Value::make_sparse(s); }));
        s.entries.back() = {0, 0, 1.0, 2.0};
        CHECK(throws_kind(ErrorKind::TypeMismatch, [&] { (void)Value::make_sparse(s); }));
    }

    // Record keeps insertion order and unique keys.
    {
        Record r;
        r.set("b", Value::make_int64(1));
        r.set("a", Value::make_int64(2));
        r.set("b", Value::make_int64(3));
        CHECK(r.size() == 2);
        CHECK(r.keys() == (std::vector<std::string>{"b", "a"}));
        CHECK(r.at("b").as_int().to_i64() == 3);
        CHECK(throws_kind(ErrorKind::NotFound, [&] { (void)r.at("zz"); }));
        CHECK(r.erase("b"));
        CHECK(!r.contains("b"));
        CHECK(!r.erase("b"));
    }

    // Equality treats NaN as equal to itself and compares widths.
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK(Value::make_double(nan) == Value::make_double(nan));
        CHECK(Value::make_double(1.0) != Value::make_single(1.0f));
        CHECK(Value::make_int64(5) != Value::make_uint64(5));
        CHECK(Value::make_text("x").describe() == "text");
        CHECK(dbl_array({2, 3}, {1, 2, 3, 4, 5, 6}).describe() == "double[2x3]");
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)Value::make_text("x").as_int(); }));
    }

    // Log levels parse case-insensitively and gate the sink.
    {
        CHECK(log_level_from_string("DEBUG") == LogLevel::Debug);
        CHECK(log_level_from_string("warning") == LogLevel::Warn);
        CHECK(log_level_from_string("loud", LogLevel::Info) == LogLevel::Info);
        CHECK(to_string(LogLevel::Trace) == "trace");

        const LogLevel saved = log_level();
        set_log_level(LogLevel::Error);
        CHECK(log_enabled(LogLevel::Error));
        CHECK(!log_enabled(LogLevel::Warn));
        set_log_level(LogLevel::Trace);
        CHECK(log_enabled(LogLevel::Debug));
        set_log_level(saved);
    }

    std::cout << "All tests passed.\n";
    return 0;
}
