#include "test_util.hpp"

#include <limits>

using namespace jdata;

static Marker pos(std::uint64_t m, Flavor f = Flavor::BJData) { return choose_int_marker(false, m, f); }
static Marker neg(std::uint64_t m, Flavor f = Flavor::BJData) { return choose_int_marker(true, m, f); }

int main() {
    // BJData ladder boundaries: U i u I m l M L, then H.
    {
        CHECK(pos(0) == Marker::UInt8);
        CHECK(pos(255) == Marker::UInt8);
        CHECK(pos(256) == Marker::UInt16);
        CHECK(pos(65535) == Marker::UInt16);
        CHECK(pos(65536) == Marker::UInt32);
        CHECK(pos(4294967295ull) == Marker::UInt32);
        CHECK(pos(4294967296ull) == Marker::UInt64);
        CHECK(pos((std::numeric_limits<std::uint64_t>::max)()) == Marker::UInt64);

        CHECK(neg(1) == Marker::Int8);
        CHECK(neg(128) == Marker::Int8);
        CHECK(neg(129) == Marker::Int16);
        CHECK(neg(32768) == Marker::Int16);
        CHECK(neg(32769) == Marker::Int32);
        CHECK(neg(2147483648ull) == Marker::Int32);
        CHECK(neg(2147483649ull) == Marker::Int64);
        CHECK(neg(0x8000000000000000ull) == Marker::Int64);
        CHECK(neg(0x8000000000000001ull) == Marker::HighPrecision);
    }

    // UBJSON has no unsigned markers beyond uint8.
    {
        const Flavor u = Flavor::UBJSON;
        CHECK(pos(255, u) == Marker::UInt8);
        CHECK(pos(256, u) == Marker::Int16);
        CHECK(pos(32768, u) == Marker::Int32);
        CHECK(pos(2147483648ull, u) == Marker::Int64);
        CHECK(pos(0x8000000000000000ull, u) == Marker::HighPrecision);
        CHECK(!element_marker(ElementType::UInt16, u));
        CHECK(!element_marker(ElementType::UInt64, u));
        CHECK(element_marker(ElementType::UInt8, u) == Marker::UInt8);
    }

    // keep_type picks the marker of the declared width.
    {
        Value v = Value::make_int(Int::from_i64(5, ElementType::Int32));
        CHECK(choose_marker(v, false) == Marker::UInt8);
        CHECK(choose_marker(v, true) == Marker::Int32);
        Value w = Value::make_int(Int::from_u64(5, ElementType::UInt16));
        CHECK(choose_marker(w, true) == Marker::UInt16);
        // No uint16 marker in UBJSON: falls back to the ladder.
        CHECK(choose_marker(w, true, Flavor::UBJSON) == Marker::UInt8);
        CHECK(choose_marker(Value::make_int64(-129), true) == Marker::Int64);
    }

    // Other scalars.
    {
        CHECK(choose_marker(Value::make_null(), false) == Marker::Null);
        CHECK(choose_marker(Value::make_bool(true), false) == Marker::True);
        CHECK(choose_marker(Value::make_bool(false), false) == Marker::False);
        CHECK(choose_marker(Value::make_double(1.5), false) == Marker::Float64);
        CHECK(choose_marker(Value::make_single(1.5f), false) == Marker::Float32);
        CHECK(choose_marker(Value::make_text("a"), false) == Marker::Char);
        CHECK(choose_marker(Value::make_text("ab"), false) == Marker::String);
        CHECK(choose_marker(Value::make_bigint("123456789012345678901234567890"), false) == Marker::HighPrecision);
        CHECK(throws_kind(ErrorKind::TypeMismatch, [] { (void)choose_marker(Value::make_list(), false); }));
    }

    // Block narrowing.
    {
        CHECK(choose_block_marker(easy::make_array<double>({3}, {1, 2, 300}), false) == Marker::UInt16);
        CHECK(choose_block_marker(easy::make_array<double>({2}, {1, 2.5}), false) == Marker::Float64);
        CHECK(choose_block_marker(easy::make_array<float>({1}, {0.5f}), false) == Marker::Float32);
        CHECK(choose_block_marker(easy::make_array<std::int64_t>({2}, {-1, 200}), false) == Marker::Int16);
        CHECK(choose_block_marker(easy::make_array<std::int64_t>({2}, {-1, 100}), false) == Marker::Int8);
        CHECK(choose_block_marker(easy::make_array<std::int64_t>({2}, {-1, 200}), true) == Marker::Int64);
        CHECK(choose_block_marker(easy::make_logical({2}, {true, false}), true) == Marker::UInt8);
        CHECK(choose_block_marker(easy::make_array<std::int32_t>({0}, {}), false) == Marker::Int32);

        auto big = easy::make_array<std::uint64_t>({1}, {0x8000000000000000ull});
        CHECK(choose_block_marker(big, false) == Marker::UInt64);
        CHECK(choose_block_marker(big, false, Flavor::UBJSON) == Marker::HighPrecision);
        // A huge integral double keeps its float marker.
        CHECK(choose_block_marker(easy::make_array<double>({1}, {1e300}), false) == Marker::Float64);
        // So does a block holding negative zero.
        CHECK(choose_block_marker(easy::make_array<double>({2}, {-0.0, 1}), false) == Marker::Float64);
        CHECK(choose_block_marker(easy::make_array<float>({1}, {-0.0f}), false) == Marker::Float32);
        CHECK(choose_block_marker(easy::make_array<double>({2}, {0.0, 1}), false) == Marker::UInt8);
    }

    // Marker table.
    {
        CHECK(marker_from_char('U') == Marker::UInt8);
        CHECK(!marker_from_char('x'));
        CHECK(marker_payload_size(Marker::Int32) == 4u);
        CHECK(marker_payload_size(Marker::Float16) == 2u);
        CHECK(marker_payload_size(Marker::Null) == 0u);
        CHECK(!marker_payload_size(Marker::String));
        CHECK(marker_element_type(Marker::Float16) == ElementType::Single);
        CHECK(marker_element_type(Marker::Byte) == ElementType::UInt8);
        CHECK(is_integer_marker(Marker::UInt64));
        CHECK(!is_integer_marker(Marker::Float64));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
