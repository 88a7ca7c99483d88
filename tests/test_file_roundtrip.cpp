#include "test_util.hpp"

#include <filesystem>
#include <fstream>

using namespace jdata;

static Value make_sample_root() {
    Record root;

    // Double 2x3: row-major [ [1 2 3]; [4 5 6] ]
    easy::set(root, "A", dbl_array({2, 3}, {1, 2, 3, 4, 5, 6}));

    // Logical 1x4
    easy::set(root, "mask", Value::make_array(easy::make_logical({1, 4}, {true, false, true, true})));

    // Int32 volume 2x2x2
    easy::set(root, "vol", Value::make_array(easy::make_array<std::int32_t>({2, 2, 2}, {1, -2, 3, -4, 5, -6, 7, -8})));

    // Complex 1x3
    easy::set(root, "z", Value::make_complex(easy::make_complex({1, 3}, {1, 2, 3}, {-1, 0, 0.5})));

    // Sparse 3x3 with two entries
    {
        SparseMatrix s;
        s.rows = 3;
        s.cols = 3;
        s.entries = {{0, 2, 4.0, 0}, {2, 0, -1.5, 0}};
        easy::set(root, "sp", Value::make_sparse(s));
    }

    // Large enough to be compressed
    {
        std::vector<double> ramp(256);
        for (std::size_t i = 0; i < ramp.size(); ++i) ramp[i] = static_cast<double>(i) / 4.0;
        easy::set(root, "ramp", dbl_array({16, 16}, ramp));
    }

    Record meta;
    easy::set(meta, "name", Value::make_text("caff\xC3\xA8 \xE2\x82\xAC"));
    easy::set(meta, "version", Value::make_int64(2));
    easy::set(meta, "tags", Value::make_list({Value::make_text("a"), Value::make_text("bc")}));
    easy::set(root, "meta", Value::make_record(meta));

    return Value::make_record(root);
}

static void flip_byte(const std::filesystem::path& p, std::size_t pos) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    CHECK(static_cast<bool>(f));
    f.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    char c;
    f.read(&c, 1);
    CHECK(static_cast<bool>(f));
    c ^= 0x01;
    f.seekp(static_cast<std::streamoff>(pos), std::ios::beg);
    f.write(&c, 1);
    CHECK(static_cast<bool>(f));
}

static void truncate_to(const std::filesystem::path& p, std::size_t n) {
    std::vector<std::uint8_t> bytes = read_file_bytes(p);
    CHECK(bytes.size() > n);
    bytes.resize(n);
    write_file_bytes(p, bytes);
}

int main() {
    const std::filesystem::path dir = std::filesystem::temp_directory_path();
    const std::filesystem::path json = dir / "jdata_cpp_test.json";
    const std::filesystem::path bjd = dir / "jdata_cpp_test.bjd";
    const std::filesystem::path raw = dir / "jdata_cpp_test.dat";
    for (const auto& p : {json, bjd, raw}) std::filesystem::remove(p);

    const Value root = make_sample_root();

    WriteOptions wo;
    wo.compression = Codec::Zlib;
    wo.keep_type = true;

    // Text file
    {
        save_file(json, root, wo);
        const std::vector<std::uint8_t> bytes = read_file_bytes(json);
        CHECK(detect_format(bytes) == Format::Text);
        CHECK(load_file(json) == root);

        PositionIndex idx;
        Value round = load_file(json, ReadOptions{}, &idx);
        CHECK(round.as_record().at("meta").as_record().at("name") == Value::make_text("caff\xC3\xA8 \xE2\x82\xAC"));
        CHECK(find_entry(idx, "$.ramp") != nullptr);
        CHECK(find_entry(idx, "$.meta.tags[1]") != nullptr);
    }

    // Binary file
    {
        save_file(bjd, root, wo);
        const std::vector<std::uint8_t> bytes = read_file_bytes(bjd);
        CHECK(detect_format(bytes) == Format::Binary);
        CHECK(load_file(bjd) == root);

        PositionIndex idx;
        (void)load_file(bjd, ReadOptions{}, &idx);
        const IndexEntry* e = find_entry(idx, "$.A");
        CHECK(e != nullptr);
        CHECK(decode_binary(slice(bytes, e->span)) == root.as_record().at("A"));
    }

    // Unknown extensions are sniffed on load and rejected on save.
    {
        write_file_bytes(raw, encode_binary(root, wo));
        CHECK(load_file(raw) == root);
        const std::string text = encode_text(root, wo);
        write_file_bytes(raw, bytes_of(text));
        CHECK(load_file(raw) == root);
        CHECK(throws_kind(ErrorKind::InvalidArgument, [&] { save_file(raw, root); }));
    }

    // Corrupt compressed payload => checksum failure
    {
        Value ramp = root.as_record().at("ramp");
        save_file(bjd, ramp, wo);
        const std::size_t size = std::filesystem::file_size(bjd);
        // The annotation ends with the zlib stream's Adler-32 trailer followed by '}'.
        flip_byte(bjd, size - 2);
        CHECK(throws_kind(ErrorKind::CompressionError, [&] { (void)load_file(bjd); }));
    }

    // Truncated files => stream errors
    {
        save_file(bjd, root, wo);
        truncate_to(bjd, std::filesystem::file_size(bjd) / 2);
        CHECK(throws_kind(ErrorKind::MalformedStream, [&] { (void)load_file(bjd); }));

        save_file(json, root, wo);
        truncate_to(json, std::filesystem::file_size(json) - 1);
        CHECK(throws_kind(ErrorKind::MalformedStream, [&] { (void)load_file(json); }));
    }

    // Missing files
    {
        const std::filesystem::path missing = dir / "jdata_cpp_test_missing.json";
        std::filesystem::remove(missing);
        CHECK(throws_kind(ErrorKind::Io, [&] { (void)load_file(missing); }));
        CHECK(throws_kind(ErrorKind::Io, [&] { save_file(dir / "no_such_dir" / "x.json", root); }));
    }

    // Format selection
    {
        CHECK(format_from_extension("a.JSON") == Format::Text);
        CHECK(format_from_extension("a.jnii") == Format::Text);
        CHECK(format_from_extension("a.bjd") == Format::Binary);
        CHECK(format_from_extension("a.ubj") == Format::Binary);
        CHECK(!format_from_extension("a.txt"));
        CHECK(!format_from_extension("noext"));
        CHECK(to_string(Format::Binary) == "bjdata");

        CHECK(detect_format(bytes_of("  {\"a\":1}")) == Format::Text);
        CHECK(detect_format(bytes_of("\xEF\xBB\xBF[1]")) == Format::Text);
        CHECK(detect_format(bytes_of("")) == Format::Text);
        CHECK(detect_format(encode_binary(Value::make_int64(5))) == Format::Binary);
        CHECK(detect_format(bytes_of("SU")) == Format::Binary);
    }

    for (const auto& p : {json, bjd, raw}) std::filesystem::remove(p);
    std::cout << "All tests passed.\n";
    return 0;
}
