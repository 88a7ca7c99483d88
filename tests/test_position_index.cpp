#include "test_util.hpp"

#include <map>

using namespace jdata;

static const Span& span_of(const PositionIndex& idx, std::string_view path) {
    const IndexEntry* e = find_entry(idx, path);
    if (!e) throw std::runtime_error("no index entry for " + std::string(path));
    return e->span;
}

static std::vector<std::string> paths_of(const PositionIndex& idx) {
    std::vector<std::string> out;
    for (const auto& e : idx) out.push_back(e.path);
    return out;
}

static Value sample_doc() {
    Record b;
    b.set("c", Value::make_text("xy"));
    b.set("d e", Value::make_list({Value::make_bool(true), Value::make_null()}));
    Record k1;
    k1.set("k", Value::make_int64(1));
    Record k2;
    k2.set("k", Value::make_int64(2));
    Record r;
    r.set("a", dbl_array({3}, {1, 2, 3}));
    r.set("b", Value::make_record(b));
    r.set("s", Value::make_list({Value::make_record(k1), Value::make_record(k2)}));
    r.set("m", dbl_array({2, 1, 2}, {1, 2, 3, 4}));
    return Value::make_record(r);
}

// Every sub-value of `v`, keyed by the path the position index gives it.
static void collect(const Value& v, const std::string& path, std::map<std::string, Value>& out) {
    out.emplace(path, v);
    if (v.is_list()) {
        const auto& items = v.as_list();
        for (std::size_t i = 0; i < items.size(); ++i) collect(items[i], item_path(path, i), out);
    } else if (v.is_record()) {
        for (const auto& [key, child] : v.as_record()) collect(child, field_path(path, key), out);
    }
}

// Each indexed span decodes on its own to the value found at its path in `whole`.
template <typename Buffer, typename Decode>
static void check_spans(const Buffer& buf, const PositionIndex& idx, const Value& whole, Decode decode) {
    std::map<std::string, Value> at;
    collect(whole, "$", at);
    for (const auto& e : idx) {
        auto it = at.find(e.path);
        if (it == at.end()) throw std::runtime_error("no value at " + e.path);
        CHECK(decode(slice(buf, e.span)) == it->second);
    }
}

static Value text_of_span(std::string_view s) { return decode_text(s); }

// Pretty text that keeps nulls as `null`.
static std::string pretty_text(const Value& v) {
    WriteOptions wo;
    wo.empty_array_as_null = true;
    return encode_text(v, wo);
}

int main() {
    const std::vector<std::string> expected_paths = {
        "$", "$.a", "$.b", "$.b.c", "$.b['d e']", "$.b['d e'][0]", "$.b['d e'][1]",
        "$.s", "$.s[0]", "$.s[0].k", "$.s[1]", "$.s[1].k", "$.m",
    };

    // Text: every span slices out a standalone value.
    {
        const std::string text = R"({"a":[1,2,3],"b":{"c":"xy","d e":[true,null]},)"
                                 R"("s":[{"k":1},{"k":2}],)"
                                 R"("m":{"_ArrayType_":"double","_ArraySize_":[2,1,2],"_ArrayData_":[1,2,3,4]}})";
        PositionIndex idx = {IndexEntry{"stale", Span{0, 1}}};
        Value v = decode_text(text, ReadOptions{}, &idx);
        CHECK(v == sample_doc());
        CHECK(paths_of(idx) == expected_paths);

        CHECK(slice(text, span_of(idx, "$")) == text);
        CHECK(slice(text, span_of(idx, "$.a")) == "[1,2,3]");
        CHECK(slice(text, span_of(idx, "$.b.c")) == "\"xy\"");
        CHECK(slice(text, span_of(idx, "$.b['d e'][1]")) == "null");
        CHECK(slice(text, span_of(idx, "$.s[1]")) == R"({"k":2})");
        CHECK(find_entry(idx, "$.a[0]") == nullptr);
        CHECK(find_entry(idx, "$.m._ArrayType_") == nullptr);

        check_spans(text, idx, v, text_of_span);
        CHECK(decode_text(slice(text, span_of(idx, "$.m"))) == sample_doc().as_record().at("m"));
        CHECK(decode_text(slice(text, span_of(idx, "$.b"))) == sample_doc().as_record().at("b"));
    }

    // Pretty text: spans skip surrounding whitespace.
    {
        const std::string text = pretty_text(sample_doc());
        PositionIndex idx;
        CHECK(decode_text(text, ReadOptions{}, &idx) == sample_doc());
        CHECK(paths_of(idx) == expected_paths);
        CHECK(slice(text, span_of(idx, "$.a")) == "[1,2,3]");
        CHECK(slice(text, span_of(idx, "$.s[0].k")) == "1");
        check_spans(text, idx, sample_doc(), text_of_span);
        for (const auto& e : idx) {
            const std::string_view s = slice(text, e.span);
            CHECK(!s.empty() && s.front() != ' ' && s.front() != '\n' && s.front() != '\t');
        }
    }

    // Binary spans decode to the same values.
    {
        const std::vector<std::uint8_t> bytes = encode_binary(sample_doc());
        PositionIndex idx;
        Value v = decode_binary(bytes, ReadOptions{}, &idx);
        CHECK(paths_of(idx) == expected_paths);
        CHECK(slice(bytes, span_of(idx, "$")) == bytes);
        CHECK(decode_binary(slice(bytes, span_of(idx, "$.a"))) == sample_doc().as_record().at("a"));
        CHECK(decode_binary(slice(bytes, span_of(idx, "$.b.c"))) == Value::make_text("xy"));
        CHECK(decode_binary(slice(bytes, span_of(idx, "$.m"))) == sample_doc().as_record().at("m"));
        CHECK(decode_binary(slice(bytes, span_of(idx, "$.s[1].k"))) ==
              Value::make_int(Int::from_u64(2, ElementType::UInt8)));
        check_spans(bytes, idx, v, [](const std::vector<std::uint8_t>& b) { return decode_binary(b); });
        CHECK(v.as_record().at("b") == sample_doc().as_record().at("b"));
    }

    // One-element bool and big-integer arrays unwrap at every depth, the same
    // way they do at the root, so nested spans agree with the whole.
    {
        const std::string text = R"({"a":[true],"b":[[false],1],"c":["x"],)"
                                 R"("d":[123456789012345678901234567890]})";
        PositionIndex idx;
        Value v = decode_text(text, ReadOptions{}, &idx);
        CHECK(v.as_record().at("a") == Value::make_bool(true));
        CHECK(v.as_record().at("b").as_list()[0] == Value::make_bool(false));
        CHECK(v.as_record().at("c").is_list());
        CHECK(v.as_record().at("d") == Value::make_bigint("123456789012345678901234567890"));
        CHECK(decode_text(slice(text, span_of(idx, "$.a"))) == Value::make_bool(true));
        check_spans(text, idx, v, text_of_span);

        ReadOptions ro;
        ro.mmap_only = true;
        PositionIndex only;
        (void)decode_text(text, ro, &only);
        CHECK(paths_of(only) == paths_of(idx));
    }

    // mmap_only builds the same index without materializing.
    {
        const std::string text = pretty_text(sample_doc());
        PositionIndex full;
        (void)decode_text(text, ReadOptions{}, &full);

        ReadOptions ro;
        ro.mmap_only = true;
        PositionIndex only;
        CHECK(decode_text(text, ro, &only).is_null());
        CHECK(only.size() == full.size());
        for (std::size_t i = 0; i < full.size(); ++i) {
            CHECK(only[i].path == full[i].path);
            CHECK(only[i].span.offset == full[i].span.offset);
            CHECK(only[i].span.length == full[i].span.length);
        }

        const std::vector<std::uint8_t> bytes = encode_binary(sample_doc());
        PositionIndex bidx;
        CHECK(decode_binary(bytes, ro, &bidx).is_null());
        CHECK(paths_of(bidx) == expected_paths);
    }

    // Include and exclude filters match path substrings.
    {
        const std::string text = pretty_text(sample_doc());
        ReadOptions ro;
        ro.mmap_only = true;
        ro.mmap_include = {"$.b"};
        PositionIndex idx;
        (void)decode_text(text, ro, &idx);
        CHECK(paths_of(idx) == (std::vector<std::string>{
            "$.b", "$.b.c", "$.b['d e']", "$.b['d e'][0]", "$.b['d e'][1]"}));

        ro.mmap_exclude = {"[0]"};
        (void)decode_text(text, ro, &idx);
        CHECK(paths_of(idx) == (std::vector<std::string>{"$.b", "$.b.c", "$.b['d e']", "$.b['d e'][1]"}));

        ReadOptions ex;
        ex.mmap_exclude = {".s", ".m"};
        Value v = decode_text(text, ex, &idx);
        CHECK(v == sample_doc());
        CHECK(paths_of(idx) == (std::vector<std::string>{
            "$", "$.a", "$.b", "$.b.c", "$.b['d e']", "$.b['d e'][0]", "$.b['d e'][1]"}));
    }

    // Keys that are not identifiers are quoted.
    {
        Record r;
        r.set("it's", Value::make_text("q"));
        r.set("_ok1", Value::make_text("w"));
        const std::string text = encode_text(Value::make_record(r));
        PositionIndex idx;
        (void)decode_text(text, ReadOptions{}, &idx);
        CHECK(paths_of(idx) == (std::vector<std::string>{"$", "$['it\\'s']", "$._ok1"}));
        CHECK(slice(text, span_of(idx, "$['it\\'s']")) == "\"q\"");
    }

    // Spans outside the buffer are rejected.
    {
        const std::string text = "[1,2]";
        CHECK(throws_kind(ErrorKind::InvalidArgument, [&] { (void)slice(text, Span{3, 5}); }));
        CHECK(throws_kind(ErrorKind::InvalidArgument, [&] { (void)slice(text, Span{6, 0}); }));
        CHECK(slice(text, Span{5, 0}).empty());
        const std::vector<std::uint8_t> bytes = bytes_of(text);
        CHECK(throws_kind(ErrorKind::InvalidArgument, [&] { (void)slice(bytes, Span{0, 6}); }));
    }

    std::cout << "All tests passed.\n";
    return 0;
}
