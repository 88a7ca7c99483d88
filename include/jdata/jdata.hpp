
#pragma once

#include "jdata/compress.hpp"
#include "jdata/numeric.hpp"
#include "jdata/shape.hpp"
#include "jdata/value.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jdata {

// ------------------------------
// Options
// ------------------------------

// Axis order of nested and flattened array data.
// Revised (JData 2): row-major, outermost nesting level is the first dimension.
// Legacy (JData 1.9): column-major, outermost nesting level is the last dimension.
enum class FormatVersion {
    Legacy,
    Revised,
};

enum class Endian {
    Little,
    Big,
};

struct WriteOptions {
    // Text layout.
    bool compact{false};
    std::string indent{"\t"};

    // Array layout.
    bool nest_array{false};
    FormatVersion format_version{FormatVersion::Revised};
    bool use_array_shape{false};

    // Compression of annotated payloads whose raw size reaches compress_array_size bytes (0 disables).
    Codec compression{Codec::None};
    std::size_t compress_array_size{100};
    int compression_level{6};

    // Binary.
    bool keep_type{false};
    Endian endian{Endian::Little};
    Flavor flavor{Flavor::BJData};

    // Keys.
    bool unpack_hex{true};
    bool escape_keys{false};

    // Text special values.
    bool empty_array_as_null{false};
    std::string nan_text{"_NaN_"};
    std::string inf_text{"_Inf_"};
    std::string neg_inf_text{"-_Inf_"};
};

struct ReadOptions {
    FormatVersion format_version{FormatVersion::Revised};
    Endian endian{Endian::Little};

    bool unpack_hex{true};
    bool simplify_array{true};
    bool jdata_decode{true};

    // Position index: only build the index, and filter its paths by substring.
    bool mmap_only{false};
    std::vector<std::string> mmap_include{};
    std::vector<std::string> mmap_exclude{};

    std::size_t max_depth{512};
    // Largest element count an annotation may declare through _ArraySize_ or
    // _ArrayZipSize_. Larger declarations fail with ShapeMismatch.
    std::size_t max_elements{std::size_t{1} << 28};

    std::string nan_text{"_NaN_"};
    std::string inf_text{"_Inf_"};
    std::string neg_inf_text{"-_Inf_"};
};

// ------------------------------
// Position index
// ------------------------------

struct Span {
    std::size_t offset{0};
    std::size_t length{0};
};

struct IndexEntry {
    // "$", "$.name", "$['odd key']", "$[3]", ...
    std::string path{};
    Span span{};
};

using PositionIndex = std::vector<IndexEntry>;

const IndexEntry* find_entry(const PositionIndex& index, std::string_view path);
// Child paths: "$.key" for identifier keys, "$['key']" otherwise; "$[i]" for list items.
std::string field_path(const std::string& parent, const std::string& key);
std::string item_path(const std::string& parent, std::size_t i);
std::string_view slice(std::string_view text, const Span& span);
std::vector<std::uint8_t> slice(const std::vector<std::uint8_t>& bytes, const Span& span);

// ------------------------------
// Codecs
// ------------------------------

std::string encode_text(const Value& v, const WriteOptions& opts = WriteOptions{});

/// Decodes JSON text. If `index` is non-null it receives the position index;
/// with ReadOptions::mmap_only the returned value is null and only the index is built.
Value decode_text(std::string_view text,
                  const ReadOptions& opts = ReadOptions{},
                  PositionIndex* index = nullptr);

std::vector<std::uint8_t> encode_binary(const Value& v, const WriteOptions& opts = WriteOptions{});

Value decode_binary(const std::uint8_t* data, std::size_t size,
                    const ReadOptions& opts = ReadOptions{},
                    PositionIndex* index = nullptr);

Value decode_binary(const std::vector<std::uint8_t>& bytes,
                    const ReadOptions& opts = ReadOptions{},
                    PositionIndex* index = nullptr);

// ------------------------------
// Keys
// ------------------------------

// Makes a key a valid identifier: a leading non-letter becomes "x0x<HEX>_",
// other characters outside [0-9A-Za-z_] become "_0x<HEX>_" (multi-byte UTF-8
// characters as their concatenated byte values).
std::string escape_key(const std::string& key);
// Replaces every "x0x<HEX>_" (at the start) and "_0x<HEX>_" with the bytes it encodes.
std::string unescape_key(const std::string& key);

// ------------------------------
// Files
// ------------------------------

enum class Format {
    Text,
    Binary,
};

std::string to_string(Format f);
// By extension: .json/.jdt/.jnii are text, .bjd/.jdb/.bjdata/.bnii/.ubj binary.
std::optional<Format> format_from_extension(const std::filesystem::path& file);
// Content sniffing: control bytes in the leading window mean binary.
Format detect_format(const std::vector<std::uint8_t>& bytes);

std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& file);
void write_file_bytes(const std::filesystem::path& file, const std::vector<std::uint8_t>& bytes);

Value load_file(const std::filesystem::path& file,
                const ReadOptions& opts = ReadOptions{},
                PositionIndex* index = nullptr);

void save_file(const std::filesystem::path& file,
               const Value& v,
               const WriteOptions& opts = WriteOptions{});

} // namespace jdata
