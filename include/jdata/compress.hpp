#pragma once

#include "jdata/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jdata {

// ------------------------------
// Compression adapter
// ------------------------------

enum class Codec {
    None,
    Zlib,
    Gzip,
    Lzma,
};

std::string to_string(Codec c);
// "zlib" | "gzip" | "lzma" | "none"; anything else throws CodecUnavailable.
Codec codec_from_string(const std::string& s);

// Compressed payload of one array: the codec, the shape of the payload matrix
// before compression, and the compressed bytes.
struct CompressionEnvelope {
    Codec codec{Codec::Zlib};
    std::vector<std::size_t> raw_shape{};
    std::vector<std::uint8_t> bytes{};
};

// `level` is the zlib level (0..9) or the lzma preset; negative means default.
std::vector<std::uint8_t> compress(Codec c, const std::vector<std::uint8_t>& in, int level = 6);
// Throws CompressionError on corrupt input or when the output length differs
// from expected_len.
std::vector<std::uint8_t> decompress(Codec c, const std::vector<std::uint8_t>& in, std::size_t expected_len);

std::string base64_encode(const std::vector<std::uint8_t>& in);
// Skips whitespace; throws MalformedStream on invalid characters or length.
std::vector<std::uint8_t> base64_decode(std::string_view in);

} // namespace jdata
