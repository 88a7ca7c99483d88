#include "jdata/compress.hpp"

#include "jdata/log.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <lzma.h>
#include <zlib.h>

namespace jdata {

std::string to_string(Codec c) {
    switch (c) {
        case Codec::None: return "none";
        case Codec::Zlib: return "zlib";
        case Codec::Gzip: return "gzip";
        case Codec::Lzma: return "lzma";
    }
    return "unknown";
}

Codec codec_from_string(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "zlib") return Codec::Zlib;
    if (t == "gzip") return Codec::Gzip;
    if (t == "lzma") return Codec::Lzma;
    if (t == "none" || t.empty()) return Codec::None;
    throw JdataError(ErrorKind::CodecUnavailable, "compression codec \"" + s + "\" is not available");
}

// ------------------------------
// zlib / gzip
// ------------------------------

static std::vector<std::uint8_t> zlib_compress(const std::vector<std::uint8_t>& in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    std::vector<std::uint8_t> out(bound);

    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) {
        throw JdataError(ErrorKind::CompressionError, "zlib compress2 failed with code " + std::to_string(rc));
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

// zlib counts bytes in uInt, so large buffers are handed over in pieces.
static constexpr std::size_t kZlibMaxChunk = (std::numeric_limits<uInt>::max)();
// Decoders grow their output by at least this much at a time.
static constexpr std::size_t kOutChunk = std::size_t{64} << 10;

static void feed_input(z_stream& strm, const std::vector<std::uint8_t>& in, std::size_t& pos) {
    if (strm.avail_in != 0 || pos == in.size()) return;
    const std::size_t n = std::min(in.size() - pos, kZlibMaxChunk);
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data() + pos));
    strm.avail_in = static_cast<uInt>(n);
    pos += n;
}

// Output never grows past `limit` bytes.
static void grow_output(std::vector<std::uint8_t>& out, std::size_t limit) {
    const std::size_t step = std::max(kOutChunk, out.size());
    out.resize(limit - out.size() < step ? limit : out.size() + step);
}

static std::vector<std::uint8_t> gzip_compress(const std::vector<std::uint8_t>& in, int level) {
    // windowBits 15 + 16 selects the gzip wrapper (RFC 1952).
    z_stream strm{};
    int rc = ::deflateInit2(&strm, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw JdataError(ErrorKind::CompressionError, "gzip deflateInit2 failed with code " + std::to_string(rc));
    }

    std::vector<std::uint8_t> out(::deflateBound(&strm, static_cast<uLong>(in.size())));
    std::size_t pos = 0;
    std::size_t done = 0;
    while (true) {
        feed_input(strm, in, pos);
        if (done == out.size()) grow_output(out, (std::numeric_limits<std::size_t>::max)());
        const std::size_t room = std::min(out.size() - done, kZlibMaxChunk);
        strm.next_out = out.data() + done;
        strm.avail_out = static_cast<uInt>(room);

        rc = ::deflate(&strm, pos == in.size() ? Z_FINISH : Z_NO_FLUSH);
        done += room - strm.avail_out;
        if (rc == Z_STREAM_END) break;
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            ::deflateEnd(&strm);
            throw JdataError(ErrorKind::CompressionError, "gzip deflate failed with code " + std::to_string(rc));
        }
    }

    out.resize(done);
    ::deflateEnd(&strm);
    return out;
}

// Inflates into a buffer that grows with the data and stops one byte past the
// expected length, so both short and long streams are reported as a length
// mismatch without trusting the declared size for the allocation.
static std::vector<std::uint8_t> inflate_exact(const std::vector<std::uint8_t>& in, std::size_t expected_len,
                                               int window_bits, const char* name) {
    z_stream strm{};
    int rc = ::inflateInit2(&strm, window_bits);
    if (rc != Z_OK) {
        throw JdataError(ErrorKind::CompressionError, std::string(name) + " inflateInit2 failed");
    }

    const std::size_t limit =
        expected_len == (std::numeric_limits<std::size_t>::max)() ? expected_len : expected_len + 1;
    std::vector<std::uint8_t> out;
    std::size_t pos = 0;
    std::size_t done = 0;
    while (true) {
        feed_input(strm, in, pos);
        if (done == out.size()) grow_output(out, limit);
        const std::size_t room = std::min(out.size() - done, kZlibMaxChunk);
        strm.next_out = out.data() + done;
        strm.avail_out = static_cast<uInt>(room);

        rc = ::inflate(&strm, Z_NO_FLUSH);
        done += room - strm.avail_out;
        if (done > expected_len) {
            ::inflateEnd(&strm);
            throw JdataError(ErrorKind::CompressionError,
                             std::string(name) + " data inflates beyond the expected " +
                             std::to_string(expected_len) + " bytes");
        }
        if (rc == Z_STREAM_END) break;
        if (rc == Z_BUF_ERROR && strm.avail_in == 0 && pos == in.size()) {
            ::inflateEnd(&strm);
            throw JdataError(ErrorKind::CompressionError, std::string(name) + " stream is truncated");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            ::inflateEnd(&strm);
            throw JdataError(ErrorKind::CompressionError,
                             std::string(name) + " inflate failed with code " + std::to_string(rc));
        }
    }
    ::inflateEnd(&strm);
    if (done != expected_len) {
        throw JdataError(ErrorKind::CompressionError,
                         std::string(name) + " data inflated to " + std::to_string(done) +
                         " bytes, expected " + std::to_string(expected_len));
    }
    out.resize(done);
    return out;
}

// ------------------------------
// lzma ("lzma alone" container)
// ------------------------------

static std::vector<std::uint8_t> lzma_compress_alone(const std::vector<std::uint8_t>& in, int level) {
    lzma_options_lzma opt;
    std::uint32_t preset = level < 0 ? LZMA_PRESET_DEFAULT : static_cast<std::uint32_t>(level > 9 ? 9 : level);
    if (lzma_lzma_preset(&opt, preset)) {
        throw JdataError(ErrorKind::CompressionError, "lzma preset " + std::to_string(preset) + " is not supported");
    }

    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret rc = lzma_alone_encoder(&strm, &opt);
    if (rc != LZMA_OK) {
        throw JdataError(ErrorKind::CompressionError, "lzma_alone_encoder failed with code " + std::to_string(static_cast<int>(rc)));
    }

    std::vector<std::uint8_t> out(in.size() + in.size() / 2 + 128);
    strm.next_in = in.data();
    strm.avail_in = in.size();
    strm.next_out = out.data();
    strm.avail_out = out.size();

    while (true) {
        rc = lzma_code(&strm, LZMA_FINISH);
        if (rc == LZMA_STREAM_END) break;
        if (rc != LZMA_OK) {
            lzma_end(&strm);
            throw JdataError(ErrorKind::CompressionError, "lzma encoding failed with code " + std::to_string(static_cast<int>(rc)));
        }
        if (strm.avail_out == 0) {
            const std::size_t used = out.size();
            out.resize(used * 2);
            strm.next_out = out.data() + used;
            strm.avail_out = out.size() - used;
        }
    }
    out.resize(strm.total_out);
    lzma_end(&strm);
    return out;
}

static std::vector<std::uint8_t> lzma_decompress_alone(const std::vector<std::uint8_t>& in, std::size_t expected_len) {
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret rc = lzma_alone_decoder(&strm, UINT64_MAX);
    if (rc != LZMA_OK) {
        throw JdataError(ErrorKind::CompressionError, "lzma_alone_decoder failed with code " + std::to_string(static_cast<int>(rc)));
    }

    const std::size_t limit =
        expected_len == (std::numeric_limits<std::size_t>::max)() ? expected_len : expected_len + 1;
    std::vector<std::uint8_t> out;
    strm.next_in = in.data();
    strm.avail_in = in.size();

    while (true) {
        if (strm.total_out == out.size()) {
            grow_output(out, limit);
            strm.next_out = out.data() + strm.total_out;
            strm.avail_out = out.size() - strm.total_out;
        }
        rc = lzma_code(&strm, LZMA_FINISH);
        if (strm.total_out > expected_len) {
            lzma_end(&strm);
            throw JdataError(ErrorKind::CompressionError,
                             "lzma data decodes beyond the expected " + std::to_string(expected_len) + " bytes");
        }
        if (rc == LZMA_STREAM_END) break;
        if (rc != LZMA_OK) {
            lzma_end(&strm);
            throw JdataError(ErrorKind::CompressionError, "lzma decoding failed with code " + std::to_string(static_cast<int>(rc)));
        }
    }
    const std::size_t produced = strm.total_out;
    lzma_end(&strm);
    if (produced != expected_len) {
        throw JdataError(ErrorKind::CompressionError,
                         "lzma data decoded to " + std::to_string(produced) + " bytes, expected " +
                         std::to_string(expected_len));
    }
    out.resize(produced);
    return out;
}

// ------------------------------
// Dispatch
// ------------------------------

std::vector<std::uint8_t> compress(Codec c, const std::vector<std::uint8_t>& in, int level) {
    std::vector<std::uint8_t> out;
    switch (c) {
        case Codec::Zlib: out = zlib_compress(in, level < 0 ? Z_DEFAULT_COMPRESSION : level); break;
        case Codec::Gzip: out = gzip_compress(in, level < 0 ? Z_DEFAULT_COMPRESSION : level); break;
        case Codec::Lzma: out = lzma_compress_alone(in, level); break;
        case Codec::None:
            throw JdataError(ErrorKind::InvalidArgument, "compress called without a codec");
    }
    JDATA_LOG_DEBUG("compress", to_string(c) << ": " << in.size() << " -> " << out.size() << " bytes");
    return out;
}

std::vector<std::uint8_t> decompress(Codec c, const std::vector<std::uint8_t>& in, std::size_t expected_len) {
    switch (c) {
        case Codec::Zlib: return inflate_exact(in, expected_len, 15, "zlib");
        case Codec::Gzip: return inflate_exact(in, expected_len, 15 + 16, "gzip");
        case Codec::Lzma: return lzma_decompress_alone(in, expected_len);
        case Codec::None: break;
    }
    throw JdataError(ErrorKind::InvalidArgument, "decompress called without a codec");
}

// ------------------------------
// base64
// ------------------------------

static constexpr const char* kBase64Charset =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static unsigned char base64_decode_char(char c) {
    if ('A' <= c && c <= 'Z') return static_cast<unsigned char>(c - 'A');
    if ('a' <= c && c <= 'z') return static_cast<unsigned char>(c - 'a' + 26);
    if ('0' <= c && c <= '9') return static_cast<unsigned char>(c - '0' + 52);
    if (c == '+') return 62;
    if (c == '/') return 63;
    throw JdataError(ErrorKind::MalformedStream, std::string("invalid base64 character '") + c + "'");
}

// Decodes 4 characters (with '=' padding) into 1..3 bytes.
static unsigned base64_decode4(std::uint8_t* d, const char* src) {
    auto c0 = base64_decode_char(src[0]);
    auto c1 = base64_decode_char(src[1]);
    d[0] = static_cast<std::uint8_t>((c0 << 2) | (c1 >> 4));
    if (src[2] == '=') return 1;
    auto c2 = base64_decode_char(src[2]);
    d[1] = static_cast<std::uint8_t>((c1 << 4) | (c2 >> 2));
    if (src[3] == '=') return 2;
    auto c3 = base64_decode_char(src[3]);
    d[2] = static_cast<std::uint8_t>((c2 << 6) | c3);
    return 3;
}

std::string base64_encode(const std::vector<std::uint8_t>& in) {
    std::string out;
    out.reserve(4 * ((in.size() + 2) / 3));
    std::size_t i = 0;
    for (; i + 3 <= in.size(); i += 3) {
        const std::uint8_t* s = in.data() + i;
        out.push_back(kBase64Charset[s[0] >> 2]);
        out.push_back(kBase64Charset[((s[0] & 3) << 4) | (s[1] >> 4)]);
        out.push_back(kBase64Charset[((s[1] & 15) << 2) | (s[2] >> 6)]);
        out.push_back(kBase64Charset[s[2] & 0x3f]);
    }
    const std::size_t rest = in.size() - i;
    if (rest == 2) {
        const std::uint8_t* s = in.data() + i;
        out.push_back(kBase64Charset[s[0] >> 2]);
        out.push_back(kBase64Charset[((s[0] & 3) << 4) | (s[1] >> 4)]);
        out.push_back(kBase64Charset[(s[1] & 15) << 2]);
        out.push_back('=');
    } else if (rest == 1) {
        const std::uint8_t* s = in.data() + i;
        out.push_back(kBase64Charset[s[0] >> 2]);
        out.push_back(kBase64Charset[(s[0] & 3) << 4]);
        out.push_back('=');
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> base64_decode(std::string_view in) {
    std::vector<std::uint8_t> out;
    out.reserve(3 * ((in.size() + 3) / 4));
    std::uint8_t buf_dest[3];
    char buf_src[4] = {'=', '=', '=', '='};
    unsigned buf_valid = 0;
    bool finished = false;
    for (char c : in) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (finished) {
            throw JdataError(ErrorKind::MalformedStream, "base64 data continues after padding");
        }
        buf_src[buf_valid++] = c;
        if (buf_valid == 4) {
            if (buf_src[0] == '=' || buf_src[1] == '=' || (buf_src[2] == '=' && buf_src[3] != '=')) {
                throw JdataError(ErrorKind::MalformedStream, "misplaced base64 padding");
            }
            finished = buf_src[3] == '=';
            auto len = base64_decode4(buf_dest, buf_src);
            out.insert(out.end(), buf_dest, buf_dest + len);
            buf_valid = 0;
            buf_src[2] = '=';
            buf_src[3] = '=';
        }
    }
    if (buf_valid == 1) {
        throw JdataError(ErrorKind::MalformedStream, "truncated base64 string");
    } else if (buf_valid > 1) {
        // Unpadded tail.
        if (buf_src[0] == '=' || buf_src[1] == '=') {
            throw JdataError(ErrorKind::MalformedStream, "misplaced base64 padding");
        }
        auto len = base64_decode4(buf_dest, buf_src);
        out.insert(out.end(), buf_dest, buf_dest + len);
    }
    return out;
}

} // namespace jdata
