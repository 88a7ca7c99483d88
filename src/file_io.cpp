#include "jdata/jdata.hpp"

#include "jdata/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace jdata {

// ------------------------------
// Position index helpers
// ------------------------------

const IndexEntry* find_entry(const PositionIndex& index, std::string_view path) {
    for (const auto& e : index) {
        if (e.path == path) return &e;
    }
    return nullptr;
}

std::string field_path(const std::string& parent, const std::string& key) {
    bool ident = !key.empty() &&
                 (std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_');
    for (std::size_t i = 1; ident && i < key.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(key[i]);
        ident = std::isalnum(c) || c == '_';
    }
    if (ident) return parent + "." + key;
    std::string out = parent + "['";
    for (char c : key) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out += "']";
    return out;
}

std::string item_path(const std::string& parent, std::size_t i) {
    return parent + "[" + std::to_string(i) + "]";
}

static void check_span(std::size_t size, const Span& span) {
    if (span.offset > size || span.length > size - span.offset) {
        throw JdataError(ErrorKind::InvalidArgument,
                         "span [" + std::to_string(span.offset) + ", +" + std::to_string(span.length) +
                         ") outside a buffer of " + std::to_string(size) + " bytes");
    }
}

std::string_view slice(std::string_view text, const Span& span) {
    check_span(text.size(), span);
    return text.substr(span.offset, span.length);
}

std::vector<std::uint8_t> slice(const std::vector<std::uint8_t>& bytes, const Span& span) {
    check_span(bytes.size(), span);
    const auto first = bytes.begin() + static_cast<std::ptrdiff_t>(span.offset);
    return std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(span.length));
}

// ------------------------------
// Format selection
// ------------------------------

std::string to_string(Format f) {
    switch (f) {
        case Format::Text: return "json";
        case Format::Binary: return "bjdata";
    }
    return "unknown";
}

std::optional<Format> format_from_extension(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json" || ext == ".jdt" || ext == ".jnii") return Format::Text;
    if (ext == ".bjd" || ext == ".jdb" || ext == ".bjdata" || ext == ".bnii" || ext == ".ubj") {
        return Format::Binary;
    }
    return std::nullopt;
}

Format detect_format(const std::vector<std::uint8_t>& bytes) {
    const std::size_t window = std::min<std::size_t>(bytes.size(), 256);
    for (std::size_t i = 0; i < window; ++i) {
        const std::uint8_t c = bytes[i];
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t') return Format::Binary;
    }
    // Binary documents open with a marker; JSON text opens with whitespace or a value.
    std::size_t i = 0;
    while (i < window && (bytes[i] == ' ' || bytes[i] == '\n' || bytes[i] == '\r' || bytes[i] == '\t')) ++i;
    if (i == window) return Format::Text;
    const char c = static_cast<char>(bytes[i]);
    if (c == '{' || c == '[' || c == '"' || c == '-' || c == '+' || (c >= '0' && c <= '9') ||
        c == 't' || c == 'f' || c == 'n' || c == '\xEF') {
        return Format::Text;
    }
    return Format::Binary;
}

// ------------------------------
// Files
// ------------------------------

std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw JdataError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    is.seekg(0, std::ios::end);
    const std::streamoff len = is.tellg();
    if (len < 0) throw JdataError(ErrorKind::Io, "failed to size file: " + file.string());
    is.seekg(0, std::ios::beg);
    std::vector<std::uint8_t> out(static_cast<std::size_t>(len));
    if (!out.empty()) {
        is.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!is) throw JdataError(ErrorKind::Io, "failed reading file: " + file.string());
    }
    return out;
}

void write_file_bytes(const std::filesystem::path& file, const std::vector<std::uint8_t>& bytes) {
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw JdataError(ErrorKind::Io, "failed to open for write: " + file.string());
    if (!bytes.empty()) {
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!os) throw JdataError(ErrorKind::Io, "failed writing file: " + file.string());
}

Value load_file(const std::filesystem::path& file, const ReadOptions& opts, PositionIndex* index) {
    std::vector<std::uint8_t> bytes = read_file_bytes(file);
    const Format f = format_from_extension(file).value_or(detect_format(bytes));
    JDATA_LOG_DEBUG("file", "loading " << file.string() << " (" << bytes.size() << " bytes) as " << to_string(f));
    if (f == Format::Text) {
        std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        return decode_text(text, opts, index);
    }
    return decode_binary(bytes, opts, index);
}

void save_file(const std::filesystem::path& file, const Value& v, const WriteOptions& opts) {
    auto f = format_from_extension(file);
    if (!f) {
        throw JdataError(ErrorKind::InvalidArgument,
                         "cannot choose a format for \"" + file.string() + "\"; use .json/.jdt/.jnii or .bjd/.jdb/.bjdata/.bnii/.ubj");
    }
    std::vector<std::uint8_t> bytes;
    if (*f == Format::Text) {
        const std::string text = encode_text(v, opts);
        bytes.assign(text.begin(), text.end());
    } else {
        bytes = encode_binary(v, opts);
    }
    JDATA_LOG_DEBUG("file", "saving " << v.describe() << " to " << file.string() << " (" << bytes.size()
                                      << " bytes) as " << to_string(*f));
    write_file_bytes(file, bytes);
}

} // namespace jdata
