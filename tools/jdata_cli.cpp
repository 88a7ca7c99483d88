#include "jdata/jdata.hpp"
#include "jdata/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <locale>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string fmt_shape(const std::vector<std::size_t>& shape) {
    if (shape.empty()) return "[0]";
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) oss << " x ";
        oss << shape[i];
    }
    oss << ']';
    return oss.str();
}

static std::string fmt_double(double d) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << d;
    return oss.str();
}

static std::string fmt_int(const jdata::Int& i) {
    return (i.negative ? "-" : "") + std::to_string(i.magnitude);
}

static std::string fmt_span(const jdata::Span& s) {
    return "off=" + std::to_string(s.offset) + " len=" + std::to_string(s.length);
}

static void usage() {
    std::cerr <<
        "jdata (C++) - JData/BJData inspector and converter\n"
        "\n"
        "Usage:\n"
        "  jdata info    <FILE> [--read-legacy] [--read-big-endian] [--no-color] [--verbose]\n"
        "  jdata tree    <FILE> [--prefix <PATH>] [--max-depth N] [--details] [--no-color]\n"
        "  jdata index   <FILE> [--include S]... [--exclude S]... [--no-color]\n"
        "  jdata convert <IN> <OUT> [--compact] [--indent N] [--nest-array] [--legacy]\n"
        "                [--compress zlib|gzip|lzma] [--level N] [--zip-min BYTES]\n"
        "                [--array-shape] [--keep-type] [--big-endian] [--ubjson] [--escape-keys]\n"
        "  jdata show    <FILE> [<PATH>] [--max-elems N] [--rows N] [--cols N] [--no-color]\n"
        "\n"
        "Paths use the position index syntax: $, $.name, $['odd key'], $[3].\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string out;
    std::string path;
    bool details{false};
    bool no_color{false};
    bool verbose{false};
    std::string prefix;
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_elems{20};
    std::size_t rows{6};
    std::size_t cols{6};
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    jdata::ReadOptions ro;
    jdata::WriteOptions wo;
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    if (a.cmd == "convert") {
        if (i >= argc) return false;
        a.out = argv[i++];
    }
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    try {
        while (i < argc) {
            std::string opt = argv[i++];
            if (opt == "--details") a.details = true;
            else if (opt == "--no-color") a.no_color = true;
            else if (opt == "--verbose") a.verbose = true;
            else if (opt == "--read-legacy") a.ro.format_version = jdata::FormatVersion::Legacy;
            else if (opt == "--read-big-endian") a.ro.endian = jdata::Endian::Big;
            else if (opt == "--compact") a.wo.compact = true;
            else if (opt == "--nest-array") a.wo.nest_array = true;
            else if (opt == "--legacy") a.wo.format_version = jdata::FormatVersion::Legacy;
            else if (opt == "--array-shape") a.wo.use_array_shape = true;
            else if (opt == "--keep-type") a.wo.keep_type = true;
            else if (opt == "--big-endian") a.wo.endian = jdata::Endian::Big;
            else if (opt == "--ubjson") a.wo.flavor = jdata::Flavor::UBJSON;
            else if (opt == "--escape-keys") a.wo.escape_keys = true;
            else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
            else if (opt == "--include" && i < argc) a.include.push_back(argv[i++]);
            else if (opt == "--exclude" && i < argc) a.exclude.push_back(argv[i++]);
            else if (opt == "--compress" && i < argc) a.wo.compression = jdata::codec_from_string(argv[i++]);
            else if (opt == "--indent" && i < argc) a.wo.indent = std::string(std::stoul(argv[i++]), ' ');
            else if (opt == "--level" && i < argc) a.wo.compression_level = std::stoi(argv[i++]);
            else if (opt == "--zip-min" && i < argc) a.wo.compress_array_size = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--rows" && i < argc) a.rows = static_cast<std::size_t>(std::stoull(argv[i++]));
            else if (opt == "--cols" && i < argc) a.cols = static_cast<std::size_t>(std::stoull(argv[i++]));
            else {
                std::cerr << "Unknown option: " << opt << "\n";
                return false;
            }
        }
    } catch (const jdata::JdataError& e) {
        std::cerr << e.what() << "\n";
        return false;
    } catch (const std::logic_error&) {
        // std::stoul and friends on a non-number.
        std::cerr << "Invalid numeric option value\n";
        return false;
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "index" && a.cmd != "convert" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Value tree -----------------

struct TreeNode {
    std::string name;
    std::string full_path; // position index path
    const jdata::Value* value{nullptr};
    const jdata::IndexEntry* entry{nullptr};
    // Document order.
    std::vector<TreeNode> children;
};

static void tree_build(TreeNode& node, const jdata::Value& v, const jdata::PositionIndex& index) {
    node.value = &v;
    node.entry = jdata::find_entry(index, node.full_path);
    if (v.is_record()) {
        for (const auto& field : v.as_record()) {
            TreeNode child;
            child.name = field.first;
            child.full_path = jdata::field_path(node.full_path, field.first);
            tree_build(child, field.second, index);
            node.children.push_back(std::move(child));
        }
    } else if (v.is_list()) {
        const auto& items = v.as_list();
        for (std::size_t i = 0; i < items.size(); ++i) {
            TreeNode child;
            child.name = "[" + std::to_string(i) + "]";
            child.full_path = jdata::item_path(node.full_path, i);
            tree_build(child, items[i], index);
            node.children.push_back(std::move(child));
        }
    }
}

static const TreeNode* tree_find(const TreeNode& root, const std::string& path) {
    if (root.full_path == path) return &root;
    for (const auto& child : root.children) {
        // Children extend the parent's path, so only descend along a matching prefix.
        if (path.compare(0, child.full_path.size(), child.full_path) != 0) continue;
        if (const TreeNode* hit = tree_find(child, path)) return hit;
    }
    return nullptr;
}

static bool is_container(const jdata::Value& v) {
    return v.is_record() || v.is_list();
}

static void print_tree(
    const TreeNode& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth,
    bool details
) {
    if (depth > max_depth) return;
    for (const auto& child : node.children) {
        std::string pad(indent, ' ');
        const jdata::Value& v = *child.value;

        if (is_container(v)) {
            std::cout << pad << ansi.magenta() << child.name << "/" << ansi.reset()
                      << " " << ansi.gray() << v.describe() << ansi.reset();
        } else {
            std::cout << pad << ansi.cyan() << child.name << ansi.reset()
                      << " " << ansi.yellow() << v.describe() << ansi.reset();
        }
        if (details) {
            std::cout << " " << ansi.dim() << "path=" << child.full_path;
            if (child.entry) std::cout << " " << fmt_span(child.entry->span);
            if (v.is_array() && v.as_array().structure) {
                std::cout << " shape=" << jdata::shape_name(*v.as_array().structure);
            }
            std::cout << ansi.reset();
        }
        std::cout << "\n";

        if (is_container(v)) {
            print_tree(child, ansi, indent + 2, depth + 1, max_depth, details);
        }
    }
}

// ----------------- Value preview -----------------

// One line of a node preview. `jdata show` prints these for leaves and
// renders them in the browser's right pane; both colour them by kind.
struct PreviewLine {
    enum class Kind { Heading, Field, Elements, Quoted };
    Kind kind{Kind::Field};
    std::string key;
    std::string text;
};

struct PreviewLimits {
    std::size_t max_elems{20};
    std::size_t rows{6};
    std::size_t cols{6};
};

using Preview = std::vector<PreviewLine>;

static void heading(Preview& out, std::string h) {
    out.push_back({PreviewLine::Kind::Heading, {}, std::move(h)});
}

static void field(Preview& out, std::string k, std::string v) {
    out.push_back({PreviewLine::Kind::Field, std::move(k), std::move(v)});
}

static void elements(Preview& out, std::string line) {
    out.push_back({PreviewLine::Kind::Elements, {}, std::move(line)});
}

static std::string element_string(const jdata::NDArray& a, std::size_t i) {
    if (a.type == jdata::ElementType::Logical) {
        return jdata::element_as_int(a, i).magnitude ? "true" : "false";
    }
    if (jdata::is_integer(a.type)) return fmt_int(jdata::element_as_int(a, i));
    return fmt_double(jdata::element_as_double(a, i));
}

static std::string complex_string(double re, double im) {
    return fmt_double(re) + (im < 0 ? "-" : "+") + fmt_double(im < 0 ? -im : im) + "i";
}

// Matrices show their top-left corner row by row; everything else shows its
// leading elements in storage order.
template <typename Fn>
static void preview_elements(Preview& out, const std::vector<std::size_t>& shape, const PreviewLimits& lim, Fn&& elem) {
    if (shape.size() == 2) {
        const std::size_t r_show = std::min(lim.rows, shape[0]);
        const std::size_t c_show = std::min(lim.cols, shape[1]);
        heading(out, "top-left " + std::to_string(r_show) + "x" + std::to_string(c_show));
        for (std::size_t r = 0; r < r_show; ++r) {
            std::string line;
            for (std::size_t c = 0; c < c_show; ++c) {
                if (c) line += "  ";
                line += elem(r * shape[1] + c);
            }
            elements(out, std::move(line));
        }
        return;
    }
    const std::size_t show = std::min(lim.max_elems, jdata::numel(shape));
    heading(out, "first " + std::to_string(show));
    std::string line;
    for (std::size_t i = 0; i < show; ++i) {
        if (i) line += ' ';
        line += elem(i);
    }
    elements(out, std::move(line));
}

static Preview build_preview(const jdata::Value& v, const PreviewLimits& lim) {
    Preview out;
    if (v.is_record()) {
        const auto& r = v.as_record();
        heading(out, "record");
        field(out, "fields", std::to_string(r.size()));
        heading(out, "fields");
        for (const auto& f : r) field(out, f.first, f.second.describe());
    } else if (v.is_list()) {
        const auto& l = v.as_list();
        heading(out, "list");
        field(out, "items", std::to_string(l.size()));
        heading(out, "items");
        const std::size_t show = std::min(lim.max_elems, l.size());
        for (std::size_t i = 0; i < show; ++i) field(out, "[" + std::to_string(i) + "]", l[i].describe());
    } else if (v.is_array()) {
        const auto& a = v.as_array();
        heading(out, "array");
        field(out, "type", jdata::to_string(a.type));
        field(out, "shape", fmt_shape(a.shape));
        field(out, "numel", std::to_string(a.size()));
        field(out, "bytes", std::to_string(a.data.size()));
        if (a.structure) field(out, "structure", jdata::shape_name(*a.structure));
        preview_elements(out, a.shape, lim, [&](std::size_t i) { return element_string(a, i); });
    } else if (v.is_complex()) {
        const auto& c = v.as_complex();
        heading(out, "complex");
        field(out, "type", jdata::to_string(c.real.type));
        field(out, "shape", fmt_shape(c.real.shape));
        field(out, "numel", std::to_string(c.real.size()));
        preview_elements(out, c.real.shape, lim, [&](std::size_t i) {
            return complex_string(jdata::element_as_double(c.real, i), jdata::element_as_double(c.imag, i));
        });
    } else if (v.is_sparse()) {
        const auto& s = v.as_sparse();
        heading(out, "sparse");
        field(out, "size", std::to_string(s.rows) + " x " + std::to_string(s.cols));
        field(out, "nnz", std::to_string(s.entries.size()));
        field(out, "complex", s.is_complex ? "true" : "false");
        heading(out, "entries");
        const std::size_t show = std::min(lim.max_elems, s.entries.size());
        for (std::size_t i = 0; i < show; ++i) {
            const auto& e = s.entries[i];
            elements(out, "(" + std::to_string(e.row) + ", " + std::to_string(e.col) + ") " +
                              (s.is_complex ? complex_string(e.re, e.im) : fmt_double(e.re)));
        }
    } else if (v.is_text()) {
        heading(out, "text");
        field(out, "bytes", std::to_string(v.as_text().size()));
        out.push_back({PreviewLine::Kind::Quoted, {}, v.as_text()});
    } else {
        heading(out, "scalar");
        if (v.is_null()) {
            field(out, "value", "null");
        } else if (v.is_bool()) {
            field(out, "value", v.as_bool() ? "true" : "false");
        } else if (v.is_int()) {
            field(out, "type", jdata::to_string(v.as_int().type));
            field(out, "value", fmt_int(v.as_int()));
        } else if (v.is_bigint()) {
            field(out, "type", "bigint");
            field(out, "value", v.as_bigint().digits);
        } else if (v.is_float()) {
            field(out, "type", jdata::to_string(v.as_float().type));
            field(out, "value", fmt_double(v.as_float().value));
        }
    }
    return out;
}

static void print_preview(const Preview& p, const Ansi& ansi) {
    for (const auto& l : p) {
        switch (l.kind) {
            case PreviewLine::Kind::Heading:
                std::cout << ansi.bold() << ansi.magenta() << l.text << ":" << ansi.reset() << "\n";
                break;
            case PreviewLine::Kind::Field:
                std::cout << "  " << ansi.yellow() << l.key << ansi.reset() << "=" << l.text << "\n";
                break;
            case PreviewLine::Kind::Elements:
                std::cout << "  " << l.text << "\n";
                break;
            case PreviewLine::Kind::Quoted:
                std::cout << "  " << ansi.green() << "\"" << l.text << "\"" << ansi.reset() << "\n";
                break;
        }
    }
}

static ftxui::Element render_preview(const Preview& p) {
    using namespace ftxui;
    if (p.empty()) return text("(nothing to show)") | color(Color::GrayDark);

    Elements lines;
    lines.reserve(p.size());
    for (const auto& l : p) {
        switch (l.kind) {
            case PreviewLine::Kind::Heading:
                lines.push_back(text(l.text) | bold | color(Color::Magenta));
                break;
            case PreviewLine::Kind::Field:
                lines.push_back(hbox({
                    text("  " + l.key) | color(Color::Yellow),
                    text(" = ") | color(Color::GrayDark),
                    text(l.text) | flex,
                }));
                break;
            case PreviewLine::Kind::Elements:
                lines.push_back(text("  " + l.text) | color(Color::White));
                break;
            case PreviewLine::Kind::Quoted:
                lines.push_back(text("  \"" + l.text + "\"") | color(Color::Green));
                break;
        }
    }
    return vbox(std::move(lines));
}

// ----------------- Browser state -----------------

struct UiRow {
    const TreeNode* node{nullptr};
    std::size_t depth{0};
};

static void flatten_rows(const TreeNode& node, const std::set<std::string>& expanded, std::size_t depth,
                         std::vector<UiRow>& out) {
    for (const auto& child : node.children) {
        out.push_back(UiRow{&child, depth});
        if (is_container(*child.value) && expanded.count(child.full_path)) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

// Visible rows of the `show` tree, the cursor among them and the first row
// drawn. The cursor always stays inside the drawn window.
class Browser {
public:
    explicit Browser(const TreeNode& start) : start_(start) { refresh(); }

    const std::vector<UiRow>& rows() const { return rows_; }
    std::size_t cursor() const { return cursor_; }
    bool is_open(const TreeNode& n) const { return expanded_.count(n.full_path) != 0; }

    const TreeNode* current() const {
        return cursor_ < rows_.size() ? rows_[cursor_].node : nullptr;
    }

    void move(long delta) {
        if (rows_.empty()) return;
        const long last = static_cast<long>(rows_.size()) - 1;
        cursor_ = static_cast<std::size_t>(std::clamp(static_cast<long>(cursor_) + delta, 0L, last));
    }

    void home() { cursor_ = 0; }
    void end() { cursor_ = rows_.empty() ? 0 : rows_.size() - 1; }

    // Opens or closes the node under the cursor. Closing a leaf moves to its parent row.
    void set_open(bool open) {
        const TreeNode* n = current();
        if (!n) return;
        if (is_container(*n->value)) {
            if (open) {
                expanded_.insert(n->full_path);
            } else if (!expanded_.erase(n->full_path)) {
                to_parent();
                return;
            }
            refresh();
        } else if (!open) {
            to_parent();
        }
    }

    // Half-open range of rows to draw in a pane `height` rows tall.
    std::pair<std::size_t, std::size_t> window(std::size_t height) {
        height = std::max<std::size_t>(height, 1);
        if (cursor_ < top_) top_ = cursor_;
        if (cursor_ >= top_ + height) top_ = cursor_ + 1 - height;
        if (rows_.size() <= height) top_ = 0;
        else top_ = std::min(top_, rows_.size() - height);
        return {top_, std::min(rows_.size(), top_ + height)};
    }

private:
    const TreeNode& start_;
    std::set<std::string> expanded_;
    std::vector<UiRow> rows_;
    std::size_t cursor_{0};
    std::size_t top_{0};

    void refresh() {
        rows_.clear();
        flatten_rows(start_, expanded_, 0, rows_);
        if (cursor_ >= rows_.size()) end();
    }

    void to_parent() {
        const std::size_t depth = rows_[cursor_].depth;
        if (depth == 0) return;
        while (cursor_ > 0 && rows_[cursor_].depth >= depth) --cursor_;
    }
};

// ----------------- Commands -----------------

struct Loaded {
    jdata::Format format{jdata::Format::Text};
    std::vector<std::uint8_t> bytes;
    jdata::Value root;
    jdata::PositionIndex index;
};

static Loaded load(const Args& a) {
    Loaded out;
    out.bytes = jdata::read_file_bytes(a.file);
    out.format = jdata::format_from_extension(a.file).value_or(jdata::detect_format(out.bytes));
    JDATA_LOG_DEBUG("cli", a.file << ": " << out.bytes.size() << " bytes as " << jdata::to_string(out.format));
    if (out.format == jdata::Format::Text) {
        const std::string_view text(reinterpret_cast<const char*>(out.bytes.data()), out.bytes.size());
        out.root = jdata::decode_text(text, a.ro, &out.index);
    } else {
        out.root = jdata::decode_binary(out.bytes, a.ro, &out.index);
    }
    return out;
}

// Decodes one node again from its own bytes.
static jdata::Value decode_span(const Loaded& f, const jdata::Span& span, const jdata::ReadOptions& ro) {
    if (f.format == jdata::Format::Text) {
        const std::string_view text(reinterpret_cast<const char*>(f.bytes.data()), f.bytes.size());
        return jdata::decode_text(jdata::slice(text, span), ro);
    }
    return jdata::decode_binary(jdata::slice(f.bytes, span), ro);
}

static int cmd_info(const Args& a, const Ansi& ansi) {
    Loaded f = load(a);
    std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
    std::cout << ansi.bold() << "Format" << ansi.reset() << ": " << jdata::to_string(f.format) << "\n";
    std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << f.bytes.size() << " bytes\n";
    std::cout << ansi.bold() << "Root" << ansi.reset() << ": " << f.root.describe() << "\n";
    std::cout << ansi.bold() << "Index entries" << ansi.reset() << ": " << f.index.size() << "\n";
    return 0;
}

static int cmd_tree(const Args& a, const Ansi& ansi) {
    Loaded f = load(a);
    TreeNode root;
    root.name = "$";
    root.full_path = "$";
    tree_build(root, f.root, f.index);

    const TreeNode* node = &root;
    if (!a.prefix.empty()) {
        node = tree_find(root, a.prefix);
        if (!node) {
            std::cerr << "prefix not found: " << a.prefix << "\n";
            return 2;
        }
        std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
    }

    std::cout << ansi.bold() << "JData tree" << ansi.reset() << ": " << a.file
              << " " << ansi.gray() << node->value->describe() << ansi.reset() << "\n";
    print_tree(*node, ansi, 0, 0, a.max_depth, a.details);
    return 0;
}

static int cmd_index(const Args& a, const Ansi& ansi) {
    jdata::ReadOptions ro = a.ro;
    ro.mmap_only = true;
    ro.mmap_include = a.include;
    ro.mmap_exclude = a.exclude;

    jdata::PositionIndex index;
    (void)jdata::load_file(a.file, ro, &index);
    for (const auto& e : index) {
        std::cout << ansi.cyan() << e.path << ansi.reset()
                  << " " << ansi.gray() << e.span.offset << " " << e.span.length << ansi.reset() << "\n";
    }
    return 0;
}

static int cmd_convert(const Args& a, const Ansi& ansi) {
    jdata::Value root = jdata::load_file(a.file, a.ro);
    jdata::save_file(a.out, root, a.wo);
    std::cout << ansi.green() << "Wrote" << ansi.reset() << " " << a.out
              << " (" << jdata::to_string(*jdata::format_from_extension(a.out)) << ")\n";
    return 0;
}

static PreviewLimits limits_of(const Args& a) {
    PreviewLimits lim;
    lim.max_elems = a.max_elems;
    lim.rows = a.rows;
    lim.cols = a.cols;
    return lim;
}

// What the right pane shows for one node.
struct Inspection {
    std::string path;
    std::vector<std::pair<std::string, std::string>> meta;
    Preview preview;
};

static Inspection inspect(const Loaded& f, const TreeNode& n, const Args& a) {
    Inspection out;
    out.path = n.full_path;
    const jdata::Value* shown = n.value;
    jdata::Value decoded;
    if (n.entry) {
        out.meta.emplace_back("span", fmt_span(n.entry->span));
        try {
            decoded = decode_span(f, n.entry->span, a.ro);
            shown = &decoded;
            out.meta.emplace_back("source", "span");
        } catch (const jdata::JdataError& e) {
            // Items of typed binary containers have no marker of their own.
            out.meta.emplace_back("source", std::string("document (") + e.what() + ")");
        }
    } else {
        out.meta.emplace_back("source", "document (not indexed)");
    }
    out.meta.insert(out.meta.begin(), {"value", shown->describe()});
    if (n.value->is_array() && n.value->as_array().structure) {
        out.meta.emplace_back("structure", jdata::shape_name(*n.value->as_array().structure));
    }
    out.preview = build_preview(*shown, limits_of(a));
    return out;
}

// Containers are magenta, numeric arrays yellow, scalars and text cyan. The
// span offset is shown for nodes the position index covers.
static ftxui::Element render_row(const UiRow& r, bool open, bool selected) {
    using namespace ftxui;
    const TreeNode& n = *r.node;
    const jdata::Value& v = *n.value;

    std::string label(r.depth * 2, ' ');
    Color tint = Color::Cyan;
    if (is_container(v)) {
        label += open ? "- " : "+ ";
        tint = Color::Magenta;
    } else {
        label += "  ";
        if (v.is_array() || v.is_complex() || v.is_sparse()) tint = Color::Yellow;
    }
    label += n.name;

    Elements parts = {text(label) | color(tint) | flex, text(" "), text(v.describe()) | dim};
    if (n.entry) parts.push_back(text(" @" + std::to_string(n.entry->span.offset)) | color(Color::GrayDark));
    Element line = hbox(std::move(parts));
    return selected ? line | inverted : line;
}

static int cmd_show(const Args& a, const Ansi& ansi) {
    Loaded f = load(a);
    TreeNode root;
    root.name = "$";
    root.full_path = "$";
    tree_build(root, f.root, f.index);

    const TreeNode* start = &root;
    if (!a.path.empty() && a.path != "$") {
        start = tree_find(root, a.path);
        if (!start) {
            std::cerr << ansi.red() << "Error" << ansi.reset() << ": path not found: " << a.path << "\n";
            return 2;
        }
    }

    // Leaves and empty containers have nothing to browse.
    if (start->children.empty()) {
        print_preview(build_preview(*start->value, limits_of(a)), ansi);
        return 0;
    }

    using namespace ftxui;
    constexpr int kTreeWidth = 56;

    Browser browser(*start);
    Inspection shown = inspect(f, *browser.current(), a);

    // Terminal rows left for tree lines: footer (1) and the pane border (2).
    auto tree_height = [] { return static_cast<std::size_t>(std::max(3, Terminal::Size().dimy - 3)); };

    auto view = Renderer([&] {
        const auto [first, last] = browser.window(tree_height());
        Elements lines;
        for (std::size_t i = first; i < last; ++i) {
            const UiRow& r = browser.rows()[i];
            lines.push_back(render_row(r, browser.is_open(*r.node), i == browser.cursor()));
        }
        Element tree = window(text(" " + start->full_path + " ") | bold, vbox(std::move(lines)) | flex);

        Elements meta;
        for (const auto& [k, v] : shown.meta) {
            meta.push_back(hbox({text(k) | bold | color(Color::Yellow), text(": ") | color(Color::GrayDark),
                                 text(v) | flex}));
        }
        Element detail = vbox({
            text(shown.path) | bold | color(Color::Green),
            vbox(std::move(meta)),
            separator(),
            render_preview(shown.preview) | vscroll_indicator | frame | flex,
        });

        const std::string position =
            std::to_string(browser.cursor() + 1) + "/" + std::to_string(browser.rows().size());
        Element footer = hbox({
            text(a.file) | color(Color::GrayDark),
            filler(),
            text(position) | bold,
            text("  arrows move/open/close  Enter inspect  q quit") | color(Color::GrayDark),
        });

        return vbox({
                   hbox({tree | size(WIDTH, EQUAL, kTreeWidth), window(text(" node "), detail) | flex}) | flex,
                   footer,
               }) |
               size(HEIGHT, EQUAL, std::max(10, Terminal::Size().dimy));
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto reinspect = [&] {
        if (const TreeNode* n = browser.current()) shown = inspect(f, *n, a);
    };
    auto page = [&] { return static_cast<long>(tree_height()); };
    const std::vector<std::pair<Event, std::function<void()>>> keys = {
        {Event::ArrowUp, [&] { browser.move(-1); }},
        {Event::ArrowDown, [&] { browser.move(1); }},
        {Event::PageUp, [&] { browser.move(-page()); }},
        {Event::PageDown, [&] { browser.move(page()); }},
        {Event::Home, [&] { browser.home(); }},
        {Event::End, [&] { browser.end(); }},
        {Event::ArrowRight, [&] { browser.set_open(true); }},
        {Event::ArrowLeft, [&] { browser.set_open(false); }},
        {Event::Return, reinspect},
    };

    auto app = CatchEvent(view, [&](Event e) {
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e.is_mouse()) {
            const Mouse m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                browser.move(-3);
            } else if (m.button == Mouse::WheelDown) {
                browser.move(3);
            } else {
                return false;
            }
            return true;
        }
        for (const auto& [key, action] : keys) {
            if (e == key) {
                action();
                return true;
            }
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();
    if (a.verbose) jdata::set_log_level(jdata::LogLevel::Debug);

    try {
        if (a.cmd == "info") return cmd_info(a, ansi);
        if (a.cmd == "tree") return cmd_tree(a, ansi);
        if (a.cmd == "index") return cmd_index(a, ansi);
        if (a.cmd == "convert") return cmd_convert(a, ansi);
        if (a.cmd == "show") return cmd_show(a, ansi);
    } catch (const jdata::JdataError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << jdata::to_string(e.kind()) << "): " << e.what();
        if (e.offset()) std::cerr << " at byte " << *e.offset();
        std::cerr << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
