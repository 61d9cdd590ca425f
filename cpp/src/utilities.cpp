#include "recload/utilities.h"
#include "recload/charset.h"
#include "recload/errors.h"

#include <cctype>
#include <vector>

#include "text_common.h"

namespace recload {

std::string join(const std::vector<std::string>& items, std::string_view delim) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out.append(delim.data(), delim.size());
        out += items[i];
    }
    return out;
}

std::string escape_xml(std::optional<std::string_view> in) {
    if (!in) return "";
    std::string out;
    out.reserve(in->size() + 16);
    for (char c : *in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;";  break;
            case '>': out += "&gt;";  break;
            default:  out.push_back(c);
        }
    }
    return out;
}

bool string_to_boolean(std::optional<std::string_view> s, bool defv) {
    if (!s) return defv;
    const std::string v = to_lower_copy(std::string(*s));
    if (v.empty() || v == "0" || v == "f" || v == "false" || v == "n" || v == "no") {
        return false;
    }
    return true;
}

std::exception_ptr deepest_cause(std::exception_ptr e) {
    std::exception_ptr cur = e;
    while (cur) {
        try {
            std::rethrow_exception(cur);
        } catch (const std::nested_exception& ne) {
            std::exception_ptr inner = ne.nested_ptr();
            if (!inner) return cur;
            cur = inner;
        } catch (...) {
            return cur;
        }
    }
    return cur;
}

std::string exception_message(std::exception_ptr e) {
    if (!e) return "";
    try {
        std::rethrow_exception(e);
    } catch (const std::exception& ex) {
        return ex.what();
    } catch (...) {
        return "non-standard exception";
    }
}

std::string drain(std::istream* in) {
    if (!in) throw IoError("null input stream");

    std::string out;
    std::vector<char> buf(DRAIN_CHUNK_BYTES);
    while (true) {
        in->read(buf.data(), (std::streamsize)buf.size());
        const std::streamsize got = in->gcount();
        if (got > 0) out.append(buf.data(), (size_t)got);
        if (!*in) break;
    }
    if (in->bad()) throw IoError("read failed while draining input stream");
    return out;
}

std::string drain(std::istream* in, const CharsetDecoder& decoder) {
    return decoder.decode(drain(in));
}

std::optional<std::string> strip_extension(std::optional<std::string> name) {
    if (!name || name->size() < 3) return name;

    const size_t i = name->rfind('.');
    if (i == std::string::npos || i < 1) return name;

    return name->substr(0, i);
}

std::string trim(std::string_view s) {
    size_t a = 0;
    while (a < s.size() && (unsigned char)s[a] <= ' ') ++a;
    size_t b = s.size();
    while (b > a && (unsigned char)s[b - 1] <= ' ') --b;
    return std::string(s.substr(a, b - a));
}

std::string replace_first(std::string_view s, std::string_view what, std::string_view with) {
    std::string out(s);
    if (what.empty()) return out;
    const size_t pos = out.find(what.data(), 0, what.size());
    if (pos == std::string::npos) return out;
    out.replace(pos, what.size(), with.data(), with.size());
    return out;
}

std::string normalize_slashes(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    bool in_run = false;
    for (char c : path) {
        if (c == '\\') {
            if (!in_run) out.push_back('/');
            in_run = true;
            continue;
        }
        in_run = false;
        out.push_back(c);
    }
    return out;
}

static bool uri_path_char_allowed(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        // unreserved
        case '-': case '.': case '_': case '~':
        // sub-delims
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
        // pchar extras and the segment separator
        case ':': case '@': case '/':
            return true;
        default:
            return false;
    }
}

std::string escape_uri_path(std::string_view path) {
    static const char* hex = "0123456789ABCDEF";

    // path-noscheme: a relative path may not carry ':' in its first segment
    const bool relative = path.empty() || path[0] != '/';
    bool first_segment = relative;

    std::string out;
    out.reserve(path.size() + 16);
    for (unsigned char c : path) {
        if (c == '/') first_segment = false;
        const bool keep = uri_path_char_allowed(c) && !(c == ':' && first_segment);
        if (keep) {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

} // namespace recload
