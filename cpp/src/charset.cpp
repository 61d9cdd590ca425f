#include "recload/charset.h"
#include "recload/errors.h"

#include <stdexcept>

#include "text_common.h"

namespace recload {

MalformedInputAction parse_malformed_action(const std::string& s) {
    const std::string v = to_lower_copy(s);
    if (v == "report") return MalformedInputAction::Report;
    if (v == "replace") return MalformedInputAction::Replace;
    if (v == "ignore") return MalformedInputAction::Ignore;
    throw std::invalid_argument("unknown malformed input action: " + s);
}

CharsetDecoder::CharsetDecoder(Charset cs, MalformedInputAction action)
    : cs_(cs), action_(action) {}

std::shared_ptr<const CharsetDecoder> CharsetDecoder::for_name(const std::string& name,
                                                               MalformedInputAction action) {
    const std::string v = to_lower_copy(name);
    Charset cs;
    if (v == "utf-8" || v == "utf8") cs = Charset::Utf8;
    else if (v == "iso-8859-1" || v == "iso8859-1" || v == "latin1" || v == "latin-1") cs = Charset::Latin1;
    else if (v == "us-ascii" || v == "ascii") cs = Charset::Ascii;
    else if (v == "windows-1251" || v == "cp1251") cs = Charset::Cp1251;
    else throw std::invalid_argument("unsupported input encoding: " + name);
    return std::make_shared<CharsetDecoder>(cs, action);
}

const char* CharsetDecoder::name() const {
    switch (cs_) {
        case Charset::Utf8:   return "UTF-8";
        case Charset::Latin1: return "ISO-8859-1";
        case Charset::Ascii:  return "US-ASCII";
        case Charset::Cp1251: return "windows-1251";
    }
    return "?";
}

void CharsetDecoder::malformed(std::string& out, size_t offset) const {
    switch (action_) {
        case MalformedInputAction::Report:
            throw IoError(std::string("malformed ") + name() + " input at byte " + std::to_string(offset));
        case MalformedInputAction::Replace:
            append_utf8(0xFFFD, out);
            return;
        case MalformedInputAction::Ignore:
            return;
    }
}

std::string CharsetDecoder::decode(std::string_view bytes) const {
    std::string out;

    switch (cs_) {
        case Charset::Utf8: {
            if (utf8_is_valid(bytes)) return std::string(bytes);
            out.reserve(bytes.size());
            size_t i = 0;
            while (i < bytes.size()) {
                const size_t len = utf8_sequence_len(bytes, i);
                if (len == 0) {
                    malformed(out, i);
                    ++i;
                    continue;
                }
                out.append(bytes.data() + i, len);
                i += len;
            }
            return out;
        }
        case Charset::Latin1: {
            out.reserve(bytes.size() * 2);
            for (unsigned char c : bytes) append_utf8((uint32_t)c, out);
            return out;
        }
        case Charset::Ascii: {
            out.reserve(bytes.size());
            for (size_t i = 0; i < bytes.size(); ++i) {
                const unsigned char c = (unsigned char)bytes[i];
                if (c < 0x80) out.push_back((char)c);
                else malformed(out, i);
            }
            return out;
        }
        case Charset::Cp1251: {
            out.reserve(bytes.size() * 2);
            for (size_t i = 0; i < bytes.size(); ++i) {
                const uint16_t cp = cp1251_to_unicode((unsigned char)bytes[i]);
                if (cp == 0 && bytes[i] != '\0') malformed(out, i);
                else append_utf8((uint32_t)cp, out);
            }
            return out;
        }
    }
    return out;
}

} // namespace recload
