#pragma once
#include <memory>
#include <string>
#include <string_view>

namespace recload {

enum class MalformedInputAction {
    Report,  // throw IoError
    Replace, // emit U+FFFD
    Ignore,  // drop the bad bytes
};

MalformedInputAction parse_malformed_action(const std::string& s);

// Decodes input bytes of one charset into UTF-8.
class CharsetDecoder {
public:
    enum class Charset { Utf8, Latin1, Ascii, Cp1251 };

    CharsetDecoder(Charset cs, MalformedInputAction action);

    // Accepts the usual aliases ("utf8", "latin1", "cp1251", ...). Throws std::invalid_argument.
    static std::shared_ptr<const CharsetDecoder> for_name(const std::string& name,
                                                          MalformedInputAction action = MalformedInputAction::Report);

    const char* name() const;
    MalformedInputAction action() const { return action_; }

    std::string decode(std::string_view bytes) const;

private:
    void malformed(std::string& out, size_t offset) const;

    Charset cs_;
    MalformedInputAction action_;
};

} // namespace recload
