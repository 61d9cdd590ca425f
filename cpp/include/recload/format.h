#pragma once

#include <filesystem>
#include <string>

namespace recload {

// Declared format of a record payload.
enum class DocumentFormat {
    None,   // not declared; the loader default applies
    Xml,    // structured markup
    Text,
    Binary,
};

const char* format_name(DocumentFormat f);

// Accepts "xml", "text", "binary" (any case). Throws std::invalid_argument otherwise.
DocumentFormat parse_format(const std::string& s);

// Payloads of these formats are decoded to UTF-8 before they are stored.
inline bool format_is_character_data(DocumentFormat f) {
    return f == DocumentFormat::Xml || f == DocumentFormat::Text;
}

std::string utc_now_iso();

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace recload
