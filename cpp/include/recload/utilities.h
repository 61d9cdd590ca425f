#pragma once
#include <cstddef>
#include <exception>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recload {

class CharsetDecoder;

constexpr size_t DRAIN_CHUNK_BYTES = 32 * 1024;

std::string join(const std::vector<std::string>& items, std::string_view delim);

// & first, so already-produced entities are not escaped twice. nullopt => "".
std::string escape_xml(std::optional<std::string_view> in);

// nullopt => defv; "", "0", "f", "false", "n", "no" (any case) => false; anything else => true.
bool string_to_boolean(std::optional<std::string_view> s, bool defv = false);

// Follows std::nested_exception links down to the innermost exception.
std::exception_ptr deepest_cause(std::exception_ptr e);

// what() of the exception, or a placeholder for non-std exceptions.
std::string exception_message(std::exception_ptr e);

// Reads the stream to exhaustion in DRAIN_CHUNK_BYTES chunks. Throws IoError on nullptr.
std::string drain(std::istream* in);

// Same, decoding the bytes to UTF-8.
std::string drain(std::istream* in, const CharsetDecoder& decoder);

// "file.xml" => "file". Unchanged when shorter than 3 chars or without a '.' past index 0.
std::optional<std::string> strip_extension(std::optional<std::string> name);

// Java-style trim: drops leading/trailing chars <= ' '.
std::string trim(std::string_view s);

std::string replace_first(std::string_view s, std::string_view what, std::string_view with);

// Every run of backslashes becomes a single '/'.
std::string normalize_slashes(std::string_view path);

// Percent-escapes a relative or absolute URI path per RFC 3986 (no scheme, no authority).
std::string escape_uri_path(std::string_view path);

} // namespace recload
