// recload/cpp/include/recload/record_reader.h
#pragma once
#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include <simdjson.h>

#include "recload/charset.h"
#include "recload/config.h"
#include "recload/format.h"

namespace recload {

// One logical document found in a work unit.
struct Record {
    std::optional<std::string> id; // raw identifier as found in the input
    std::string path;              // where it came from, for diagnostics
    std::string payload;           // UTF-8 for xml/text, untouched for binary
    DocumentFormat format{DocumentFormat::None}; // None => the loader's format
};

// Record discovery for one input format.
class RecordReader {
public:
    virtual ~RecordReader() = default;

    // false once the input is exhausted. Throws IoError on malformed input.
    virtual bool next(Record& rec) = 0;
};

// The whole work unit is one record, identified by its record path.
class WholeFileReader : public RecordReader {
public:
    WholeFileReader(std::istream& in, const CharsetDecoder& decoder, DocumentFormat fmt,
                    std::optional<std::string> record_path);

    bool next(Record& rec) override;

private:
    std::istream& in_;
    const CharsetDecoder& decoder_;
    DocumentFormat format_;
    std::optional<std::string> record_path_;
    bool done_{false};
};

// One JSON object per line: {"<id_name>": ..., "<content_key>": ..., "format": ...}
class JsonlReader : public RecordReader {
public:
    JsonlReader(std::istream& in, const CharsetDecoder& decoder, std::string id_name,
                std::string content_key, std::optional<std::string> record_path);

    bool next(Record& rec) override;

    size_t line_number() const { return line_no_; }

private:
    std::istream& in_;
    const CharsetDecoder& decoder_;
    std::string id_name_;
    std::string content_key_;
    std::optional<std::string> record_path_;
    bool filename_ids_;
    simdjson::dom::parser parser_;
    std::string line_;
    size_t line_no_{0};
};

// One record per delimited line; the id is the field at `id_index`.
class DelimitedReader : public RecordReader {
public:
    DelimitedReader(std::istream& in, const CharsetDecoder& decoder, DocumentFormat fmt,
                    char delimiter, size_t id_index, std::optional<std::string> record_path);

    bool next(Record& rec) override;

private:
    std::istream& in_;
    const CharsetDecoder& decoder_;
    DocumentFormat format_;
    char delim_;
    size_t id_index_;
    std::optional<std::string> record_path_;
    std::string line_;
    size_t line_no_{0};
};

// Picks the reader named by cfg.loader(): "file" | "jsonl" | "delimited".
std::unique_ptr<RecordReader> make_record_reader(const Configuration& cfg,
                                                 std::istream& in,
                                                 const CharsetDecoder& decoder,
                                                 DocumentFormat fmt,
                                                 const std::optional<std::string>& record_path);

} // namespace recload
