// recload/cpp/src/record_reader.cpp
#include "recload/record_reader.h"
#include "recload/errors.h"
#include "recload/utilities.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace recload {

namespace {

std::string line_path(const std::optional<std::string>& record_path, size_t line_no) {
    return (record_path ? *record_path : std::string("<stream>")) + ":" + std::to_string(line_no);
}

// getline that drops a trailing '\r'; false at end of input
bool read_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) {
        if (in.bad()) throw IoError("read failed");
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if ((unsigned char)c > ' ') return false;
    }
    return true;
}

std::vector<std::string> split_fields(const std::string& line, char delim) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = line.find(delim, start);
        if (pos == std::string::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

} // namespace

// -------------------- WholeFileReader --------------------

WholeFileReader::WholeFileReader(std::istream& in, const CharsetDecoder& decoder, DocumentFormat fmt,
                                 std::optional<std::string> record_path)
    : in_(in), decoder_(decoder), format_(fmt), record_path_(std::move(record_path)) {}

bool WholeFileReader::next(Record& rec) {
    if (done_) return false;
    done_ = true;

    rec.id = record_path_;
    rec.path = record_path_ ? *record_path_ : std::string("<stream>");
    rec.format = format_;
    rec.payload = format_is_character_data(format_) ? drain(&in_, decoder_) : drain(&in_);
    return true;
}

// -------------------- JsonlReader --------------------

JsonlReader::JsonlReader(std::istream& in, const CharsetDecoder& decoder, std::string id_name,
                         std::string content_key, std::optional<std::string> record_path)
    : in_(in),
      decoder_(decoder),
      id_name_(std::move(id_name)),
      content_key_(std::move(content_key)),
      record_path_(std::move(record_path)),
      filename_ids_(id_name_ == Configuration::FILENAME_ID) {}

bool JsonlReader::next(Record& rec) {
    std::string raw;
    while (true) {
        if (!read_line(in_, raw)) return false;
        ++line_no_;
        if (!is_blank(raw)) break;
    }
    line_ = decoder_.decode(raw);
    rec.path = line_path(record_path_, line_no_);

    simdjson::dom::element doc;
    auto err = parser_.parse(line_).get(doc);
    if (err) {
        throw IoError("malformed JSON at " + rec.path + ": " + simdjson::error_message(err),
                      ErrorCode::ParseError);
    }
    if (!doc.is_object()) throw IoError("expected a JSON object at " + rec.path, ErrorCode::ParseError);

    // id
    rec.id.reset();
    if (filename_ids_) {
        rec.id = record_path_;
    } else {
        simdjson::dom::element v;
        if (!doc.at_key(id_name_).get(v)) {
            std::string_view sv;
            int64_t i = 0;
            uint64_t u = 0;
            if (!v.get(sv)) rec.id = std::string(sv);
            else if (!v.get(i)) rec.id = std::to_string(i);
            else if (!v.get(u)) rec.id = std::to_string(u);
            else if (!v.is_null()) {
                throw IoError("field " + id_name_ + " must be a string or integer at " + rec.path,
                              ErrorCode::ParseError);
            }
        }
    }

    // payload: strings as-is, anything else as minified JSON
    simdjson::dom::element body;
    if (doc.at_key(content_key_).get(body)) {
        throw IoError("missing field " + content_key_ + " at " + rec.path, ErrorCode::ParseError);
    }
    std::string_view body_sv;
    if (!body.get(body_sv)) rec.payload.assign(body_sv.data(), body_sv.size());
    else rec.payload = simdjson::minify(body);

    // optional per-record format
    rec.format = DocumentFormat::None;
    std::string_view fmt_sv;
    if (!doc.at_key("format").get(fmt_sv)) {
        try {
            rec.format = parse_format(std::string(fmt_sv));
        } catch (const std::invalid_argument& e) {
            throw IoError(std::string(e.what()) + " at " + rec.path, ErrorCode::ParseError);
        }
    }
    return true;
}

// -------------------- DelimitedReader --------------------

DelimitedReader::DelimitedReader(std::istream& in, const CharsetDecoder& decoder, DocumentFormat fmt,
                                 char delimiter, size_t id_index, std::optional<std::string> record_path)
    : in_(in),
      decoder_(decoder),
      format_(fmt),
      delim_(delimiter),
      id_index_(id_index),
      record_path_(std::move(record_path)) {}

bool DelimitedReader::next(Record& rec) {
    std::string raw;
    while (true) {
        if (!read_line(in_, raw)) return false;
        ++line_no_;
        if (!is_blank(raw)) break;
    }
    line_ = decoder_.decode(raw);
    rec.path = line_path(record_path_, line_no_);
    rec.format = format_;

    const std::vector<std::string> fields = split_fields(line_, delim_);
    rec.id.reset();
    if (id_index_ < fields.size()) rec.id = fields[id_index_];

    if (format_ == DocumentFormat::Text) {
        rec.payload = line_;
        return true;
    }

    std::string xml = "<record>";
    for (size_t i = 0; i < fields.size(); ++i) {
        const std::string tag = "f" + std::to_string(i);
        xml += "<" + tag + ">" + escape_xml(fields[i]) + "</" + tag + ">";
    }
    xml += "</record>";
    rec.payload = std::move(xml);
    return true;
}

// -------------------- factory --------------------

std::unique_ptr<RecordReader> make_record_reader(const Configuration& cfg,
                                                 std::istream& in,
                                                 const CharsetDecoder& decoder,
                                                 DocumentFormat fmt,
                                                 const std::optional<std::string>& record_path) {
    const std::string& kind = cfg.loader();
    if (kind == "file") {
        return std::make_unique<WholeFileReader>(in, decoder, fmt, record_path);
    }
    if (kind == "jsonl") {
        return std::make_unique<JsonlReader>(in, decoder, cfg.id_name(), cfg.content_key(), record_path);
    }
    if (kind == "delimited") {
        return std::make_unique<DelimitedReader>(in, decoder, fmt, cfg.field_delimiter(),
                                                 cfg.id_field_index(), record_path);
    }
    throw FatalError("unknown loader: " + kind);
}

} // namespace recload
