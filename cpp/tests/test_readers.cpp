#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "recload/charset.h"
#include "recload/config.h"
#include "recload/errors.h"
#include "recload/record_reader.h"
#include "test_support.h"

using namespace recload;
using namespace test_support;

static void test_jsonl_file() {
    std::ifstream in(test_data_file("records.jsonl"), std::ios::binary);
    assert(in);
    auto dec = utf8();
    JsonlReader r(in, *dec, "id", "content", std::string("records.jsonl"));

    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("r1"));
    assert(rec.payload == "<a>one</a>");
    assert(rec.format == DocumentFormat::None);
    assert(rec.path == "records.jsonl:1");

    assert(r.next(rec));
    assert(rec.id == std::string("2"));
    assert(rec.payload == "{\"k\":[1,2]}");

    // blank line 3 is skipped
    assert(r.next(rec));
    assert(rec.id == std::string("r3"));
    assert(rec.format == DocumentFormat::Text);
    assert(rec.path == "records.jsonl:4");

    assert(r.next(rec));
    assert(!rec.id.has_value());
    assert(rec.payload == "<nil/>");

    assert(!r.next(rec));
    assert(r.line_number() == 5);
}

static void test_jsonl_errors() {
    auto dec = utf8();
    {
        std::istringstream in("{\"id\": \"a\", \"content\": \"x\"}\n{not json\n");
        JsonlReader r(in, *dec, "id", "content", std::string("bad.jsonl"));
        Record rec;
        assert(r.next(rec));
        bool threw = false;
        try {
            (void)r.next(rec);
        } catch (const IoError& e) {
            threw = true;
            assert(e.code() == ErrorCode::ParseError);
            assert(std::string(e.what()).find("malformed JSON at bad.jsonl:2") == 0);
        }
        assert(threw);
    }
    {
        std::istringstream in("{\"id\": \"a\"}\n");
        JsonlReader r(in, *dec, "id", "content", std::nullopt);
        Record rec;
        bool threw = false;
        try {
            (void)r.next(rec);
        } catch (const IoError& e) {
            threw = true;
            assert(std::string(e.what()) == "missing field content at <stream>:1");
        }
        assert(threw);
    }
    {
        std::istringstream in("{\"id\": 1.5, \"content\": \"x\"}\n");
        JsonlReader r(in, *dec, "id", "content", std::nullopt);
        Record rec;
        bool threw = false;
        try {
            (void)r.next(rec);
        } catch (const IoError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        std::istringstream in("[1, 2]\n");
        JsonlReader r(in, *dec, "id", "content", std::nullopt);
        Record rec;
        bool threw = false;
        try {
            (void)r.next(rec);
        } catch (const IoError& e) {
            threw = true;
            assert(e.code() == ErrorCode::ParseError);
        }
        assert(threw);
    }
}

static void test_jsonl_filename_ids() {
    auto dec = utf8();
    std::istringstream in("{\"body\": \"<x/>\"}\n");
    JsonlReader r(in, *dec, Configuration::FILENAME_ID, "body", std::string("dir/one.jsonl"));
    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("dir/one.jsonl"));
    assert(rec.payload == "<x/>");
}

static void test_jsonl_decodes_input() {
    auto latin1 = CharsetDecoder::for_name("latin1");
    std::istringstream in(std::string("{\"id\": \"caf\xE9\", \"content\": \"\xE9t\xE9\"}\n"));
    JsonlReader r(in, *latin1, "id", "content", std::nullopt);
    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("caf\xC3\xA9"));
    assert(rec.payload == "\xC3\xA9t\xC3\xA9");
}

static void test_delimited_file() {
    std::ifstream in(test_data_file("records.csv"), std::ios::binary);
    assert(in);
    auto dec = utf8();
    DelimitedReader r(in, *dec, DocumentFormat::Xml, ',', 0, std::string("records.csv"));

    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("k1"));
    assert(rec.payload == "<record><f0>k1</f0><f1>Ann</f1><f2>a &lt; b</f2></record>");
    assert(rec.format == DocumentFormat::Xml);

    assert(r.next(rec));
    assert(rec.id == std::string("k2"));
    assert(rec.payload == "<record><f0>k2</f0><f1>Bob</f1><f2>x &amp; y</f2></record>");
    assert(rec.path == "records.csv:3");

    assert(!r.next(rec));
}

static void test_delimited_text_and_index() {
    auto dec = utf8();
    std::istringstream in("a\tb\tc\nonly\n");
    DelimitedReader r(in, *dec, DocumentFormat::Text, '\t', 2, std::nullopt);

    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("c"));
    assert(rec.payload == "a\tb\tc");

    // too few fields: no id, the loader rejects the record
    assert(r.next(rec));
    assert(!rec.id.has_value());
    assert(!r.next(rec));
}

static void test_whole_file() {
    auto dec = utf8();
    std::istringstream in("<doc>\n  body\n</doc>\n");
    WholeFileReader r(in, *dec, DocumentFormat::Xml, std::string("d/doc.xml"));
    Record rec;
    assert(r.next(rec));
    assert(rec.id == std::string("d/doc.xml"));
    assert(rec.payload == "<doc>\n  body\n</doc>\n");
    assert(!r.next(rec));

    // binary payloads are not decoded
    std::istringstream raw(std::string("\xFF\xFE", 2));
    WholeFileReader b(raw, *dec, DocumentFormat::Binary, std::string("blob.bin"));
    assert(b.next(rec));
    assert(rec.payload == std::string("\xFF\xFE", 2));

    std::istringstream bad(std::string("\xFF\xFE", 2));
    WholeFileReader x(bad, *dec, DocumentFormat::Xml, std::string("bad.xml"));
    bool threw = false;
    try {
        (void)x.next(rec);
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);
}

static void test_factory_selects_reader() {
    auto dec = utf8();
    Configuration cfg;
    cfg.set("loader", "delimited");
    cfg.set("field_delimiter", "|");
    cfg.set("id_field_index", "1");

    std::istringstream in("x|y\n");
    auto r = make_record_reader(cfg, in, *dec, DocumentFormat::Text, std::nullopt);
    Record rec;
    assert(r->next(rec));
    assert(rec.id == std::string("y"));

    Configuration jl;
    jl.set("loader", "jsonl");
    jl.set("id_name", "key");
    jl.set("content_key", "doc");
    std::istringstream in2("{\"key\": \"k\", \"doc\": \"d\"}\n");
    auto r2 = make_record_reader(jl, in2, *dec, DocumentFormat::Xml, std::nullopt);
    assert(r2->next(rec));
    assert(rec.id == std::string("k"));
    assert(rec.payload == "d");

    Configuration bad;
    bad.set("loader", "parquet");
    bool threw = false;
    try {
        (void)make_record_reader(bad, in, *dec, DocumentFormat::Xml, std::nullopt);
    } catch (const FatalError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_jsonl_file();
    test_jsonl_errors();
    test_jsonl_filename_ids();
    test_jsonl_decodes_input();
    test_delimited_file();
    test_delimited_text_and_index();
    test_whole_file();
    test_factory_selects_reader();

    std::cout << "OK\n";
    return 0;
}
