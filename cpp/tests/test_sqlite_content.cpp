#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "recload/content.h"
#include "recload/errors.h"
#include "recload/fs_content.h"
#include "recload/loader.h"
#include "recload/sqlite_content.h"
#include "test_support.h"

using namespace recload;
using namespace test_support;
namespace fs = std::filesystem;

static std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void test_sqlite_insert_and_overwrite() {
    auto dir = mk_tmp_dir("sqlite");
    const std::string conn = "sqlite:" + (dir / "db" / "docs.sqlite").string();

    auto cfg = std::make_shared<Configuration>();
    cfg->set("output_collections", "batch1");

    SqliteContentFactory f;
    f.set_configuration(cfg);
    f.set_connection_uri(conn);
    assert(f.is_open());
    assert(f.connection_uri() == conn);
    assert(fs::exists(dir / "db" / "docs.sqlite"));

    auto c = f.new_content("/a/1.xml", DocumentFormat::Xml);
    assert(c->uri() == "/a/1.xml");
    assert(!c->check_document_uri("/a/1.xml"));
    c->set_payload("<one/>");
    c->insert();
    c->close();
    c->close();
    assert(c->check_document_uri("/a/1.xml"));

    auto d = f.fetch("/a/1.xml");
    assert(d.has_value());
    assert(d->content == "<one/>");
    assert(d->format == "xml");
    assert(d->collections == "batch1");
    assert(d->bytes == 6);
    assert(!d->inserted_at_utc.empty());

    // same uri again replaces the document
    auto c2 = f.new_content("/a/1.xml", DocumentFormat::Text);
    c2->set_payload("two");
    c2->insert();
    assert(f.count() == 1);
    assert(f.fetch("/a/1.xml")->content == "two");
    assert(f.fetch("/a/1.xml")->format == "text");
    assert(!f.fetch("/missing").has_value());

    // a second connection sees the same file
    SqliteContentFactory g;
    g.set_connection_uri(conn);
    assert(g.exists("/a/1.xml"));
    g.close();
    g.close();
    assert(!g.is_open());

    bool threw = false;
    try {
        (void)g.new_content("/x", DocumentFormat::Xml);
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);

    f.close();
    fs::remove_all(dir);
}

static void test_insert_without_payload() {
    SqliteContentFactory f;
    f.set_connection_uri("sqlite::memory:");
    auto c = f.new_content("u", DocumentFormat::Xml);
    bool threw = false;
    try {
        c->insert();
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);
}

static void test_bad_connection() {
    SqliteContentFactory f;
    bool threw = false;
    try {
        f.set_connection_uri("sqlite:");
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);
    assert(!f.is_open());
}

static void test_loader_against_sqlite() {
    auto dir = mk_tmp_dir("sqlite_loader");
    const std::string conn = "sqlite:" + (dir / "out.sqlite").string();

    auto cfg = field_id_config();
    cfg->set("loader", "jsonl");
    cfg->set("skip_existing", "true");
    cfg->set("use_filename_collection", "true");

    RecordingMonitor mon;
    {
        Loader l;
        l.set_configuration(cfg);
        l.set_monitor(&mon);
        l.set_file_basename(std::string("records.jsonl"));
        l.set_record_path("records.jsonl");
        l.set_connection_uri(conn);
        l.bind_input(test_data_file("records.jsonl"), utf8());

        LoadResult r = l.execute();
        // the fourth record has a null id
        assert(r.outcome == Outcome::RecordFatal);
        assert(r.error.message == "id may not be null");
        assert(r.committed == 3);
    }

    SqliteContentFactory check;
    check.set_connection_uri(conn);
    assert(check.count() == 3);
    auto r1 = check.fetch("records/r1");
    assert(r1.has_value());
    assert(r1->content == "<a>one</a>");
    assert(r1->collections == "records.jsonl");
    assert(check.fetch("records/r3")->format == "text");
    assert(check.fetch("records/2")->content == "{\"k\":[1,2]}");
    check.close();

    // second run: everything that was stored is skipped
    RecordingMonitor mon2;
    {
        Loader l;
        l.set_configuration(cfg);
        l.set_monitor(&mon2);
        l.set_file_basename(std::string("records.jsonl"));
        l.set_connection_uri(conn);
        l.bind_input(test_data_file("records.jsonl"), utf8());
        LoadResult r = l.execute();
        assert(r.committed == 0);
        assert(r.skipped == 3);
    }
    assert(mon2.skip_reasons.size() == 3);

    fs::remove_all(dir);
}

static void test_filesystem_store() {
    auto dir = mk_tmp_dir("fs_store");

    FilesystemContentFactory f;
    f.set_connection_uri("file://" + (dir / "out").string());
    assert(fs::is_directory(dir / "out"));
    assert(f.root() == dir / "out");

    auto c = f.new_content("/docs/a b.xml", DocumentFormat::Xml);
    assert(!c->check_document_uri("/docs/a b.xml"));
    c->set_payload("<a/>");
    c->insert();
    assert(read_file(dir / "out" / "docs" / "a b.xml") == "<a/>");
    assert(c->check_document_uri("/docs/a b.xml"));

    auto c2 = f.new_content("/docs/a b.xml", DocumentFormat::Xml);
    c2->set_payload("<b/>");
    c2->insert();
    assert(read_file(dir / "out" / "docs" / "a b.xml") == "<b/>");

    bool threw = false;
    try {
        (void)f.document_path("/../escape.xml");
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)f.document_path("///");
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);

    f.close();
    threw = false;
    try {
        (void)f.new_content("/x", DocumentFormat::Xml);
    } catch (const IoError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
}

static void test_factory_kinds() {
    assert(dynamic_cast<SqliteContentFactory*>(make_content_factory("sqlite").get()) != nullptr);
    assert(dynamic_cast<FilesystemContentFactory*>(make_content_factory("FileSystem").get()) != nullptr);

    bool threw = false;
    try {
        (void)make_content_factory("marklogic");
    } catch (const FatalError&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_sqlite_insert_and_overwrite();
    test_insert_without_payload();
    test_bad_connection();
    test_loader_against_sqlite();
    test_filesystem_store();
    test_factory_kinds();

    std::cout << "OK\n";
    return 0;
}
