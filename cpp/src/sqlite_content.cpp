// recload/cpp/src/sqlite_content.cpp
#include "recload/sqlite_content.h"
#include "recload/errors.h"
#include "recload/log.h"
#include "recload/utilities.h"

#include <sqlite3.h>

#include <filesystem>

namespace recload {

namespace {

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

std::string column_string(sqlite3_stmt* st, int i) {
    const unsigned char* p = sqlite3_column_text(st, i);
    return p ? (const char*)p : "";
}

// Finalizes on scope exit, so every throw below leaves no statement behind.
struct Statement {
    sqlite3_stmt* st{nullptr};

    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

class SqliteContent : public Content {
public:
    SqliteContent(SqliteContentFactory* factory, std::string uri, DocumentFormat fmt,
                  std::vector<std::string> collections)
        : factory_(factory), uri_(std::move(uri)), format_(fmt), collections_(std::move(collections)) {}

    const std::string& uri() const override { return uri_; }

    bool check_document_uri(const std::string& uri) override {
        return factory_->exists(uri);
    }

    void set_payload(std::string bytes) override {
        payload_ = std::move(bytes);
    }

    void insert() override {
        if (!payload_) throw IoError("no payload for " + uri_);
        StoredDocument d;
        d.uri = uri_;
        d.format = format_name(format_);
        d.collections = join(collections_, ",");
        d.content = *payload_;
        d.bytes = (int64_t)payload_->size();
        d.inserted_at_utc = utc_now_iso();
        factory_->upsert(d);
    }

    void close() override {
        payload_.reset();
    }

private:
    SqliteContentFactory* factory_;
    std::string uri_;
    DocumentFormat format_;
    std::vector<std::string> collections_;
    std::optional<std::string> payload_;
};

} // namespace

SqliteContentFactory::~SqliteContentFactory() {
    close();
}

void SqliteContentFactory::set_connection_uri(const std::string& uri) {
    close();
    connection_uri_ = uri;
    path_ = uri.rfind("sqlite:", 0) == 0 ? uri.substr(7) : uri;
    if (path_.empty()) throw IoError("empty sqlite path in connection uri: " + uri);

    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    sqlite3* db = nullptr;
    if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw IoError("cannot open sqlite: " + path_ + " (" + msg + ")");
    }
    db_ = db;
    sqlite3_busy_timeout(db, 5000);
    try {
        init();
    } catch (const StoreError&) {
        close();
        throw;
    }
    log_debug("connected to sqlite:" + path_);
}

void SqliteContentFactory::init() {
    auto* db = (sqlite3*)db_;
    exec(db, R"SQL(
        PRAGMA journal_mode=WAL;
        PRAGMA synchronous=NORMAL;

        CREATE TABLE IF NOT EXISTS documents (
            uri TEXT NOT NULL PRIMARY KEY,
            format TEXT,
            collections TEXT,
            content BLOB,
            bytes INTEGER,
            inserted_at_utc TEXT
        );
    )SQL");
}

std::unique_ptr<Content> SqliteContentFactory::new_content(const std::string& uri, DocumentFormat fmt) {
    if (!db_) throw IoError("sqlite connection is not open");
    return std::make_unique<SqliteContent>(this, uri, fmt, collections());
}

void SqliteContentFactory::close() {
    if (!db_) return;
    sqlite3_close((sqlite3*)db_);
    db_ = nullptr;
}

bool SqliteContentFactory::exists(const std::string& uri) {
    if (!db_) throw IoError("sqlite connection is not open");
    auto* db = (sqlite3*)db_;
    Statement s(db, "SELECT 1 FROM documents WHERE uri=? LIMIT 1;");
    sqlite3_bind_text(s.st, 1, uri.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
}

void SqliteContentFactory::upsert(const StoredDocument& d) {
    if (!db_) throw IoError("sqlite connection is not open");
    auto* db = (sqlite3*)db_;
    Statement s(db, R"SQL(
        INSERT INTO documents(uri, format, collections, content, bytes, inserted_at_utc)
        VALUES(?,?,?,?,?,?)
        ON CONFLICT(uri) DO UPDATE SET
            format=excluded.format,
            collections=excluded.collections,
            content=excluded.content,
            bytes=excluded.bytes,
            inserted_at_utc=excluded.inserted_at_utc;
    )SQL");

    sqlite3_bind_text (s.st, 1, d.uri.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text (s.st, 2, d.format.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text (s.st, 3, d.collections.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob (s.st, 4, d.content.data(), (int)d.content.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int64(s.st, 5, d.bytes);
    sqlite3_bind_text (s.st, 6, d.inserted_at_utc.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(s.st) != SQLITE_DONE) {
        throw StoreError("sqlite insert failed for " + d.uri + ": " + sqlite3_errmsg(db));
    }
}

std::optional<StoredDocument> SqliteContentFactory::fetch(const std::string& uri) {
    if (!db_) throw IoError("sqlite connection is not open");
    auto* db = (sqlite3*)db_;
    Statement s(db, R"SQL(
        SELECT uri, format, collections, content, bytes, inserted_at_utc
        FROM documents WHERE uri=? LIMIT 1;
    )SQL");
    sqlite3_bind_text(s.st, 1, uri.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));

    StoredDocument d;
    d.uri = column_string(s.st, 0);
    d.format = column_string(s.st, 1);
    d.collections = column_string(s.st, 2);
    const void* blob = sqlite3_column_blob(s.st, 3);
    const int n = sqlite3_column_bytes(s.st, 3);
    if (blob && n > 0) d.content.assign((const char*)blob, (size_t)n);
    d.bytes = sqlite3_column_int64(s.st, 4);
    d.inserted_at_utc = column_string(s.st, 5);
    return d;
}

int64_t SqliteContentFactory::count() {
    if (!db_) throw IoError("sqlite connection is not open");
    auto* db = (sqlite3*)db_;
    Statement s(db, "SELECT COUNT(*) FROM documents;");
    if (sqlite3_step(s.st) != SQLITE_ROW) {
        throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    return sqlite3_column_int64(s.st, 0);
}

} // namespace recload
