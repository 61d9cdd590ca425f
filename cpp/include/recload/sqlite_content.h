#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recload/content.h"

namespace recload {

struct StoredDocument {
    std::string uri;
    std::string format;
    std::string collections; // comma-separated
    std::string content;
    int64_t bytes{0};
    std::string inserted_at_utc;
};

// Documents go to one SQLite table; many connections may share a file (WAL).
// Connection URI: "sqlite:<path>" or a plain path.
class SqliteContentFactory : public ContentFactory {
public:
    SqliteContentFactory() = default;
    ~SqliteContentFactory() override;

    void set_connection_uri(const std::string& uri) override;
    std::unique_ptr<Content> new_content(const std::string& uri, DocumentFormat fmt) override;
    void close() override;

    bool is_open() const { return db_ != nullptr; }

    bool exists(const std::string& uri);
    void upsert(const StoredDocument& d);
    std::optional<StoredDocument> fetch(const std::string& uri);
    int64_t count();

private:
    void init();

    void* db_{nullptr}; // sqlite3*
    std::string path_;
};

} // namespace recload
