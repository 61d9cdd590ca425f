#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recload/config.h"
#include "recload/format.h"

namespace recload {

// One record bound for the store: payload plus destination metadata.
class Content {
public:
    virtual ~Content() = default;

    virtual const std::string& uri() const = 0;

    // true if a document is already stored under `uri`
    virtual bool check_document_uri(const std::string& uri) = 0;

    virtual void set_payload(std::string bytes) = 0;

    // Writes the document. Throws LoaderException (IoError/StoreError).
    virtual void insert() = 0;

    // Releases the payload. Safe to call more than once.
    virtual void close() = 0;
};

// Per-connection maker of Content handles. Owns the store connection;
// one instance per Loader.
class ContentFactory {
public:
    virtual ~ContentFactory() = default;

    virtual void set_configuration(std::shared_ptr<const Configuration> cfg);

    // Opens the connection. Throws LoaderException if it cannot.
    virtual void set_connection_uri(const std::string& uri) = 0;

    // Adds the file basename to the collections of every later document.
    virtual void set_file_basename(const std::string& name);

    virtual std::unique_ptr<Content> new_content(const std::string& uri, DocumentFormat fmt) = 0;

    // Closes the connection. Safe to call more than once.
    virtual void close() = 0;

    const std::string& connection_uri() const { return connection_uri_; }

protected:
    // configured output collections, plus the file basename when one was set
    std::vector<std::string> collections() const;

    std::shared_ptr<const Configuration> config_;
    std::string connection_uri_;
    std::optional<std::string> file_basename_;
};

// "sqlite" | "filesystem". Throws FatalError for anything else.
std::unique_ptr<ContentFactory> make_content_factory(const std::string& kind);

} // namespace recload
