#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "recload/content.h"

namespace recload {

// Writes each document to <root>/<uri>. Connection URI: "file:<dir>".
class FilesystemContentFactory : public ContentFactory {
public:
    void set_connection_uri(const std::string& uri) override;
    std::unique_ptr<Content> new_content(const std::string& uri, DocumentFormat fmt) override;
    void close() override;

    const std::filesystem::path& root() const { return root_; }

    // Target path of a document; throws IoError for URIs that would leave the root.
    std::filesystem::path document_path(const std::string& uri) const;

private:
    std::filesystem::path root_;
    bool open_{false};
};

} // namespace recload
