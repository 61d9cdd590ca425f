#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct zip;

namespace recload {

// Rejects absolute names, backslashes, NULs and ".." segments.
bool zip_entry_name_is_safe(const std::string& name);

// Read-only zip archive shared by the loaders of its entries.
// libzip handles are not safe for concurrent reads, so reads are serialized.
class ZipArchive {
public:
    // Throws IoError if the archive cannot be opened or lists an unsafe entry.
    static std::shared_ptr<ZipArchive> open(const std::filesystem::path& p);

    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // File entries in archive order (directory entries are left out).
    const std::vector<std::string>& entry_names() const { return entries_; }

    // Throws IoError if the archive is closed or the entry cannot be read.
    std::string read_entry(const std::string& name);

    void close();
    bool is_open() const;

private:
    ZipArchive(std::filesystem::path p, struct zip* za);

    std::filesystem::path path_;
    mutable std::mutex mu_;
    struct zip* za_{nullptr};
    std::vector<std::string> entries_;
};

} // namespace recload
