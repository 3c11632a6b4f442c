#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ArchiveKind { Plain, Zip, Gzip };

struct ZipEntry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint64_t compressedSize = 0;
    uint64_t uncompressedSize = 0;
    uint64_t localHeaderOffset = 0;

    bool isDirectory() const { return !name.empty() && name.back() == '/'; }
};

// Sniffs the leading magic bytes; anything unrecognised is Plain.
ArchiveKind detect_archive(const std::filesystem::path& path);

// Central directory of a (non-ZIP64) zip archive, in archive order.
std::vector<ZipEntry> list_zip_entries(const std::filesystem::path& zipPath);

// First regular entry whose name ends in ".log" or ".txt".
const ZipEntry* find_log_entry(const std::vector<ZipEntry>& entries);

// Unpacks the log file of a zip archive into destDir (stored and deflate
// entries, CRC checked). Returns the written file.
std::filesystem::path extract_zip_log(const std::filesystem::path& zipPath, const std::filesystem::path& destDir);

// Decompresses a gzip file into destDir.
std::filesystem::path gunzip_log(const std::filesystem::path& gzPath, const std::filesystem::path& destDir);

// Returns a plain log file for 'path': the file itself when it is not an
// archive, otherwise the unpacked copy inside destDir.
std::filesystem::path materialize_log(const std::filesystem::path& path, const std::filesystem::path& destDir);
