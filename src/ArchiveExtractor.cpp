#include "ArchiveExtractor.hpp"
#include "MappedLogFile.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <system_error>
#include <utility>
#include <zlib.h>
#include <trantor/utils/Logger.h>

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;
constexpr size_t kChunkSize = 256 * 1024;

uint16_t le16(const char* p) {
    const unsigned char* u = reinterpret_cast<const unsigned char*>(p);
    return static_cast<uint16_t>(u[0] | (u[1] << 8));
}

uint32_t le32(const char* p) {
    const unsigned char* u = reinterpret_cast<const unsigned char*>(p);
    return static_cast<uint32_t>(u[0]) | (static_cast<uint32_t>(u[1]) << 8) |
           (static_cast<uint32_t>(u[2]) << 16) | (static_cast<uint32_t>(u[3]) << 24);
}

bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

size_t find_end_of_central_dir(const MappedLogFile& zip) {
    const char* data = zip.data();
    size_t size = zip.size();
    if (size < kEndOfCentralDirSize) {
        throw ArchiveError("Not a zip archive (too short): " + zip.path());
    }
    size_t lowest = size - kEndOfCentralDirSize > kMaxCommentSize ? size - kEndOfCentralDirSize - kMaxCommentSize : 0;
    for (size_t pos = size - kEndOfCentralDirSize + 1; pos-- > lowest;) {
        if (le32(data + pos) == kEndOfCentralDirSig) {
            return pos;
        }
    }
    throw ArchiveError("End of central directory not found: " + zip.path());
}

// Opening the output truncates it, so it must never be the archive being read.
void ensure_distinct(const std::filesystem::path& in, const std::filesystem::path& out) {
    std::error_code ec;
    bool same = std::filesystem::exists(out, ec) && std::filesystem::equivalent(in, out, ec);
    if (ec) {
        same = std::filesystem::weakly_canonical(in, ec) == std::filesystem::weakly_canonical(out, ec);
    }
    if (same) {
        throw ArchiveError("Unpacked file would overwrite its archive: " + out.string());
    }
}

std::ofstream open_output(const std::filesystem::path& out) {
    std::ofstream ofs(out, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw ArchiveError("Cannot create " + out.string());
    }
    return ofs;
}

void write_chunk(std::ofstream& ofs, const char* data, size_t len, const std::filesystem::path& out) {
    ofs.write(data, static_cast<std::streamsize>(len));
    if (!ofs) {
        throw ArchiveError("Write failed: " + out.string());
    }
}

uLong crc_update(uLong crc, const char* data, size_t len) {
    while (len > 0) {
        uInt n = static_cast<uInt>(std::min<size_t>(len, kChunkSize));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), n);
        data += n;
        len -= n;
    }
    return crc;
}

uint64_t copy_stored(const char* src, size_t len, std::ofstream& ofs, const std::filesystem::path& out, uLong& crc) {
    for (size_t done = 0; done < len;) {
        size_t n = std::min(kChunkSize, len - done);
        write_chunk(ofs, src + done, n, out);
        crc = crc_update(crc, src + done, n);
        done += n;
    }
    return len;
}

uint64_t inflate_raw(const char* src, size_t len, std::ofstream& ofs, const std::filesystem::path& out, uLong& crc) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw ArchiveError("inflateInit2 failed");
    }
    std::vector<char> buf(kChunkSize);
    uint64_t total = 0;
    size_t consumed = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0 && consumed < len) {
            size_t n = std::min<size_t>(len - consumed, 0x40000000);
            zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src + consumed));
            zs.avail_in = static_cast<uInt>(n);
            consumed += n;
        }
        zs.next_out = reinterpret_cast<Bytef*>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "error " + std::to_string(rc);
            inflateEnd(&zs);
            if (rc == Z_BUF_ERROR) {
                throw ArchiveError("Truncated deflate stream in " + out.filename().string());
            }
            throw ArchiveError("Inflate failed for " + out.filename().string() + ": " + msg);
        }
        size_t produced = buf.size() - zs.avail_out;
        if (produced > 0) {
            try {
                write_chunk(ofs, buf.data(), produced, out);
            } catch (...) {
                inflateEnd(&zs);
                throw;
            }
            crc = crc_update(crc, buf.data(), produced);
            total += produced;
        }
    }
    inflateEnd(&zs);
    return total;
}

}

ArchiveKind detect_archive(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArchiveError("Cannot open " + path.string());
    }
    std::array<char, 4> magic{};
    in.read(magic.data(), magic.size());
    std::streamsize got = in.gcount();
    if (got >= 4 && le32(magic.data()) == kLocalHeaderSig) {
        return ArchiveKind::Zip;
    }
    if (got >= 2 && static_cast<unsigned char>(magic[0]) == 0x1f && static_cast<unsigned char>(magic[1]) == 0x8b) {
        return ArchiveKind::Gzip;
    }
    return ArchiveKind::Plain;
}

std::vector<ZipEntry> list_zip_entries(const std::filesystem::path& zipPath) {
    MappedLogFile zip(zipPath.string());
    const char* data = zip.data();
    size_t size = zip.size();

    size_t eocd = find_end_of_central_dir(zip);
    uint16_t count = le16(data + eocd + 10);
    uint32_t cdSize = le32(data + eocd + 12);
    uint32_t cdOffset = le32(data + eocd + 16);
    if (count == 0xFFFF || cdSize == 0xFFFFFFFF || cdOffset == 0xFFFFFFFF) {
        throw ArchiveError("ZIP64 archives are not supported: " + zipPath.string());
    }
    if (static_cast<uint64_t>(cdOffset) + cdSize > eocd) {
        throw ArchiveError("Central directory out of bounds: " + zipPath.string());
    }

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    size_t pos = cdOffset;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > size || le32(data + pos) != kCentralHeaderSig) {
            throw ArchiveError("Corrupt central directory entry " + std::to_string(i) + " in " + zipPath.string());
        }
        ZipEntry e;
        e.flags = le16(data + pos + 8);
        e.method = le16(data + pos + 10);
        e.crc = le32(data + pos + 16);
        e.compressedSize = le32(data + pos + 20);
        e.uncompressedSize = le32(data + pos + 24);
        uint16_t nameLen = le16(data + pos + 28);
        uint16_t extraLen = le16(data + pos + 30);
        uint16_t commentLen = le16(data + pos + 32);
        e.localHeaderOffset = le32(data + pos + 42);
        if (pos + kCentralHeaderSize + nameLen > size) {
            throw ArchiveError("Corrupt entry name in " + zipPath.string());
        }
        e.name.assign(data + pos + kCentralHeaderSize, nameLen);
        entries.push_back(std::move(e));
        pos += kCentralHeaderSize + nameLen + extraLen + commentLen;
    }
    return entries;
}

const ZipEntry* find_log_entry(const std::vector<ZipEntry>& entries) {
    for (const auto& e : entries) {
        if (e.isDirectory()) continue;
        if (ends_with(e.name, ".log") || ends_with(e.name, ".txt")) {
            return &e;
        }
    }
    return nullptr;
}

std::filesystem::path extract_zip_log(const std::filesystem::path& zipPath, const std::filesystem::path& destDir) {
    auto entries = list_zip_entries(zipPath);
    const ZipEntry* entry = find_log_entry(entries);
    if (!entry) {
        throw ArchiveError("No log file found in zip archive");
    }
    if (entry->flags & 0x0001) {
        throw ArchiveError("Encrypted zip entries are not supported: " + entry->name);
    }
    if (entry->method != 0 && entry->method != Z_DEFLATED) {
        throw ArchiveError("Unsupported compression method " + std::to_string(entry->method) + " for " + entry->name);
    }
    std::string baseName = std::filesystem::path(entry->name).filename().string();
    if (baseName.empty() || baseName == "." || baseName == "..") {
        throw ArchiveError("Unusable entry name: " + entry->name);
    }
    LOG_INFO << "Extracting " << entry->name << " (" << entry->uncompressedSize << " bytes)";

    MappedLogFile zip(zipPath.string());
    const char* data = zip.data();
    size_t size = zip.size();
    size_t lh = entry->localHeaderOffset;
    if (lh + kLocalHeaderSize > size || le32(data + lh) != kLocalHeaderSig) {
        throw ArchiveError("Corrupt local header for " + entry->name);
    }
    size_t dataStart = lh + kLocalHeaderSize + le16(data + lh + 26) + le16(data + lh + 28);
    if (dataStart > size || entry->compressedSize > size - dataStart) {
        throw ArchiveError("Entry data out of bounds: " + entry->name);
    }

    std::filesystem::path out = destDir / baseName;
    ensure_distinct(zipPath, out);
    std::ofstream ofs = open_output(out);
    uLong crc = crc32(0L, Z_NULL, 0);
    const char* src = data + dataStart;
    size_t len = static_cast<size_t>(entry->compressedSize);
    uint64_t written = entry->method == 0 ? copy_stored(src, len, ofs, out, crc)
                                          : inflate_raw(src, len, ofs, out, crc);
    ofs.close();
    if (!ofs) {
        throw ArchiveError("Write failed: " + out.string());
    }
    if (written != entry->uncompressedSize) {
        throw ArchiveError("Size mismatch for " + entry->name + ": expected " +
                           std::to_string(entry->uncompressedSize) + ", got " + std::to_string(written));
    }
    if (static_cast<uint32_t>(crc) != entry->crc) {
        throw ArchiveError("CRC mismatch for " + entry->name);
    }
    return out;
}

std::filesystem::path gunzip_log(const std::filesystem::path& gzPath, const std::filesystem::path& destDir) {
    std::string name = gzPath.filename().string();
    if (ends_with(name, ".gz") && name.size() > 3) {
        name.resize(name.size() - 3);
    } else {
        name = "logs.txt";
    }
    std::filesystem::path out = destDir / name;
    ensure_distinct(gzPath, out);

    gzFile gz = gzopen(gzPath.string().c_str(), "rb");
    if (!gz) {
        throw ArchiveError("Cannot open " + gzPath.string());
    }
    LOG_INFO << "Decompressing " << gzPath.filename().string();

    std::vector<char> buf(kChunkSize);
    uint64_t total = 0;
    try {
        std::ofstream ofs = open_output(out);
        int n = 0;
        while ((n = gzread(gz, buf.data(), static_cast<unsigned>(buf.size()))) > 0) {
            write_chunk(ofs, buf.data(), static_cast<size_t>(n), out);
            total += static_cast<uint64_t>(n);
        }
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz, &errnum);
            throw ArchiveError("gzip read failed for " + gzPath.string() + ": " + (msg ? msg : "unknown error"));
        }
        ofs.close();
        if (!ofs) {
            throw ArchiveError("Write failed: " + out.string());
        }
    } catch (...) {
        gzclose(gz);
        throw;
    }
    gzclose(gz);
    LOG_DEBUG << "Decompressed " << total << " bytes into " << out.string();
    return out;
}

std::filesystem::path materialize_log(const std::filesystem::path& path, const std::filesystem::path& destDir) {
    switch (detect_archive(path)) {
        case ArchiveKind::Zip:
            return extract_zip_log(path, destDir);
        case ArchiveKind::Gzip:
            return gunzip_log(path, destDir);
        case ArchiveKind::Plain:
            break;
    }
    return path;
}
