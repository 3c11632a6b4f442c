#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include <cstring>
#include <zlib.h>
#include "../src/ArchiveExtractor.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

struct TestEntry {
    std::string name;
    std::string content;
    bool deflate;
};

static void put16(std::string& out, uint16_t v) {
    out.push_back((char)(v & 0xff));
    out.push_back((char)((v >> 8) & 0xff));
}

static void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((char)((v >> (8 * i)) & 0xff));
}

static std::string raw_deflate(const std::string& in) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    std::string out(deflateBound(&zs, in.size()), '\0');
    zs.next_in = (Bytef*)in.data();
    zs.avail_in = (uInt)in.size();
    zs.next_out = (Bytef*)&out[0];
    zs.avail_out = (uInt)out.size();
    deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

// Minimal zip writer: local headers, central directory, end record.
static std::string build_zip(const std::vector<TestEntry>& entries) {
    std::string zip;
    std::string central;
    for (const auto& e : entries) {
        std::string payload = e.deflate ? raw_deflate(e.content) : e.content;
        uint32_t crc = (uint32_t)crc32(0L, (const Bytef*)e.content.data(), (uInt)e.content.size());
        uint16_t method = e.deflate ? 8 : 0;
        uint32_t offset = (uint32_t)zip.size();

        put32(zip, 0x04034b50); put16(zip, 20); put16(zip, 0); put16(zip, method);
        put16(zip, 0); put16(zip, 0); put32(zip, crc);
        put32(zip, (uint32_t)payload.size()); put32(zip, (uint32_t)e.content.size());
        put16(zip, (uint16_t)e.name.size()); put16(zip, 0);
        zip += e.name;
        zip += payload;

        put32(central, 0x02014b50); put16(central, 20); put16(central, 20); put16(central, 0);
        put16(central, method); put16(central, 0); put16(central, 0); put32(central, crc);
        put32(central, (uint32_t)payload.size()); put32(central, (uint32_t)e.content.size());
        put16(central, (uint16_t)e.name.size()); put16(central, 0); put16(central, 0);
        put16(central, 0); put16(central, 0); put32(central, 0); put32(central, offset);
        central += e.name;
    }
    uint32_t cdOffset = (uint32_t)zip.size();
    zip += central;
    put32(zip, 0x06054b50); put16(zip, 0); put16(zip, 0);
    put16(zip, (uint16_t)entries.size()); put16(zip, (uint16_t)entries.size());
    put32(zip, (uint32_t)central.size()); put32(zip, cdOffset);
    put16(zip, 0);
    return zip;
}

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << content;
}

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

int main() {
    auto tmpDir = fs::temp_directory_path() / "logdate_archive_test";
    try {
        fs::remove_all(tmpDir);
        fs::create_directories(tmpDir / "unpacked");

        std::string logs;
        for (int i = 0; i < 2000; ++i) {
            logs += (i < 1000 ? "2024-01-01" : "2024-01-02");
            logs += " 12:00:00 INFO request " + std::to_string(i) + " served\n";
        }

        // deflated entry behind a directory and a non-log entry
        auto zipPath = tmpDir / "logs.zip";
        write_file(zipPath, build_zip({
            {"readme.md", "not a log", false},
            {"data/", "", false},
            {"data/app.log", logs, true},
            {"other.txt", "second candidate", false},
        }));
        ASSERT_TRUE(detect_archive(zipPath) == ArchiveKind::Zip);

        auto entries = list_zip_entries(zipPath);
        ASSERT_TRUE(entries.size() == 4);
        ASSERT_TRUE(entries[1].isDirectory());
        const ZipEntry* chosen = find_log_entry(entries);
        ASSERT_TRUE(chosen != nullptr);
        ASSERT_TRUE(chosen->name == "data/app.log");
        ASSERT_TRUE(chosen->method == 8);

        auto out = materialize_log(zipPath, tmpDir / "unpacked");
        ASSERT_TRUE(out == tmpDir / "unpacked" / "app.log");
        ASSERT_TRUE(read_file(out) == logs);

        // stored entry
        auto storedZip = tmpDir / "stored.zip";
        write_file(storedZip, build_zip({{"server.txt", "2024-03-01 stored\n", false}}));
        auto storedOut = extract_zip_log(storedZip, tmpDir / "unpacked");
        ASSERT_TRUE(read_file(storedOut) == "2024-03-01 stored\n");

        // archive without a log entry
        auto noLog = tmpDir / "nolog.zip";
        write_file(noLog, build_zip({{"image.png", "....", false}}));
        bool threw = false;
        try {
            extract_zip_log(noLog, tmpDir / "unpacked");
        } catch (const ArchiveError& e) {
            threw = std::string(e.what()) == "No log file found in zip archive";
        }
        ASSERT_TRUE(threw);

        // corrupted payload is caught by the CRC check
        std::string bad = build_zip({{"bad.log", "2024-04-01 payload\n", false}});
        bad[30 + 7 + 3] ^= 0x01;
        auto badZip = tmpDir / "bad.zip";
        write_file(badZip, bad);
        threw = false;
        try {
            extract_zip_log(badZip, tmpDir / "unpacked");
        } catch (const ArchiveError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // truncated archive: no end of central directory record
        auto truncated = tmpDir / "truncated.zip";
        write_file(truncated, build_zip({{"t.log", logs, true}}).substr(0, 200));
        threw = false;
        try {
            extract_zip_log(truncated, tmpDir / "unpacked");
        } catch (const ArchiveError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // gzip
        auto gzPath = tmpDir / "service.log.gz";
        gzFile gz = gzopen(gzPath.string().c_str(), "wb");
        ASSERT_TRUE(gz != nullptr);
        ASSERT_TRUE(gzwrite(gz, logs.data(), (unsigned)logs.size()) == (int)logs.size());
        gzclose(gz);
        ASSERT_TRUE(detect_archive(gzPath) == ArchiveKind::Gzip);
        auto gzOut = materialize_log(gzPath, tmpDir / "unpacked");
        ASSERT_TRUE(gzOut.filename() == "service.log");
        ASSERT_TRUE(read_file(gzOut) == logs);

        // a zip that shares its name with the entry it holds is left intact
        auto sameDir = tmpDir / "same";
        fs::create_directories(sameDir / "unpacked");
        auto zipNamedLikeEntry = sameDir / "app.log";
        std::string sameZip = build_zip({{"app.log", logs, true}});
        write_file(zipNamedLikeEntry, sameZip);
        threw = false;
        try {
            materialize_log(zipNamedLikeEntry, sameDir);
        } catch (const ArchiveError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        ASSERT_TRUE(read_file(zipNamedLikeEntry) == sameZip);
        // unpacking next to it works
        auto sideOut = materialize_log(zipNamedLikeEntry, sameDir / "unpacked");
        ASSERT_TRUE(read_file(sideOut) == logs);

        // gzip without a .gz suffix would otherwise decompress onto itself
        auto gzNoSuffix = sameDir / "logs.txt";
        gz = gzopen(gzNoSuffix.string().c_str(), "wb");
        ASSERT_TRUE(gz != nullptr);
        ASSERT_TRUE(gzwrite(gz, logs.data(), (unsigned)logs.size()) == (int)logs.size());
        gzclose(gz);
        std::string gzBytes = read_file(gzNoSuffix);
        threw = false;
        try {
            materialize_log(gzNoSuffix, sameDir);
        } catch (const ArchiveError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        ASSERT_TRUE(read_file(gzNoSuffix) == gzBytes);
        auto gzSide = materialize_log(gzNoSuffix, sameDir / "unpacked");
        ASSERT_TRUE(read_file(gzSide) == logs);

        // plain files pass through untouched
        auto plain = tmpDir / "plain.log";
        write_file(plain, logs);
        ASSERT_TRUE(detect_archive(plain) == ArchiveKind::Plain);
        ASSERT_TRUE(materialize_log(plain, tmpDir / "unpacked") == plain);

        auto tiny = tmpDir / "tiny.log";
        write_file(tiny, "P");
        ASSERT_TRUE(detect_archive(tiny) == ArchiveKind::Plain);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    fs::remove_all(tmpDir);
    std::cout << "All archive extractor tests passed" << std::endl;
    return 0;
}
