#include "MappedLogFile.hpp"
#include <filesystem>
#include <system_error>
#include <boost/interprocess/exceptions.hpp>

namespace {

size_t checkedFileSize(const std::string& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw MappingError("Log file not found: " + path);
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw MappingError("Not a regular file: " + path);
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw MappingError("Cannot stat " + path + ": " + ec.message());
    }
    return static_cast<size_t>(size);
}

boost::interprocess::file_mapping openMapping(const std::string& path) {
    try {
        return boost::interprocess::file_mapping(path.c_str(), boost::interprocess::read_only);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw MappingError("Cannot open " + path + " for mapping: " + e.what());
    }
}

}

MappedLogFile::MappedLogFile(const std::string& path)
    : filePath(path),
      segmentSize(checkedFileSize(path)) {
    fileMapping = openMapping(path);
    // mapped_region refuses zero-length mappings
    if (segmentSize == 0) {
        return;
    }
    try {
        boost::interprocess::mapped_region mapped(fileMapping, boost::interprocess::read_only);
        region.swap(mapped);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw MappingError("Cannot map " + path + ": " + e.what());
    }
    // the file may have changed between stat and map
    segmentSize = region.get_size();
}

size_t MappedLogFile::size() const {
    return segmentSize;
}

const char* MappedLogFile::data() const {
    return static_cast<const char*>(region.get_address());
}

std::string_view MappedLogFile::view() const {
    if (segmentSize == 0) {
        return std::string_view();
    }
    return std::string_view(data(), segmentSize);
}

const std::string& MappedLogFile::path() const {
    return filePath;
}
