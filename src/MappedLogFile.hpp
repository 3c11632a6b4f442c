#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

class MappingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only view of a whole file, released when the object goes away.
// Empty files are valid and produce an empty view without a mapping.
class MappedLogFile {
public:
    explicit MappedLogFile(const std::string& path);
    MappedLogFile(const MappedLogFile&) = delete;
    MappedLogFile& operator=(const MappedLogFile&) = delete;

    size_t size() const;
    const char* data() const;
    std::string_view view() const;
    const std::string& path() const;

private:
    std::string filePath;
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t segmentSize;
};
