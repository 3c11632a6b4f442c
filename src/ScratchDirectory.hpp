#pragma once
#include <filesystem>
#include <string>

// Unique working directory under the system temp directory, removed with
// everything in it when the owner goes out of scope.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix = "logdate");
    ~ScratchDirectory();

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const;
    std::filesystem::path file(const std::string& name) const;
    // Creates (if needed) and returns a directory inside the scratch area.
    std::filesystem::path subdirectory(const std::string& name) const;

private:
    void release() noexcept;

    std::filesystem::path dir_;
};
