#include "ScratchDirectory.hpp"
#include <chrono>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <unistd.h>
#include <trantor/utils/Logger.h>

ScratchDirectory::ScratchDirectory(const std::string& prefix) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("No usable temp directory: " + ec.message());
    }
    std::mt19937_64 rng(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count())
                        ^ static_cast<uint64_t>(::getpid()));
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / (prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(rng() % 1000000000ULL));
        if (std::filesystem::create_directory(candidate, ec)) {
            dir_ = candidate;
            LOG_DEBUG << "Scratch directory " << dir_.string();
            return;
        }
        if (ec) {
            throw std::runtime_error("Cannot create scratch directory " + candidate.string() + ": " + ec.message());
        }
    }
    throw std::runtime_error("Cannot create a unique scratch directory under " + base.string());
}

ScratchDirectory::~ScratchDirectory() {
    release();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : dir_(std::exchange(other.dir_, std::filesystem::path())) {}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        release();
        dir_ = std::exchange(other.dir_, std::filesystem::path());
    }
    return *this;
}

const std::filesystem::path& ScratchDirectory::path() const {
    return dir_;
}

std::filesystem::path ScratchDirectory::file(const std::string& name) const {
    return dir_ / name;
}

std::filesystem::path ScratchDirectory::subdirectory(const std::string& name) const {
    auto dir = dir_ / name;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
    }
    return dir;
}

void ScratchDirectory::release() noexcept {
    if (dir_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        LOG_WARN << "Could not remove scratch directory " << dir_.string() << ": " << ec.message();
    } else {
        LOG_DEBUG << "Removed scratch directory " << dir_.string();
    }
    dir_.clear();
}
