#pragma once

#include <filesystem>
#include <utility>

// Removes the file at path when it goes out of scope. Removal errors are ignored.
class ScopedFile {
public:
    ScopedFile() = default;
    explicit ScopedFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedFile() { reset(); }

    ScopedFile(ScopedFile&& other) noexcept : path_(std::exchange(other.path_, {})) {}
    ScopedFile& operator=(ScopedFile&& other) noexcept {
        if (this != &other) {
            reset();
            path_ = std::exchange(other.path_, {});
        }
        return *this;
    }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void reset() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        path_.clear();
    }

private:
    std::filesystem::path path_;
};
