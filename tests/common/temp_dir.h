#pragma once

#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace civdl::test {

// Unique temporary directory, removed with its contents on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "civdl-test-") {
        auto base = std::filesystem::temp_directory_path();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        for (int i = 0; i < 5; ++i) {
            path_ = base / (prefix + std::to_string(dist(gen)));
            if (!std::filesystem::exists(path_)) {
                std::filesystem::create_directories(path_);
                break;
            }
        }
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace civdl::test
