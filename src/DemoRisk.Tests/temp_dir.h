#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

/// @brief Temporary folder under the GoogleTest temp directory, removed on destruction
class TempDir {
  public:
    TempDir() : rnd_{std::random_device()()} {
        path_ = std::filesystem::path{::testing::TempDir()} / "demorisk" / random_string();
        if (!std::filesystem::create_directories(path_)) {
            throw std::runtime_error{"Could not create temp dir"};
        }

        path_ = std::filesystem::absolute(path_);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string random_string() const { return std::to_string(rnd_()); }

    const std::filesystem::path &path() const { return path_; }

    /// @brief Writes a text file inside the folder
    std::filesystem::path write_file(const std::string &file_name,
                                     const std::string &contents) const {
        auto file_path = path_ / file_name;
        std::ofstream ofs{file_path};
        ofs << contents;
        return file_path;
    }

  private:
    mutable std::mt19937 rnd_;
    std::filesystem::path path_;
};
