#pragma once

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <shared/Sha256.hpp>
#include <string>
#include <vector>

// Deterministic pseudo random bytes.
inline std::vector<uint8_t> makeBytes(const std::size_t size,
                                      const uint32_t seed = 42) {
    std::mt19937 engine(seed);
    std::vector<uint8_t> bytes(size);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(engine() & 0xFF);
    }
    return bytes;
}

inline std::string sha256Hex(const std::vector<uint8_t>& bytes) {
    const auto digest = FileTransfer::Sha256::compute(bytes.data(), bytes.size());
    return digest ? FileTransfer::Sha256::toHex(*digest) : std::string();
}

inline void writeFile(const std::filesystem::path& path,
                      const std::vector<uint8_t>& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

inline std::optional<std::vector<uint8_t>> readFile(
    const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(ifs),
                                std::istreambuf_iterator<char>());
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
   public:
    TempDir() {
        const auto* info = testing::UnitTest::GetInstance()->current_test_info();
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("filetransfer_" +
                 std::string(info != nullptr ? info->name() : "test") + "_" +
                 std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

   private:
    std::filesystem::path path_;
};
