#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace stash::testing {

inline std::filesystem::path create_temp_dir(const std::string& prefix = "stash_test_") {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + std::to_string(::getpid()) + "_" + std::to_string(id));
    std::filesystem::create_directories(dir);
    return dir;
}

// Deterministic content: byte i is i % 251, so every range has a distinct shape
inline std::uint8_t pattern_byte(std::uint64_t offset) {
    return static_cast<std::uint8_t>(offset % 251);
}

inline std::string pattern_bytes(std::uint64_t start, std::uint64_t length) {
    std::string data;
    data.reserve(static_cast<std::size_t>(length));
    for (std::uint64_t i = 0; i < length; ++i) {
        data.push_back(static_cast<char>(pattern_byte(start + i)));
    }
    return data;
}

inline std::filesystem::path write_pattern_file(const std::filesystem::path& path, std::uint64_t size) {
    std::ofstream out(path, std::ios::binary);
    const auto data = pattern_bytes(0, size);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

inline std::filesystem::path write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
    return path;
}

} // namespace stash::testing
