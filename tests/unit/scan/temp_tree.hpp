#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace disksight::test
{

// A scratch directory under the system temp path, removed on destruction.
class TempTree
{
public:
    TempTree()
    {
        auto base = std::filesystem::temp_directory_path();
        std::random_device rd;
        std::mt19937_64 rng(rd());
        std::uniform_int_distribution<std::uint64_t> dist;
        do
        {
            rootPath = base / ("disksight_scan_test_" + std::to_string(dist(rng)));
        } while (std::filesystem::exists(rootPath));
        std::filesystem::create_directories(rootPath);
    }

    ~TempTree()
    {
        std::error_code ec;
        std::filesystem::remove_all(rootPath, ec);
    }

    TempTree(const TempTree &) = delete;
    TempTree &operator=(const TempTree &) = delete;

    const std::filesystem::path &root() const noexcept { return rootPath; }

    std::filesystem::path addDirectory(const std::string &relative)
    {
        auto path = rootPath / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    std::filesystem::path addFile(const std::string &relative, std::size_t bytes)
    {
        auto path = rootPath / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << std::string(bytes, 'x');
        return path;
    }

    std::filesystem::path addSymlink(const std::string &relative, const std::filesystem::path &target)
    {
        auto path = rootPath / relative;
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::create_symlink(target, path);
        return path;
    }

    std::filesystem::path addDirectorySymlink(const std::string &relative, const std::filesystem::path &target)
    {
        auto path = rootPath / relative;
        std::filesystem::create_directories(path.parent_path());
        std::filesystem::create_directory_symlink(target, path);
        return path;
    }

private:
    std::filesystem::path rootPath;
};

} // namespace disksight::test
