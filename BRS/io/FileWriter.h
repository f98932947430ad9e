#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <mutex>

class FileWriter
{
public:
    FileWriter(const std::string& path, std::uint64_t fileSize);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Fails if the file already exists unless overwrite is set
    bool open(bool overwrite = false);
    bool write(std::uint64_t offset, const char* data, std::size_t size);
    bool flush();
    void close();

    // Writes a complete document in one go
    static bool writeWhole(const std::string& path, const char* data, std::size_t size);

    // Replaces path separators and control characters; never returns an empty name
    static std::string sanitizeFileName(const std::string& name);
    // <dir>/<base><ext>, or <dir>/<base> (n)<ext> for the first n that is free
    static std::string uniquePath(const std::string& dir, const std::string& base, const std::string& ext);

private:
    std::string filePath;
    std::uint64_t totalSize;

    std::mutex writeMutex;
    int fileHandle = -1;
};
