#include "FileWriter.h"

#include <filesystem>

#include <unistd.h>
#include <fcntl.h>

namespace fs = std::filesystem;

FileWriter::FileWriter(const std::string& path, std::uint64_t fileSize)
    : filePath(path), totalSize(fileSize) {
}

FileWriter::~FileWriter() {
    close();
}

bool FileWriter::open(bool overwrite) {
    int flags = O_WRONLY | O_CREAT;
    flags |= overwrite ? O_TRUNC : O_EXCL;
    const int mode = 0644;

    fileHandle = ::open(filePath.c_str(), flags, mode);
    if (fileHandle < 0)
        return false;

    // Pre-allocate file size
    if (totalSize > 0 && ::ftruncate(fileHandle, static_cast<off_t>(totalSize)) != 0) {
        close();
        return false;
    }

    return true;
}

bool FileWriter::write(std::uint64_t offset, const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    std::lock_guard<std::mutex> lock(writeMutex);

    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = ::pwrite(fileHandle, data + done, size - done,
            static_cast<off_t>(offset + done));
        if (n <= 0)
            return false;
        done += static_cast<std::size_t>(n);
    }
    return true;
}

bool FileWriter::flush() {
    if (fileHandle < 0)
        return false;
    return ::fsync(fileHandle) == 0;
}

void FileWriter::close() {
    if (fileHandle >= 0) {
        ::close(fileHandle);
        fileHandle = -1;
    }
}

bool FileWriter::writeWhole(const std::string& path, const char* data, std::size_t size) {
    FileWriter writer(path, size);
    if (!writer.open())
        return false;

    if (!writer.write(0, data, size) || !writer.flush()) {
        writer.close();
        std::error_code ec;
        fs::remove(path, ec);
        return false;
    }

    writer.close();
    return true;
}

std::string FileWriter::sanitizeFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());

    for (char ch : name) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F || ch == '/' || ch == '\\' || ch == ':'
            || ch == '*' || ch == '?' || ch == '"' || ch == '<' || ch == '>' || ch == '|')
            out.push_back('_');
        else
            out.push_back(ch);
    }

    // No leading dots or spaces, no trailing dots or spaces
    while (!out.empty() && (out.front() == '.' || out.front() == ' '))
        out.erase(out.begin());
    while (!out.empty() && (out.back() == ' ' || out.back() == '.'))
        out.pop_back();

    if (out.empty())
        out = "document";
    return out;
}

std::string FileWriter::uniquePath(const std::string& dir, const std::string& base, const std::string& ext) {
    const fs::path root(dir.empty() ? "." : dir);

    fs::path candidate = root / (base + ext);
    std::size_t n = 1;
    while (fs::exists(candidate)) {
        ++n;
        candidate = root / (base + " (" + std::to_string(n) + ")" + ext);
    }
    return candidate.string();
}
