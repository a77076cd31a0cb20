#pragma once

#include <memory>
#include <string>

namespace workbook
{

/// Read-only view of a ZIP package (miniz)
class ZipArchive
{
public:
    ZipArchive();
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    bool open(const std::string& path, std::string& outError);
    void close();
    bool isOpen() const;

    int fileCount() const;
    std::string fileName(int index) const;
    bool contains(const std::string& name) const;

    // false if the entry is missing or cannot be inflated
    bool read(const std::string& name, std::string& out) const;

private:
    friend class ZipWriter;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Writes a new ZIP package, copying untouched entries from a ZipArchive
class ZipWriter
{
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    bool open(const std::string& path, std::string& outError);
    bool add(const std::string& name, const std::string& data, std::string& outError);
    bool copyFrom(const ZipArchive& source, int index, std::string& outError);

    // Writes the central directory and closes the file
    bool finalize(std::string& outError);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace workbook
