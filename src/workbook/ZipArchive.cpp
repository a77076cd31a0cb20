#include "ZipArchive.hpp"

#include <plog/Log.h>
#include <miniz.h>

#include <cstring>

namespace workbook
{

namespace
{

std::string lastZipError(mz_zip_archive& zip)
{
    const char* msg = mz_zip_get_error_string(mz_zip_get_last_error(&zip));
    return msg ? std::string(msg) : std::string("unknown zip error");
}

} // namespace

struct ZipArchive::Impl
{
    Impl() { std::memset(&zip, 0, sizeof(zip)); }

    mutable mz_zip_archive zip;
    bool open = false;
};

ZipArchive::ZipArchive()
    : impl_(std::make_unique<Impl>())
{
}

ZipArchive::~ZipArchive() { close(); }

bool ZipArchive::open(const std::string& path, std::string& outError)
{
    close();
    if (!mz_zip_reader_init_file(&impl_->zip, path.c_str(), 0))
    {
        outError = "Failed to open ZIP package: " + path + " (" + lastZipError(impl_->zip) + ")";
        std::memset(&impl_->zip, 0, sizeof(impl_->zip));
        return false;
    }
    impl_->open = true;
    PLOG_DEBUG << "Opened package " << path << " with " << fileCount() << " entries";
    return true;
}

void ZipArchive::close()
{
    if (impl_ && impl_->open)
    {
        mz_zip_reader_end(&impl_->zip);
        std::memset(&impl_->zip, 0, sizeof(impl_->zip));
        impl_->open = false;
    }
}

bool ZipArchive::isOpen() const { return impl_->open; }

int ZipArchive::fileCount() const
{
    if (!impl_->open)
        return 0;
    return static_cast<int>(mz_zip_reader_get_num_files(&impl_->zip));
}

std::string ZipArchive::fileName(int index) const
{
    if (!impl_->open)
        return {};
    mz_zip_archive_file_stat stat{};
    if (!mz_zip_reader_file_stat(&impl_->zip, static_cast<mz_uint>(index), &stat))
        return {};
    return stat.m_filename;
}

bool ZipArchive::contains(const std::string& name) const
{
    if (!impl_->open)
        return false;
    return mz_zip_reader_locate_file(&impl_->zip, name.c_str(), nullptr, 0) >= 0;
}

bool ZipArchive::read(const std::string& name, std::string& out) const
{
    if (!impl_->open)
        return false;

    const int index = mz_zip_reader_locate_file(&impl_->zip, name.c_str(), nullptr, 0);
    if (index < 0)
        return false;

    size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(&impl_->zip, static_cast<mz_uint>(index), &size, 0);
    if (!data)
    {
        PLOG_WARNING << "Failed to inflate " << name << ": " << lastZipError(impl_->zip);
        return false;
    }
    out.assign(static_cast<const char*>(data), size);
    mz_free(data);
    return true;
}

struct ZipWriter::Impl
{
    Impl() { std::memset(&zip, 0, sizeof(zip)); }

    mz_zip_archive zip;
    bool open = false;
};

ZipWriter::ZipWriter()
    : impl_(std::make_unique<Impl>())
{
}

ZipWriter::~ZipWriter()
{
    if (impl_->open)
        mz_zip_writer_end(&impl_->zip);
}

bool ZipWriter::open(const std::string& path, std::string& outError)
{
    if (!mz_zip_writer_init_file(&impl_->zip, path.c_str(), 0))
    {
        outError = "Cannot create " + path + " (" + lastZipError(impl_->zip) + ")";
        return false;
    }
    impl_->open = true;
    return true;
}

bool ZipWriter::add(const std::string& name, const std::string& data, std::string& outError)
{
    if (!mz_zip_writer_add_mem(&impl_->zip, name.c_str(), data.data(), data.size(), MZ_DEFAULT_COMPRESSION))
    {
        outError = "Cannot write entry " + name + " (" + lastZipError(impl_->zip) + ")";
        return false;
    }
    return true;
}

bool ZipWriter::copyFrom(const ZipArchive& source, int index, std::string& outError)
{
    if (!mz_zip_writer_add_from_zip_reader(&impl_->zip, &source.impl_->zip, static_cast<mz_uint>(index)))
    {
        outError = "Cannot copy entry " + source.fileName(index) + " (" + lastZipError(impl_->zip) + ")";
        return false;
    }
    return true;
}

bool ZipWriter::finalize(std::string& outError)
{
    if (!impl_->open)
    {
        outError = "Package is not open for writing";
        return false;
    }

    bool ok = mz_zip_writer_finalize_archive(&impl_->zip) != 0;
    if (!ok)
        outError = "Cannot finalize package (" + lastZipError(impl_->zip) + ")";

    if (!mz_zip_writer_end(&impl_->zip) && ok)
    {
        outError = "Cannot close package (" + lastZipError(impl_->zip) + ")";
        ok = false;
    }
    impl_->open = false;
    return ok;
}

} // namespace workbook
