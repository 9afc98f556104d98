#include "iptcinfo/byte_source.h"

#include <cstring>
#include <limits>
#include <utility>

namespace iptcinfo {

SpanByteSource::SpanByteSource(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


size_t
SpanByteSource::read(std::span<std::byte> out) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes_.size());
    if (pos_ >= size || out.empty()) {
        return 0;
    }
    const uint64_t avail = size - pos_;
    const size_t n       = (avail < out.size()) ? static_cast<size_t>(avail)
                                                : out.size();
    std::memcpy(out.data(), bytes_.data() + static_cast<size_t>(pos_), n);
    pos_ += n;
    return n;
}


bool
SpanByteSource::seek(uint64_t offset) noexcept
{
    if (offset > static_cast<uint64_t>(bytes_.size())) {
        return false;
    }
    pos_ = offset;
    return true;
}


uint64_t
SpanByteSource::tell() const noexcept
{
    return pos_;
}


std::span<const std::byte>
SpanByteSource::bytes() const noexcept
{
    return bytes_;
}


FileByteSource::FileByteSource() noexcept = default;


FileByteSource::~FileByteSource() noexcept
{
    close();
}


FileByteSource::FileByteSource(FileByteSource&& other) noexcept
{
    *this = std::move(other);
}


FileByteSource&
FileByteSource::operator=(FileByteSource&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

    file_       = other.file_;
    pos_        = other.pos_;
    other.file_ = nullptr;
    other.pos_  = 0;
    return *this;
}


FileOpenStatus
FileByteSource::open(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return FileOpenStatus::OpenFailed;
    }
    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return FileOpenStatus::OpenFailed;
    }
    file_ = f;
    pos_  = 0;
    return FileOpenStatus::Ok;
}


void
FileByteSource::close() noexcept
{
    if (file_) {
        (void)std::fclose(file_);
    }
    file_ = nullptr;
    pos_  = 0;
}


bool
FileByteSource::is_open() const noexcept
{
    return file_ != nullptr;
}


size_t
FileByteSource::read(std::span<std::byte> out) noexcept
{
    if (!file_ || out.empty()) {
        return 0;
    }
    const size_t n = std::fread(out.data(), 1, out.size(), file_);
    pos_ += n;
    return n;
}


bool
FileByteSource::seek(uint64_t offset) noexcept
{
    if (!file_) {
        return false;
    }
    if (offset > static_cast<uint64_t>(std::numeric_limits<long>::max())) {
        return false;
    }
    if (std::fseek(file_, static_cast<long>(offset), SEEK_SET) != 0) {
        return false;
    }
    pos_ = offset;
    return true;
}


uint64_t
FileByteSource::tell() const noexcept
{
    return pos_;
}

}  // namespace iptcinfo
