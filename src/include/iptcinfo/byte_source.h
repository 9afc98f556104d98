#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>

/**
 * \file byte_source.h
 * \brief Seekable, read-only byte sources consumed by the IIM scanner/decoder.
 */

namespace iptcinfo {

/**
 * \brief Sequential reader with an explicit, seekable cursor.
 *
 * The cursor is state of the source, not of the decoder: one source must be
 * used by one caller at a time, but independent sources can be decoded
 * concurrently.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to `out.size()` bytes at the cursor and advances it.
    /// Returns the number of bytes read (short only at end of data or on error).
    virtual size_t read(std::span<std::byte> out) noexcept = 0;
    /// Moves the cursor to the absolute \p offset.
    virtual bool seek(uint64_t offset) noexcept = 0;
    /// Returns the current cursor position.
    virtual uint64_t tell() const noexcept = 0;
};

/// Byte source over caller-owned memory (e.g. a file loaded by the caller).
class SpanByteSource final : public ByteSource {
public:
    SpanByteSource() noexcept = default;
    explicit SpanByteSource(std::span<const std::byte> bytes) noexcept;

    size_t read(std::span<std::byte> out) noexcept override;
    /// Seeking past the end fails and leaves the cursor unchanged.
    bool seek(uint64_t offset) noexcept override;
    uint64_t tell() const noexcept override;

    std::span<const std::byte> bytes() const noexcept;

private:
    std::span<const std::byte> bytes_;
    uint64_t pos_ = 0;
};

/// Status code for \ref FileByteSource::open.
enum class FileOpenStatus : uint8_t {
    Ok,
    OpenFailed,
};

/**
 * \brief Byte source backed by a stdio file handle.
 *
 * Only the bytes actually requested are read, so probing a large file for
 * a missing IIM block costs at most one scan window.
 */
class FileByteSource final : public ByteSource {
public:
    FileByteSource() noexcept;
    ~FileByteSource() noexcept override;

    FileByteSource(const FileByteSource&)            = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    FileByteSource(FileByteSource&& other) noexcept;
    FileByteSource& operator=(FileByteSource&& other) noexcept;

    /// Opens \p path for binary reading, closing any previous file.
    FileOpenStatus open(const char* path) noexcept;
    /// Closes the file (idempotent).
    void close() noexcept;
    bool is_open() const noexcept;

    size_t read(std::span<std::byte> out) noexcept override;
    bool seek(uint64_t offset) noexcept override;
    uint64_t tell() const noexcept override;

private:
    std::FILE* file_ = nullptr;
    uint64_t pos_    = 0;
};

}  // namespace iptcinfo
