/*
 * Byte I/O adapters - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <rawline/core/error.hpp>
#include <string>
#include <istream>
#include <cstddef>

namespace rawline {

enum class ReadStatus { Ok, Eof, Failed };

struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    unsigned char byte = 0;
    Error error{ErrorKind::ReadFailure, ""}; // meaningful only when Failed
};

// Delivers the input one byte at a time, blocking until a byte is available.
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual ReadResult read_byte() = 0;
};

// Terminal output. write() may buffer; flush() pushes everything out.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual MaybeError write(const std::string& bytes) = 0;
    virtual MaybeError flush() = 0;
};

// read(2) on a descriptor, one byte per call, EINTR retried.
class FdInput : public InputSource {
public:
    explicit FdInput(int fd) : m_fd(fd) {}
    ReadResult read_byte() override;
private:
    int m_fd;
};

// Collects writes in memory until flush() hands them to write(2); a backlog
// of kWriteThrough bytes is written out immediately.
class FdOutput : public OutputSink {
public:
    static constexpr std::size_t kWriteThrough = 4096;
    explicit FdOutput(int fd) : m_fd(fd) {}
    MaybeError write(const std::string& bytes) override;
    MaybeError flush() override;
private:
    MaybeError drain(ErrorKind kind, const char* what);
    int m_fd;
    std::string m_pending;
};

// Byte-delivering adapter over a buffered stream (pipes, files, non-POSIX consoles).
class StreamInput : public InputSource {
public:
    explicit StreamInput(std::istream& in) : m_in(in) {}
    ReadResult read_byte() override;
private:
    std::istream& m_in;
};

} // namespace rawline
