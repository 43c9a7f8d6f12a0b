/*
 * Byte I/O adapters implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/term/io.hpp>
#include <unistd.h>
#include <cerrno>

namespace rawline {

ReadResult FdInput::read_byte() {
    ReadResult r;
    unsigned char c;
    while (true) {
        errno = 0;
        ssize_t n = ::read(m_fd, &c, 1);
        if (n == 1) { r.byte = c; return r; }
        if (n == 0) { r.status = ReadStatus::Eof; return r; }
        if (errno == EINTR) continue;
        r.status = ReadStatus::Failed;
        r.error = os_error(ErrorKind::ReadFailure, "unable to read from stdin");
        return r;
    }
}

MaybeError FdOutput::write(const std::string& bytes) {
    m_pending += bytes;
    if (m_pending.size() < kWriteThrough) return std::nullopt;
    return drain(ErrorKind::WriteFailure, "unable to write to stdout");
}

MaybeError FdOutput::flush() {
    return drain(ErrorKind::FlushFailure, "unable to flush stdout");
}

MaybeError FdOutput::drain(ErrorKind kind, const char* what) {
    std::size_t off = 0;
    while (off < m_pending.size()) {
        errno = 0;
        ssize_t n = ::write(m_fd, m_pending.data() + off, m_pending.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err = os_error(kind, what);
            m_pending.erase(0, off);
            return err;
        }
        off += static_cast<std::size_t>(n);
    }
    m_pending.clear();
    return std::nullopt;
}

ReadResult StreamInput::read_byte() {
    ReadResult r;
    char c;
    if (m_in.get(c)) { r.byte = static_cast<unsigned char>(c); return r; }
    if (m_in.eof()) { r.status = ReadStatus::Eof; return r; }
    r.status = ReadStatus::Failed;
    r.error = Error{ErrorKind::ReadFailure, "input stream failure"};
    return r;
}

} // namespace rawline
