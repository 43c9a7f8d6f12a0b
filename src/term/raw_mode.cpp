/*
 * Raw terminal mode implementation - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <rawline/term/raw_mode.hpp>
#include <unistd.h>
#include <cerrno>
#include <cstdio>

namespace rawline {

MaybeError PosixRawMode::acquire() {
    if (m_raw) return std::nullopt;
    struct termios t;
    errno = 0;
    if (tcgetattr(m_fd, &t) != 0)
        return os_error(ErrorKind::InitializationFailure, "tcgetattr");
    m_orig = t;
    t.c_lflag &= ~(ICANON | ECHO);
    t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
    if (tcsetattr(m_fd, TCSANOW, &t) != 0)
        return os_error(ErrorKind::InitializationFailure, "tcsetattr");
    m_raw = true;
    if (m_trace) *m_trace << "[rawline] raw mode on (fd " << m_fd << ")\r\n";
    return std::nullopt;
}

void PosixRawMode::release() {
    if (!m_raw) return;
    if (tcsetattr(m_fd, TCSANOW, &m_orig) != 0) perror("rawline: restore terminal");
    m_raw = false;
    if (m_trace) *m_trace << "[rawline] raw mode off\n";
}

} // namespace rawline
