/*
 * Raw terminal mode - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <rawline/core/error.hpp>
#include <termios.h>
#include <ostream>

namespace rawline {

// Scoped terminal mode: acquire() before the first read, release() on the way out.
// release() must be safe to call when nothing was acquired or when already released.
class TerminalMode {
public:
    virtual ~TerminalMode() = default;
    virtual MaybeError acquire() = 0;
    virtual void release() = 0;
};

// Non-canonical, no echo, VMIN=1 VTIME=0 on a termios descriptor.
class PosixRawMode : public TerminalMode {
public:
    explicit PosixRawMode(int fd, std::ostream* trace = nullptr) : m_fd(fd), m_trace(trace) {}
    PosixRawMode(const PosixRawMode&) = delete;
    PosixRawMode& operator=(const PosixRawMode&) = delete;
    ~PosixRawMode() override { release(); }

    MaybeError acquire() override;
    void release() override;
    bool active() const { return m_raw; }
private:
    int m_fd;
    std::ostream* m_trace;
    bool m_raw = false;
    struct termios m_orig{};
};

// Used when input is not a terminal (pipes, files): nothing to switch.
class NoTerminalMode : public TerminalMode {
public:
    MaybeError acquire() override { return std::nullopt; }
    void release() override {}
};

} // namespace rawline
