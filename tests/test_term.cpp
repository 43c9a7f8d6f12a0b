/*
 * Terminal adapter tests - RawLine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <rawline/term/io.hpp>
#include <rawline/term/raw_mode.hpp>
#include <csignal>
#include <fstream>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

using namespace rawline;

static std::string slurp(const char* path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss; oss << in.rdbuf();
    return oss.str();
}

TEST(FdInput, ReadsBytesThenEof) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    ASSERT_EQ(::write(fds[1], "a\xc3", 2), 2);
    close(fds[1]);
    FdInput in(fds[0]);
    ReadResult a = in.read_byte();
    EXPECT_EQ(a.status, ReadStatus::Ok);
    EXPECT_EQ(a.byte, 'a');
    ReadResult b = in.read_byte();
    EXPECT_EQ(b.status, ReadStatus::Ok);
    EXPECT_EQ(b.byte, 0xC3);
    EXPECT_EQ(in.read_byte().status, ReadStatus::Eof);
    close(fds[0]);
}

TEST(FdInput, BadDescriptorIsReadFailure) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[0]); close(fds[1]);
    FdInput in(fds[0]);
    ReadResult r = in.read_byte();
    EXPECT_EQ(r.status, ReadStatus::Failed);
    EXPECT_EQ(r.error.kind, ErrorKind::ReadFailure);
    EXPECT_NE(r.error.message.find("unable to read from stdin"), std::string::npos);
}

TEST(StreamInput, EofAndFailureAreDistinct) {
    std::istringstream one("x");
    StreamInput in(one);
    ReadResult r = in.read_byte();
    EXPECT_EQ(r.status, ReadStatus::Ok);
    EXPECT_EQ(r.byte, 'x');
    EXPECT_EQ(in.read_byte().status, ReadStatus::Eof);

    std::istringstream broken("y");
    broken.setstate(std::ios::badbit);
    StreamInput bad(broken);
    ReadResult f = bad.read_byte();
    EXPECT_EQ(f.status, ReadStatus::Failed);
    EXPECT_EQ(f.error.kind, ErrorKind::ReadFailure);
}

TEST(FdOutput, BuffersUntilFlush) {
    const char* path = "/tmp/rawline_test_out";
    int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
    ASSERT_GE(fd, 0);
    FdOutput out(fd);
    ASSERT_FALSE(out.write("> ").has_value());
    ASSERT_FALSE(out.write("abc").has_value());
    EXPECT_EQ(slurp(path), "");
    ASSERT_FALSE(out.flush().has_value());
    EXPECT_EQ(slurp(path), "> abc");
    ASSERT_FALSE(out.flush().has_value()); // nothing pending
    EXPECT_EQ(slurp(path), "> abc");
    close(fd);
    unlink(path);
}

TEST(FdOutput, LargeBacklogWrittenThrough) {
    const char* path = "/tmp/rawline_test_out_big";
    int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
    ASSERT_GE(fd, 0);
    FdOutput out(fd);
    std::string chunk(FdOutput::kWriteThrough - 1, 'x');
    ASSERT_FALSE(out.write(chunk).has_value());
    EXPECT_TRUE(slurp(path).empty());
    ASSERT_FALSE(out.write("yz").has_value()); // crosses the threshold
    EXPECT_EQ(slurp(path), chunk + "yz");
    ASSERT_FALSE(out.flush().has_value());
    EXPECT_EQ(slurp(path).size(), FdOutput::kWriteThrough + 1);
    close(fd);
    unlink(path);
}

TEST(FdOutput, ClosedReaderReportsWriteAndFlushErrors) {
    auto old = std::signal(SIGPIPE, SIG_IGN);
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[0]);
    FdOutput out(fds[1]);

    ASSERT_FALSE(out.write("abc").has_value());
    auto flush_err = out.flush();
    ASSERT_TRUE(flush_err.has_value());
    EXPECT_EQ(flush_err->kind, ErrorKind::FlushFailure);
    EXPECT_NE(to_string(*flush_err).find("IO flush error"), std::string::npos);

    auto write_err = out.write(std::string(FdOutput::kWriteThrough, 'x'));
    ASSERT_TRUE(write_err.has_value());
    EXPECT_EQ(write_err->kind, ErrorKind::WriteFailure);
    EXPECT_NE(to_string(*write_err).find("IO write error"), std::string::npos);

    close(fds[1]);
    std::signal(SIGPIPE, old);
}

TEST(PosixRawMode, NonTerminalFailsToInitialize) {
    int fd = open("/dev/null", O_RDWR);
    ASSERT_GE(fd, 0);
    std::ostringstream trace;
    {
        PosixRawMode mode(fd, &trace);
        auto err = mode.acquire();
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->kind, ErrorKind::InitializationFailure);
        EXPECT_NE(err->message.find("tcgetattr"), std::string::npos);
        EXPECT_FALSE(mode.active());
        mode.release(); // nothing acquired, nothing to restore
        EXPECT_FALSE(mode.active());
    }
    EXPECT_TRUE(trace.str().empty());
    close(fd);
}

TEST(NoTerminalMode, AlwaysSucceeds) {
    NoTerminalMode mode;
    EXPECT_FALSE(mode.acquire().has_value());
    mode.release();
    mode.release();
}
