#pragma once

// Socket and stream helpers shared by the bridge and serve commands.

#include <cerrno>
#include <cstring>
#include <iostream>
#include <streambuf>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>

namespace mixmaster {

inline bool is_socket(int fd) {
    struct stat st{};
    if (::fstat(fd, &st) != 0) return false;
    return S_ISSOCK(st.st_mode);
}

// Set socket recv/send timeouts so a stalled peer cannot hold the
// connection open forever. Failure is reported and otherwise tolerated.
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        std::cerr << "[mixmaster] setsockopt timeouts: " << std::strerror(errno) << "\n";
    }
}

// Buffered std::streambuf over a file descriptor, flushed on sync and on
// destruction. Reads and writes both go to fd; the descriptor is not owned.
class FdStreamBuf : public std::streambuf {
public:
    explicit FdStreamBuf(int fd) : fd_(fd) {
        setg(in_, in_, in_);
        setp(out_, out_ + sizeof(out_));
    }
    ~FdStreamBuf() override { sync(); }

    FdStreamBuf(const FdStreamBuf&) = delete;
    FdStreamBuf& operator=(const FdStreamBuf&) = delete;

protected:
    int_type underflow() override {
        if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
        ssize_t n;
        do {
            n = ::read(fd_, in_, sizeof(in_));
        } while (n < 0 && errno == EINTR);
        if (n <= 0) return traits_type::eof(); // timeout, error or peer closed
        setg(in_, in_, in_ + n);
        return traits_type::to_int_type(*gptr());
    }

    int_type overflow(int_type ch) override {
        if (flush_out() != 0) return traits_type::eof();
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(ch);
            pbump(1);
        }
        return traits_type::not_eof(ch);
    }

    int sync() override { return flush_out(); }

private:
    int flush_out() {
        char* p = pbase();
        while (p < pptr()) {
            ssize_t n = ::write(fd_, p, static_cast<size_t>(pptr() - p));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return -1;
            p += n;
        }
        setp(out_, out_ + sizeof(out_));
        return 0;
    }

    int fd_;
    char in_[8192];
    char out_[8192];
};

} // namespace mixmaster
