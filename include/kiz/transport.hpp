/**
 * @file transport.hpp
 * @brief Byte streams to the headset and length-prefixed frame assembly.
 *
 * - ByteStream: abstract bidirectional stream (Read with timeout, Write,
 *   Close).
 * - FdStream: any POSIX descriptor (socketpair, pipe, tty) driven by poll().
 * - SerialStream: opens a tty path such as /dev/rfcomm0 in raw 8N1 mode.
 * - FrameAssembler: turns arbitrary read chunks into complete Frames and
 *   resynchronises after garbage or oversize headers.
 *
 * POSIX only (termios + poll + read/write). Header-only, C++17.
 */

#ifndef KIZ_TRANSPORT_HPP_
#define KIZ_TRANSPORT_HPP_

#include "kiz/codec.hpp"
#include "kiz/log.hpp"
#include "kiz/platform.hpp"
#include "kiz/vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#if defined(KIZ_PLATFORM_LINUX) || defined(KIZ_PLATFORM_MACOS)
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace kiz {

// ============================================================================
// ByteStream
// ============================================================================

/**
 * @brief Already-connected bidirectional byte stream.
 *
 * Read() returns the number of bytes read, 0 when @p timeout_ms elapsed with
 * nothing to read, or TransportError::kClosed once the peer hung up.
 * Implementations need not be thread-safe; Session serialises writers and
 * owns the only reader.
 */
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  virtual expected<uint32_t, TransportError> Read(uint8_t* buf, uint32_t cap,
                                                  int32_t timeout_ms) = 0;
  virtual expected<void, TransportError> Write(const uint8_t* data,
                                               uint32_t len) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

// ============================================================================
// FdStream
// ============================================================================

class FdStream : public ByteStream {
 public:
  /// Takes ownership of @p fd; the descriptor is switched to non-blocking.
  explicit FdStream(int fd = -1, uint32_t write_timeout_ms = 1000U) noexcept
      : fd_(fd), write_timeout_ms_(write_timeout_ms) {
    if (fd_ >= 0) SetNonBlocking(fd_);
  }

  ~FdStream() override { Close(); }

  FdStream(const FdStream&) = delete;
  FdStream& operator=(const FdStream&) = delete;

  expected<uint32_t, TransportError> Read(uint8_t* buf, uint32_t cap,
                                          int32_t timeout_ms) override {
    using R = expected<uint32_t, TransportError>;
    if (fd_ < 0) return R::error(TransportError::kNotOpen);

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return R::success(0U);
    if (pr < 0) {
      return (errno == EINTR) ? R::success(0U)
                              : R::error(TransportError::kReadFailed);
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0 &&
        (pfd.revents & POLLIN) == 0) {
      return R::error(TransportError::kReadFailed);
    }

    // POLLHUP with buffered data still reads; the next read returns 0.
    const ssize_t n = ::read(fd_, buf, cap);
    if (n > 0) return R::success(static_cast<uint32_t>(n));
    if (n == 0) return R::error(TransportError::kClosed);
    const int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
      return R::success(0U);
    }
    // A pty master reports EIO once the slave side is gone.
    return R::error(err == EIO ? TransportError::kClosed
                               : TransportError::kReadFailed);
  }

  expected<void, TransportError> Write(const uint8_t* data,
                                       uint32_t len) override {
    using R = expected<void, TransportError>;
    if (fd_ < 0) return R::error(TransportError::kNotOpen);
    uint32_t written = 0U;
    while (written < len) {
      const ssize_t n = WriteSome(data + written, len - written);
      if (n >= 0) {
        written += static_cast<uint32_t>(n);
        continue;
      }
      const int err = errno;
      if (err == EINTR) continue;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (::poll(&pfd, 1, static_cast<int>(write_timeout_ms_)) <= 0) {
          return R::error(TransportError::kWriteFailed);
        }
        continue;
      }
      return R::error((err == EPIPE || err == ECONNRESET)
                          ? TransportError::kClosed
                          : TransportError::kWriteFailed);
    }
    return R::success();
  }

  void Close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool IsOpen() const override { return fd_ >= 0; }

  int GetFd() const noexcept { return fd_; }

 protected:
  static void SetNonBlocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  int fd_;

 private:
  /// send() with MSG_NOSIGNAL so a vanished socket peer is an error, not
  /// SIGPIPE; plain write() for pipes and ttys.
  ssize_t WriteSome(const uint8_t* data, uint32_t len) noexcept {
#ifdef MSG_NOSIGNAL
    if (is_socket_ != 0) {
      const ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
      if (n >= 0 || errno != ENOTSOCK) {
        is_socket_ = 1;
        return n;
      }
      is_socket_ = 0;
    }
#endif
    return ::write(fd_, data, len);
  }

  uint32_t write_timeout_ms_;
  int is_socket_ = -1;  ///< -1 unknown, 0 no, 1 yes
};

// ============================================================================
// SerialStream
// ============================================================================

struct SerialConfig {
  std::string port = "/dev/rfcomm0";
  uint32_t baud_rate = 115200U;
  uint32_t write_timeout_ms = 1000U;
};

/**
 * @brief tty-backed stream (RFCOMM device node or any serial port).
 *
 * The port is put into raw mode: 8 data bits, no parity, one stop bit, no
 * flow control, VMIN=0/VTIME=0 (reads are paced by poll()).
 */
class SerialStream final : public FdStream {
 public:
  explicit SerialStream(const SerialConfig& cfg)
      : FdStream(-1, cfg.write_timeout_ms), cfg_(cfg) {}

  expected<void, TransportError> Open() {
    using R = expected<void, TransportError>;
    if (fd_ >= 0) return R::success();

    fd_ = ::open(cfg_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      KIZ_LOG_WARN("Serial", "open %s failed: %s", cfg_.port.c_str(),
                   std::strerror(errno));
      return R::error(TransportError::kOpenFailed);
    }
    auto r = ConfigurePort();
    if (!r) {
      KIZ_LOG_WARN("Serial", "configure %s failed", cfg_.port.c_str());
      Close();
      return r;
    }
    KIZ_LOG_DEBUG("Serial", "opened %s at %u baud", cfg_.port.c_str(),
                  cfg_.baud_rate);
    return R::success();
  }

  const SerialConfig& GetConfig() const noexcept { return cfg_; }

  static bool IsSupportedBaud(uint32_t baud) noexcept {
    speed_t unused;
    return BaudToSpeed(baud, unused);
  }

 private:
  expected<void, TransportError> ConfigurePort() {
    using R = expected<void, TransportError>;
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));
    if (::tcgetattr(fd_, &tio) != 0) {
      return R::error(TransportError::kConfigFailed);
    }

    tio.c_iflag &= static_cast<tcflag_t>(
        ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON |
          IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CS8 | CLOCAL | CREAD);
#ifdef CRTSCTS
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    speed_t speed = B115200;
    if (!BaudToSpeed(cfg_.baud_rate, speed)) {
      KIZ_LOG_WARN("Serial", "unsupported baud %u, using 115200",
                   cfg_.baud_rate);
    }
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return R::error(TransportError::kConfigFailed);
    }
    ::tcflush(fd_, TCIOFLUSH);
    return R::success();
  }

  static bool BaudToSpeed(uint32_t baud, speed_t& out) noexcept {
    switch (baud) {
      case 9600U:   out = B9600;   return true;
      case 19200U:  out = B19200;  return true;
      case 38400U:  out = B38400;  return true;
      case 57600U:  out = B57600;  return true;
      case 115200U: out = B115200; return true;
      case 230400U: out = B230400; return true;
#ifdef B460800
      case 460800U: out = B460800; return true;
#endif
#ifdef B921600
      case 921600U: out = B921600; return true;
#endif
      default:
        out = B115200;
        return false;
    }
  }

  SerialConfig cfg_;
};

// ============================================================================
// FrameAssembler
// ============================================================================

struct FramerStats {
  uint64_t frames = 0;
  uint64_t oversize_frames = 0;
  uint64_t bad_headers = 0;
  uint64_t bytes_discarded = 0;
};

/**
 * @brief Reassembles frames from a byte stream.
 *
 * A header is plausible when the type is known, the length fits the type
 * (exactly 3 for a handshake, 7..max for data) and a data frame carries the
 * protocol version byte. An implausible header is reported once, then bytes
 * are dropped one at a time until a plausible header appears.
 *
 * Single-threaded: owned by the session reader loop.
 */
class FrameAssembler {
 public:
  enum class Status : uint8_t {
    kFrame,     ///< @p out holds a complete frame.
    kNeedMore,  ///< Feed more bytes.
    kError,     ///< @p err set; resynchronisation has started.
  };

  explicit FrameAssembler(uint32_t max_frame_size = kDefaultMaxFrameSize)
      : max_frame_size_(max_frame_size < kMinDataFrameSize ? kMinDataFrameSize
                                                           : max_frame_size) {
    buf_.reserve(max_frame_size_ * 2U);
  }

  void Feed(const uint8_t* data, uint32_t len) {
    buf_.insert(buf_.end(), data, data + len);
  }

  Status Next(Frame& out, FrameError& err) {
    for (;;) {
      const size_t avail = buf_.size() - pos_;
      if (avail < kFrameHeaderSize) {
        Compact();
        return Status::kNeedMore;
      }
      const uint8_t* h = buf_.data() + pos_;
      const uint16_t len = ReadBe16(h);
      const uint8_t type = h[2];

      bool plausible = false;
      FrameError why = FrameError::kBadHeader;
      if (type == static_cast<uint8_t>(FrameType::kHandshake)) {
        plausible = len == kFrameHeaderSize;
      } else if (type == static_cast<uint8_t>(FrameType::kData)) {
        if (len > max_frame_size_) {
          why = FrameError::kFrameTooLarge;
        } else if (len >= kMinDataFrameSize) {
          if (avail < kFrameHeaderSize + 1U) {
            Compact();
            return Status::kNeedMore;
          }
          plausible = h[3] == kProtocolVersion;
        }
      }

      if (!plausible) {
        ++pos_;
        ++stats_.bytes_discarded;
        if (!resyncing_) {
          resyncing_ = true;
          if (why == FrameError::kFrameTooLarge) {
            ++stats_.oversize_frames;
          } else {
            ++stats_.bad_headers;
          }
          err = why;
          return Status::kError;
        }
        continue;
      }

      if (avail < len) {
        Compact();
        return Status::kNeedMore;
      }
      out.type = static_cast<FrameType>(type);
      out.bytes.assign(h, h + len);
      pos_ += len;
      resyncing_ = false;
      ++stats_.frames;
      return Status::kFrame;
    }
  }

  /// Bytes buffered but not yet returned as a frame.
  size_t Buffered() const noexcept { return buf_.size() - pos_; }

  void Reset() noexcept {
    buf_.clear();
    pos_ = 0;
    resyncing_ = false;
  }

  uint32_t MaxFrameSize() const noexcept { return max_frame_size_; }
  const FramerStats& Stats() const noexcept { return stats_; }

 private:
  void Compact() {
    if (pos_ == 0U) return;
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = 0;
  }

  std::vector<uint8_t> buf_;
  size_t pos_ = 0;
  uint32_t max_frame_size_;
  bool resyncing_ = false;
  FramerStats stats_;
};

}  // namespace kiz

#endif  // KIZ_TRANSPORT_HPP_
