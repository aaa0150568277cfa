/**
 * @file stream.hpp
 * @brief Byte stream interfaces (Reader, Writer, Closer) and the concrete
 *        sinks and sources used with processes.
 *
 * A Writer may optionally expose a closing capability through AsCloser().
 * The query is virtual rather than dynamic_cast so the code stays usable
 * under -fno-rtti.
 *
 * Concrete types:
 *   - BufferWriter: thread-safe in-memory sink (closable)
 *   - StringReader: in-memory source
 *   - FdReader / FdWriter: blocking I/O on a POSIX file descriptor
 */

#ifndef SUBCMD_STREAM_HPP_
#define SUBCMD_STREAM_HPP_

#include "subcmd/platform.hpp"
#include "subcmd/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace subcmd {

// ============================================================================
// StreamError
// ============================================================================

enum class StreamError : uint8_t {
  kWriteFailed = 0,  ///< Destination rejected the write
  kShortWrite,       ///< Destination accepted fewer bytes than requested
  kReadFailed,       ///< Source reported a read error
  kCloseFailed,      ///< Destination failed to close
  kClosed,           ///< Operation on an already closed stream
};

inline constexpr const char* StreamErrorToString(StreamError e) noexcept {
  switch (e) {
    case StreamError::kWriteFailed:
      return "write failed";
    case StreamError::kShortWrite:
      return "short write";
    case StreamError::kReadFailed:
      return "read failed";
    case StreamError::kCloseFailed:
      return "close failed";
    case StreamError::kClosed:
      return "stream closed";
  }
  return "unknown";
}

// ============================================================================
// Interfaces
// ============================================================================

class Closer {
 public:
  virtual ~Closer() = default;
  virtual expected<void, StreamError> Close() = 0;
};

/**
 * @brief Destination for bytes.
 *
 * Write() returns the number of bytes accepted. Accepting fewer than
 * @p size bytes without an error is legal for an implementation, callers
 * decide whether that is a failure.
 */
class Writer {
 public:
  virtual ~Writer() = default;
  virtual expected<size_t, StreamError> Write(const void* data, size_t size) = 0;

  /// @brief Closing capability, nullptr when the writer cannot be closed.
  virtual Closer* AsCloser() noexcept { return nullptr; }
};

class WriteCloser : public Writer, public Closer {
 public:
  Closer* AsCloser() noexcept override { return this; }
};

/**
 * @brief Source of bytes. Read() returns 0 at end of stream.
 */
class Reader {
 public:
  virtual ~Reader() = default;
  virtual expected<size_t, StreamError> Read(void* buf, size_t size) = 0;
};

// ============================================================================
// BufferWriter
// ============================================================================

/**
 * @brief Growable in-memory sink, safe to read while another thread writes.
 *
 * Close() marks the buffer closed; later writes fail with kClosed.
 */
class BufferWriter final : public WriteCloser {
 public:
  BufferWriter() = default;

  BufferWriter(const BufferWriter&) = delete;
  BufferWriter& operator=(const BufferWriter&) = delete;

  expected<size_t, StreamError> Write(const void* data, size_t size) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return expected<size_t, StreamError>::error(StreamError::kClosed);
    }
    data_.append(static_cast<const char*>(data), size);
    return expected<size_t, StreamError>::success(size);
  }

  expected<void, StreamError> Close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    return expected<void, StreamError>::success();
  }

  /// @brief Snapshot of everything written so far.
  std::string Contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::string data_;
  bool closed_ = false;
};

// ============================================================================
// StringReader
// ============================================================================

class StringReader final : public Reader {
 public:
  explicit StringReader(std::string data) : data_(std::move(data)) {}

  expected<size_t, StreamError> Read(void* buf, size_t size) override {
    const size_t remaining = data_.size() - pos_;
    const size_t n = (size < remaining) ? size : remaining;
    if (n > 0) {
      std::memcpy(buf, data_.data() + pos_, n);
      pos_ += n;
    }
    return expected<size_t, StreamError>::success(n);
  }

 private:
  std::string data_;
  size_t pos_ = 0;
};

// ============================================================================
// FdReader / FdWriter
// ============================================================================

/**
 * @brief Blocking reader over a file descriptor. Closes the descriptor on
 *        destruction when constructed with @p owned == true.
 *
 * With a @p cancel_fd, Read() also polls that descriptor and reports end of
 * stream as soon as it becomes readable, even if data is still pending.
 */
class FdReader final : public Reader {
 public:
  explicit FdReader(int fd, bool owned = true, int cancel_fd = -1)
      : fd_(fd), owned_(owned), cancel_fd_(cancel_fd) {}

  ~FdReader() override {
    if (owned_ && fd_ >= 0) {
      ::close(fd_);  // NOLINT
    }
  }

  FdReader(const FdReader&) = delete;
  FdReader& operator=(const FdReader&) = delete;

  FdReader(FdReader&& other) noexcept
      : fd_(other.fd_), owned_(other.owned_), cancel_fd_(other.cancel_fd_) {
    other.fd_ = -1;
    other.owned_ = false;
    other.cancel_fd_ = -1;
  }

  expected<size_t, StreamError> Read(void* buf, size_t size) override {
    if (fd_ < 0) {
      return expected<size_t, StreamError>::error(StreamError::kClosed);
    }
    if (cancel_fd_ >= 0) {
      struct pollfd fds[2];
      fds[0].fd = fd_;
      fds[0].events = POLLIN;
      fds[1].fd = cancel_fd_;
      fds[1].events = POLLIN;
      for (;;) {
        fds[0].revents = 0;
        fds[1].revents = 0;
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
          if (errno == EINTR) continue;
          return expected<size_t, StreamError>::error(StreamError::kReadFailed);
        }
        if (fds[1].revents != 0) {
          return expected<size_t, StreamError>::success(0);
        }
        if (fds[0].revents != 0) break;
      }
    }
    for (;;) {
      ssize_t n = ::read(fd_, buf, size);
      if (n >= 0) {
        return expected<size_t, StreamError>::success(static_cast<size_t>(n));
      }
      if (errno != EINTR) {
        return expected<size_t, StreamError>::error(StreamError::kReadFailed);
      }
    }
  }

  int fd() const noexcept { return fd_; }

 private:
  int fd_;
  bool owned_;
  int cancel_fd_;
};

/**
 * @brief Blocking writer over a file descriptor. Write() loops until the
 *        whole buffer is written; Close() releases an owned descriptor.
 */
class FdWriter final : public WriteCloser {
 public:
  explicit FdWriter(int fd, bool owned = true) : fd_(fd), owned_(owned) {}

  ~FdWriter() override {
    if (owned_ && fd_ >= 0) {
      ::close(fd_);  // NOLINT
    }
  }

  FdWriter(const FdWriter&) = delete;
  FdWriter& operator=(const FdWriter&) = delete;

  expected<size_t, StreamError> Write(const void* data, size_t size) override {
    if (fd_ < 0) {
      return expected<size_t, StreamError>::error(StreamError::kClosed);
    }
    const char* p = static_cast<const char*>(data);
    size_t written = 0;
    while (written < size) {
      ssize_t n = ::write(fd_, p + written, size - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        return expected<size_t, StreamError>::error(StreamError::kWriteFailed);
      }
      written += static_cast<size_t>(n);
    }
    return expected<size_t, StreamError>::success(written);
  }

  /// @brief Closes an owned descriptor. A borrowed descriptor is left open.
  expected<void, StreamError> Close() override {
    if (!owned_ || fd_ < 0) {
      return expected<void, StreamError>::success();
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {  // NOLINT
      return expected<void, StreamError>::error(StreamError::kCloseFailed);
    }
    return expected<void, StreamError>::success();
  }

  int fd() const noexcept { return fd_; }

 private:
  int fd_;
  bool owned_;
};

}  // namespace subcmd

#endif  // SUBCMD_STREAM_HPP_
