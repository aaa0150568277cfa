/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file broadcaster.hpp
 * @brief Broadcaster - thread-safe fan-out writer.
 *
 * Replicates every Write() to all registered sinks in registration order
 * and cascades Close() to the sinks that can be closed.
 *
 *   Reader (pipe) --Copy()--> Broadcaster --+--> sink[0]
 *                                           +--> sink[1]
 *                                           +--> ...
 *
 * The sink list is append-only. Register(), Write() and Close() are
 * serialized by one mutex, so a sink registered mid-stream only sees the
 * bytes of writes that start after its registration returned.
 *
 * Sinks are borrowed: the Broadcaster never owns or deletes them.
 */

#ifndef SUBCMD_BROADCASTER_HPP_
#define SUBCMD_BROADCASTER_HPP_

#include "subcmd/platform.hpp"
#include "subcmd/stream.hpp"
#include "subcmd/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace subcmd {

class Broadcaster final : public WriteCloser {
 public:
  Broadcaster() = default;

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;
  Broadcaster(Broadcaster&&) = delete;
  Broadcaster& operator=(Broadcaster&&) = delete;

  /**
   * @brief Append a sink. The caller keeps @p sink alive for as long as the
   *        Broadcaster may write to it.
   */
  void Register(Writer* sink) {
    SUBCMD_ASSERT(sink != nullptr);
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(sink);
  }

  /**
   * @brief Write @p size bytes to every sink, in registration order.
   *
   * @return @p size on success. Otherwise the first failure, and the
   *         remaining sinks are not written for this call:
   *         - the sink's own error, returned unchanged;
   *         - kShortWrite if a sink accepted fewer bytes without an error.
   */
  expected<size_t, StreamError> Write(const void* data, size_t size) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Writer* sink : sinks_) {
      auto r = sink->Write(data, size);
      if (!r.has_value()) {
        return r;
      }
      if (SUBCMD_UNLIKELY(r.value() != size)) {
        return expected<size_t, StreamError>::error(StreamError::kShortWrite);
      }
    }
    return expected<size_t, StreamError>::success(size);
  }

  /**
   * @brief Close every closable sink in registration order.
   *
   * Sinks without a closing capability are skipped. Stops at the first
   * failing Close() and returns its error; later sinks stay open.
   */
  expected<void, StreamError> Close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (Writer* sink : sinks_) {
      Closer* closer = sink->AsCloser();
      if (closer == nullptr) {
        continue;
      }
      auto r = closer->Close();
      if (!r.has_value()) {
        return r;
      }
    }
    return expected<void, StreamError>::success();
  }

  /**
   * @brief Forward everything from @p source until end of stream, then Close().
   *
   * Close() runs even when the copy stopped early on a read or write
   * error. The copy error wins over the close result.
   */
  expected<void, StreamError> Copy(Reader& source) {
    auto buf = std::make_unique<char[]>(kCopyBufSize);
    optional<StreamError> copy_err;

    for (;;) {
      auto rd = source.Read(buf.get(), kCopyBufSize);
      if (!rd.has_value()) {
        copy_err = rd.get_error();
        break;
      }
      if (rd.value() == 0U) {
        break;
      }
      auto wr = Write(buf.get(), rd.value());
      if (!wr.has_value()) {
        copy_err = wr.get_error();
        break;
      }
    }

    auto closed = Close();
    if (copy_err.has_value()) {
      return expected<void, StreamError>::error(copy_err.value());
    }
    return closed;
  }

  uint32_t SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(sinks_.size());
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Writer*> sinks_;
};

}  // namespace subcmd

#endif  // SUBCMD_BROADCASTER_HPP_
