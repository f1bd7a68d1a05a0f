#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <span>
#include <utility>
#include <vector>
#include "connectable_transport.hpp"

namespace asyncmb {

/**
 * @brief Memory-based transport implementation for testing
 *
 * Reads come from an in-memory buffer the test appends to, writes are
 * collected for inspection. Connect results can be scripted and single read
 * or write failures injected to simulate a dropped link.
 */
class MemoryTransport : public ConnectableTransport {
 public:
  /** Called after each successful write, e.g. to queue the device's reply */
  using WriteHandler = std::function<void(std::span<const uint8_t>)>;

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (!open_) {
      return -1;
    }
    if (fail_next_read_) {
      fail_next_read_ = false;
      open_ = !drop_link_on_failure_;
      return -1;
    }
    if (read_pos_ >= read_buffer_.size()) {
      return 0;  // No data available
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override { return read_pos_ < read_buffer_.size(); }

  [[nodiscard]] size_t AvailableBytes() const override { return read_buffer_.size() - read_pos_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    if (!open_) {
      return -1;
    }
    if (fail_next_write_) {
      fail_next_write_ = false;
      open_ = !drop_link_on_failure_;
      return -1;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    frames_.emplace_back(data.begin(), data.end());
    if (write_handler_) {
      write_handler_(data);
    }
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return open_; }

  // ConnectableTransport interface
  [[nodiscard]] ConnectStatus Connect() override {
    ++connect_attempts_;
    ConnectStatus status = ConnectStatus::kConnected;
    if (!connect_results_.empty()) {
      status = connect_results_.front();
      connect_results_.pop_front();
    }
    open_ = status == ConnectStatus::kConnected;
    return status;
  }

  void Close() override {
    if (open_) {
      ++close_count_;
    }
    open_ = false;
  }

  [[nodiscard]] bool IsOpen() const override { return open_; }

  void DiscardInput() override {
    read_buffer_.clear();
    read_pos_ = 0;
    ++discard_count_;
  }

  // MemoryTransport-specific methods
  /**
   * @brief Queue bytes to be returned by Read()
   */
  void AppendReadData(std::span<const uint8_t> data) { read_buffer_.insert(read_buffer_.end(), data.begin(), data.end()); }

  /**
   * @brief Replace the unread data
   */
  void SetReadData(std::span<const uint8_t> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Results returned by the next Connect() calls, in order; kConnected once exhausted
   */
  void ScriptConnectResults(std::vector<ConnectStatus> results) {
    connect_results_.assign(results.begin(), results.end());
  }

  /** The next Read() fails; unless drop_link is false the link goes down with it */
  void FailNextRead(bool drop_link = true) {
    fail_next_read_ = true;
    drop_link_on_failure_ = drop_link;
  }

  /** The next Write() fails; unless drop_link is false the link goes down with it */
  void FailNextWrite(bool drop_link = true) {
    fail_next_write_ = true;
    drop_link_on_failure_ = drop_link;
  }

  void SetWriteHandler(WriteHandler handler) { write_handler_ = std::move(handler); }

  /**
   * @brief Get the data that was written via Write()
   */
  [[nodiscard]] std::span<const uint8_t> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  /** Each Write() call as a separate frame */
  [[nodiscard]] const std::vector<std::vector<uint8_t>> &GetWrittenFrames() const { return frames_; }

  /**
   * @brief Clear the write buffer
   */
  void ClearWriteBuffer() {
    write_buffer_.clear();
    frames_.clear();
  }

  [[nodiscard]] int GetConnectAttempts() const noexcept { return connect_attempts_; }
  [[nodiscard]] int GetCloseCount() const noexcept { return close_count_; }
  [[nodiscard]] int GetDiscardCount() const noexcept { return discard_count_; }

 private:
  std::vector<uint8_t> read_buffer_{};
  size_t read_pos_{0};
  std::vector<uint8_t> write_buffer_{};
  std::vector<std::vector<uint8_t>> frames_{};
  std::deque<ConnectStatus> connect_results_{};
  WriteHandler write_handler_{};
  bool open_{false};
  bool fail_next_read_{false};
  bool fail_next_write_{false};
  bool drop_link_on_failure_{true};
  int connect_attempts_{0};
  int close_count_{0};
  int discard_count_{0};
};

}  // namespace asyncmb
