#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fixtree::core {

  struct SerializeError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Little-endian integers and raw byte runs, no framing.
  class ByteWriter {
    public:
      void write_u8(uint8_t value) { out_.push_back(value); }

      void write_u32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) out_.push_back(static_cast<uint8_t>(value >> shift));
      }

      void write_raw(std::span<const uint8_t> bytes) { out_.insert(out_.end(), bytes.begin(), bytes.end()); }

      std::vector<uint8_t> take() { return std::move(out_); }

    private:
      std::vector<uint8_t> out_;
  };

  class ByteReader {
    public:
      explicit ByteReader(std::span<const uint8_t> src) : rest_(src) {}

      uint8_t read_u8() {
        require(1);
        uint8_t value = rest_[0];
        rest_ = rest_.subspan(1);
        return value;
      }

      uint32_t read_u32() {
        require(4);
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) value |= static_cast<uint32_t>(rest_[i]) << (8 * i);
        rest_ = rest_.subspan(4);
        return value;
      }

      // Fills out completely or throws.
      void read_raw(std::span<uint8_t> out) {
        require(out.size());
        std::copy_n(rest_.begin(), out.size(), out.begin());
        rest_ = rest_.subspan(out.size());
      }

      size_t remaining_bytes() const { return rest_.size(); }

    private:
      void require(size_t count) const {
        if (rest_.size() < count) throw SerializeError("deserialize: truncated buffer");
      }

      std::span<const uint8_t> rest_;
  };
}
