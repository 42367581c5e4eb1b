#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace puresend::core {

// Big-endian encoding helpers shared by the wire protocol and persisted blobs.
class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& buffer) : buffer_(buffer) {}

    void write_uint8(std::uint8_t value) {
        buffer_.push_back(value);
    }

    void write_uint16(std::uint16_t value) {
        buffer_.push_back((value >> 8) & 0xFF);
        buffer_.push_back(value & 0xFF);
    }

    void write_uint32(std::uint32_t value) {
        buffer_.push_back((value >> 24) & 0xFF);
        buffer_.push_back((value >> 16) & 0xFF);
        buffer_.push_back((value >> 8) & 0xFF);
        buffer_.push_back(value & 0xFF);
    }

    void write_uint64(std::uint64_t value) {
        write_uint32(static_cast<std::uint32_t>(value >> 32));
        write_uint32(static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_int64(std::int64_t value) {
        write_uint64(static_cast<std::uint64_t>(value));
    }

    void write_bool(bool value) {
        write_uint8(value ? 1 : 0);
    }

    void write_string(const std::string& str) {
        write_uint32(static_cast<std::uint32_t>(str.size()));
        buffer_.insert(buffer_.end(), str.begin(), str.end());
    }

    void write_bytes(std::span<const std::uint8_t> data) {
        write_uint32(static_cast<std::uint32_t>(data.size()));
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    void write_raw(std::span<const std::uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

private:
    std::vector<std::uint8_t>& buffer_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t read_uint8() {
        require(1, "uint8");
        auto value = data_[0];
        data_ = data_.subspan(1);
        return value;
    }

    std::uint16_t read_uint16() {
        require(2, "uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data_[0]) << 8) |
                              static_cast<std::uint16_t>(data_[1]);
        data_ = data_.subspan(2);
        return value;
    }

    std::uint32_t read_uint32() {
        require(4, "uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data_[0]) << 24) |
                              (static_cast<std::uint32_t>(data_[1]) << 16) |
                              (static_cast<std::uint32_t>(data_[2]) << 8) |
                              static_cast<std::uint32_t>(data_[3]);
        data_ = data_.subspan(4);
        return value;
    }

    std::uint64_t read_uint64() {
        std::uint64_t high = read_uint32();
        std::uint64_t low = read_uint32();
        return (high << 32) | low;
    }

    std::int64_t read_int64() {
        return static_cast<std::int64_t>(read_uint64());
    }

    bool read_bool() {
        return read_uint8() != 0;
    }

    std::string read_string() {
        auto length = read_uint32();
        require(length, "string");
        std::string str(reinterpret_cast<const char*>(data_.data()), length);
        data_ = data_.subspan(length);
        return str;
    }

    std::vector<std::uint8_t> read_bytes() {
        auto length = read_uint32();
        return read_raw(length);
    }

    std::vector<std::uint8_t> read_raw(std::size_t length) {
        require(length, "bytes");
        std::vector<std::uint8_t> bytes(data_.begin(), data_.begin() + length);
        data_ = data_.subspan(length);
        return bytes;
    }

    std::size_t remaining() const { return data_.size(); }

private:
    void require(std::size_t count, const char* what) const {
        if (data_.size() < count) {
            throw std::runtime_error(std::string("Insufficient data for ") + what);
        }
    }

    std::span<const std::uint8_t> data_;
};

} // namespace puresend::core
