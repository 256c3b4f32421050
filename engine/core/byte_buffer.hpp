#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace engine {

// Thrown by ByteReader when a read runs past the end of the datagram or a
// list count exceeds the caller's limit.
class BufferUnderflow : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Little-endian datagram builder. Strings and lists carry a u16 prefix.
class ByteWriter {
public:
    void write_u8(std::uint8_t v) { put_le(v); }
    void write_u16(std::uint16_t v) { put_le(v); }
    void write_u32(std::uint32_t v) { put_le(v); }
    void write_i32(std::int32_t v) { put_le(static_cast<std::uint32_t>(v)); }

    void write_f32(float v) {
        std::uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_le(bits);
    }

    void write_bool(bool v) { put_le<std::uint8_t>(v ? 1 : 0); }

    void write_string(std::string_view s) {
        write_count(s.size());
        out_.insert(out_.end(), s.begin(), s.end());
    }

    // The caller writes the elements afterwards.
    void write_count(std::size_t count) {
        if (count > 0xFFFF) {
            throw std::length_error("ByteWriter: " + std::to_string(count) + " exceeds a u16 prefix");
        }
        put_le(static_cast<std::uint16_t>(count));
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    std::vector<std::uint8_t> take() { return std::move(out_); }

private:
    template <typename T>
    void put_le(T v) {
        static_assert(std::is_unsigned_v<T>);
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    std::vector<std::uint8_t> out_;
};

// Bounds-checked reader over a borrowed datagram. Every read either
// consumes its bytes or throws BufferUnderflow.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> in)
        : in_(in) {}

    std::uint8_t read_u8() { return get_le<std::uint8_t>(); }
    std::uint16_t read_u16() { return get_le<std::uint16_t>(); }
    std::uint32_t read_u32() { return get_le<std::uint32_t>(); }
    std::int32_t read_i32() { return static_cast<std::int32_t>(get_le<std::uint32_t>()); }

    float read_f32() {
        const auto bits = get_le<std::uint32_t>();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    bool read_bool() { return read_u8() != 0; }

    std::string read_string() {
        const auto bytes = read_bytes(read_u16());
        return std::string(bytes.begin(), bytes.end());
    }

    // Rejects counts above maxCount before the caller allocates anything.
    std::size_t read_count(std::size_t maxCount) {
        const std::size_t count = read_u16();
        if (count > maxCount) {
            throw BufferUnderflow("ByteReader: list count " + std::to_string(count) +
                                  " exceeds limit " + std::to_string(maxCount));
        }
        return count;
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        const auto out = in_.subspan(offset_, count);
        offset_ += count;
        return out;
    }

private:
    template <typename T>
    T get_le() {
        require(sizeof(T));
        T v = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            v = static_cast<T>(v | (static_cast<T>(in_[offset_ + i]) << (8 * i)));
        }
        offset_ += sizeof(T);
        return v;
    }

    void require(std::size_t count) const {
        const std::size_t left = in_.size() - offset_;
        if (count > left) {
            throw BufferUnderflow("ByteReader: need " + std::to_string(count) +
                                  " bytes, " + std::to_string(left) + " left");
        }
    }

    std::span<const std::uint8_t> in_;
    std::size_t offset_{0};
};

} // namespace engine
