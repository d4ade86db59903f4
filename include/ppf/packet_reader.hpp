/**
 * @file packet_reader.hpp
 * @brief Sequential packet reading from dump data.
 *
 * The dump format addresses everything in 4-byte packets. A read declares
 * its size in packets and the type the bytes are interpreted as; the
 * number of items decoded is derived from the two. All values are stored
 * little-endian.
 *
 * @see Hyades User's Guide Version PP.11.xx, Appendix IV
 */

#ifndef PPF_PACKET_READER_HPP
#define PPF_PACKET_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <bit>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace ppf {

/**
 * @brief Interpretation applied to the bytes of a read.
 */
enum class PacketType {
    Char,   ///< 1-byte character
    Int,    ///< 4-byte unsigned integer
    Double, ///< 8-byte IEEE double (spans two packets)
    Float   ///< 4-byte IEEE float
};

/**
 * @brief Size in bytes of one item of the given type.
 */
constexpr std::size_t item_size(PacketType type) noexcept {
    switch (type) {
    case PacketType::Char:
        return 1U;
    case PacketType::Int:
        return 4U;
    case PacketType::Double:
        return 8U;
    case PacketType::Float:
        return 4U;
    }
    return 1U;
}

namespace detail {

template <typename T> struct packet_type_of;

template <> struct packet_type_of<char> {
    static constexpr PacketType value = PacketType::Char;
};

template <> struct packet_type_of<std::uint32_t> {
    static constexpr PacketType value = PacketType::Int;
};

template <> struct packet_type_of<double> {
    static constexpr PacketType value = PacketType::Double;
};

template <> struct packet_type_of<float> {
    static constexpr PacketType value = PacketType::Float;
};

inline std::uint32_t load_le32(const std::uint8_t* p) noexcept {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8U) |
           (static_cast<std::uint32_t>(p[2]) << 16U) | (static_cast<std::uint32_t>(p[3]) << 24U);
}

inline std::uint64_t load_le64(const std::uint8_t* p) noexcept {
    return static_cast<std::uint64_t>(load_le32(p)) |
           (static_cast<std::uint64_t>(load_le32(p + 4)) << 32U);
}

/**
 * @brief Check that bytes form well-formed UTF-8.
 *
 * Rejects overlong encodings, surrogates and code points above U+10FFFF.
 */
inline bool is_valid_utf8(const std::uint8_t* p, std::size_t n) noexcept {
    std::size_t i = 0;
    while (i < n) {
        std::uint8_t lead = p[i];
        if (lead < 0x80U) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        std::uint8_t lo = 0x80U;
        std::uint8_t hi = 0xBFU;
        if (lead >= 0xC2U && lead <= 0xDFU) {
            length = 2;
        } else if (lead >= 0xE0U && lead <= 0xEFU) {
            length = 3;
            if (lead == 0xE0U) {
                lo = 0xA0U;
            } else if (lead == 0xEDU) {
                hi = 0x9FU;
            }
        } else if (lead >= 0xF0U && lead <= 0xF4U) {
            length = 4;
            if (lead == 0xF0U) {
                lo = 0x90U;
            } else if (lead == 0xF4U) {
                hi = 0x8FU;
            }
        } else {
            return false;
        }

        if (length > n - i) {
            return false;
        }
        // Only the first continuation byte has a narrowed range
        if (p[i + 1] < lo || p[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k < length; ++k) {
            if (p[i + k] < 0x80U || p[i + k] > 0xBFU) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

template <typename T> T decode_item(const std::uint8_t* p) noexcept {
    if constexpr (std::is_same_v<T, char>) {
        return static_cast<char>(*p);
    } else if constexpr (std::is_same_v<T, std::uint32_t>) {
        return load_le32(p);
    } else if constexpr (std::is_same_v<T, float>) {
        return std::bit_cast<float>(load_le32(p));
    } else {
        return std::bit_cast<double>(load_le64(p));
    }
}

} // namespace detail

/**
 * @brief Sequential packet reader over an in-memory dump buffer.
 *
 * Tracks a single byte cursor. Every successful read advances the cursor
 * by exactly the number of bytes declared; a failed read leaves it where
 * it was. The reader does not own the buffer.
 */
class PacketReader {
public:
    /**
     * @brief Construct a packet reader.
     *
     * @param data Pointer to source data buffer
     * @param num_bytes Number of valid bytes in buffer
     */
    PacketReader(const std::uint8_t* data, std::size_t num_bytes) noexcept
        : data_(data), num_bytes_(num_bytes), pos_(0) {}

    /**
     * @brief Read packets as an array of items.
     *
     * Decodes (packets * 4) / sizeof(T) little-endian items.
     *
     * @tparam T Item type: char, std::uint32_t, float or double
     * @param packets Number of packets to consume
     * @param[out] values Decoded items (replaced)
     * @return Error::Ok on success, Error::MalformedPacketCount if the byte
     *         count is not a multiple of the item size,
     *         Error::StreamExhausted if not enough bytes remain
     */
    template <typename T> Error read_array(std::size_t packets, std::vector<T>& values) {
        constexpr std::size_t size = item_size(detail::packet_type_of<T>::value);

        std::size_t byte_count = 0;
        auto status = reserve(packets, size, byte_count);
        if (status != Error::Ok) {
            return status;
        }

        std::size_t items = byte_count / size;
        values.resize(items);
        for (std::size_t i = 0; i < items; ++i) {
            values[i] = detail::decode_item<T>(data_ + pos_ + (i * size));
        }
        pos_ += byte_count;

        return Error::Ok;
    }

    /**
     * @brief Read packets and keep the first decoded item.
     *
     * All declared packets are consumed even when they hold more than one
     * item.
     *
     * @tparam T Item type: char, std::uint32_t, float or double
     * @param packets Number of packets to consume
     * @param[out] value First decoded item
     * @return Error::Ok on success, Error::MalformedPacketCount if the
     *         packets hold no whole item
     */
    template <typename T> Error read(std::size_t packets, T& value) noexcept {
        constexpr std::size_t size = item_size(detail::packet_type_of<T>::value);

        std::size_t byte_count = 0;
        auto status = reserve(packets, size, byte_count);
        if (status != Error::Ok) {
            return status;
        }
        if (byte_count < size) [[unlikely]] {
            return Error::MalformedPacketCount;
        }

        value = detail::decode_item<T>(data_ + pos_);
        pos_ += byte_count;

        return Error::Ok;
    }

    /**
     * @brief Read packets as a single character string.
     *
     * The bytes are decoded as UTF-8 text and kept verbatim, including any
     * blank padding written by the producer.
     *
     * @param packets Number of packets to consume
     * @param[out] value String of packets * 4 bytes
     * @return Error::Ok on success, Error::StreamExhausted if not enough
     *         bytes remain, Error::MalformedText if the bytes are not valid
     *         UTF-8
     */
    Error read_string(std::size_t packets, std::string& value) {
        std::size_t byte_count = 0;
        auto status = reserve(packets, item_size(PacketType::Char), byte_count);
        if (status != Error::Ok) {
            return status;
        }
        if (!detail::is_valid_utf8(data_ + pos_, byte_count)) {
            return Error::MalformedText;
        }

        value.assign(reinterpret_cast<const char*>(data_ + pos_), byte_count);
        pos_ += byte_count;

        return Error::Ok;
    }

    /**
     * @brief Skip packets without decoding them.
     *
     * @param packets Number of packets to discard
     * @return Error::Ok on success, Error::StreamExhausted if not enough
     *         bytes remain
     */
    Error skip(std::size_t packets) noexcept {
        std::size_t byte_count = 0;
        auto status = reserve(packets, 1U, byte_count);
        if (status != Error::Ok) {
            return status;
        }
        pos_ += byte_count;
        return Error::Ok;
    }

    /**
     * @brief Skip raw bytes, clamped to the end of data.
     *
     * Used for the separator between dumps, which may be cut short at the
     * end of a file.
     *
     * @param num_bytes Number of bytes to discard
     * @return Number of bytes actually skipped
     */
    std::size_t skip_bytes(std::size_t num_bytes) noexcept {
        std::size_t n = (num_bytes < remaining()) ? num_bytes : remaining();
        pos_ += n;
        return n;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < num_bytes_) ? (num_bytes_ - pos_) : 0;
    }

    /**
     * @brief Get total buffer size in bytes.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return num_bytes_;
    }

private:
    Error reserve(std::size_t packets, std::size_t item_bytes,
                  std::size_t& byte_count) const noexcept {
        // Compare in packets first so a corrupt count cannot overflow
        if (packets > remaining() / BYTES_PER_PACKET) {
            if (packets <= SIZE_MAX / BYTES_PER_PACKET &&
                (packets * BYTES_PER_PACKET) % item_bytes != 0) {
                return Error::MalformedPacketCount;
            }
            return Error::StreamExhausted;
        }

        byte_count = packets * BYTES_PER_PACKET;
        if (byte_count % item_bytes != 0) {
            return Error::MalformedPacketCount;
        }
        return Error::Ok;
    }

    const std::uint8_t* data_;
    std::size_t num_bytes_;
    std::size_t pos_;
};

} // namespace ppf

#endif // PPF_PACKET_READER_HPP
