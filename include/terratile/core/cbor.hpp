#pragma once

/**
 * @file cbor.hpp
 * @brief Minimal CBOR (RFC 8949) encoding and decoding for the map format
 *
 * Only the subset the map payload uses: unsigned/negative integers, byte and
 * text strings, arrays, maps and booleans, all definite-length. The decoder
 * throws MapFormatError on truncated input or unexpected types.
 */

#include "terratile/core/errors.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace terratile {
namespace cbor {

// CBOR major types
constexpr uint8_t UNSIGNED_INT = 0;
constexpr uint8_t NEGATIVE_INT = 1;
constexpr uint8_t BYTE_STRING = 2;
constexpr uint8_t TEXT_STRING = 3;
constexpr uint8_t ARRAY = 4;
constexpr uint8_t MAP = 5;
constexpr uint8_t SIMPLE = 7;

// Simple values
constexpr uint8_t FALSE_VALUE = 20;
constexpr uint8_t TRUE_VALUE = 21;

// ============================================================================
// Encoding
// ============================================================================

/// Encode a header: major type plus its argument in the shortest form
inline void encodeHeader(std::vector<uint8_t>& out, uint8_t majorType, uint64_t value) {
    uint8_t mt = static_cast<uint8_t>(majorType << 5);

    int extraBytes = 0;
    if (value < 24) {
        out.push_back(static_cast<uint8_t>(mt | value));
        return;
    } else if (value <= 0xFF) {
        out.push_back(mt | 24);
        extraBytes = 1;
    } else if (value <= 0xFFFF) {
        out.push_back(mt | 25);
        extraBytes = 2;
    } else if (value <= 0xFFFFFFFF) {
        out.push_back(mt | 26);
        extraBytes = 4;
    } else {
        out.push_back(mt | 27);
        extraBytes = 8;
    }

    for (int i = extraBytes - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void encodeInt(std::vector<uint8_t>& out, int64_t value) {
    if (value >= 0) {
        encodeHeader(out, UNSIGNED_INT, static_cast<uint64_t>(value));
    } else {
        encodeHeader(out, NEGATIVE_INT, static_cast<uint64_t>(-1 - value));
    }
}

inline void encodeUnsigned(std::vector<uint8_t>& out, uint64_t value) {
    encodeHeader(out, UNSIGNED_INT, value);
}

inline void encodeString(std::vector<uint8_t>& out, std::string_view str) {
    encodeHeader(out, TEXT_STRING, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline void encodeBytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    encodeHeader(out, BYTE_STRING, bytes.size());
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void encodeBool(std::vector<uint8_t>& out, bool value) {
    out.push_back(static_cast<uint8_t>((SIMPLE << 5) | (value ? TRUE_VALUE : FALSE_VALUE)));
}

inline void encodeMapHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, MAP, count);
}

inline void encodeArrayHeader(std::vector<uint8_t>& out, size_t count) {
    encodeHeader(out, ARRAY, count);
}

// ============================================================================
// Decoding
// ============================================================================

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] bool hasMore() const { return pos_ < data_.size(); }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

    uint8_t read() {
        require(1);
        return data_[pos_++];
    }

    /// Read a header, returns (major type, argument)
    std::pair<uint8_t, uint64_t> readHeader() {
        uint8_t initial = read();
        uint8_t majorType = initial >> 5;
        uint8_t additional = initial & 0x1F;

        if (additional < 24) {
            return {majorType, additional};
        }

        int extraBytes = 0;
        switch (additional) {
            case 24: extraBytes = 1; break;
            case 25: extraBytes = 2; break;
            case 26: extraBytes = 4; break;
            case 27: extraBytes = 8; break;
            default:
                throw MapFormatError("CBOR: indefinite or reserved length not supported");
        }

        uint64_t value = 0;
        for (int i = 0; i < extraBytes; ++i) {
            value = (value << 8) | read();
        }
        return {majorType, value};
    }

    /// Read a header and check its major type; returns the argument
    uint64_t expect(uint8_t majorType, const char* what) {
        auto [type, value] = readHeader();
        if (type != majorType) {
            throw MapFormatError(std::string("CBOR: unexpected type for ") + what);
        }
        return value;
    }

    int64_t readInt() {
        auto [majorType, value] = readHeader();
        if (majorType == UNSIGNED_INT) {
            return static_cast<int64_t>(value);
        }
        if (majorType == NEGATIVE_INT) {
            return -1 - static_cast<int64_t>(value);
        }
        throw MapFormatError("CBOR: expected integer");
    }

    std::string readString() {
        uint64_t length = expect(TEXT_STRING, "text string");
        require(length);
        std::string result(reinterpret_cast<const char*>(data_.data() + pos_),
                           static_cast<size_t>(length));
        pos_ += static_cast<size_t>(length);
        return result;
    }

    std::vector<uint8_t> readBytes() {
        uint64_t length = expect(BYTE_STRING, "byte string");
        require(length);
        std::vector<uint8_t> result(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                    data_.begin() + static_cast<std::ptrdiff_t>(pos_ + length));
        pos_ += static_cast<size_t>(length);
        return result;
    }

    bool readBool() {
        auto [majorType, value] = readHeader();
        if (majorType == SIMPLE && value == TRUE_VALUE) return true;
        if (majorType == SIMPLE && value == FALSE_VALUE) return false;
        throw MapFormatError("CBOR: expected boolean");
    }

    /// Skip one complete value (unknown map fields)
    void skipValue() {
        auto [majorType, value] = readHeader();
        switch (majorType) {
            case UNSIGNED_INT:
            case NEGATIVE_INT:
            case SIMPLE:
                break;
            case BYTE_STRING:
            case TEXT_STRING:
                require(value);
                pos_ += static_cast<size_t>(value);
                break;
            case ARRAY:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue();
                }
                break;
            case MAP:
                for (uint64_t i = 0; i < value; ++i) {
                    skipValue();  // key
                    skipValue();  // value
                }
                break;
            default:
                throw MapFormatError("CBOR: unsupported major type");
        }
    }

private:
    void require(uint64_t count) const {
        if (count > data_.size() - pos_) {
            throw MapFormatError("CBOR: truncated input");
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

}  // namespace cbor
}  // namespace terratile
