//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/byte_reader.hpp
//
// Bounds-checked reader over an encoded value
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/cql_protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace gatewire {

class ByteReader {
public:
    ByteReader(const uint8_t* data_p, size_t len_p)
        : data(data_p), len(len_p), pos(0) {}

    bool HasRemaining(size_t bytes = 1) const {
        return bytes <= len - pos;
    }

    size_t Remaining() const {
        return len - pos;
    }

    const uint8_t* Current() const {
        return data + pos;
    }

    bool ReadByte(uint8_t& out) {
        if (!HasRemaining(1)) return false;
        out = data[pos++];
        return true;
    }

    bool ReadInt16(int16_t& out) {
        if (!HasRemaining(2)) return false;
        out = static_cast<int16_t>(cql::LoadBigEndian16(data + pos));
        pos += 2;
        return true;
    }

    bool ReadInt32(int32_t& out) {
        if (!HasRemaining(4)) return false;
        out = static_cast<int32_t>(cql::LoadBigEndian32(data + pos));
        pos += 4;
        return true;
    }

    bool ReadInt64(int64_t& out) {
        if (!HasRemaining(8)) return false;
        out = static_cast<int64_t>(cql::LoadBigEndian64(data + pos));
        pos += 8;
        return true;
    }

    // Unsigned vint: the number of leading 1 bits in the first byte gives the
    // number of extra bytes that follow.
    bool ReadUnsignedVInt(uint64_t& out) {
        uint8_t first;
        if (!ReadByte(first)) return false;
        if ((first & 0x80) == 0) {
            out = first;
            return true;
        }

        int extra = 0;
        while (extra < 8 && (first & (0x80 >> extra)) != 0) {
            extra++;
        }
        if (!HasRemaining(static_cast<size_t>(extra))) return false;

        uint64_t value = extra == 8 ? 0 : (first & (0xFF >> extra));
        for (int i = 0; i < extra; i++) {
            value = (value << 8) | data[pos++];
        }
        out = value;
        return true;
    }

    bool ReadSignedVInt(int64_t& out) {
        uint64_t raw;
        if (!ReadUnsignedVInt(raw)) return false;
        out = cql::ZigZagDecode(raw);
        return true;
    }

    // [int32 n][n bytes]; a negative n leaves value null
    bool ReadValue(const uint8_t*& value, int32_t& length) {
        if (!ReadInt32(length)) return false;
        if (length < 0) {
            value = nullptr;
            return true;
        }
        if (!HasRemaining(static_cast<size_t>(length))) return false;
        value = data + pos;
        pos += static_cast<size_t>(length);
        return true;
    }

    bool ReadString(std::string& out, size_t n) {
        if (!HasRemaining(n)) return false;
        out.assign(reinterpret_cast<const char*>(data + pos), n);
        pos += n;
        return true;
    }

private:
    const uint8_t* data;
    size_t len;
    size_t pos;
};

} // namespace gatewire
