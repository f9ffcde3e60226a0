//===----------------------------------------------------------------------===//
//                         GateWire
//
// codec/byte_writer.hpp
//
// Big-endian writer for encoded values
//===----------------------------------------------------------------------===//

#pragma once

#include "codec/cql_protocol.hpp"
#include "common.hpp"
#include <string>

namespace gatewire {

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) {
        buffer.reserve(reserve);
    }

    const Bytes& GetBuffer() const { return buffer; }
    Bytes TakeBuffer() {
        Bytes out = std::move(buffer);
        buffer.clear();
        return out;
    }

    size_t Size() const { return buffer.size(); }

    void WriteByte(uint8_t value) {
        buffer.push_back(value);
    }

    void WriteBytes(const uint8_t* data, size_t len) {
        buffer.insert(buffer.end(), data, data + len);
    }

    void WriteBytes(const Bytes& bytes) {
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    void WriteString(const std::string& str) {
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void WriteInt16(int16_t value) {
        uint8_t tmp[2];
        cql::StoreBigEndian16(static_cast<uint16_t>(value), tmp);
        buffer.insert(buffer.end(), tmp, tmp + 2);
    }

    void WriteInt32(int32_t value) {
        uint8_t tmp[4];
        cql::StoreBigEndian32(static_cast<uint32_t>(value), tmp);
        buffer.insert(buffer.end(), tmp, tmp + 4);
    }

    void WriteInt64(int64_t value) {
        uint8_t tmp[8];
        cql::StoreBigEndian64(static_cast<uint64_t>(value), tmp);
        buffer.insert(buffer.end(), tmp, tmp + 8);
    }

    void WriteUnsignedVInt(uint64_t value) {
        int size = VIntSize(value);
        if (size == 1) {
            buffer.push_back(static_cast<uint8_t>(value));
            return;
        }
        int extra = size - 1;
        uint8_t tmp[9];
        for (int i = size - 1; i >= 0; i--) {
            tmp[i] = static_cast<uint8_t>(value);
            value >>= 8;
        }
        // Prefix the first byte with one 1-bit per extra byte
        tmp[0] |= static_cast<uint8_t>(~(0xFF >> extra));
        buffer.insert(buffer.end(), tmp, tmp + size);
    }

    void WriteSignedVInt(int64_t value) {
        WriteUnsignedVInt(cql::ZigZagEncode(value));
    }

    // [int32 length][bytes]
    void WriteValue(const Bytes& value) {
        WriteInt32(static_cast<int32_t>(value.size()));
        WriteBytes(value);
    }

    void WriteNull() {
        WriteInt32(cql::NULL_LENGTH);
    }

    static int VIntSize(uint64_t value) {
        int magnitude = 64 - CountLeadingZeros(value | 1);
        // 7 payload bits per byte until the 9 byte form
        int size = (magnitude + 6) / 7;
        if (size > 8) size = 9;
        return size;
    }

private:
    static int CountLeadingZeros(uint64_t value) {
        int n = 0;
        for (uint64_t bit = 1ULL << 63; bit != 0 && (value & bit) == 0; bit >>= 1) {
            n++;
        }
        return n;
    }

private:
    Bytes buffer;
};

} // namespace gatewire
