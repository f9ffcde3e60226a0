//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/value.cpp
//
// Wire value construction and formatting
//===----------------------------------------------------------------------===//

#include "wire/value.hpp"
#include "utils/hex.hpp"
#include <spdlog/fmt/fmt.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <algorithm>

namespace gatewire {

const char* ValueKindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::UNSET:      return "unset";
        case ValueKind::NULL_VALUE: return "null";
        case ValueKind::INT:        return "int";
        case ValueKind::FLOAT:      return "float";
        case ValueKind::DOUBLE:     return "double";
        case ValueKind::BOOLEAN:    return "boolean";
        case ValueKind::BYTES:      return "bytes";
        case ValueKind::STRING:     return "string";
        case ValueKind::UUID:       return "uuid";
        case ValueKind::INET:       return "inet";
        case ValueKind::DATE:       return "date";
        case ValueKind::TIME:       return "time";
        case ValueKind::DECIMAL:    return "decimal";
        case ValueKind::VARINT:     return "varint";
        case ValueKind::DURATION:   return "duration";
        case ValueKind::COLLECTION: return "collection";
        case ValueKind::UDT:        return "udt";
        default:                    return "unknown";
    }
}

Value Value::Collection(std::vector<Value> elements) {
    return Value(Storage(CollectionValue{std::move(elements)}));
}

Value Value::Udt(std::map<std::string, Value> fields) {
    return Value(Storage(UdtValue{std::move(fields)}));
}

//===----------------------------------------------------------------------===//
// UUID
//===----------------------------------------------------------------------===//
std::string FormatUuid(const UuidValue& uuid) {
    std::string hex = BytesToHex(uuid.bytes.data(), uuid.bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

bool ParseUuid(const std::string& text, UuidValue& out) {
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' ||
        text[23] != '-') {
        return false;
    }
    std::string hex;
    hex.reserve(32);
    for (char c : text) {
        if (c != '-') hex += c;
    }
    Bytes bytes;
    if (!HexToBytes(hex, bytes) || bytes.size() != 16) {
        return false;
    }
    std::copy(bytes.begin(), bytes.end(), out.bytes.begin());
    return true;
}

//===----------------------------------------------------------------------===//
// Inet
//===----------------------------------------------------------------------===//
std::string FormatInet(const InetValue& inet) {
    char buf[INET6_ADDRSTRLEN];
    int family;
    if (inet.address.size() == 4) {
        family = AF_INET;
    } else if (inet.address.size() == 16) {
        family = AF_INET6;
    } else {
        return "0x" + BytesToHex(inet.address);
    }
    if (inet_ntop(family, inet.address.data(), buf, sizeof(buf)) == nullptr) {
        return "0x" + BytesToHex(inet.address);
    }
    return buf;
}

//===----------------------------------------------------------------------===//
// Varint
//===----------------------------------------------------------------------===//
std::string FormatVarint(const Bytes& bytes) {
    if (bytes.empty()) {
        return "0";
    }

    bool negative = (bytes[0] & 0x80) != 0;
    Bytes magnitude = bytes;
    if (negative) {
        // Two's complement negate, least significant byte last
        uint32_t carry = 1;
        for (size_t i = magnitude.size(); i-- > 0;) {
            uint32_t v = static_cast<uint8_t>(~magnitude[i]) + carry;
            magnitude[i] = static_cast<uint8_t>(v);
            carry = v >> 8;
        }
    }

    std::string digits;
    size_t start = 0;
    while (start < magnitude.size()) {
        // Divide the big-endian magnitude by 10 in place
        uint32_t remainder = 0;
        for (size_t i = start; i < magnitude.size(); i++) {
            uint32_t cur = (remainder << 8) | magnitude[i];
            magnitude[i] = static_cast<uint8_t>(cur / 10);
            remainder = cur % 10;
        }
        digits += static_cast<char>('0' + remainder);
        while (start < magnitude.size() && magnitude[start] == 0) {
            start++;
        }
    }
    if (digits.empty()) {
        digits = "0";
    }
    if (negative) {
        digits += '-';
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool ParseVarint(const std::string& text, Bytes& out) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        i++;
    }
    if (i == text.size()) {
        return false;
    }

    // Little-endian magnitude
    Bytes mag;
    for (; i < text.size(); i++) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        uint32_t carry = static_cast<uint32_t>(c - '0');
        for (auto& b : mag) {
            uint32_t v = b * 10u + carry;
            b = static_cast<uint8_t>(v);
            carry = v >> 8;
        }
        while (carry != 0) {
            mag.push_back(static_cast<uint8_t>(carry));
            carry >>= 8;
        }
    }
    // Room for the sign bit
    mag.push_back(0);

    if (negative) {
        uint32_t carry = 1;
        for (auto& b : mag) {
            uint32_t v = static_cast<uint8_t>(~b) + carry;
            b = static_cast<uint8_t>(v);
            carry = v >> 8;
        }
    }

    Bytes be(mag.rbegin(), mag.rend());
    // Strip redundant sign extension bytes
    size_t skip = 0;
    while (skip + 1 < be.size()) {
        if (be[skip] == 0x00 && (be[skip + 1] & 0x80) == 0) {
            skip++;
        } else if (be[skip] == 0xFF && (be[skip + 1] & 0x80) != 0) {
            skip++;
        } else {
            break;
        }
    }
    out.assign(be.begin() + static_cast<std::ptrdiff_t>(skip), be.end());
    return true;
}

//===----------------------------------------------------------------------===//
// Date / Time
//===----------------------------------------------------------------------===//
std::string FormatDate(uint32_t days) {
    // Civil date from days since 1970-01-01
    int64_t z = static_cast<int64_t>(days) - (int64_t(1) << 31) + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) {
        y++;
    }
    return fmt::format("{:04}-{:02}-{:02}", y, m, d);
}

std::string FormatTime(int64_t nanos) {
    if (nanos < 0) {
        return std::to_string(nanos) + "ns";
    }
    int64_t seconds = nanos / 1000000000;
    return fmt::format("{:02}:{:02}:{:02}.{:09}", seconds / 3600, (seconds / 60) % 60,
                       seconds % 60, nanos % 1000000000);
}

//===----------------------------------------------------------------------===//
// ToString
//===----------------------------------------------------------------------===//
namespace {

std::string QuoteString(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string FormatDuration(const DurationValue& d) {
    bool negative = d.months < 0 || d.days < 0 || d.nanos < 0;
    std::string out = negative ? "-" : "";
    auto abs64 = [](int64_t v) { return v < 0 ? -static_cast<uint64_t>(v) : static_cast<uint64_t>(v); };
    if (d.months != 0) out += fmt::format("{}mo", abs64(d.months));
    if (d.days != 0) out += fmt::format("{}d", abs64(d.days));
    if (d.nanos != 0) out += fmt::format("{}ns", abs64(d.nanos));
    if (out.empty() || out == "-") out = "0ns";
    return out;
}

} // namespace

std::string Value::ToString() const {
    switch (Kind()) {
        case ValueKind::UNSET:
            return "unset";
        case ValueKind::NULL_VALUE:
            return "null";
        case ValueKind::INT:
            return std::to_string(GetInt());
        case ValueKind::FLOAT:
            return fmt::format("{}", GetFloat());
        case ValueKind::DOUBLE:
            return fmt::format("{}", GetDouble());
        case ValueKind::BOOLEAN:
            return GetBoolean() ? "true" : "false";
        case ValueKind::BYTES:
            return "0x" + BytesToHex(GetBlob());
        case ValueKind::STRING:
            return QuoteString(GetString());
        case ValueKind::UUID:
            return FormatUuid(GetUuid());
        case ValueKind::INET:
            return FormatInet(GetInet());
        case ValueKind::DATE:
            return FormatDate(GetDate().days);
        case ValueKind::TIME:
            return FormatTime(GetTime().nanos);
        case ValueKind::DECIMAL: {
            const auto& d = GetDecimal();
            return FormatVarint(d.unscaled.bytes) + "E" + std::to_string(-static_cast<int64_t>(d.scale));
        }
        case ValueKind::VARINT:
            return FormatVarint(GetVarint().bytes);
        case ValueKind::DURATION:
            return FormatDuration(GetDuration());
        case ValueKind::COLLECTION: {
            std::string out = "[";
            const auto& elements = GetElements();
            for (size_t i = 0; i < elements.size(); i++) {
                if (i > 0) out += ", ";
                out += elements[i].ToString();
            }
            out += "]";
            return out;
        }
        case ValueKind::UDT: {
            std::string out = "{";
            bool first = true;
            for (const auto& [name, field] : GetFields()) {
                if (!first) out += ", ";
                first = false;
                out += name + ": " + field.ToString();
            }
            out += "}";
            return out;
        }
        default:
            return "?";
    }
}

} // namespace gatewire
