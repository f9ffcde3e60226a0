//===----------------------------------------------------------------------===//
//                         GateWire
//
// wire/literal.cpp
//===----------------------------------------------------------------------===//

#include "wire/literal.hpp"
#include "codec/cql_protocol.hpp"
#include "utils/hex.hpp"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace gatewire {

int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2;
    int64_t era = (year >= 0 ? year : year - 399) / 400;
    int64_t yoe = year - era * 400;
    int64_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

namespace {

bool Invalid(const std::string& text, const ColumnType& type, MarshalError& error) {
    error = MarshalError::InvalidArgument("Invalid " + type.ToString() + " literal '" + text + "'");
    return false;
}

bool ParseInt64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    const char* first = text.data();
    const char* last = first + text.size();
    if (*first == '+') first++;
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

bool ParseDouble(const std::string& text, double& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size() && errno != ERANGE;
}

bool ParseFloat(const std::string& text, float& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtof(text.c_str(), &end);
    return end == text.c_str() + text.size() && errno != ERANGE;
}

bool ParseDate(const std::string& text, uint32_t& out) {
    // [-]YYYY-MM-DD
    size_t pos = text[0] == '-' ? 1 : 0;
    size_t first_dash = text.find('-', pos);
    if (first_dash == std::string::npos || text.size() != first_dash + 6 ||
        text[first_dash + 3] != '-') {
        return false;
    }
    int64_t year;
    int64_t month;
    int64_t day;
    if (!ParseInt64(text.substr(0, first_dash), year) ||
        !ParseInt64(text.substr(first_dash + 1, 2), month) ||
        !ParseInt64(text.substr(first_dash + 4, 2), day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) +
                   static_cast<int64_t>(cql::EPOCH_DAY);
    if (days < 0 || days > static_cast<int64_t>(UINT32_MAX)) {
        return false;
    }
    out = static_cast<uint32_t>(days);
    return true;
}

bool ParseTime(const std::string& text, int64_t& out) {
    // HH:MM:SS[.fraction]
    if (text.size() < 8 || text[2] != ':' || text[5] != ':') {
        return false;
    }
    int64_t hours;
    int64_t minutes;
    int64_t seconds;
    if (!ParseInt64(text.substr(0, 2), hours) || !ParseInt64(text.substr(3, 2), minutes) ||
        !ParseInt64(text.substr(6, 2), seconds)) {
        return false;
    }
    if (hours > 23 || minutes > 59 || seconds > 59 || hours < 0 || minutes < 0 || seconds < 0) {
        return false;
    }
    int64_t nanos = 0;
    if (text.size() > 8) {
        if (text[8] != '.' || text.size() == 9 || text.size() > 18) {
            return false;
        }
        std::string fraction = text.substr(9);
        for (char c : fraction) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        fraction.append(9 - fraction.size(), '0');
        if (!ParseInt64(fraction, nanos)) {
            return false;
        }
    }
    out = ((hours * 60 + minutes) * 60 + seconds) * 1000000000LL + nanos;
    return true;
}

bool ParseDecimal(const std::string& text, int32_t& scale, Bytes& unscaled) {
    std::string digits;
    size_t dot = text.find('.');
    if (dot == std::string::npos) {
        digits = text;
        scale = 0;
    } else {
        std::string fraction = text.substr(dot + 1);
        if (fraction.empty() || fraction[0] == '-' || fraction[0] == '+') {
            return false;
        }
        digits = text.substr(0, dot) + fraction;
        scale = static_cast<int32_t>(fraction.size());
    }
    return ParseVarint(digits, unscaled);
}

bool ParseDuration(const std::string& text, int32_t& months_out, int32_t& days_out,
                   int64_t& nanos_out) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && text[pos] == '-') {
        negative = true;
        pos++;
    }
    if (pos == text.size()) {
        return false;
    }

    int64_t months = 0;
    int64_t days = 0;
    int64_t nanos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) pos++;
        int64_t amount;
        if (start == pos || !ParseInt64(text.substr(start, pos - start), amount)) {
            return false;
        }
        start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) pos++;
        std::string unit = text.substr(start, pos - start);
        for (auto& c : unit) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (unit == "y") {
            months += amount * 12;
        } else if (unit == "mo") {
            months += amount;
        } else if (unit == "w") {
            days += amount * 7;
        } else if (unit == "d") {
            days += amount;
        } else if (unit == "h") {
            nanos += amount * 3600LL * 1000000000LL;
        } else if (unit == "m") {
            nanos += amount * 60LL * 1000000000LL;
        } else if (unit == "s") {
            nanos += amount * 1000000000LL;
        } else if (unit == "ms") {
            nanos += amount * 1000000LL;
        } else if (unit == "us") {
            nanos += amount * 1000LL;
        } else if (unit == "ns") {
            nanos += amount;
        } else {
            return false;
        }
        if (months > INT32_MAX || days > INT32_MAX) {
            return false;
        }
    }

    months_out = static_cast<int32_t>(negative ? -months : months);
    days_out = static_cast<int32_t>(negative ? -days : days);
    nanos_out = negative ? -nanos : nanos;
    return true;
}

} // namespace

bool ParseLiteral(const std::string& text, const ColumnType& type, Value& out,
                  MarshalError& error) {
    switch (type.GetRawType()) {
        case RawType::TINYINT:
        case RawType::SMALLINT:
        case RawType::INT:
        case RawType::BIGINT:
        case RawType::COUNTER:
        case RawType::TIMESTAMP: {
            int64_t v;
            if (!ParseInt64(text, v)) return Invalid(text, type, error);
            out = Value::Int(v);
            return true;
        }
        case RawType::FLOAT: {
            float v;
            if (!ParseFloat(text, v)) return Invalid(text, type, error);
            out = Value::Float(v);
            return true;
        }
        case RawType::DOUBLE: {
            double v;
            if (!ParseDouble(text, v)) return Invalid(text, type, error);
            out = Value::Double(v);
            return true;
        }
        case RawType::BOOLEAN: {
            std::string lower = text;
            for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower != "true" && lower != "false") return Invalid(text, type, error);
            out = Value::Boolean(lower == "true");
            return true;
        }
        case RawType::ASCII:
        case RawType::TEXT:
            out = Value::String(text);
            return true;
        case RawType::BLOB: {
            Bytes bytes;
            if (!HexToBytes(text, bytes)) return Invalid(text, type, error);
            out = Value::Blob(std::move(bytes));
            return true;
        }
        case RawType::UUID:
        case RawType::TIMEUUID: {
            UuidValue uuid;
            if (!ParseUuid(text, uuid)) return Invalid(text, type, error);
            out = Value::Uuid(uuid);
            return true;
        }
        case RawType::INET: {
            Bytes address(16);
            if (inet_pton(AF_INET, text.c_str(), address.data()) == 1) {
                address.resize(4);
            } else if (inet_pton(AF_INET6, text.c_str(), address.data()) != 1) {
                return Invalid(text, type, error);
            }
            out = Value::Inet(std::move(address));
            return true;
        }
        case RawType::DATE: {
            uint32_t days;
            if (text.empty() || !ParseDate(text, days)) return Invalid(text, type, error);
            out = Value::Date(days);
            return true;
        }
        case RawType::TIME: {
            int64_t nanos;
            if (!ParseTime(text, nanos)) return Invalid(text, type, error);
            out = Value::Time(nanos);
            return true;
        }
        case RawType::DECIMAL: {
            int32_t scale;
            Bytes unscaled;
            if (!ParseDecimal(text, scale, unscaled)) return Invalid(text, type, error);
            out = Value::Decimal(scale, std::move(unscaled));
            return true;
        }
        case RawType::VARINT: {
            Bytes bytes;
            if (!ParseVarint(text, bytes)) return Invalid(text, type, error);
            out = Value::Varint(std::move(bytes));
            return true;
        }
        case RawType::DURATION: {
            int32_t months;
            int32_t days;
            int64_t nanos;
            if (!ParseDuration(text, months, days, nanos)) return Invalid(text, type, error);
            out = Value::Duration(months, days, nanos);
            return true;
        }
        default:
            error = MarshalError::InvalidArgument("Literals of type " + type.ToString() +
                                                  " are not supported");
            return false;
    }
}

} // namespace gatewire
