//===----------------------------------------------------------------------===//
//                         GateWire
//
// schema/type_parser.cpp
//
// Recursive descent parser for CQL type strings
//===----------------------------------------------------------------------===//

#include "schema/type_parser.hpp"
#include "codec/marshal_limits.hpp"
#include <cctype>

namespace gatewire {

namespace {

class TypeParser {
public:
    TypeParser(const std::string& text_p, uint32_t max_depth_p)
        : text(text_p), pos(0), max_depth(max_depth_p) {}

    bool Parse(ColumnType& out) {
        if (!ParseType(out, 1)) {
            return false;
        }
        SkipSpaces();
        if (pos != text.size()) {
            return Fail("unexpected '" + text.substr(pos) + "' after type");
        }
        return true;
    }

    const std::string& GetError() const { return error; }

private:
    bool ParseType(ColumnType& out, uint32_t depth) {
        if (depth > max_depth) {
            return Fail("type nesting exceeds maximum depth of " + std::to_string(max_depth));
        }

        std::string name;
        if (!ReadIdentifier(name)) {
            return false;
        }

        std::string lower = name;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (lower == "frozen") {
            std::vector<ColumnType> inner;
            if (!ParseParameters(name, inner, depth)) {
                return false;
            }
            if (inner.size() != 1) {
                return Fail("frozen<> takes exactly one type");
            }
            if (!IsComposite(inner[0].GetRawType())) {
                return Fail("frozen<> is only allowed on collections and tuples");
            }
            out = ColumnType::Parameterized(inner[0].GetRawType(), inner[0].Parameters(), true);
            return true;
        }

        RawType raw;
        if (!RawTypeFromName(lower, raw) || raw == RawType::UDT) {
            return Fail("user defined type '" + name + "' cannot be resolved without a schema");
        }
        if (raw == RawType::CUSTOM) {
            return Fail("custom types are not supported");
        }

        if (!IsComposite(raw)) {
            SkipSpaces();
            if (Peek() == '<') {
                return Fail("type '" + name + "' does not take parameters");
            }
            out = ColumnType::Primitive(raw);
            return true;
        }

        std::vector<ColumnType> parameters;
        if (!ParseParameters(name, parameters, depth)) {
            return false;
        }

        switch (raw) {
            case RawType::LIST:
            case RawType::SET:
                if (parameters.size() != 1) {
                    return Fail(lower + " takes exactly one element type");
                }
                break;
            case RawType::MAP:
                if (parameters.size() != 2) {
                    return Fail("map takes a key type and a value type");
                }
                break;
            default:
                break;
        }

        if (raw == RawType::TUPLE) {
            out = ColumnType::Tuple(std::move(parameters));
        } else {
            out = ColumnType::Parameterized(raw, std::move(parameters));
        }
        return true;
    }

    // '<' type { ',' type } '>'
    bool ParseParameters(const std::string& name, std::vector<ColumnType>& out, uint32_t depth) {
        SkipSpaces();
        if (Peek() != '<') {
            return Fail("type '" + name + "' requires parameters");
        }
        pos++;

        while (true) {
            ColumnType parameter;
            if (!ParseType(parameter, depth + 1)) {
                return false;
            }
            out.push_back(std::move(parameter));

            SkipSpaces();
            char c = Peek();
            if (c == ',') {
                pos++;
                continue;
            }
            if (c == '>') {
                pos++;
                return true;
            }
            return Fail("expected ',' or '>' in parameters of '" + name + "'");
        }
    }

    bool ReadIdentifier(std::string& out) {
        SkipSpaces();
        size_t start = pos;
        while (pos < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[pos]);
            if (!std::isalnum(c) && c != '_') {
                break;
            }
            pos++;
        }
        if (start == pos) {
            if (pos >= text.size()) {
                return Fail("unexpected end of input");
            }
            return Fail(std::string("unexpected character '") + text[pos] + "'");
        }
        out = text.substr(start, pos - start);
        return true;
    }

    void SkipSpaces() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            pos++;
        }
    }

    char Peek() const {
        return pos < text.size() ? text[pos] : '\0';
    }

    bool Fail(const std::string& message) {
        if (error.empty()) {
            error = message;
        }
        return false;
    }

private:
    const std::string& text;
    size_t pos;
    uint32_t max_depth;
    std::string error;
};

} // namespace

bool ParseColumnType(const std::string& text, ColumnType& out, MarshalError& error) {
    TypeParser parser(text, GetMarshalLimits().max_nesting_depth);
    ColumnType parsed;
    if (!parser.Parse(parsed)) {
        error = MarshalError::InvalidArgument(
            "Unable to parse type '" + text + "': " + parser.GetError());
        return false;
    }
    out = std::move(parsed);
    return true;
}

} // namespace gatewire
