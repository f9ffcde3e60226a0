//===----------------------------------------------------------------------===//
//                         GateWire
//
// main.cpp
//
// gatewire-codec: inspect type descriptors and encoded values
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "codec/value_codecs.hpp"
#include "config/marshal_config.hpp"
#include "logging/logger.hpp"
#include "payload/type_converter.hpp"
#include "schema/type_parser.hpp"
#include "utils/hex.hpp"
#include "wire/literal.hpp"
#include "version.hpp"

#include <iostream>

using namespace gatewire;

namespace {

constexpr int EXIT_MARSHAL_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void PrintVersion() {
    std::cout << "gatewire-codec " << GATEWIRE_VERSION << "\n"
              << "Git commit: " << GATEWIRE_GIT_COMMIT << "\n"
              << "Build type: " << GATEWIRE_BUILD_TYPE << "\n"
              << "Build time: " << GATEWIRE_BUILD_TIME << "\n";
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [arguments]\n"
              << "\nCommands:\n"
              << "  describe <type>            Print the wire type descriptor of a CQL type\n"
              << "  decode <type> <hex|null>   Decode an encoded value\n"
              << "  encode <type> <literal>    Encode a scalar literal, printed as hex\n"
              << "\nOptions:\n"
              << "  -c, --config <path>        Config file path (.yaml/.yml or key=value)\n"
              << "  --log-file <path>          Log file path\n"
              << "  --log-level <level>        Log level (trace, debug, info, warn, error)\n"
              << "  --max-depth <n>            Max type nesting depth (default: 32)\n"
              << "  --max-elements <n>         Max collection elements (default: 1048576)\n"
              << "  --max-value-bytes <n>      Max encoded value size (default: 268435456)\n"
              << "  --version                  Show version info\n"
              << "  --help                     Show this help\n";
}

int Fail(const MarshalError& error) {
    std::cerr << error.ToString() << std::endl;
    return EXIT_MARSHAL_ERROR;
}

bool ParseType(const std::string& text, ColumnType& type, MarshalError& error) {
    if (!ParseColumnType(text, type, error)) {
        GW_LOG_DEBUG("tool", "{}", error.message);
        return false;
    }
    return true;
}

int Describe(const std::string& type_text) {
    MarshalError error;
    ColumnType type;
    TypeSpec spec;
    if (!ParseType(type_text, type, error) || !ConvertType(type, spec, error)) {
        return Fail(error);
    }
    std::cout << spec.ToString() << std::endl;
    return 0;
}

int Decode(const std::string& type_text, const std::string& hex) {
    MarshalError error;
    ColumnType type;
    if (!ParseType(type_text, type, error)) {
        return Fail(error);
    }

    BufferPtr buffer;
    if (hex != "null") {
        Bytes bytes;
        if (!HexToBytes(hex, bytes)) {
            return Fail(MarshalError::InvalidArgument("Invalid hex string '" + hex + "'"));
        }
        buffer = MakeBuffer(std::move(bytes));
    }

    Value value;
    if (!DecodeValue(ValueCodecs::Get(type.GetRawType()), buffer, type, value, error)) {
        return Fail(error);
    }
    std::cout << value.ToString() << std::endl;
    return 0;
}

int Encode(const std::string& type_text, const std::string& literal) {
    MarshalError error;
    ColumnType type;
    Value value;
    if (!ParseType(type_text, type, error) || !ParseLiteral(literal, type, value, error)) {
        return Fail(error);
    }

    BufferPtr buffer;
    if (!EncodeValue(ValueCodecs::Get(type.GetRawType()), value, type, buffer, error)) {
        return Fail(error);
    }
    std::cout << (buffer ? BytesToHex(*buffer) : "null") << std::endl;
    return 0;
}

} // namespace

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    CommandLine cmd;
    std::string error;
    if (!ParseCommandLine(argc, argv, cmd, error)) {
        std::cerr << error << std::endl;
        PrintUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (cmd.show_help) {
        PrintUsage(argv[0]);
        return 0;
    }
    if (cmd.show_version) {
        PrintVersion();
        return 0;
    }

    if (!cmd.config.Validate(error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return EXIT_USAGE;
    }

    // stdout carries the command output
    Logger::Initialize(cmd.config.log_file, cmd.config.log_level, LogConsole::STDERR);
    SetMarshalLimits(cmd.config.ToLimits());
    if (!cmd.config.config_file.empty()) {
        GW_LOG_DEBUG("config", "Loaded configuration from {}", cmd.config.config_file);
    }

    const auto& args = cmd.arguments;
    if (args.empty()) {
        PrintUsage(argv[0]);
        return EXIT_USAGE;
    }

    int rc;
    try {
        const std::string& command = args[0];
        if (command == "describe" && args.size() == 2) {
            rc = Describe(args[1]);
        } else if (command == "decode" && args.size() == 3) {
            rc = Decode(args[1], args[2]);
        } else if (command == "encode" && args.size() == 3) {
            rc = Encode(args[1], args[2]);
        } else {
            std::cerr << "Invalid command: " << command << std::endl;
            PrintUsage(argv[0]);
            rc = EXIT_USAGE;
        }
    } catch (const InternalError& e) {
        std::cerr << e.GetError().ToString() << std::endl;
        rc = EXIT_MARSHAL_ERROR;
    }

    Logger::Shutdown();
    return rc;
}
