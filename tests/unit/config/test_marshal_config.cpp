//===----------------------------------------------------------------------===//
//                         GateWire - Unit Tests
//
// tests/unit/config/test_marshal_config.cpp
//
// Unit tests for MarshalConfig, the config file loaders and command line
//===----------------------------------------------------------------------===//

#include "config/marshal_config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace gatewire;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static std::string WriteTempFile(const std::string& content, const std::string& suffix = ".conf") {
    std::string path = "/tmp/gatewire_test_config" + suffix;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

static void CleanupFile(const std::string& path) {
    std::remove(path.c_str());
}

static bool Parse(std::vector<std::string> args, CommandLine& out, std::string& error) {
    args.insert(args.begin(), "gatewire-codec");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return ParseCommandLine(static_cast<int>(args.size()), argv.data(), out, error);
}

//===----------------------------------------------------------------------===//
// Defaults and Validation Tests
//===----------------------------------------------------------------------===//

void TestDefaultValues() {
    std::cout << "  Testing default values..." << std::endl;

    MarshalConfig config;
    assert(config.log_file.empty());
    assert(config.log_level == "info");
    assert(config.max_nesting_depth == 32);
    assert(config.max_collection_elements == 1024 * 1024);
    assert(config.max_value_bytes == 256ULL * 1024 * 1024);
    assert(config.config_file.empty());

    MarshalLimits limits = config.ToLimits();
    assert(limits.max_nesting_depth == config.max_nesting_depth);
    assert(limits.max_collection_elements == config.max_collection_elements);
    assert(limits.max_value_bytes == config.max_value_bytes);

    std::cout << "    PASSED" << std::endl;
}

void TestValidation() {
    std::cout << "  Testing Validate..." << std::endl;

    std::string error;
    MarshalConfig config;
    assert(config.Validate(error));

    config.max_nesting_depth = 0;
    assert(!config.Validate(error));
    assert(error == "Max nesting depth must be greater than 0");

    config = MarshalConfig();
    config.max_collection_elements = 0;
    assert(!config.Validate(error));
    assert(error == "Max collection elements must be greater than 0");

    config = MarshalConfig();
    config.max_value_bytes = 0;
    assert(!config.Validate(error));
    assert(error == "Max value bytes must be greater than 0");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// INI Config Tests
//===----------------------------------------------------------------------===//

void TestLoadIni() {
    std::cout << "  Testing key=value config..." << std::endl;

    std::string path = WriteTempFile(
        "# limits\n"
        "log_level = debug\n"
        "log_file = \"/tmp/gatewire.log\"\n"
        "; comment\n"
        "max_nesting_depth = 8\n"
        "max_collection_elements=1000\n"
        "max_value_bytes = 4096\n");

    MarshalConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.log_level == "debug");
    assert(config.log_file == "/tmp/gatewire.log");
    assert(config.max_nesting_depth == 8);
    assert(config.max_collection_elements == 1000);
    assert(config.max_value_bytes == 4096);
    assert(config.config_file == path);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadIniErrors() {
    std::cout << "  Testing key=value config errors..." << std::endl;

    std::string error;
    MarshalConfig config;

    std::string path = WriteTempFile("log_level = info\nmax_nesting_depth = -1\n");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Invalid value for 'max_nesting_depth' at line 2: expected a non-negative integer");
    // A failed load does not record the path
    assert(config.config_file.empty());

    path = WriteTempFile("max_collection_elements = 4294967296\n");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Value for 'max_collection_elements' is out of range");

    path = WriteTempFile("just some text\n");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Invalid syntax at line 1");

    path = WriteTempFile(" = value\n");
    assert(!config.LoadFromFile(path, error));
    assert(error == "Missing key at line 1");
    CleanupFile(path);

    assert(!config.LoadFromFile("/nonexistent/gatewire.conf", error));
    assert(error == "Cannot open config file: /nonexistent/gatewire.conf");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// YAML Config Tests
//===----------------------------------------------------------------------===//

void TestLoadYaml() {
    std::cout << "  Testing YAML config..." << std::endl;

    std::string path = WriteTempFile(
        "logging:\n"
        "  level: warn\n"
        "  file: /var/log/gatewire.log\n"
        "limits:\n"
        "  max_nesting_depth: 16\n"
        "  max_collection_elements: 5000\n"
        "  max_value_bytes: 1048576\n",
        ".yaml");

    MarshalConfig config;
    std::string error;
    assert(config.LoadFromFile(path, error));
    assert(config.log_level == "warn");
    assert(config.log_file == "/var/log/gatewire.log");
    assert(config.max_nesting_depth == 16);
    assert(config.max_collection_elements == 5000);
    assert(config.max_value_bytes == 1048576);
    assert(config.config_file == path);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadYamlPartial() {
    std::cout << "  Testing partial YAML config..." << std::endl;

    YamlConfig yaml;
    assert(yaml.LoadString("limits:\n  max_nesting_depth: 4\n"));
    assert(yaml.Has("limits.max_nesting_depth"));
    assert(!yaml.Has("limits.max_value_bytes"));
    assert(!yaml.Has("logging.level"));
    assert(!yaml.Has("limits.max_nesting_depth.deeper"));
    assert(yaml.GetString("logging.level", "info") == "info");

    MarshalConfig config;
    std::string error;
    assert(config.LoadFromYamlConfig(yaml, error));
    assert(config.max_nesting_depth == 4);
    // Untouched settings keep their defaults
    assert(config.log_level == "info");
    assert(config.max_value_bytes == DEFAULT_MAX_VALUE_BYTES);

    std::cout << "    PASSED" << std::endl;
}

void TestLoadYamlErrors() {
    std::cout << "  Testing YAML config errors..." << std::endl;

    YamlConfig yaml;
    assert(yaml.LoadString("limits:\n  max_value_bytes: lots\n"));
    MarshalConfig config;
    std::string error;
    assert(!config.LoadFromYamlConfig(yaml, error));
    assert(error == "Invalid value for 'limits.max_value_bytes': expected a non-negative integer");

    YamlConfig broken;
    assert(!broken.LoadString("limits: [unclosed\n"));
    assert(broken.GetError().find("YAML parse error: ") == 0);

    assert(!config.LoadFromFile("/nonexistent/gatewire.yml", error));
    assert(error == "Cannot open config file: /nonexistent/gatewire.yml");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Command Line Tests
//===----------------------------------------------------------------------===//

void TestCommandLine() {
    std::cout << "  Testing command line options..." << std::endl;

    CommandLine cmd;
    std::string error;
    assert(Parse({"--log-level", "debug", "--max-depth", "5", "--max-elements", "10",
                  "--max-value-bytes", "64", "decode", "int", "00000001"},
                 cmd, error));
    assert(cmd.config.log_level == "debug");
    assert(cmd.config.max_nesting_depth == 5);
    assert(cmd.config.max_collection_elements == 10);
    assert(cmd.config.max_value_bytes == 64);
    assert(cmd.arguments == std::vector<std::string>({"decode", "int", "00000001"}));
    assert(!cmd.show_help && !cmd.show_version);

    // Options stop at the first operand, so negative literals stay operands
    assert(Parse({"encode", "int", "-5"}, cmd, error));
    assert(cmd.arguments.size() == 3);
    assert(cmd.arguments[2] == "-5");

    assert(Parse({"--version", "--", "--help"}, cmd, error));
    assert(cmd.show_version);
    assert(!cmd.show_help);
    assert(cmd.arguments == std::vector<std::string>({"--help"}));

    std::cout << "    PASSED" << std::endl;
}

void TestCommandLineConfigFile() {
    std::cout << "  Testing config file with command line overrides..." << std::endl;

    std::string path = WriteTempFile("log_level = warn\nmax_nesting_depth = 8\n");

    // Explicit options win regardless of their position
    CommandLine cmd;
    std::string error;
    assert(Parse({"--max-depth", "3", "-c", path, "describe", "int"}, cmd, error));
    assert(cmd.config.max_nesting_depth == 3);
    assert(cmd.config.log_level == "warn");
    assert(cmd.config.config_file == path);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestCommandLineErrors() {
    std::cout << "  Testing command line errors..." << std::endl;

    CommandLine cmd;
    std::string error;

    assert(!Parse({"--max-depth"}, cmd, error));
    assert(error == "Option --max-depth requires a value");

    assert(!Parse({"--max-depth", "-1"}, cmd, error));
    assert(error == "Invalid value for --max-depth: -1");

    assert(!Parse({"--max-elements", "4294967296"}, cmd, error));
    assert(error == "Invalid value for --max-elements: 4294967296");

    assert(!Parse({"--bogus"}, cmd, error));
    assert(error == "Unknown option: --bogus");

    assert(!Parse({"-c", "/nonexistent/gatewire.conf"}, cmd, error));
    assert(error == "Error loading config file: Cannot open config file: /nonexistent/gatewire.conf");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== MarshalConfig Unit Tests ===" << std::endl;

    std::cout << "\n1. Defaults and Validation:" << std::endl;
    TestDefaultValues();
    TestValidation();

    std::cout << "\n2. Key=Value Config:" << std::endl;
    TestLoadIni();
    TestLoadIniErrors();

    std::cout << "\n3. YAML Config:" << std::endl;
    TestLoadYaml();
    TestLoadYamlPartial();
    TestLoadYamlErrors();

    std::cout << "\n4. Command Line:" << std::endl;
    TestCommandLine();
    TestCommandLineConfigFile();
    TestCommandLineErrors();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
