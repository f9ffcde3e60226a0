//===----------------------------------------------------------------------===//
//                         GateWire - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger and the GW_LOG_* macros
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <iterator>

using namespace gatewire;

static std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

//===----------------------------------------------------------------------===//
// Log Level Conversion Tests
//===----------------------------------------------------------------------===//

void TestLogLevelEnumConversion() {
    std::cout << "  Testing LogLevel enum to spdlog conversion..." << std::endl;

    assert(Logger::ToSpdlogLevel(LogLevel::TRACE) == spdlog::level::trace);
    assert(Logger::ToSpdlogLevel(LogLevel::DEBUG) == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel(LogLevel::INFO) == spdlog::level::info);
    assert(Logger::ToSpdlogLevel(LogLevel::WARN) == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel(LogLevel::ERROR) == spdlog::level::err);
    assert(Logger::ToSpdlogLevel(LogLevel::FATAL) == spdlog::level::critical);

    std::cout << "    PASSED" << std::endl;
}

void TestLogLevelStringConversion() {
    std::cout << "  Testing string to spdlog level conversion..." << std::endl;

    assert(Logger::ToSpdlogLevel("trace") == spdlog::level::trace);
    assert(Logger::ToSpdlogLevel("DEBUG") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("Info") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("warning") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("err") == spdlog::level::err);
    assert(Logger::ToSpdlogLevel("ERROR") == spdlog::level::err);
    assert(Logger::ToSpdlogLevel("critical") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("fatal") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("off") == spdlog::level::off);

    // Unknown defaults to info
    assert(Logger::ToSpdlogLevel("verbose") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("") == spdlog::level::info);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Logger Initialization Tests
//===----------------------------------------------------------------------===//

void TestLoggerAutoInitialize() {
    std::cout << "  Testing auto-initialization..." << std::endl;

    Logger::Shutdown();
    assert(!Logger::IsInitialized());

    auto& logger = Logger::Get();
    assert(logger != nullptr);
    assert(Logger::IsInitialized());
    assert(logger->level() == spdlog::level::info);

    Logger::Shutdown();
    assert(!Logger::IsInitialized());
    std::cout << "    PASSED" << std::endl;
}

void TestLoggerDoubleInitialize() {
    std::cout << "  Testing double initialization is a no-op..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "debug", LogConsole::STDERR);
    assert(Logger::Get()->level() == spdlog::level::debug);

    Logger::Initialize("", "error");
    assert(Logger::Get()->level() == spdlog::level::debug);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Set Level Tests
//===----------------------------------------------------------------------===//

void TestSetLevel() {
    std::cout << "  Testing SetLevel..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "info", LogConsole::STDERR);

    Logger::SetLevel(LogLevel::TRACE);
    assert(Logger::Get()->level() == spdlog::level::trace);
    Logger::SetLevel(LogLevel::ERROR);
    assert(Logger::Get()->level() == spdlog::level::err);

    Logger::SetLevel("Warning");
    assert(Logger::Get()->level() == spdlog::level::warn);
    Logger::SetLevel("off");
    assert(Logger::Get()->level() == spdlog::level::off);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File Output Tests
//===----------------------------------------------------------------------===//

void TestLoggerFileOutput() {
    std::cout << "  Testing file output and macros..." << std::endl;

    std::string log_file = "/tmp/gatewire_test_logger.log";
    std::filesystem::remove(log_file);

    Logger::Shutdown();
    Logger::Initialize(log_file, "info", LogConsole::STDERR);

    GW_LOG_INFO("bind", "bound {} values to statement {}", 2, "0a0b");
    GW_LOG_WARN("result", "row {} has no cells", 7);
    // Below the threshold
    GW_LOG_DEBUG("codec", "hidden message {}", 1);

    Logger::Flush();
    Logger::Shutdown();

    assert(std::filesystem::exists(log_file));
    std::string content = ReadFile(log_file);
    assert(content.find("[bind] bound 2 values to statement 0a0b") != std::string::npos);
    assert(content.find("[result] row 7 has no cells") != std::string::npos);
    assert(content.find("hidden message") == std::string::npos);

    std::filesystem::remove(log_file);
    std::cout << "    PASSED" << std::endl;
}

void TestSetOutput() {
    std::cout << "  Testing SetOutput keeps the level..." << std::endl;

    std::string log_file = "/tmp/gatewire_test_logger_output.log";
    std::filesystem::remove(log_file);

    Logger::Shutdown();
    Logger::Initialize("", "debug", LogConsole::STDERR);
    Logger::SetOutput(log_file);
    assert(Logger::IsInitialized());
    assert(Logger::Get()->level() == spdlog::level::debug);

    GW_LOG_DEBUG("config", "limits loaded from {}", "gatewire.yaml");
    Logger::Flush();
    Logger::Shutdown();

    std::string content = ReadFile(log_file);
    assert(content.find("[config] limits loaded from gatewire.yaml") != std::string::npos);

    std::filesystem::remove(log_file);
    std::cout << "    PASSED" << std::endl;
}

void TestMacroFiltering() {
    std::cout << "  Testing macros skip argument evaluation when disabled..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "error", LogConsole::STDERR);

    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };
    GW_LOG_INFO("test", "value {}", count());
    assert(evaluated == 0);
    GW_LOG_ERROR("test", "value {}", count());
    assert(evaluated == 1);
    GW_LOG_FATAL("test", "no arguments");

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Log Level Conversion Tests:" << std::endl;
    TestLogLevelEnumConversion();
    TestLogLevelStringConversion();

    std::cout << "\n2. Logger Initialization Tests:" << std::endl;
    TestLoggerAutoInitialize();
    TestLoggerDoubleInitialize();

    std::cout << "\n3. Set Level Tests:" << std::endl;
    TestSetLevel();

    std::cout << "\n4. File Output Tests:" << std::endl;
    TestLoggerFileOutput();
    TestSetOutput();

    std::cout << "\n5. Log Macro Tests:" << std::endl;
    TestMacroFiltering();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
