/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <dcmstream/integration/logger_adapter.hpp>

#include <dcmstream/core/dicom_tag_constants.hpp>
#include <dcmstream/io/memory_source.hpp>
#include <dcmstream/parser/element_stream.hpp>

#include "test_stream_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace dcmstream;
using namespace dcmstream::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "dcmstream_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;
        config.enable_file = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::get_config().file_name == "dcmstream.log");

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls keep the first configuration") {
        logger_config first;
        first.log_directory = temp_dir;
        first.enable_console = false;
        first.min_level = log_level::debug;

        logger_config second = first;
        second.min_level = log_level::error;

        logger_adapter::initialize(first);
        logger_adapter::initialize(second);
        REQUIRE(logger_adapter::is_initialized());
        CHECK(logger_adapter::get_min_level() == log_level::debug);

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter is silent until initialized", "[logger_adapter][logging]") {
    logger_adapter::shutdown();
    REQUIRE_FALSE(logger_adapter::is_initialized());

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));

    logger_adapter::info("Dropped message: {}", 1);
    logger_adapter::error("Dropped message: {}", 2);
    logger_adapter::log(log_level::warn, "Dropped message");
    logger_adapter::flush();
}

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);

        logger_adapter::flush();
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }

    SECTION("Stream failures and structure tracing are logged") {
        auto bytes = test::stream_builder::explicit_le()
                         .sequence(core::tags::referenced_image_sequence)
                         .item()
                         .item_delimiter()
                         .sequence_delimiter()
                         .sequence_delimiter()
                         .take();
        io::memory_source source(std::move(bytes));

        parser::stream_options options;
        options.trace_structure = true;
        auto stream = parser::element_stream::create(source, options);
        REQUIRE(stream.is_ok());

        std::size_t produced = 0;
        bool failed = false;
        while (auto item = stream.value().next()) {
            if (item->is_err()) {
                failed = true;
                break;
            }
            ++produced;
        }

        CHECK(produced == 4);
        CHECK(failed);
        logger_adapter::flush();
    }
}

// =============================================================================
// Utility Tests
// =============================================================================

TEST_CASE("logger_adapter level names", "[logger_adapter][utility]") {
    CHECK(logger_adapter::log_level_to_string(log_level::trace) == "TRACE");
    CHECK(logger_adapter::log_level_to_string(log_level::debug) == "DEBUG");
    CHECK(logger_adapter::log_level_to_string(log_level::info) == "INFO");
    CHECK(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
    CHECK(logger_adapter::log_level_to_string(log_level::error) == "ERROR");
    CHECK(logger_adapter::log_level_to_string(log_level::fatal) == "FATAL");
    CHECK(logger_adapter::log_level_to_string(log_level::off) == "OFF");
}
