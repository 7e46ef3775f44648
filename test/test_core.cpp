// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(Error, default_is_ok) {
    core::Error e;
    CHECK(e.is_ok());
    CHECK(!static_cast<bool>(e));
    CHECK_EQ(e.format(), std::string("no error"));
}

TEST_CASE(Error, format_contains_name_and_message) {
    auto e = core::make_error(core::ErrorCode::INSUFFICIENT_BYTES,
                              "need 2 bytes");
    std::string s = e.format();
    CHECK(s.find("INSUFFICIENT_BYTES(100)") != std::string::npos);
    CHECK(s.find("need 2 bytes") != std::string::npos);
}

TEST_CASE(Error, wrap_keeps_code_and_prefixes_message) {
    auto inner = core::make_error(core::ErrorCode::VARINT_TOO_LARGE, "6 groups");
    auto outer = inner.wrap("read_string");
    CHECK(outer.code() == core::ErrorCode::VARINT_TOO_LARGE);
    CHECK_EQ(outer.message(), std::string("read_string: 6 groups"));
    CHECK_EQ(outer.location().line(), inner.location().line());
}

TEST_CASE(Error, code_names) {
    CHECK_EQ(core::error_code_name(core::ErrorCode::VARLONG_TOO_LARGE),
             std::string_view("VARLONG_TOO_LARGE"));
    CHECK_EQ(core::error_code_name(core::ErrorCode::OFFSET_OUT_OF_RANGE),
             std::string_view("OFFSET_OUT_OF_RANGE"));
    CHECK_EQ(core::error_code_name(static_cast<core::ErrorCode>(999)),
             std::string_view("UNKNOWN"));
}

TEST_CASE(Result, value_and_error) {
    core::Result<int> ok = 42;
    CHECK(ok.ok());
    CHECK_EQ(ok.value(), 42);

    core::Result<int> bad = core::make_error(core::ErrorCode::VALUE_ERROR, "x");
    CHECK(!bad.ok());
    CHECK_EQ(bad.value_or(7), 7);
    CHECK(bad.error().code() == core::ErrorCode::VALUE_ERROR);
}

TEST_CASE(Result, value_on_error_throws) {
    core::Result<int> bad = core::make_error(core::ErrorCode::INTERNAL_ERROR);
    bool threw = false;
    try {
        (void)bad.value();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Result, map_and_then) {
    core::Result<int> r = 20;
    auto doubled = r.map([](int v) { return v * 2; });
    CHECK_EQ(doubled.value(), 40);

    auto chained = r.and_then([](int v) -> core::Result<std::string> {
        if (v > 10) {
            return core::make_error(core::ErrorCode::VALUE_ERROR, "too big");
        }
        return std::to_string(v);
    });
    CHECK_ERR_CODE(chained, core::ErrorCode::VALUE_ERROR);
}

namespace {

core::Result<int> half(int v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::VALUE_ERROR, "odd");
    }
    return v / 2;
}

core::Result<int> quarter(int v) {
    BYTEWIRE_TRY_ASSIGN(h, half(v));
    BYTEWIRE_TRY_ASSIGN(q, half(h));
    return q;
}

core::Result<void> check_even(int v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::VALUE_ERROR, "odd");
    }
    return core::make_ok();
}

core::Result<void> require_even(int v) {
    BYTEWIRE_TRY_VOID(check_even(v));
    return core::make_ok();
}

} // anonymous namespace

TEST_CASE(Result, try_macros_propagate) {
    CHECK_EQ(quarter(8).value(), 2);
    CHECK_ERR_CODE(quarter(6), core::ErrorCode::VALUE_ERROR);
    CHECK_OK(require_even(4));
    CHECK_ERR(require_even(3));
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, encode_lowercase) {
    std::vector<uint8_t> data = {0x00, 0xab, 0xCD, 0xff};
    CHECK_EQ(core::to_hex(data), std::string("00abcdff"));
    CHECK_EQ(core::to_hex({}), std::string(""));
}

TEST_CASE(Hex, decode_prefix_and_whitespace) {
    auto a = core::from_hex("0x0102ff");
    CHECK(a.has_value());
    CHECK_EQ(a->size(), 3u);
    CHECK_EQ((*a)[2], 0xff);

    auto b = core::from_hex("01 02\tff");
    CHECK(b.has_value());
    CHECK(*a == *b);
}

TEST_CASE(Hex, decode_rejects_bad_input) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zz").has_value());
    CHECK(!core::from_hex("0 1").has_value());
}

TEST_CASE(Hex, is_hex_strict) {
    CHECK(core::is_hex("deadBEEF"));
    CHECK(!core::is_hex("dead beef"));
    CHECK(!core::is_hex("0x00"));
    CHECK(!core::is_hex("a"));
}

TEST_CASE(Hex, window_marks_position) {
    std::vector<uint8_t> data = {0x0a, 0x0b, 0x0c, 0x0d};
    CHECK_EQ(core::hex_window(data, 2), std::string("0a 0b [0c] 0d"));
    CHECK_EQ(core::hex_window(data, 4), std::string("0a 0b 0c 0d []"));
    CHECK_EQ(core::hex_window(data, 2, 1), std::string(".. 0b [0c] 0d"));
    CHECK_EQ(core::hex_window(data, 0, 1), std::string("[0a] 0b .."));
    CHECK_EQ(core::hex_window({}, 0), std::string("[]"));
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_keys_flags_positionals) {
    const char* argv[] = {"bytewire", "decode", "--layout=u8,u16le",
                          "-offset=3", "--verbose", "extra"};
    core::Config cfg;
    cfg.parse_args(6, argv);

    CHECK_EQ(cfg.get_or(core::CONF_LAYOUT, ""), std::string("u8,u16le"));
    CHECK_EQ(cfg.get_int(core::CONF_OFFSET), 3);
    CHECK(cfg.get_bool("verbose"));
    CHECK_EQ(cfg.positionals().size(), 2u);
    CHECK_EQ(cfg.positionals()[0], std::string("decode"));
    CHECK_EQ(cfg.positionals()[1], std::string("extra"));
}

TEST_CASE(Config, negative_value_in_pair) {
    const char* argv[] = {"bytewire", "--fields=varint=-1"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    CHECK_EQ(cfg.get_or(core::CONF_FIELDS, ""), std::string("varint=-1"));
    CHECK(cfg.positionals().empty());
}

TEST_CASE(Config, typed_getters_fall_back_on_garbage) {
    core::Config cfg;
    cfg.set("n", "12x");
    cfg.set("d", "2.5");
    cfg.set("b", "maybe");
    CHECK_EQ(cfg.get_int("n", 9), 9);
    CHECK_NEAR(cfg.get_double("d"), 2.5, 1e-12);
    CHECK(cfg.get_bool("b", true));
    CHECK(!cfg.has("missing"));
    CHECK_EQ(cfg.get_or("missing", "dflt"), std::string("dflt"));
}

TEST_CASE(Config, cli_overrides_file) {
    auto path = std::filesystem::temp_directory_path() /
                "bytewire_test_config.conf";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "layout = u32\n"
            << "eof=strict\n"
            << "\n";
    }

    const char* argv[] = {"bytewire", "--layout=u8"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    CHECK_OK(cfg.parse_file(path));

    CHECK_EQ(cfg.get_or(core::CONF_LAYOUT, ""), std::string("u8"));
    CHECK_EQ(cfg.get_or(core::CONF_EOF, ""), std::string("strict"));

    std::filesystem::remove(path);
}

TEST_CASE(Config, missing_file_is_io_error) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file("/nonexistent/bytewire/none.conf"),
                   core::ErrorCode::IO_ERROR);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_level_names) {
    CHECK(core::parse_log_level("TRACE") == core::LogLevel::TRACE);
    CHECK(core::parse_log_level("warn") == core::LogLevel::WARN);
    CHECK(core::parse_log_level(" error ") == core::LogLevel::ERR);
    CHECK(core::parse_log_level("off") == core::LogLevel::OFF);
    CHECK(!core::parse_log_level("loud").has_value());
}

TEST_CASE(Logging, parse_category_list) {
    auto cats = core::parse_log_categories("stream, layout,bogus");
    CHECK(cats == (core::LogCategory::STREAM | core::LogCategory::LAYOUT));
    CHECK(core::parse_log_categories("all") == core::LogCategory::ALL);
    CHECK(core::parse_log_categories("") == core::LogCategory::NONE);
}

TEST_CASE(Logging, will_log_respects_level_and_category) {
    auto& logger = core::Logger::instance();
    const auto saved_level = logger.level();
    const auto saved_cats  = logger.enabled_categories();

    logger.set_level(core::LogLevel::INFO);
    logger.set_categories(core::LogCategory::CODEC);
    CHECK(logger.will_log(core::LogLevel::WARN, core::LogCategory::CODEC));
    CHECK(!logger.will_log(core::LogLevel::DEBUG, core::LogCategory::CODEC));
    CHECK(!logger.will_log(core::LogLevel::WARN, core::LogCategory::STREAM));

    logger.set_level(saved_level);
    logger.set_categories(saved_cats);
}

TEST_CASE(Logging, no_sink_means_nothing_logs) {
    auto& logger = core::Logger::instance();
    const auto saved_level = logger.level();
    logger.set_level(core::LogLevel::TRACE);

    logger.set_print_to_console(false);
    CHECK(!logger.will_log(core::LogLevel::FATAL, core::LogCategory::NONE));
    logger.set_print_to_console(true);
    CHECK(logger.will_log(core::LogLevel::FATAL, core::LogCategory::NONE));

    logger.set_level(saved_level);
}

TEST_CASE(Logging, category_names) {
    CHECK_EQ(core::log_category_string(core::LogCategory::LAYOUT),
             std::string_view("LAYOUT"));
    CHECK_EQ(core::log_category_string(core::LogCategory::NONE),
             std::string_view("NONE"));
    CHECK_EQ(core::log_level_string(core::LogLevel::ERR),
             std::string_view("ERROR"));
}
