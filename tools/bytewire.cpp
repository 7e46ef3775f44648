// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// bytewire -- decode and encode binary messages from a field layout
//
// Usage:
//   bytewire [options] <command>
//
// Commands:
//   decode              Read the fields named by --layout from the input
//   encode              Write the values given by --fields, print as hex
//
// Options:
//   --layout=FIELDS     e.g. "u16le,varint,string,bytes:4,rest"
//   --hex=HEX           Input bytes as hex (decode)
//   --file=PATH         Input bytes from a file (decode)
//   --offset=N          Start reading at byte N (default: 0)
//   --eof=MODE          legacy or strict (default: legacy)
//   --fields=VALUES     e.g. "u16le=300,string=hi,bytes=dead" (encode)
//   --conf=PATH         Read options from an INI-style file
//   --loglevel=LEVEL    trace, debug, info, warn, error, fatal, off
//   --logcategories=L   codec, stream, layout, config, cli, all
//   --logfile=PATH      Also append log lines to PATH
//   --printtoconsole=0  Keep log lines off stderr
// ---------------------------------------------------------------------------

#include "codec/layout.h"
#include "codec/stream.h"
#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "bytewire\n\n"
              << "Usage: bytewire [options] <command>\n\n"
              << "Commands:\n"
              << "  decode              Read --layout fields from the input\n"
              << "  encode              Encode --fields and print as hex\n\n"
              << "Options:\n"
              << "  --layout=FIELDS     Field list, e.g. u16le,varint,string\n"
              << "  --hex=HEX           Input bytes as hex\n"
              << "  --file=PATH         Input bytes from a file\n"
              << "  --offset=N          Start offset (default: 0)\n"
              << "  --eof=MODE          legacy or strict (default: legacy)\n"
              << "  --fields=VALUES     kind=value list to encode\n"
              << "  --conf=PATH         INI-style option file\n"
              << "  --loglevel=LEVEL    Log level (default: warn)\n"
              << "  --logcategories=L   Comma-separated log categories\n"
              << "  --logfile=PATH      Append log output to PATH\n"
              << "  --printtoconsole=0  Do not log to stderr\n\n"
              << "Examples:\n"
              << "  bytewire decode --layout=u16le,string --hex=2c01026869\n"
              << "  bytewire encode --fields=varint=-1,string=hello\n";
}

void print_error(const core::Error& err) {
    std::cerr << "error: " << err.message() << " ("
              << core::error_code_name(err.code()) << ")" << std::endl;
}

core::Result<void> init_logging(const core::Config& cfg) {
    auto& logger = core::Logger::instance();

    const std::string level_name = cfg.get_or(core::CONF_LOGLEVEL, "warn");
    auto level = core::parse_log_level(level_name);
    if (!level) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "unknown log level '" + level_name + "'");
    }
    logger.set_level(*level);

    if (auto cats = cfg.get(core::CONF_LOGCATEGORIES)) {
        logger.set_categories(core::parse_log_categories(*cats));
    }

    logger.set_print_to_console(cfg.get_bool(core::CONF_PRINTTOCONSOLE, true));

    if (auto path = cfg.get(core::CONF_LOGFILE)) {
        if (!logger.set_log_file(*path)) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "cannot open log file '" + *path + "'");
        }
    }
    return core::make_ok();
}

core::Result<codec::Bytes> load_input(const core::Config& cfg) {
    if (auto hex = cfg.get(core::CONF_HEX)) {
        auto bytes = core::from_hex(*hex);
        if (!bytes) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "--hex is not valid hex");
        }
        return std::move(*bytes);
    }

    if (auto path = cfg.get(core::CONF_FILE)) {
        std::ifstream in(*path, std::ios::binary);
        if (!in) {
            return core::make_error(core::ErrorCode::IO_ERROR,
                                    "cannot open '" + *path + "'");
        }
        codec::Bytes data((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
        LOG_DEBUG(core::LogCategory::CLI,
                  "read " + std::to_string(data.size()) + " bytes from " +
                  *path);
        return data;
    }

    return core::make_error(core::ErrorCode::CONFIG_ERROR,
                            "decode needs --hex or --file");
}

core::Result<codec::EofMode> eof_mode_from(const core::Config& cfg) {
    const std::string mode = cfg.get_or(core::CONF_EOF, "legacy");
    if (mode == "legacy") return codec::EofMode::LEGACY;
    if (mode == "strict") return codec::EofMode::STRICT;
    return core::make_error(core::ErrorCode::CONFIG_ERROR,
                            "--eof must be legacy or strict, got '" +
                            mode + "'");
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_decode(const core::Config& cfg) {
    auto layout_text = cfg.get(core::CONF_LAYOUT);
    if (!layout_text) {
        std::cerr << "Usage: bytewire decode --layout=<fields> "
                  << "(--hex=<hex> | --file=<path>)" << std::endl;
        return 1;
    }

    auto fields = codec::parse_layout(*layout_text);
    if (!fields.ok()) {
        print_error(fields.error());
        return 1;
    }
    auto input = load_input(cfg);
    if (!input.ok()) {
        print_error(input.error());
        return 1;
    }
    auto mode = eof_mode_from(cfg);
    if (!mode.ok()) {
        print_error(mode.error());
        return 1;
    }

    const int64_t offset = cfg.get_int(core::CONF_OFFSET, 0);
    if (offset < 0) {
        std::cerr << "error: --offset must not be negative" << std::endl;
        return 1;
    }

    codec::Stream stream(std::move(input).value(), 0, mode.value());
    auto seek = stream.set_offset(static_cast<size_t>(offset));
    if (!seek.ok()) {
        print_error(seek.error());
        return 1;
    }

    auto decoded = codec::decode_layout(stream, fields.value());
    if (!decoded.ok()) {
        std::cerr << "fault: " << stream.fault()->format() << std::endl;
        return 2;
    }

    for (const auto& f : decoded.value()) {
        std::cout << f.offset << " " << f.spec.to_string() << " "
                  << f.text << "\n";
    }
    std::cout << "offset " << stream.offset() << " of " << stream.size()
              << (stream.eof() ? " (eof)" : "") << std::endl;
    return 0;
}

int cmd_encode(const core::Config& cfg) {
    auto fields_text = cfg.get(core::CONF_FIELDS);
    if (!fields_text) {
        std::cerr << "Usage: bytewire encode --fields=<kind=value,...>"
                  << std::endl;
        return 1;
    }

    auto values = codec::parse_field_values(*fields_text);
    if (!values.ok()) {
        print_error(values.error());
        return 1;
    }

    codec::Stream stream;
    auto res = codec::encode_fields(stream, values.value());
    if (!res.ok()) {
        print_error(res.error());
        return 1;
    }

    LOG_INFO(core::LogCategory::CLI,
             "encoded " + std::to_string(values.value().size()) +
             " fields into " + std::to_string(stream.size()) + " bytes");
    std::cout << core::to_hex(stream.view()) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config cfg;
    cfg.parse_args(argc, argv);

    if (cfg.positionals().empty()) {
        print_usage();
        return 0;
    }

    if (auto conf = cfg.get(core::CONF_CONF)) {
        auto res = cfg.parse_file(*conf);
        if (!res.ok()) {
            print_error(res.error());
            return 1;
        }
    }

    auto logging = init_logging(cfg);
    if (!logging.ok()) {
        print_error(logging.error());
        return 1;
    }

    const std::string& command = cfg.positionals().front();
    LOG_DEBUG(core::LogCategory::CLI, "command: " + command);

    int rc;
    if (command == "decode") {
        rc = cmd_decode(cfg);
    }
    else if (command == "encode") {
        rc = cmd_encode(cfg);
    }
    else {
        std::cerr << "Unknown command: " << command << std::endl;
        std::cerr << "Run 'bytewire' without arguments for help."
                  << std::endl;
        rc = 1;
    }

    core::Logger::instance().flush();
    return rc;
}
