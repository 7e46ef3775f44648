#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF           = "conf";
inline constexpr const char* CONF_HEX            = "hex";
inline constexpr const char* CONF_FILE           = "file";
inline constexpr const char* CONF_LAYOUT         = "layout";
inline constexpr const char* CONF_FIELDS         = "fields";
inline constexpr const char* CONF_OFFSET         = "offset";
inline constexpr const char* CONF_EOF            = "eof";
inline constexpr const char* CONF_LOGLEVEL       = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES  = "logcategories";
inline constexpr const char* CONF_LOGFILE        = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE = "printtoconsole";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  programmatic set()
// A key given more than once keeps its first value.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments, skipping argv[0].
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Arguments without a leading dash are collected as positionals.
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style file: one key=value per line, '#' comments and
    /// blank lines ignored, whitespace around key and value trimmed.
    /// Fails with IO_ERROR if the file cannot be opened.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous programmatic or
    /// file value; CLI values still win).
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Value parsed as int64, or @p default_val when absent or malformed.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    [[nodiscard]] double get_double(std::string_view key,
                                    double default_val = 0.0) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Positional (non-dash) command-line arguments in order.
    [[nodiscard]] const std::vector<std::string>& positionals() const noexcept {
        return positionals_;
    }

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positionals_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
