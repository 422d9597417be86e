//! # jsev Commands
//!
//! | Command  | Output |
//! |----------|--------|
//! | `events` | one line per event |
//! | `format` | each document as compact JSON on its own line |
//! | `check`  | `ok: N documents, M events` or the first error |
//!
//! Every command returns the process exit code: 0 on success, 1 on error.

#pragma once

#include "common.hpp"
#include "stream/byte_source.hpp"
#include "stream/parser.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace jsev::tool {

enum class Command : uint8_t { Events, Format, Check, Help, Version };

/// Parsed command line.
struct ToolOptions {
    Command command = Command::Help;
    stream::ParserOptions parser;
    size_t timeout_ms = 0; ///< 0 for no deadline
    std::string input = "-";
};

/// Parses the arguments after the program name. Logging options are skipped.
///
/// # Returns
///
/// The options, or a usage error message.
[[nodiscard]] auto parse_tool_args(const std::vector<std::string>& args)
    -> Result<ToolOptions, std::string>;

/// Display name of an input path (`<stdin>` for `-`).
[[nodiscard]] auto input_name(const std::string& input) -> std::string;

/// Opens the input named by `options`, `-` being standard input.
[[nodiscard]] auto open_input(const ToolOptions& options)
    -> Result<Box<stream::ByteSource>, std::string>;

auto run_events(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int;
auto run_format(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int;
auto run_check(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int;

} // namespace jsev::tool
