//! # jsev Command Implementations

#include "commands.hpp"

#include "log/log.hpp"
#include "stream/event_stream.hpp"
#include "stream/event_writer.hpp"

#include <charconv>
#include <chrono>
#include <string_view>

namespace jsev::tool {

namespace {

auto parse_size(std::string_view text, size_t& value) -> bool {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

/// Parser options with the deadline computed from `--timeout-ms`.
auto effective_parser_options(const ToolOptions& options) -> stream::ParserOptions {
    stream::ParserOptions parser = options.parser;
    if (options.timeout_ms > 0) {
        parser.deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(options.timeout_ms);
    }
    return parser;
}

/// Prints `<file>:<line>:<position>: <message>[: <cause>]`.
void report(std::ostream& err, const ToolOptions& options, const stream::ParseError& error) {
    err << input_name(options.input) << ":" << error.line << ":" << error.position << ": "
        << error.message;
    if (!error.cause.empty()) {
        err << ": " << error.cause;
    }
    err << "\n";
}

} // namespace

auto parse_tool_args(const std::vector<std::string>& args) -> Result<ToolOptions, std::string> {
    ToolOptions options;
    if (args.empty()) {
        return options;
    }

    const std::string& command = args[0];
    if (command == "events") {
        options.command = Command::Events;
    } else if (command == "format") {
        options.command = Command::Format;
    } else if (command == "check") {
        options.command = Command::Check;
    } else if (command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else if (command == "--version" || command == "-V") {
        options.command = Command::Version;
        return options;
    } else {
        return "unknown command '" + command + "'";
    }

    bool has_input = false;
    for (size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
        } else if (arg == "--absolute-coords") {
            options.parser.coordinates = stream::CoordinateMode::Absolute;
        } else if (arg == "--no-null") {
            options.parser.allow_null = false;
        } else if (arg == "--strict-whitespace") {
            options.parser.extended_whitespace = false;
        } else if (arg.starts_with("--max-depth=")) {
            if (!parse_size(arg.substr(12), options.parser.max_depth)) {
                return "invalid value for --max-depth: " + std::string(arg.substr(12));
            }
        } else if (arg.starts_with("--buffer-size=")) {
            if (!parse_size(arg.substr(14), options.parser.buffer_size) ||
                options.parser.buffer_size == 0) {
                return "invalid value for --buffer-size: " + std::string(arg.substr(14));
            }
        } else if (arg.starts_with("--timeout-ms=")) {
            if (!parse_size(arg.substr(13), options.timeout_ms)) {
                return "invalid value for --timeout-ms: " + std::string(arg.substr(13));
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "unknown option '" + std::string(arg) + "'";
        } else if (has_input) {
            return "unexpected argument '" + std::string(arg) + "'";
        } else {
            options.input = std::string(arg);
            has_input = true;
        }
    }

    return options;
}

auto input_name(const std::string& input) -> std::string {
    return input == "-" ? "<stdin>" : input;
}

auto open_input(const ToolOptions& options) -> Result<Box<stream::ByteSource>, std::string> {
    if (options.input == "-") {
        return Box<stream::ByteSource>(stream::FileSource::standard_input());
    }

    auto file = stream::FileSource::open(options.input);
    if (is_err(file)) {
        return unwrap_err(file);
    }
    return Box<stream::ByteSource>(std::move(unwrap(file)));
}

auto run_events(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto source = open_input(options);
    if (is_err(source)) {
        err << "error: " << unwrap_err(source) << "\n";
        return 1;
    }

    stream::EventStream events(std::move(unwrap(source)), effective_parser_options(options));
    int status = 0;
    while (auto event = events.next()) {
        out << event->to_string() << "\n";
        if (event->is_error()) {
            report(err, options, *event->error);
            status = 1;
        }
    }
    return status;
}

auto run_format(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto source = open_input(options);
    if (is_err(source)) {
        err << "error: " << unwrap_err(source) << "\n";
        return 1;
    }

    stream::StreamParser parser(*unwrap(source), effective_parser_options(options));
    stream::EventWriter writer(out);
    if (parser.parse(writer)) {
        return 0;
    }

    if (!writer.error().empty()) {
        err << input_name(options.input) << ": " << writer.error() << "\n";
    } else {
        report(err, options, *parser.error());
    }
    return 1;
}

auto run_check(const ToolOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto source = open_input(options);
    if (is_err(source)) {
        err << "error: " << unwrap_err(source) << "\n";
        return 1;
    }

    stream::StreamParser parser(*unwrap(source), effective_parser_options(options));
    size_t events = 0;
    stream::CallbackSink sink([&events](const stream::Event& event) {
        if (!event.is_end()) {
            ++events;
        }
        return true;
    });

    if (!parser.parse(sink)) {
        report(err, options, *parser.error());
        return 1;
    }

    JSEV_LOG_INFO("tool", "checked " << input_name(options.input) << " (" << events << " events)");
    out << "ok: " << parser.documents() << " documents, " << events << " events\n";
    return 0;
}

} // namespace jsev::tool
