//! # jsev Command Dispatcher
//!
//! ```text
//! jsev_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ events         → run_events()
//!   ├─ format         → run_format()
//!   └─ check          → run_check()
//! ```
//!
//! Logging flags (`--log-level=`, `-v`, ...) are accepted after any command.

#include "commands.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace jsev::tool {

namespace {

void print_usage() {
    std::cout << "jsev " << VERSION << "\n\n";
    std::cout << "Usage: jsev <command> [options] [file|-]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  events    Print one line per parse event\n";
    std::cout << "  format    Re-emit each document as compact JSON\n";
    std::cout << "  check     Validate the input and print a summary\n\n";
    std::cout << "Options:\n";
    std::cout << "  --absolute-coords     Report error coordinates from the start of the stream\n";
    std::cout << "  --no-null             Reject the null literal\n";
    std::cout << "  --strict-whitespace   Do not treat 0x85 and 0xA0 as whitespace\n";
    std::cout << "  --max-depth=N         Limit container nesting (0 = unlimited)\n";
    std::cout << "  --buffer-size=N       Read buffer size in bytes\n";
    std::cout << "  --timeout-ms=N        Abort the parse after N milliseconds\n";
    std::cout << "  --log-level=LEVEL     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=SPEC     Per-module levels, e.g. parser=debug,*=warn\n";
    std::cout << "  --log-file=PATH       Also write logs to PATH\n";
    std::cout << "  --log-format=FORMAT   text or json\n";
    std::cout << "  -v, -vv, -vvv         Increase log verbosity\n";
    std::cout << "  -q, --quiet           Only log errors\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -V, --version         Show the version\n\n";
    std::cout << "Reads standard input when no file or '-' is given.\n";
}

void print_version() {
    std::cout << "jsev " << VERSION << "\n";
}

} // namespace

/// Main entry point for the jsev CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                |
/// |------|----------------------------------------|
/// | 0    | Success                                |
/// | 1    | Parse error, I/O error or usage error  |
int jsev_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_tool_args(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'jsev --help' for usage.\n";
        return 1;
    }

    const ToolOptions& options = unwrap(parsed);
    JSEV_LOG_DEBUG("tool", "input " << input_name(options.input) << ", timeout "
                                    << options.timeout_ms << " ms");

    int status = 0;
    switch (options.command) {
    case Command::Help:
        print_usage();
        break;
    case Command::Version:
        print_version();
        break;
    case Command::Events:
        status = run_events(options, std::cout, std::cerr);
        break;
    case Command::Format:
        status = run_format(options, std::cout, std::cerr);
        break;
    case Command::Check:
        status = run_check(options, std::cout, std::cerr);
        break;
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace jsev::tool
