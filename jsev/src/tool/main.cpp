//! # jsev Entry Point
//!
//! ```bash
//! jsev events dump.json         # One line per event
//! jsev format < stream.json     # Compact JSON, one document per line
//! jsev check --max-depth=64 a.json
//! ```

#include "driver.hpp"

int main(int argc, char* argv[]) {
    return jsev::tool::jsev_main(argc, argv);
}
