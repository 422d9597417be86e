//! # jsev Driver Interface
//!
//! `jsev_main()` dispatches to the command handler named by argv[1].

#pragma once

namespace jsev::tool {

int jsev_main(int argc, char* argv[]);

} // namespace jsev::tool
