//! # CLI Driver Interface
//!
//! Entry point of the `hbs` command-line tool. `main()` forwards to
//! `hbs_main()`; see `dispatcher.cpp` for the command table.

#pragma once

int hbs_main(int argc, char* argv[]);
