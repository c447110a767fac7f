//! # HBS Entry Point
//!
//! The `hbs` binary tokenizes template files:
//!
//! ```bash
//! hbs scan page.hbs                       # Print the token stream
//! hbs scan page.hbs --delimiters="<% %>"  # Scan with custom delimiters
//! hbs check page.hbs --gettext            # Report scan errors only
//! ```
//!
//! All work happens in the CLI driver (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return hbs_main(argc, argv);
}
