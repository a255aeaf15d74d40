//! # cdlc Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`).
//!
//! ```bash
//! cdlc git.cdl gitcli            # Compile and validate
//! cdlc check git.cdl gitcli      # Print the emit plan
//! cdlc run git.cdl -- remote add origin
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return cdl_main(argc, argv);
}
