#pragma once

namespace h0stx::commands {

// prints the host snapshot and its representative family
int info_command();

} // namespace h0stx::commands
