#pragma once

namespace h0stx::commands {

// lists every family in resolution order, marking the ones the host belongs to
int families_command();

} // namespace h0stx::commands
