#pragma once

namespace patchwright::interrupt {

// Route SIGINT/SIGTERM to a process-wide flag instead of terminating.
void install_handlers();

[[nodiscard]] bool requested();

// Throw Interrupted if a signal arrived. Called at safe points only.
void check();

// Simulate a signal (tests) / clear the flag.
void request();
void reset();

} // namespace patchwright::interrupt
