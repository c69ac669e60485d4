#pragma once

namespace rev::task {

/// Runs the terminal UI until the user quits. Requires Init().
int StartUi();

} // namespace rev::task
