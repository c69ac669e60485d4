#pragma once

namespace rev::task {

/// Loads the config, opens the log and builds the review source.
/// False when the tool cannot run (e.g. no credentials).
bool Init();

} // namespace rev::task
