#pragma once

#include "arguments.hpp"

namespace phashcache_app {

/**
 * Handles a hashing run: recovers the checkpoint file, hashes every listed image not
 * yet recorded in it, and appends the new hashes as they complete
 * @param args Validated command arguments
 * @return 0 on success (including runs where individual images failed), 1 on a fatal error
 */
int handleHashCommand(const Arguments& args);

} // namespace phashcache_app
