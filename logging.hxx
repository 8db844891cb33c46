#pragma once

/**
 * @brief Routes spdlog's default logger to stderr
 *
 * Verbosity 0 logs warnings and errors, 1 adds info, 2 debug, 3 and more trace.
 */
void setupLogging(int verbosity);
