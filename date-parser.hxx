#pragma once

#include "commit.hxx"

#include <string_view>

/**
 * @brief Converts a user supplied date into an UTC instant
 *
 * Interpretations are tried in this order, the first one that matches wins:
 *  1. RFC 3339 timestamp with zone: 2023-01-01T00:00:00Z, 2023-01-01T02:00:00+02:00
 *  2. RFC 2822 timestamp: Mon, 01 Jan 2023 00:00:00 GMT, 01 Jan 2023 00:00:00 +0000
 *  3. YYYY-MM-DD, taken as UTC midnight
 *  4. YYYY-MM-DD HH:MM:SS, taken as UTC
 *
 * Fractional seconds of RFC 3339 timestamps are kept. A timestamp with a time of day but without zone marker
 * (2023-01-01T00:00:00) is rejected.
 *
 * @throws InvalidDateFormat
 */
Instant parseDate(std::string_view text);

/// Human readable list of the accepted formats
std::string_view supportedDateFormats();
