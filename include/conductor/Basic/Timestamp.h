//===- Timestamp.h ----------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef CONDUCTOR_BASIC_TIMESTAMP_H
#define CONDUCTOR_BASIC_TIMESTAMP_H

#include "conductor/Basic/LLVM.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Chrono.h"

#include <chrono>
#include <string>

namespace conductor {
namespace basic {

/// A wall clock instant, always expressed in UTC, at microsecond precision.
///
/// Every timestamp the core stores or compares goes through this type, so two
/// instants read back from different textual encodings compare equal when
/// they denote the same moment.
typedef llvm::sys::TimePoint<std::chrono::microseconds> Timestamp;

/// Get the current time, truncated to microseconds.
Timestamp currentTimestamp();

/// Format a timestamp in the canonical storage form,
/// "YYYY-MM-DDTHH:MM:SS.ffffff+00:00".
///
/// The canonical form is fixed width, so it also sorts lexicographically.
std::string formatTimestamp(Timestamp value);

/// Parse an ISO-8601 style timestamp.
///
/// Accepts a 'T' or ' ' separator between date and time, optional fractional
/// seconds (digits beyond microseconds are truncated), and an optional 'Z' or
/// numeric UTC offset ("+HH:MM", "+HHMM", "+HH"). A missing offset means UTC.
///
/// \returns None if the text is not a valid timestamp.
Optional<Timestamp> parseTimestamp(StringRef text);

}
}

#endif
