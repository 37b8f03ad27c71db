//===-- Version.cpp -------------------------------------------------------===//
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

#include "conductor/Basic/Version.h"

#include <string>

namespace conductor {

std::string getConductorFullVersion(StringRef productName) {
  std::string result = productName.str() + " version 1.0";

  // Include the additional build version information, if present.
#ifdef CONDUCTOR_VENDOR_STRING
  result = std::string(CONDUCTOR_VENDOR_STRING) + " " + result;
#endif
#ifdef CONDUCTOR_VERSION_STRING
  result = result + " (" + std::string(CONDUCTOR_VERSION_STRING) + ")";
#endif

  return result;
}

}
