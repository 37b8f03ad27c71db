//===-- Identifiers.cpp ---------------------------------------------------===//
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

#include "conductor/Basic/Identifiers.h"

#define UUID_SYSTEM_GENERATOR 1
#include "uuid.h"

#include <algorithm>

using namespace conductor;

std::string basic::generateIdentifier() {
  std::string result = uuids::to_string(uuids::uuid_system_generator()());
  result.erase(std::remove(result.begin(), result.end(), '-'), result.end());
  return result;
}
