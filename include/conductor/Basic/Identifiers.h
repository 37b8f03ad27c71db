//===- Identifiers.h --------------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_BASIC_IDENTIFIERS_H
#define CONDUCTOR_BASIC_IDENTIFIERS_H

#include <string>

namespace conductor {
namespace basic {

/// Generate a new 128-bit identifier from the system UUID generator, rendered
/// as 32 lowercase hexadecimal characters.
///
/// This function is thread safe.
std::string generateIdentifier();

}
}

#endif
