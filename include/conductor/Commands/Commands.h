//===- Commands.h -----------------------------------------------*- C++ -*-===//
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
//
// This header describes the interfaces in the Commands conductor library,
// which contains the command line tool implementations.
//
//===----------------------------------------------------------------------===//

#ifndef CONDUCTOR_COMMANDS_COMMANDS_H
#define CONDUCTOR_COMMANDS_COMMANDS_H

#include "conductor/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace conductor {
namespace commands {

/// Register the program name.
void setProgramName(StringRef name);

/// Get the registered program name.
const char* getProgramName();

/// Run the project state subtool.
///
/// \returns The process exit status.
int executeStateCommand(const std::vector<std::string> &args);

}
}

#endif
