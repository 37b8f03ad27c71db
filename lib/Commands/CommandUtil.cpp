//===-- CommandUtil.cpp ---------------------------------------------------===//
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

#include "conductor/Commands/Commands.h"

#include <string>

using namespace conductor;
using namespace conductor::commands;

static std::string programName;

void commands::setProgramName(StringRef name) {
  programName = name.str();
}

const char* commands::getProgramName() {
  if (programName.empty())
    return "conductor";

  return programName.c_str();
}
