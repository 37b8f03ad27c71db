//===- unittests/TestSupport/TempDir.h ------------------------------------===//
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

#ifndef CONDUCTOR_TESTS_TEMPDIR_H
#define CONDUCTOR_TESTS_TEMPDIR_H

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"

#include <string>

namespace conductor {

/// Creates a temporary directory in its constructor and removes it, with its
/// contents, in its destructor.
class TmpDir {
private:
  TmpDir(const TmpDir&) = delete;
  TmpDir& operator=(const TmpDir&) = delete;

  llvm::SmallString<256> tempDir;

public:
  TmpDir(llvm::StringRef namePrefix = "");
  ~TmpDir();

  const char *c_str();
  std::string str() const;

  /// Get the path of \p name inside the directory.
  std::string path(llvm::StringRef name) const;
};

}

#endif
