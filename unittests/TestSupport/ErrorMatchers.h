//===- unittests/TestSupport/ErrorMatchers.h ------------------------------===//
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

#ifndef CONDUCTOR_TESTS_ERRORMATCHERS_H
#define CONDUCTOR_TESTS_ERRORMATCHERS_H

#include "conductor/Basic/Errors.h"

#include "llvm/Support/Error.h"

namespace conductor {

/// Check whether \p err is an error of kind \p ErrT, consuming it.
template <typename ErrT>
bool failsWith(llvm::Error err) {
  if (!err)
    return false;
  bool matches = err.isA<ErrT>();
  llvm::consumeError(std::move(err));
  return matches;
}

/// Check whether \p value holds an error of kind \p ErrT, consuming it.
template <typename ErrT, typename T>
bool failsWith(llvm::Expected<T>& value) {
  if (value)
    return false;
  return failsWith<ErrT>(value.takeError());
}

/// Get the code of the error held by \p value, consuming it.
///
/// \returns CoreErrorCode::Unknown if \p value holds no error.
template <typename T>
CoreErrorCode errorCodeOf(llvm::Expected<T>& value) {
  if (value)
    return CoreErrorCode::Unknown;
  return takeCoreErrorCode(value.takeError());
}

}

#endif
