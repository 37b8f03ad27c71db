//===- ProjectStateCoding.h -------------------------------------*- C++ -*-===//
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

#ifndef CONDUCTOR_STATE_PROJECTSTATECODING_H
#define CONDUCTOR_STATE_PROJECTSTATECODING_H

#include "conductor/Basic/LLVM.h"
#include "conductor/State/ProjectState.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <string>
#include <vector>

namespace conductor {
namespace state {

/// Render a JSON value in its compact textual form.
std::string serializeJSON(const json::Value& value);

json::Array encodeTaskList(ArrayRef<std::string> tasks);

/// Decode a stored task list.
///
/// Malformed text, or text which is not a JSON array, decodes to an empty
/// list; elements which are not strings are skipped.
std::vector<std::string> decodeTaskList(StringRef text);

/// Decode a task list held either as an array or as serialized text.
std::vector<std::string> decodeTaskList(const json::Value* value);

/// Decode a stored JSON object, or an empty object if \p text is malformed or
/// not an object.
json::Object decodeObject(StringRef text);

/// Decode an object held either inline or as serialized text.
json::Object decodeObject(const json::Value* value);

/// Encode the full project row, as stored in snapshots and as the prior state
/// of transactions.
json::Object encodeProjectState(const ProjectState& state);

/// Overwrite the restorable fields of \p state (everything except the
/// identifier and the creation and update times) from a document produced by
/// encodeProjectState().
///
/// Collections are decoded leniently. A missing status restores an active
/// project.
///
/// \param error_out [out] Error string if return value is false, in which case
/// \p state is unchanged.
bool applyStateDocument(const json::Object& document, ProjectState& state,
                        std::string* error_out);

json::Object encodeTransaction(const TransactionRecord& record);
json::Object encodeSnapshot(const SnapshotRecord& record);
json::Object encodeProgress(const ProjectProgress& progress);

}
}

#endif
