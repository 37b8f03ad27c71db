//===-- StateInvocation.cpp -----------------------------------------------===//
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

#include "conductor/Commands/StateInvocation.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

using namespace conductor;
using namespace conductor::basic;
using namespace conductor::commands;

void StateInvocation::getUsage(int optionWidth, raw_ostream& os) {
  const struct Options {
    llvm::StringRef option, helpText;
  } options[] = {
    { "--help", "show this help message and exit" },
    { "--version", "show the tool version" },
    { "--db <PATH>", "use the project state database at PATH" },
    { "--actor <NAME>", "record NAME as the author of changes" },
    { "--no-cache", "always read project state from the database" },
    { "--log-level <LEVEL>",
      "show diagnostics up to LEVEL (error, warning, info, debug, trace)" },
    { "-v, --verbose", "show verbose status information" },
    { "--expect-updated <TIME>",
      "reject the change unless the project was last updated at TIME" },
    { "--result <JSON>", "record the JSON object as the task result" },
    { "--transaction <ID>", "roll back the changes of transaction ID" },
    { "--snapshot <ID>", "roll back to snapshot ID" },
    { "--at <TIME>", "roll back to the state before TIME" },
  };

  for (const auto& entry: options) {
    os << "  " << llvm::format("%-*s", optionWidth, entry.option.str().c_str())
       << " " << entry.helpText << "\n";
  }
}

void StateInvocation::parse(llvm::ArrayRef<std::string> args,
                            llvm::SourceMgr& sourceMgr) {
  auto error = [&](const Twine &message) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error, message);
    hadErrors = true;
  };

  // Parse a time argument into \p value_out, or report an error.
  auto parseTime = [&](const std::string& option, const std::string& text,
                       Optional<Timestamp>& value_out) {
    auto value = parseTimestamp(text);
    if (!value) {
      error("invalid time '" + text + "' for '" + option + "'");
      return false;
    }
    value_out = *value;
    return true;
  };

  while (!args.empty()) {
    const auto& option = args.front();
    args = args.slice(1);

    if (option == "-") {
      for (const auto& arg: args) {
        positionalArgs.push_back(arg);
      }
      break;
    }

    if (!option.empty() && option[0] != '-') {
      positionalArgs.push_back(option);
      continue;
    }

    if (option == "--help") {
      showUsage = true;
      break;
    } else if (option == "--version") {
      showVersion = true;
      break;
    } else if (option == "--no-cache") {
      enableCache = false;
    } else if (option == "-v" || option == "--verbose") {
      logLevel = LogLevel::Debug;
    } else if (option == "--db" || option == "--actor" ||
               option == "--log-level" || option == "--expect-updated" ||
               option == "--result" || option == "--transaction" ||
               option == "--snapshot" || option == "--at") {
      if (args.empty()) {
        error("missing argument to '" + option + "'");
        break;
      }
      const std::string& value = args[0];
      args = args.slice(1);

      if (option == "--db") {
        dbPath = value;
      } else if (option == "--actor") {
        actor = value;
      } else if (option == "--log-level") {
        auto level = parseLogLevel(value);
        if (!level) {
          error("unknown log level '" + value + "'");
          break;
        }
        logLevel = *level;
      } else if (option == "--expect-updated") {
        if (!parseTime(option, value, expectedLastUpdated))
          break;
      } else if (option == "--result") {
        auto parsed = json::parse(value);
        if (!parsed) {
          error("invalid JSON for '" + option + "': " +
                llvm::toString(parsed.takeError()));
          break;
        }
        json::Object* object = parsed->getAsObject();
        if (!object) {
          error("argument to '" + option + "' must be a JSON object");
          break;
        }
        resultMetadata = std::move(*object);
      } else if (option == "--transaction") {
        transactionID = value;
      } else if (option == "--snapshot") {
        snapshotID = value;
      } else {
        if (!parseTime(option, value, restoreAt))
          break;
      }
    } else {
      error("invalid option '" + option + "'");
      break;
    }
  }
}
