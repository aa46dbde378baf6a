// Copyright (c) 2025 YiZhonghua<zhyi@dpai.com>. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace tsfilter {

enum class DiagLevel { Warning, Error, Note };

/// The failure classes a caller can react to. Everything but RootEliminated
/// is a load-time error.
enum class ErrorKind {
  Syntax,
  DuplicateDeclaration,
  DanglingReference,
  ArityMismatch,
  RootEliminated
};

enum class DiagID {
#define DIAG(ID, Level, Kind, Msg) ID,
#include "tsfilter/DiagnosticDefs.def"
#undef DIAG
  NUM_DIAGNOSTICS
};

const char *getKindName(ErrorKind Kind);

/// SchemaError - the llvm::Error payload for every diagnostic the library
/// produces. Line and Column are 1-based; 0 means "not tied to source".
class SchemaError : public llvm::ErrorInfo<SchemaError> {
public:
  static char ID;

  SchemaError(DiagID Diag, int Line, int Column, std::string Message);

  DiagID getDiagID() const { return Diag; }
  ErrorKind kind() const;
  int getLine() const { return Line; }
  int getColumn() const { return Column; }
  const std::string &getMessage() const { return Message; }

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override;

private:
  DiagID Diag;
  int Line;
  int Column;
  std::string Message;
};

class DiagnosticEngine {
public:
  explicit DiagnosticEngine(llvm::raw_ostream &OS, std::string FileName = "")
      : OS(OS), FileName(std::move(FileName)) {}

  unsigned getErrorCount() const { return ErrorCount; }
  unsigned getWarningCount() const { return WarningCount; }
  bool hasErrors() const { return ErrorCount > 0; }

  /// Build an llvm::Error for \p id with the message arguments substituted.
  template <typename... Args>
  static llvm::Error makeError(DiagID id, int Line, int Column,
                               Args &&...args) {
    return llvm::make_error<SchemaError>(
        id, Line, Column, formatMessage(id, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void report(int Line, int Column, DiagID id, Args &&...args) {
    reportImpl(Line, Column, id,
               formatMessage(id, std::forward<Args>(args)...));
  }

  /// Render every SchemaError inside \p E and consume it. Errors of any
  /// other type are rendered through their log() text.
  void report(llvm::Error E);

  static DiagLevel getLevel(DiagID id);
  static ErrorKind getKind(DiagID id);

private:
  llvm::raw_ostream &OS;
  std::string FileName;
  unsigned ErrorCount = 0;
  unsigned WarningCount = 0;

  void reportImpl(int Line, int Column, DiagID id,
                  const std::string &message);
  static const char *getFormatString(DiagID id);

  // Poor Man's Format:

  // Template for arithmetic types (to avoid ambiguity with strings)
  template <typename T,
            typename std::enable_if<
                std::is_arithmetic<typename std::decay<T>::type>::value,
                int>::type = 0>
  static std::string toString(T &&val) {
    return std::to_string(std::forward<T>(val));
  }

  static std::string toString(const std::string &val) { return val; }
  static std::string toString(llvm::StringRef val) { return val.str(); }
  static std::string toString(const char *val) {
    return std::string(val != nullptr ? val : "(null)");
  }

  template <typename T, typename... Args>
  static void formatHelper(std::string &fmt, size_t pos, T &&arg,
                           Args &&...args) {
    size_t placeholder = fmt.find("{}", pos);
    if (placeholder != std::string::npos) {
      std::string val = toString(std::forward<T>(arg));
      fmt.replace(placeholder, 2, val);
      formatHelper(fmt, placeholder + val.length(),
                   std::forward<Args>(args)...);
    }
  }

  static void formatHelper(std::string &, size_t) {}

  template <typename... Args>
  static std::string formatMessage(DiagID id, Args &&...args) {
    std::string fmt = getFormatString(id);
    formatHelper(fmt, 0, std::forward<Args>(args)...);
    return fmt;
  }
};

} // namespace tsfilter
