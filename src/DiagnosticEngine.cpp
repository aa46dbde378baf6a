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
#include "tsfilter/DiagnosticEngine.h"

namespace tsfilter {

char SchemaError::ID = 0;

const char *getKindName(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::Syntax:
    return "SyntaxError";
  case ErrorKind::DuplicateDeclaration:
    return "DuplicateDeclarationError";
  case ErrorKind::DanglingReference:
    return "DanglingReferenceError";
  case ErrorKind::ArityMismatch:
    return "ArityMismatchError";
  case ErrorKind::RootEliminated:
    return "RootEliminatedError";
  }
  return "UnknownError";
}

SchemaError::SchemaError(DiagID Diag, int Line, int Column,
                         std::string Message)
    : Diag(Diag), Line(Line), Column(Column), Message(std::move(Message)) {}

ErrorKind SchemaError::kind() const { return DiagnosticEngine::getKind(Diag); }

void SchemaError::log(llvm::raw_ostream &OS) const {
  if (Line > 0)
    OS << Line << ":" << Column << ": ";
  OS << getKindName(kind()) << ": " << Message;
}

std::error_code SchemaError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

const char *DiagnosticEngine::getFormatString(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Kind, Msg)                                             \
  case DiagID::ID:                                                             \
    return Msg;
#include "tsfilter/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return "Unknown Error";
  }
  return "Unknown Error";
}

DiagLevel DiagnosticEngine::getLevel(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Kind, Msg)                                             \
  case DiagID::ID:                                                             \
    return DiagLevel::Level;
#include "tsfilter/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return DiagLevel::Error;
  }
  return DiagLevel::Error;
}

ErrorKind DiagnosticEngine::getKind(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Kind, Msg)                                             \
  case DiagID::ID:                                                             \
    return ErrorKind::Kind;
#include "tsfilter/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return ErrorKind::Syntax;
  }
  return ErrorKind::Syntax;
}

void DiagnosticEngine::report(llvm::Error E) {
  llvm::handleAllErrors(
      std::move(E),
      [&](const SchemaError &SE) {
        reportImpl(SE.getLine(), SE.getColumn(), SE.getDiagID(),
                   SE.getMessage());
      },
      [&](const llvm::ErrorInfoBase &EI) {
        ++ErrorCount;
        OS << (FileName.empty() ? "<input>" : FileName) << ": error: "
           << EI.message() << "\n";
      });
}

void DiagnosticEngine::reportImpl(int Line, int Column, DiagID id,
                                  const std::string &message) {
  DiagLevel level = getLevel(id);

  llvm::raw_ostream::Colors color = llvm::raw_ostream::CYAN;
  const char *levelStr = "note";
  if (level == DiagLevel::Error) {
    ++ErrorCount;
    color = llvm::raw_ostream::RED;
    levelStr = "error";
  } else if (level == DiagLevel::Warning) {
    ++WarningCount;
    color = llvm::raw_ostream::YELLOW;
    levelStr = "warning";
  }

  OS << (FileName.empty() ? "<input>" : FileName);
  if (Line > 0)
    OS << ":" << Line << ":" << Column;
  OS << ": ";
  OS.changeColor(color, /*Bold=*/true);
  OS << levelStr << ":";
  OS.resetColor();
  OS << " " << message << "\n";
}

} // namespace tsfilter
