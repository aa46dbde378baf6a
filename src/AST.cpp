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
#include "tsfilter/AST.h"
#include "llvm/ADT/StringExtras.h"

namespace tsfilter {

std::string quoteString(const std::string &value) {
  std::string out = "\"";
  for (char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out += c;
      break;
    }
  }
  out += "\"";
  return out;
}

static bool isIdentifierName(const std::string &name) {
  if (name.empty() || llvm::isDigit(name[0]))
    return false;
  for (char c : name)
    if (!llvm::isAlnum(c) && c != '_' && c != '$')
      return false;
  return true;
}

bool PrimitiveType::isPrimitiveName(const std::string &name) {
  return name == "string" || name == "number" || name == "boolean" ||
         name == "null" || name == "undefined" || name == "unknown";
}

std::string TypeExpr::toString(const PrintOptions &Opts) const {
  std::string out;
  llvm::raw_string_ostream OS(out);
  print(OS, Opts);
  return OS.str();
}

void ReferenceType::print(llvm::raw_ostream &OS,
                          const PrintOptions &Opts) const {
  OS << Name;
  if (Args.empty())
    return;
  OS << "<";
  for (size_t i = 0; i < Args.size(); ++i) {
    if (i)
      OS << ",";
    Args[i]->print(OS, Opts);
  }
  OS << ">";
}

void UnionType::print(llvm::raw_ostream &OS, const PrintOptions &Opts) const {
  for (size_t i = 0; i < Members.size(); ++i) {
    if (i)
      OS << "|";
    Members[i]->print(OS, Opts);
  }
}

void StructType::print(llvm::raw_ostream &OS, const PrintOptions &Opts) const {
  OS << "{";
  for (size_t i = 0; i < Fields.size(); ++i) {
    const Field &F = Fields[i];
    if (i)
      OS << ",";
    OS << (isIdentifierName(F.Name) ? F.Name : quoteString(F.Name));
    if (F.Optional)
      OS << "?";
    OS << ":";
    F.Type->print(OS, Opts);
  }
  OS << "}";
}

void ArrayType::print(llvm::raw_ostream &OS, const PrintOptions &Opts) const {
  // A union element needs grouping: (A|B)[] is not A|B[].
  bool group = llvm::isa<UnionType>(Element.get());
  if (group)
    OS << "(";
  Element->print(OS, Opts);
  if (group)
    OS << ")";
  OS << "[]";
}

void LiteralType::print(llvm::raw_ostream &OS, const PrintOptions &) const {
  OS << (IsNumeric ? Value : quoteString(Value));
}

void SpecialType::print(llvm::raw_ostream &OS, const PrintOptions &) const {
  switch (Which) {
  case Any:
    OS << "any";
    return;
  case Never:
    OS << "never";
    return;
  case Choose:
    OS << "CHOOSE";
    return;
  }
}

void TemplateType::print(llvm::raw_ostream &OS,
                         const PrintOptions &Opts) const {
  if (!Opts.KeepTemplates) {
    OS << quoteString(Label);
    return;
  }
  OS << "LITERAL<" << quoteString(Label) << ",[";
  for (size_t i = 0; i < Aliases.size(); ++i) {
    if (i)
      OS << ",";
    OS << quoteString(Aliases[i]);
  }
  OS << "]," << (Pinned ? "true" : "false") << ">";
}

int Declaration::findParam(const std::string &name) const {
  for (size_t i = 0; i < Params.size(); ++i)
    if (Params[i].Name == name)
      return static_cast<int>(i);
  return -1;
}

void Declaration::print(llvm::raw_ostream &OS,
                        const PrintOptions &Opts) const {
  OS << "type " << Name;
  if (!Params.empty()) {
    OS << "<";
    for (size_t i = 0; i < Params.size(); ++i) {
      if (i)
        OS << ",";
      OS << Params[i].Name;
      if (Params[i].Constraint) {
        OS << " extends ";
        Params[i].Constraint->print(OS, Opts);
      }
    }
    OS << ">";
  }
  OS << "=";
  Body->print(OS, Opts);
  OS << ";";
}

std::string Declaration::toString(const PrintOptions &Opts) const {
  std::string out;
  llvm::raw_string_ostream OS(out);
  print(OS, Opts);
  return OS.str();
}

} // namespace tsfilter
