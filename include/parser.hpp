#pragma once

#include "scanner.hpp"
#include "vmarray/cell_codec.hpp"

#include <optional>
#include <string>
#include <variant>

/*
command  -> create | input | print | exit
create   -> "create" path kind NUMBER
path     -> WORD | STRING
kind     -> "int"
          | "char" "(" NUMBER ")"
          | "varchar" "(" NUMBER ")"
input    -> "input" NUMBER value
value    -> NUMBER | WORD | STRING
print    -> "print" NUMBER
exit     -> "exit"
*/

class UnsupportedElementKind : public BadCommand
{
public:
  using BadCommand::BadCommand;
};

class BadCreationParameters : public BadCommand
{
public:
  using BadCommand::BadCommand;
};

namespace Command
{
struct Create
{
  std::string path;
  ElementSpec spec;
  u64 size;
};

struct Input
{
  u64 index;
  // the value as typed, unescaped if it was quoted
  std::string text;
  // set when the value was a number
  std::optional<i64> number;
};

struct Print
{
  u64 index;
};

struct Exit
{
};

using Any = std::variant<Create, Input, Print, Exit>;
} // namespace Command

class Parser
{
public:
  Parser(Scanner &scanner) : m_scanner(scanner) {}
  // parse exactly one command, throws BadCommand (or a subclass) otherwise
  Command::Any parse();

private:
  [[noreturn]] void error(const Token &t, const std::string &msg);
  Command::Create create();
  Command::Input input();
  Command::Print print();
  ElementSpec kind();
  u64 index();

  Scanner &m_scanner;
};
