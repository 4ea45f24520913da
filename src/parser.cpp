#include "parser.hpp"

#include <limits>
#include <sstream>
#include <utility>

void Parser::error(const Token &t, const std::string &msg)
{
  std::ostringstream ss;
  ss << t.location() << " ";
  // report what the scanner rejected rather than what was expected
  if (m_scanner.hadError() && t.is(Token::Kind::Unexpected))
  {
    ss << "Malformed input '" << t.lexeme() << "'";
  }
  else
  {
    ss << msg;
  }
  throw BadCommand(ss.str());
}

// strip the backslashes from a quoted lexeme
static std::string unescape(std::string_view lexeme)
{
  std::string out;
  out.reserve(lexeme.size());
  bool escapeNext = false;
  for (char c : lexeme)
  {
    if (!escapeNext && c == '\\')
    {
      escapeNext = true;
      continue;
    }
    escapeNext = false;
    out.push_back(c);
  }
  return out;
}

Command::Any Parser::parse()
{
  Command::Any command;
  const Token t = m_scanner.next();

  switch (t.kind())
  {
  case Token::Kind::Create:
    command = create();
    break;
  case Token::Kind::Input:
    command = input();
    break;
  case Token::Kind::Print:
    command = print();
    break;
  case Token::Kind::Exit:
    command = Command::Exit{};
    break;
  default:
    error(t, "Unknown command '" + std::string(t.lexeme()) + "'");
  }

  const Token end = m_scanner.next();
  if (!end.is(Token::Kind::End))
  {
    error(end, "Unexpected '" + std::string(end.lexeme()) + "' after command");
  }
  return command;
}

Command::Create Parser::create()
{
  const Token path = m_scanner.next();
  if (!path.isOneOf(Token::Kind::Word, Token::Kind::String))
  {
    error(path, "Expected a file path after 'create'");
  }

  const ElementSpec spec = kind();

  const Token size = m_scanner.next();
  if (!size.is(Token::Kind::Number))
  {
    error(size, "Expected the array size");
  }
  if (size.value.number <= 0)
  {
    std::ostringstream ss;
    ss << size.location() << " Array size must be positive, got " << size.value.number;
    throw BadCreationParameters(ss.str());
  }

  return Command::Create{unescape(path.lexeme()), spec, static_cast<u64>(size.value.number)};
}

ElementSpec Parser::kind()
{
  // text kinds take a length in parentheses
  static const std::pair<const char *, ElementKind> kinds[] = {
    {"int", ElementKind::Integer},
    {"char", ElementKind::FixedText},
    {"varchar", ElementKind::VarText},
  };

  const Token t = m_scanner.next();
  if (!t.is(Token::Kind::Word))
  {
    error(t, "Expected an element kind (int, char(n) or varchar(n))");
  }

  std::optional<ElementKind> found;
  for (const auto &k : kinds)
  {
    if (t.lexeme().compare(k.first) == 0)
    {
      found = k.second;
    }
  }
  if (!found)
  {
    std::ostringstream ss;
    ss << t.location() << " Unsupported element kind '" << t.lexeme() << "'";
    throw UnsupportedElementKind(ss.str());
  }

  if (*found == ElementKind::Integer)
  {
    return ElementSpec::integer();
  }

  m_scanner.next().expectOrThrow("Expected '(' before the text length", Token::Kind::OpenParen);
  const Token len = m_scanner.next();
  if (!len.is(Token::Kind::Number))
  {
    error(len, "Expected the text length");
  }
  if (len.value.number <= 0 || len.value.number > std::numeric_limits<u32>::max())
  {
    std::ostringstream ss;
    ss << len.location() << " Text length must be between 1 and "
       << std::numeric_limits<u32>::max() << ", got " << len.value.number;
    throw BadCreationParameters(ss.str());
  }
  m_scanner.next().expectOrThrow("Expected ')' after the text length", Token::Kind::CloseParen);

  const u32 n = static_cast<u32>(len.value.number);
  return *found == ElementKind::FixedText ? ElementSpec::fixedText(n) : ElementSpec::varText(n);
}

u64 Parser::index()
{
  const Token t = m_scanner.next();
  if (!t.is(Token::Kind::Number))
  {
    error(t, "Expected an index");
  }
  if (t.value.number < 0)
  {
    error(t, "Index must not be negative");
  }
  return static_cast<u64>(t.value.number);
}

Command::Input Parser::input()
{
  const u64 i = index();

  const Token value = m_scanner.next();
  switch (value.kind())
  {
  case Token::Kind::Number:
    return Command::Input{i, std::string(value.lexeme()), value.value.number};
  case Token::Kind::String:
    return Command::Input{i, unescape(value.lexeme()), std::nullopt};
  case Token::Kind::Word:
    [[fallthrough]];
  case Token::Kind::Create:
    [[fallthrough]];
  case Token::Kind::Input:
    [[fallthrough]];
  case Token::Kind::Print:
    [[fallthrough]];
  case Token::Kind::Exit:
    // reserved words are fine as text values
    return Command::Input{i, std::string(value.lexeme()), std::nullopt};
  default:
    error(value, "Expected a value");
  }
}

Command::Print Parser::print()
{
  return Command::Print{index()};
}
