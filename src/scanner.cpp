#include "scanner.hpp"

#include <cctype>
#include <charconv>

char Scanner::get() noexcept
{
  char c = *m_start++;
  m_col++;
  if (c == '\n')
  {
    m_line++;
    m_col = 0;
  }
  return c;
}

Token Scanner::next() noexcept
{
  while (isWhiteSpace(peek()))
  {
    get();
  }

  const Token::Location location = {m_line, m_col};
  const char c = peek();

  if (c == '\0')
  {
    return Token(Token::Kind::End, m_start, std::size_t{0}, location);
  }

  switch (c)
  {
  case '(':
    return charToken(Token::Kind::OpenParen);
  case ')':
    return charToken(Token::Kind::CloseParen);
  case '\'':
    [[fallthrough]];
  case '"':
    return quoted(c, location);
  case '-':
    if (std::isdigit(static_cast<unsigned char>(peekNext())))
    {
      return number(location);
    }
    m_hadError = true;
    return charToken(Token::Kind::Unexpected);
  default:
    break;
  }

  if (std::isdigit(static_cast<unsigned char>(c)))
  {
    return number(location);
  }

  if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' || c == '~')
  {
    return word(location);
  }

  m_hadError = true;
  return charToken(Token::Kind::Unexpected);
}

static bool isWordChar(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' || c == '-' || c == '~';
}

Token Scanner::number(Token::Location location) noexcept
{
  const char *tokenStart = m_start;
  if (peek() == '-')
  {
    get();
  }
  while (std::isdigit(static_cast<unsigned char>(peek())))
  {
    get();
  }

  // don't allow running from a number straight into a word, e.g. 12ab
  if (isWordChar(peek()))
  {
    while (isWordChar(peek()))
    {
      get();
    }
    m_hadError = true;
    return Token(Token::Kind::Unexpected, tokenStart, m_start, location);
  }

  Token token = Token(Token::Kind::Number, tokenStart, m_start, location);
  const auto [end, ec] = std::from_chars(tokenStart, m_start, token.value.number);
  if (ec != std::errc() || end != m_start)
  {
    // too large for 64 bits
    m_hadError = true;
    return Token(Token::Kind::Unexpected, tokenStart, m_start, location);
  }
  return token;
}

Token Scanner::word(Token::Location location) noexcept
{
  const char *tokenStart = m_start;
  while (isWordChar(peek()))
  {
    get();
  }
  return wordOrReserved(tokenStart, m_start, location);
}

Token Scanner::quoted(char quote, Token::Location location) noexcept
{
  // dont include the quotes in the token
  get();
  const char *tokenStart = m_start;
  bool escapeNext = false;

  while (peek() != '\0')
  {
    if (isNonEscaped(peek(), quote, escapeNext))
    {
      const char *tokenEnd = m_start;
      get(); // consume the end quote
      return Token(Token::Kind::String, tokenStart, tokenEnd, location);
    }
    get();
  }

  // no closing quote
  m_hadError = true;
  return Token(Token::Kind::Unexpected, tokenStart, m_start, location);
}

struct ReservedWord
{
  const char *str;
  Token::Kind kind;
};
inline constexpr ReservedWord reserved[] = {
#define RESERVED_true(str, kind) {str, Token::Kind::kind},
#define RESERVED_false(str, kind) // empty
#define X(kind, str, is_kw) RESERVED_##is_kw(str, kind)
#include "token_list.hpp"
#undef X
#undef RESERVED_true
#undef RESERVED_false
};

// reserved words match regardless of case, so Input and INPUT both work
static bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size())
  {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); i++)
  {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
    {
      return false;
    }
  }
  return true;
}

Token Scanner::wordOrReserved(const char *start, const char *end, Token::Location location) const noexcept
{
  const std::string_view lexeme = std::string_view(start, end - start);
  for (const ReservedWord &r : reserved)
  {
    if (equalsIgnoreCase(lexeme, r.str))
    {
      return Token(r.kind, start, end, location);
    }
  }
  return Token(Token::Kind::Word, start, end, location);
}

bool Scanner::isWhiteSpace(char c) const noexcept { return c > 0 && c <= ' '; }

Token Scanner::charToken(Token::Kind kind) noexcept
{
  const Token::Location location = {m_line, m_col};
  const char *start = m_start;
  get();
  return Token(kind, start, 1, location);
}

bool Scanner::isNonEscaped(char c, char end, bool &escapeNext) const noexcept
{
  if (escapeNext)
  {
    escapeNext = false;
    return false;
  }

  if (c == '\\')
  {
    escapeNext = true;
    return false;
  }

  return c == end;
}
