#pragma once

#include "machine.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

// a command line that could not be understood
class BadCommand : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

struct Token
{
  struct Location
  {
    int line, col;
  };

  enum class Kind
  {
    #define X(kind, str, is_kw) kind,
#include "token_list.hpp"
    #undef X
  };

  Token() noexcept : m_kind(Token::Kind::End), m_lexeme(), m_location() {}

  Token(Kind kind, const char *start, std::size_t len, Location location = {}) noexcept
      : m_kind(kind), m_lexeme(start, len), m_location(location)
  {
  }
  Token(Kind kind, const char *start, const char *end, Location location = {}) noexcept
      : m_kind(kind), m_lexeme(start, end - start), m_location(location)
  {
  }

  Kind kind() const noexcept { return m_kind; }

  bool is(Kind kind) const noexcept { return m_kind == kind; }
  bool isOneOf(Kind k1, Kind k2) const noexcept
  {
    return m_kind == k1 || m_kind == k2;
  }

  // throws BadCommand, prefixed with where the token was found
  void expectOrThrow(const std::string &message, Kind kind) const;

  std::string_view lexeme() const noexcept { return m_lexeme; }

  const Location &location() const noexcept { return m_location; }

  // only set for Number tokens
  union
  {
    i64 number;
  } value = {0};

private:
  Kind m_kind;
  std::string_view m_lexeme;
  Location m_location;
};

std::ostream &operator<<(std::ostream &os, const Token::Kind &kind);
std::ostream &operator<<(std::ostream &os, const Token::Location &location);
