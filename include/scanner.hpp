#pragma once

#include "token.hpp"

// splits one command line into tokens. lexemes point into the scanned text,
// which must outlive the tokens
class Scanner
{
public:
  Scanner(const char *start) noexcept : m_start(start) {}

  Token next() noexcept;
  bool hadError() const noexcept { return m_hadError; }

private:
  char peek() const noexcept { return *m_start; }
  char peekNext() const noexcept { return m_start[0] == '\0' ? '\0' : m_start[1]; }
  char get() noexcept;
  Token charToken(Token::Kind kind) noexcept;
  Token number(Token::Location location) noexcept;
  Token word(Token::Location location) noexcept;
  Token quoted(char quote, Token::Location location) noexcept;
  Token wordOrReserved(const char *start, const char *end, Token::Location location) const noexcept;

  bool isNonEscaped(char c, char end, bool &escapeNext) const noexcept;
  bool isWhiteSpace(char c) const noexcept;
  const char *m_start;

  bool m_hadError = false;
  int m_line = 1;
  int m_col = 0;
};
