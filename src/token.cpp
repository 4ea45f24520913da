#include "token.hpp"

#include <sstream>

static const char *kindToString(const Token::Kind &k)
{
  switch (k)
  {
  #define X(kind, str, is_kw) case Token::Kind::kind: return str;
#include "token_list.hpp"
#undef X
  };
  return "Unknown";
}

void Token::expectOrThrow(const std::string &message, Kind kind) const
{
  if (!is(kind))
  {
    std::ostringstream ss;
    ss << m_location << " " << message;
    throw BadCommand(ss.str());
  }
}

std::ostream &operator<<(std::ostream &os, const Token::Kind &k)
{
  return os << kindToString(k);
}

std::ostream &operator<<(std::ostream &os, const Token::Location &location)
{
  return os << location.line << ":" << location.col;
}
