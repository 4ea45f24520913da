#include "session.hpp"

#include <limits>
#include <sstream>

Session::~Session()
{
  try
  {
    close();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to close array: " << e.what() << std::endl;
  }
}

void Session::open(const std::filesystem::path &path, const ElementSpec &spec, u64 size)
{
  close();
  m_array = openArray(path, spec, size);
  m_out << "Opened " << path.string() << ": " << size << " x " << spec << std::endl;
}

void Session::close()
{
  if (!m_array)
  {
    return;
  }
  m_array->close();
  m_array.reset();
}

IVirtualArray &Session::current()
{
  if (!m_array)
  {
    throw BadCommand("No array is open, use 'create <path> <kind> <size>' first");
  }
  return *m_array;
}

void Session::input(const Command::Input &command)
{
  IVirtualArray &array = current();

  Value value;
  if (array.spec().kind == ElementKind::Integer)
  {
    if (!command.number)
    {
      throw BadCommand("Expected an integer value, got '" + command.text + "'");
    }
    if (*command.number < std::numeric_limits<i32>::min() || *command.number > std::numeric_limits<i32>::max())
    {
      throw BadCommand("Value " + command.text + " does not fit in a 32 bit integer");
    }
    value = static_cast<i32>(*command.number);
  }
  else
  {
    value = command.text;
  }

  array.writeValue(command.index, value);
  // read back so truncated text shows what was stored
  m_out << "[" << command.index << "] = " << array.readValue(command.index) << std::endl;
}

void Session::print(const Command::Print &command)
{
  IVirtualArray &array = current();
  m_out << "[" << command.index << "] = " << array.readValue(command.index) << std::endl;
}

bool Session::execute(const std::string &line)
{
  if (line.find_first_not_of(" \t\r\n") == std::string::npos)
  {
    return true;
  }

  bool keepGoing = true;
  try
  {
    Scanner scanner(line.c_str());
    Parser parser(scanner);
    const Command::Any command = parser.parse();

    if (const auto *c = std::get_if<Command::Create>(&command); c != nullptr)
    {
      open(c->path, c->spec, c->size);
    }
    else if (const auto *i = std::get_if<Command::Input>(&command); i != nullptr)
    {
      input(*i);
    }
    else if (const auto *p = std::get_if<Command::Print>(&command); p != nullptr)
    {
      print(*p);
    }
    else
    {
      // exit ends the session even if the close fails
      keepGoing = false;
      close();
    }
  }
  catch (const std::exception &e)
  {
    m_out << "Error: " << e.what() << std::endl;
  }
  return keepGoing;
}

void Session::run(std::istream &in)
{
  std::string line;
  while (true)
  {
    m_out << "vm> " << std::flush;
    if (!std::getline(in, line))
    {
      // end of input behaves like exit
      m_out << std::endl;
      execute("exit");
      return;
    }

    if (!execute(line))
    {
      return;
    }
  }
}
