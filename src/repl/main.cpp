#include "session.hpp"

#include <charconv>
#include <cstring>
#include <iostream>

void printUsage(const char *program)
{
  std::cerr << "usage: " << program << " [swap file] [number of integers]" << std::endl;
}

int main(int argc, char **argv)
{
  if (argc > 3)
  {
    printUsage(argv[0]);
    return 1;
  }

  std::filesystem::path path = DEFAULT_SWAP_FILE;
  u64 size = DEFAULT_ARRAY_SIZE;

  if (argc >= 2)
  {
    path = argv[1];
  }
  if (argc >= 3)
  {
    const char *end = argv[2] + std::strlen(argv[2]);
    const auto [ptr, ec] = std::from_chars(argv[2], end, size);
    if (ec != std::errc() || ptr != end || size == 0)
    {
      std::cerr << "Invalid array size: " << argv[2] << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  Session session(std::cout);
  try
  {
    session.open(path, ElementSpec::integer(), size);
  }
  catch (const std::exception &e)
  {
    // carry on without an array, 'create' can still open one
    std::cerr << "Failed to open " << path << ": " << e.what() << std::endl;
  }

  session.run(std::cin);
  return 0;
}
