#pragma once

#include "parser.hpp"
#include "vmarray/virtual_array.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

// what the repl opens when started without arguments
const char *const DEFAULT_SWAP_FILE = "swapfile.dat";
const u64 DEFAULT_ARRAY_SIZE = 5000;

// runs text commands against at most one open array. errors are reported on
// the output stream and the session carries on
class Session
{
public:
  explicit Session(std::ostream &out) : m_out(out) {}
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // replace the current array with the one at path
  void open(const std::filesystem::path &path, const ElementSpec &spec, u64 size);
  void close();

  // run one command line, returns false once the session should end
  bool execute(const std::string &line);
  // prompt and execute lines until exit or end of input
  void run(std::istream &in);

  IVirtualArray *array() noexcept { return m_array.get(); }

private:
  IVirtualArray &current();
  void input(const Command::Input &command);
  void print(const Command::Print &command);

  std::ostream &m_out;
  std::unique_ptr<IVirtualArray> m_array;
};
