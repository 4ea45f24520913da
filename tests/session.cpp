#include <gtest/gtest.h>

#include <sstream>

#include "session.hpp"
#include "temp_file_fixture.hpp"

class SessionFile : public TempFileFixture
{
protected:
  std::string create(const std::string &kind, u64 size)
  {
    return "create \"" + path.string() + "\" " + kind + " " + std::to_string(size);
  }

  // output produced by the last command only
  std::string run(Session &session, const std::string &line)
  {
    out.str("");
    session.execute(line);
    return out.str();
  }

  std::ostringstream out;
};

TEST_F(SessionFile, IntegerCommands)
{
  Session session(out);
  EXPECT_EQ("Opened " + path.string() + ": 5000 x int\n", run(session, create("int", 5000)));
  EXPECT_EQ("[4999] = 42\n", run(session, "input 4999 42"));
  EXPECT_EQ("[0] = 7\n", run(session, "Input 0 7"));
  EXPECT_EQ("[4999] = 42\n", run(session, "print 4999"));
  EXPECT_EQ("[1] = 0\n", run(session, "Print 1"));
  EXPECT_FALSE(session.execute("exit"));
  EXPECT_EQ(nullptr, session.array());

  Session reopened(out);
  run(reopened, create("int", 5000));
  EXPECT_EQ("[4999] = 42\n", run(reopened, "print 4999"));
}

TEST_F(SessionFile, TextCommands)
{
  Session session(out);
  run(session, create("char(5)", 10));
  EXPECT_EQ("[2] = \"hello\"\n", run(session, "input 2 \"hello world\""));
  EXPECT_EQ("[3] = \"abc\"\n", run(session, "input 3 abc"));
  EXPECT_EQ("[4] = \"123\"\n", run(session, "input 4 123"));
  EXPECT_EQ("[5] = \"\"\n", run(session, "print 5"));
}

/* errors are reported and the session keeps going */
TEST_F(SessionFile, ErrorsAreReported)
{
  Session session(out);
  EXPECT_EQ("Error: No array is open, use 'create <path> <kind> <size>' first\n", run(session, "print 0"));

  run(session, create("int", 10));
  EXPECT_EQ("Error: Index 10 is out of range for an array of 10 elements\n", run(session, "print 10"));
  EXPECT_EQ("Error: Expected an integer value, got 'abc'\n", run(session, "input 1 abc"));
  EXPECT_EQ("Error: Value 3000000000 does not fit in a 32 bit integer\n", run(session, "input 1 3000000000"));
  EXPECT_EQ("Error: 1:0 Unknown command 'hello'\n", run(session, "hello"));
  EXPECT_EQ("Error: varchar arrays are not implemented\n", run(session, create("varchar(4)", 10)));

  EXPECT_TRUE(session.execute("print 0"));
}

TEST_F(SessionFile, BlankLinesIgnored)
{
  Session session(out);
  EXPECT_EQ("", run(session, ""));
  EXPECT_EQ("", run(session, "   "));
}

TEST_F(SessionFile, CreateReplacesArray)
{
  Session session(out);
  run(session, create("int", 10));
  run(session, "input 0 5");

  const auto other = path.string() + ".other";
  run(session, "create \"" + other + "\" int 20");
  ASSERT_NE(nullptr, session.array());
  EXPECT_EQ(20u, session.array()->size());

  // the first array was flushed when it was replaced
  Session check(out);
  run(check, create("int", 10));
  EXPECT_EQ("[0] = 5\n", run(check, "print 0"));

  session.close();
  std::filesystem::remove(other);
}

TEST_F(SessionFile, RunUntilExit)
{
  std::istringstream in(create("int", 100) + "\ninput 1 9\nexit\nprint 1\n");
  Session session(out);
  session.run(in);

  const std::string output = out.str();
  EXPECT_NE(std::string::npos, output.find("vm> "));
  EXPECT_NE(std::string::npos, output.find("[1] = 9"));
  // nothing after exit is executed
  EXPECT_EQ(std::string::npos, output.find("[1] = 9", output.find("[1] = 9") + 1));
  EXPECT_EQ(nullptr, session.array());
}

/* running out of input closes the array like exit */
TEST_F(SessionFile, RunUntilEndOfInput)
{
  std::istringstream in(create("int", 100) + "\ninput 2 8\n");
  {
    Session session(out);
    session.run(in);
    EXPECT_EQ(nullptr, session.array());
  }

  IntArray a(path, 100);
  EXPECT_EQ(8, a.read(2));
}
