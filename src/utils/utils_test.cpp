#include "utils.hpp"

#include <fcntl.h>  // fcntl, F_GETFL, O_NONBLOCK
#include <gtest/gtest.h>
#include <unistd.h>  // pipe, close

#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Build a mutable argv from string literals for processArgs.
class ArgvBuilder {
 public:
  explicit ArgvBuilder(const std::vector<std::string>& args) : storage_(args) {
    for (size_t i = 0; i < storage_.size(); ++i) {
      ptrs_.push_back(&storage_[i][0]);
    }
    ptrs_.push_back(NULL);
  }

  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return &ptrs_[0]; }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> ptrs_;
};

}  // namespace

TEST(SetNonblockingTests, InvalidFdReturnsMinusOne) {
  EXPECT_EQ(set_nonblocking(-1), -1);
}

TEST(SetNonblockingTests, SetsNonblockingOnPipeFdAndIsIdempotent) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0) << "pipe() failed";

  EXPECT_GE(set_nonblocking(fds[0]), 0);
  int flags_after = fcntl(fds[0], F_GETFL, 0);
  ASSERT_GE(flags_after, 0);
  EXPECT_TRUE((flags_after & O_NONBLOCK) != 0)
      << "O_NONBLOCK not set after call";
  EXPECT_GE(set_nonblocking(fds[0]), 0);

  close(fds[0]);
  close(fds[1]);
}

TEST(TrimCopyTests, EmptyAndAllWhitespace) {
  EXPECT_EQ(trim_copy(""), "");
  EXPECT_EQ(trim_copy("    \t\n  \r "), "");
}

TEST(TrimCopyTests, BothEndsTrimmedAndInternalPreserved) {
  EXPECT_EQ(trim_copy("  hello   world  "), "hello   world");
  EXPECT_EQ(trim_copy("world   \n\t"), "world");
}

TEST(ToLowerCopyTests, LowersAsciiOnly) {
  EXPECT_EQ(to_lower_copy("/Static/IMG.PNG"), "/static/img.png");
}

TEST(IsDigitsTests, Basics) {
  EXPECT_TRUE(is_digits("8080"));
  EXPECT_FALSE(is_digits(""));
  EXPECT_FALSE(is_digits("80a"));
  EXPECT_FALSE(is_digits("-1"));
}

TEST(ParseLogLevelFlagTests, AcceptsKnownLevels) {
  EXPECT_EQ(parseLogLevelFlag("-l:0"), 0);
  EXPECT_EQ(parseLogLevelFlag("-l:2"), 2);
  EXPECT_THROW(parseLogLevelFlag("-l:7"), std::invalid_argument);
  EXPECT_THROW(parseLogLevelFlag("-l:"), std::invalid_argument);
}

TEST(ProcessArgsTests, DefaultsWhenNoArguments) {
  std::vector<std::string> args;
  args.push_back("ngxpreview");
  ArgvBuilder b(args);
  Options opts;
  processArgs(b.argc(), b.argv(), opts);
  EXPECT_EQ(opts.config_path, "");
  EXPECT_EQ(opts.base_dir, "");
  EXPECT_EQ(opts.host, "0.0.0.0");
  EXPECT_EQ(opts.port_override, 0);
  EXPECT_EQ(opts.log_level, 1);
}

TEST(ProcessArgsTests, ParsesAllOptions) {
  std::vector<std::string> args;
  args.push_back("ngxpreview");
  args.push_back("-l:0");
  args.push_back("-H");
  args.push_back("127.0.0.1");
  args.push_back("-p");
  args.push_back("9090");
  args.push_back("-b");
  args.push_back("/srv/site");
  args.push_back("conf/nginx.conf");
  ArgvBuilder b(args);
  Options opts;
  processArgs(b.argc(), b.argv(), opts);
  EXPECT_EQ(opts.log_level, 0);
  EXPECT_EQ(opts.host, "127.0.0.1");
  EXPECT_EQ(opts.port_override, 9090);
  EXPECT_EQ(opts.base_dir, "/srv/site");
  EXPECT_EQ(opts.config_path, "conf/nginx.conf");
}

TEST(ProcessArgsTests, RejectsBadPortAndUnknownFlags) {
  std::vector<std::string> bad_port;
  bad_port.push_back("ngxpreview");
  bad_port.push_back("-p");
  bad_port.push_back("70000");
  ArgvBuilder b1(bad_port);
  Options o1;
  EXPECT_THROW(processArgs(b1.argc(), b1.argv(), o1), std::invalid_argument);

  std::vector<std::string> unknown;
  unknown.push_back("ngxpreview");
  unknown.push_back("--verbose");
  ArgvBuilder b2(unknown);
  Options o2;
  EXPECT_THROW(processArgs(b2.argc(), b2.argv(), o2), std::invalid_argument);

  std::vector<std::string> missing;
  missing.push_back("ngxpreview");
  missing.push_back("-H");
  ArgvBuilder b3(missing);
  Options o3;
  EXPECT_THROW(processArgs(b3.argc(), b3.argv(), o3), std::invalid_argument);
}
