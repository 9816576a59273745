#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

#include <pty.h> // openpty
#include <unistd.h>

namespace {

  // false ttyUSB0 "device": master end stays with the test
  struct PseudoTerminal {
    int masterFd{ -1 };
    int slaveFd{ -1 };
    char slaveName[64]{};

    PseudoTerminal() { openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr); }
    ~PseudoTerminal() {
      if (masterFd >= 0)
        close(masterFd);
      if (slaveFd >= 0)
        close(slaveFd);
    }
  };

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

} // namespace

TEST(serial_channel, opens_writes_reads_bytes) {
  PseudoTerminal pty;
  ASSERT_GE(pty.masterFd, 0);

  anod::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B9600));
  ASSERT_TRUE(chan.isOpen());

  // Writer on master side
  const std::uint8_t request[] = { 0x01, 0x03, 0x02, 0x00, 0x2A, 0x38, 0x5B };
  ASSERT_EQ(static_cast<ssize_t>(sizeof(request)), write(pty.masterFd, request, sizeof(request)));

  auto header = chan.read(3, std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(header);
  EXPECT_EQ((std::vector<std::uint8_t>{ 0x01, 0x03, 0x02 }), *header);

  auto rest = chan.read(4, std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(rest);
  EXPECT_EQ((std::vector<std::uint8_t>{ 0x00, 0x2A, 0x38, 0x5B }), *rest);

  const std::vector<std::uint8_t> reply{ 0x01, 0x06, 0x00, 0x30, 0x01, 0xF4 };
  ASSERT_TRUE(chan.write(reply));
  std::uint8_t buf[16] = { 0 };
  ASSERT_EQ(static_cast<ssize_t>(reply.size()), read(pty.masterFd, buf, sizeof(buf)));
  EXPECT_TRUE(std::equal(reply.begin(), reply.end(), buf));
}

TEST(serial_channel, read_times_out_and_keeps_partial_bytes) {
  PseudoTerminal pty;
  ASSERT_GE(pty.masterFd, 0);

  anod::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B9600));

  const std::uint8_t partial[] = { 0xAA, 0xBB };
  ASSERT_EQ(2, write(pty.masterFd, partial, sizeof(partial)));

  const auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(chan.read(4, std::chrono::milliseconds{ 50 }));
  EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds{ 50 });

  // the two bytes are still buffered
  auto two = chan.read(2, std::chrono::milliseconds{ 10 });
  ASSERT_TRUE(two);
  EXPECT_EQ((std::vector<std::uint8_t>{ 0xAA, 0xBB }), *two);
}

TEST(serial_channel, discard_input_drops_stale_bytes) {
  PseudoTerminal pty;
  ASSERT_GE(pty.masterFd, 0);

  anod::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B9600));

  const std::uint8_t stale[] = { 0x11, 0x22, 0x33 };
  ASSERT_EQ(3, write(pty.masterFd, stale, sizeof(stale)));
  ASSERT_TRUE(chan.read(1, std::chrono::milliseconds{ 500 })); // pulls everything into the buffer

  chan.discardInput();
  EXPECT_FALSE(chan.read(1, std::chrono::milliseconds{ 20 }));
}

TEST(serial_channel, closed_channel_refuses_io) {
  anod::io::SerialChannel chan;
  EXPECT_FALSE(chan.isOpen());
  const std::vector<std::uint8_t> bytes{ 0x01 };
  EXPECT_FALSE(chan.write(bytes));
  EXPECT_FALSE(chan.read(1, std::chrono::milliseconds{ 1 }));
  EXPECT_FALSE(chan.open("/dev/does-not-exist-anod", B9600));
}

TEST(serial_channel, move_transfers_the_descriptor) {
  PseudoTerminal pty;
  ASSERT_GE(pty.masterFd, 0);

  anod::io::SerialChannel a;
  ASSERT_TRUE(a.open(pty.slaveName, B9600));
  anod::io::SerialChannel b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());
}

TEST(serial_channel, baud_table) {
  EXPECT_EQ(B9600, anod::io::SerialChannel::baudFromInt(9600).value());
  EXPECT_EQ(B115200, anod::io::SerialChannel::baudFromInt(115200).value());
  EXPECT_FALSE(anod::io::SerialChannel::baudFromInt(12345));
}

TEST(file_logger, writes_and_escapes_csv) {
  const std::string path = ::testing::TempDir() + "anod_file_logger.csv";
  {
    anod::io::FileLogger file;
    ASSERT_TRUE(file.open(path));
    EXPECT_EQ(path, file.path());
    ASSERT_TRUE(file.write("a,b\n"));
    ASSERT_TRUE(file.write(anod::io::FileLogger::escape("x,\"y\"") + "\n"));
    EXPECT_TRUE(file.flush());
    file.close();
    EXPECT_FALSE(file.isOpen());
  }
  EXPECT_EQ("a,b\n\"x,\"\"y\"\"\"\n", slurp(path));
  std::remove(path.c_str());
}

TEST(file_logger, plain_fields_are_not_quoted) {
  EXPECT_EQ("plain", anod::io::FileLogger::escape("plain"));
  EXPECT_EQ("\"two\nlines\"", anod::io::FileLogger::escape("two\nlines"));
}

TEST(file_logger, write_without_open_fails) {
  anod::io::FileLogger file;
  EXPECT_FALSE(file.write("x"));
}
