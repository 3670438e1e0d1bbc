#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace rt;

TEST_CASE("RawSocketUtils writeAll writes all data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  const string payload = "test data for writeAll";
  RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
  ::close(fds[1]);

  optional<string> received =
      RawSocketUtils::readAvailable(fds[0], 1024, 1000);
  REQUIRE(received.has_value());
  REQUIRE(*received == payload);

  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll with large data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Bigger than a pipe buffer, so the writer blocks until we drain it
  const size_t size = 1024 * 1024;
  string payload(size, 'X');

  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string buffer;
  while (true) {
    optional<string> chunk =
        RawSocketUtils::readAvailable(fds[0], 64 * 1024, 1000);
    if (!chunk) {
      break;
    }
    buffer += *chunk;
  }
  REQUIRE(buffer == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll with invalid fd", "[RawSocketUtils]") {
  const string payload = "test";

  REQUIRE_THROWS(RawSocketUtils::writeAll(-1, payload.data(), payload.size()));
}

TEST_CASE("RawSocketUtils readAvailable times out with nothing to read",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  optional<string> received = RawSocketUtils::readAvailable(fds[0], 16, 20);
  REQUIRE(received.has_value());
  REQUIRE(received->empty());

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils readAvailable reports end of file",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[1]);

  REQUIRE_FALSE(RawSocketUtils::readAvailable(fds[0], 16, 100).has_value());

  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils readAvailable caps the read size",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  const string payload = "0123456789";
  RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());

  REQUIRE(*RawSocketUtils::readAvailable(fds[0], 4, 100) == "0123");
  REQUIRE(*RawSocketUtils::readAvailable(fds[0], 16, 100) == "456789");

  ::close(fds[0]);
  ::close(fds[1]);
}
