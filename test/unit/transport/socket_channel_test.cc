#include "bluelink/transport/socket_channel.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <atomic>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "bluelink/diagnostics/error_mapping.hpp"
#include "test_utils.hpp"

using namespace bluelink;
using namespace bluelink::transport;
using namespace bluelink::test;

class SocketChannelTest : public BaseTest {
 protected:
  void SetUp() override {
    BaseTest::SetUp();
    std::tie(left_, right_) = SocketChannel::make_local_pair(ioc_, "AA:AA:AA:AA:AA:AA", "BB:BB:BB:BB:BB:BB");
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<SocketChannel> left_;
  std::shared_ptr<SocketChannel> right_;
};

TEST_F(SocketChannelTest, PeersAreCrossed) {
  EXPECT_EQ(left_->remote_peer(), "BB:BB:BB:BB:BB:BB");
  EXPECT_EQ(right_->remote_peer(), "AA:AA:AA:AA:AA:AA");
  EXPECT_TRUE(left_->is_open());
  EXPECT_TRUE(right_->is_open());
}

TEST_F(SocketChannelTest, BytesArriveInOrder) {
  boost::system::error_code ec;
  auto data = TestUtils::bytes("hi\r\n");
  left_->write_bytes(data.data(), data.size(), ec);
  ASSERT_FALSE(ec);

  std::string received;
  for (size_t i = 0; i < data.size(); ++i) {
    received.push_back(static_cast<char>(right_->read_byte(ec)));
    ASSERT_FALSE(ec);
  }
  EXPECT_EQ(received, "hi\r\n");
}

TEST_F(SocketChannelTest, RecordsArriveWhole) {
  boost::system::error_code ec;
  base::Record first{"temp", TestUtils::bytes("21.5")};
  base::Record second{"", {}};
  right_->write_record(first, ec);
  ASSERT_FALSE(ec);
  right_->write_record(second, ec);
  ASSERT_FALSE(ec);

  EXPECT_EQ(left_->read_record(ec), first);
  ASSERT_FALSE(ec);
  EXPECT_EQ(left_->read_record(ec), second);
  ASSERT_FALSE(ec);
}

TEST_F(SocketChannelTest, EmptyWriteIsNoop) {
  boost::system::error_code ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
  left_->write_bytes(nullptr, 0, ec);
  EXPECT_FALSE(ec);
}

TEST_F(SocketChannelTest, CloseWakesBlockedReader) {
  std::atomic<bool> done{false};
  boost::system::error_code read_ec;
  std::thread reader([&]() {
    left_->read_byte(read_ec);
    done = true;
  });

  TestUtils::waitFor(20);
  EXPECT_FALSE(done.load());

  boost::system::error_code ec;
  left_->close(ec);
  EXPECT_FALSE(ec);
  ASSERT_TRUE(TestUtils::waitForCondition([&] { return done.load(); }));
  reader.join();

  EXPECT_TRUE(diagnostics::is_channel_closed(read_ec));
  EXPECT_FALSE(left_->is_open());

  // Second close is a no-op
  left_->close(ec);
  EXPECT_FALSE(ec);
}

TEST_F(SocketChannelTest, PeerCloseEndsReads) {
  boost::system::error_code ec;
  right_->close(ec);
  left_->read_byte(ec);
  EXPECT_EQ(ec, boost::asio::error::eof);
  left_->read_record(ec);
  EXPECT_TRUE(diagnostics::is_channel_closed(ec));
}

TEST_F(SocketChannelTest, OversizedRecordIsRejected) {
  boost::system::error_code ec;
  const uint8_t huge_prefix[] = {0xFF, 0xFF, 0xFF, 0xFF};
  right_->write_bytes(huge_prefix, sizeof(huge_prefix), ec);
  ASSERT_FALSE(ec);

  left_->read_record(ec);
  EXPECT_EQ(ec, boost::system::errc::message_size);
}

TEST_F(SocketChannelTest, ConfiguredLimitApplies) {
  boost::asio::local::stream_protocol::socket a(ioc_);
  boost::asio::local::stream_protocol::socket b(ioc_);
  boost::asio::local::connect_pair(a, b);
  SocketChannel small(SocketChannel::Socket(std::move(a)), "CC:CC:CC:CC:CC:CC", 16);
  SocketChannel sender(SocketChannel::Socket(std::move(b)), "DD:DD:DD:DD:DD:DD");

  boost::system::error_code ec;
  sender.write_record(base::Record{"ok", TestUtils::bytes("fits")}, ec);
  ASSERT_FALSE(ec);
  EXPECT_EQ(small.read_record(ec).type, "ok");
  ASSERT_FALSE(ec);

  sender.write_record(base::Record{"big", std::vector<uint8_t>(64, 0x55)}, ec);
  ASSERT_FALSE(ec);
  small.read_record(ec);
  EXPECT_EQ(ec, boost::system::errc::message_size);
}

TEST_F(SocketChannelTest, WriteAfterPeerCloseFails) {
  boost::system::error_code ec;
  right_->close(ec);

  // The first write may still land in the socket buffer
  auto data = TestUtils::bytes("x");
  for (int i = 0; i < 10 && !ec; ++i) {
    left_->write_bytes(data.data(), data.size(), ec);
    if (!ec) TestUtils::waitFor(5);
  }
  EXPECT_TRUE(ec);
}

TEST_F(SocketChannelTest, AdoptRejectsBadDescriptor) {
  boost::system::error_code ec;
  auto channel = SocketChannel::adopt(ioc_, AF_UNIX, 0, -1, "EE:EE:EE:EE:EE:EE", ec);
  EXPECT_TRUE(ec);
  EXPECT_EQ(channel, nullptr);
}
