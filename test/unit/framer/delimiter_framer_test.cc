#include "bluelink/framer/delimiter_framer.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace bluelink;
using namespace bluelink::framer;

class DelimiterFramerTest : public ::testing::Test {
 protected:
  void make(const std::vector<uint8_t>& delimiters, size_t max_length = 0) {
    framer_ = std::make_unique<DelimiterFramer>(delimiters, max_length);
    framer_->set_on_message([this](const uint8_t* data, size_t size) {
      messages_.emplace_back(reinterpret_cast<const char*>(data), size);
    });
  }

  void push(const std::string& text) {
    framer_->push_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  void SetUp() override { make(DelimiterFramer::default_delimiters()); }

  std::unique_ptr<DelimiterFramer> framer_;
  std::vector<std::string> messages_;
};

TEST_F(DelimiterFramerTest, CrLfProducesEmptySegmentBetween) {
  push("AB\r\nCD");
  ASSERT_EQ(messages_.size(), 2u);
  EXPECT_EQ(messages_[0], "AB");
  EXPECT_EQ(messages_[1], "");

  framer_->flush();
  ASSERT_EQ(messages_.size(), 3u);
  EXPECT_EQ(messages_[2], "CD");
}

TEST_F(DelimiterFramerTest, ByteAtATimeMatchesBulkPush) {
  const std::string input = "one\ntwo\rthree";
  for (char c : input) {
    push(std::string(1, c));
  }
  framer_->flush();
  EXPECT_EQ(messages_, (std::vector<std::string>{"one", "two", "three"}));
}

TEST_F(DelimiterFramerTest, LeadingDelimiterEmitsEmptyString) {
  push("\nX\n");
  EXPECT_EQ(messages_, (std::vector<std::string>{"", "X"}));
}

TEST_F(DelimiterFramerTest, FlushWithEmptyBufferEmitsNothing) {
  push("done\n");
  framer_->flush();
  framer_->flush();
  EXPECT_EQ(messages_, (std::vector<std::string>{"done"}));
}

TEST_F(DelimiterFramerTest, CustomDelimiterSet) {
  make({';', '|'});
  push("a;b|c\n");
  framer_->flush();
  EXPECT_EQ(messages_, (std::vector<std::string>{"a", "b", "c\n"}));
}

TEST_F(DelimiterFramerTest, EmptyDelimiterSetFallsBackToCrLf) {
  make({});
  push("x\ry");
  framer_->flush();
  EXPECT_EQ(messages_, (std::vector<std::string>{"x", "y"}));
}

TEST_F(DelimiterFramerTest, OversizedPartialIsDiscarded) {
  make(DelimiterFramer::default_delimiters(), 4);
  push("12345");
  EXPECT_EQ(framer_->buffered(), 0u);
  push("ok\n");
  EXPECT_EQ(messages_, (std::vector<std::string>{"ok"}));
}

TEST_F(DelimiterFramerTest, ResetDropsBufferedBytes) {
  push("partial");
  EXPECT_EQ(framer_->buffered(), 7u);
  framer_->reset();
  framer_->flush();
  EXPECT_TRUE(messages_.empty());
}

TEST_F(DelimiterFramerTest, NullInputIsIgnored) {
  framer_->push_bytes(nullptr, 10);
  EXPECT_EQ(framer_->buffered(), 0u);
  EXPECT_TRUE(messages_.empty());
}
