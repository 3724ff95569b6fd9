// formatter5424_test.cpp

#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <syslog_fmt/FormatError.hpp>
#include <syslog_fmt/Formatter5424.hpp>

using namespace syslog_fmt;
using namespace std::chrono_literals;

namespace {
Formatter5424 makeFormatter(std::optional<std::string> hostname,
                            SdEscaping escaping = SdEscaping::Verbatim) {
  return Formatter5424{
      Facility::Local4,
      ProcessIdentity{std::move(hostname), "myapp", 8710},
      Rfc5424Options{escaping,
                     test::fixedClock(test::EXAMPLE_TIME + 3ms + 400ns)}};
}
} // namespace

TEST(MessageId, AbsentIsNilValue) {
  EXPECT_EQ("-", normalizeMessageId(std::nullopt));
}

TEST(MessageId, PrintableIsKept) {
  EXPECT_EQ("ID47", normalizeMessageId(std::string{"ID47"}));
  EXPECT_EQ("", normalizeMessageId(std::string{}));
}

TEST(MessageId, NonPrintableIsDropped) {
  EXPECT_EQ("ab", normalizeMessageId(std::string{"a b"}));
  EXPECT_EQ("ab", normalizeMessageId(std::string{"a\tb\x7f"}));
  EXPECT_EQ("caf", normalizeMessageId(std::string{"caf\xc3\xa9"}));
}

TEST(MessageId, TruncatedTo32) {
  std::string longId(40, 'x');
  EXPECT_EQ(std::string(32, 'x'), normalizeMessageId(longId));
}

TEST(MessageId, FilterBeforeTruncate) {
  // 60 characters, but only 30 of them are printable
  std::string id;
  for (int i = 0; i < 30; ++i) {
    id += static_cast<char>('a' + i % 26);
    id += ' ';
  }
  ASSERT_GT(id.size(), MAX_MESSAGE_ID_LENGTH);

  std::string expected;
  for (int i = 0; i < 30; ++i) {
    expected += static_cast<char>('a' + i % 26);
  }
  EXPECT_EQ(expected, normalizeMessageId(id));

  // 40 printable characters interleaved with spaces
  std::string longId;
  for (int i = 0; i < 40; ++i) {
    longId += "z ";
  }
  EXPECT_EQ(std::string(32, 'z'), normalizeMessageId(longId));
}

TEST(Formatter5424, FullRecord) {
  std::ostringstream sink;
  makeFormatter("mymachine.example.com")
      .format(sink,
              Severity::Notice,
              Rfc5424Message{"ID47",
                             {{"exampleSDID@32473", {{"iut", "3"}}}},
                             "An application event"});

  EXPECT_EQ("<165>1 2003-10-11T22:14:15.003Z mymachine.example.com myapp "
            "8710 ID47 [exampleSDID@32473 iut=\"3\"] An application event",
            sink.str());
}

TEST(Formatter5424, NilValues) {
  std::ostringstream sink;
  makeFormatter("host1").format(
      sink, Severity::Info, Rfc5424Message{std::nullopt, {}, "hello"});

  EXPECT_EQ("<166>1 2003-10-11T22:14:15.003Z host1 myapp 8710 - - hello",
            sink.str());
}

TEST(Formatter5424, LocalhostWithoutHostname) {
  std::ostringstream sink;
  makeFormatter(std::nullopt)
      .format(sink, Severity::Info, Rfc5424Message{"ID", {}, "hello"});

  EXPECT_EQ("<166>1 2003-10-11T22:14:15.003Z localhost myapp 8710 ID - hello",
            sink.str());
}

TEST(Formatter5424, NumericMessageIdSameAsString) {
  Formatter5424 formatter = makeFormatter("host1");

  std::ostringstream numeric;
  std::ostringstream text;
  formatter.format(numeric,
                   Severity::Err,
                   Rfc5424NumericMessage{42, {{"id", {{"a", "b"}}}}, "msg"});
  formatter.format(text,
                   Severity::Err,
                   Rfc5424Message{"42", {{"id", {{"a", "b"}}}}, "msg"});

  EXPECT_EQ(text.str(), numeric.str());
  EXPECT_EQ(
      "<163>1 2003-10-11T22:14:15.003Z host1 myapp 8710 42 [id a=\"b\"] msg",
      numeric.str());
}

TEST(Formatter5424, MessageIdIsNormalized) {
  std::ostringstream sink;
  makeFormatter("host1").format(
      sink,
      Severity::Debug,
      Rfc5424Message{"my id\n" + std::string(40, 'q'), {}, "m"});

  EXPECT_EQ("<167>1 2003-10-11T22:14:15.003Z host1 myapp 8710 myid" +
                std::string(28, 'q') + " - m",
            sink.str());
}

TEST(Formatter5424, EmptyMessageIdIsNotNilValue) {
  std::ostringstream sink;
  makeFormatter("host1").format(
      sink, Severity::Info, Rfc5424Message{"\t \n", {}, "hello"});

  EXPECT_EQ("<166>1 2003-10-11T22:14:15.003Z host1 myapp 8710  - hello",
            sink.str());
}

TEST(Formatter5424, FractionIsTruncated) {
  Formatter5424 formatter{
      Facility::User,
      ProcessIdentity{"h", "p", 1},
      Rfc5424Options{SdEscaping::Verbatim,
                     test::fixedClock(test::EXAMPLE_TIME + 123456789ns)}};

  std::ostringstream sink;
  formatter.info(sink, Rfc5424Message{std::nullopt, {}, "m"});
  EXPECT_EQ("<14>1 2003-10-11T22:14:15.123456Z h p 1 - - m", sink.str());
}

TEST(Formatter5424, SeverityShortcuts) {
  Formatter5424      formatter = makeFormatter("h");
  std::ostringstream sink;

  formatter.emerg(sink, Rfc5424Message{std::nullopt, {}, "m"});
  formatter.alert(sink, Rfc5424NumericMessage{1, {}, "m"});
  formatter.crit(sink, Rfc5424Message{std::nullopt, {}, "m"});
  formatter.err(sink, Rfc5424NumericMessage{1, {}, "m"});
  formatter.warning(sink, Rfc5424Message{std::nullopt, {}, "m"});
  formatter.notice(sink, Rfc5424NumericMessage{1, {}, "m"});
  formatter.info(sink, Rfc5424Message{std::nullopt, {}, "m"});
  formatter.debug(sink, Rfc5424NumericMessage{1, {}, "m"});

  std::string expected;
  for (int severity = 0; severity <= 7; ++severity) {
    expected += "<" + std::to_string(160 + severity) +
                ">1 2003-10-11T22:14:15.003Z h myapp 8710 " +
                (severity % 2 == 0 ? "-" : "1") + " - m";
  }
  EXPECT_EQ(expected, sink.str());
}

TEST(Formatter5424, StrictEscaping) {
  StructuredData data{{"id", {{"p", R"(say "hi")"}}}};

  EXPECT_EQ(R"([id p="say "hi""])",
            makeFormatter("h").formatStructuredData(data));
  EXPECT_EQ(R"([id p="say \"hi\""])",
            makeFormatter("h", SdEscaping::Strict).formatStructuredData(data));

  std::ostringstream sink;
  makeFormatter("h", SdEscaping::Strict)
      .info(sink, Rfc5424Message{std::nullopt, data, "m"});
  EXPECT_EQ("<166>1 2003-10-11T22:14:15.003Z h myapp 8710 - "
            R"([id p="say \"hi\""] m)",
            sink.str());
}

TEST(Formatter5424, FailedStream) {
  test::BrokenBuffer buffer;
  std::ostream       sink{&buffer};

  EXPECT_THROW(
      makeFormatter("h").info(sink, Rfc5424NumericMessage{7, {}, "m"}),
      FormatError);
}

TEST(Formatter5424, Detect) {
  Formatter5424 formatter = Formatter5424::detect(Facility::Daemon);
  EXPECT_EQ(Facility::Daemon, formatter.facility());
  EXPECT_EQ(SdEscaping::Verbatim, formatter.escaping());
  EXPECT_FALSE(formatter.identity().process.empty());

  std::ostringstream sink;
  formatter.info(sink, Rfc5424Message{std::nullopt, {}, "hello"});
  EXPECT_EQ(0u, sink.str().find("<30>1 "));
  EXPECT_EQ(sink.str().size() - 10, sink.str().rfind(" - - hello"));
}
