#include "WamCommand.h"
#include "WamErrors.h"
#include "WamTransport.h"

#include <gtest/gtest.h>

TEST(WamCommandTest, SerializesDecimalParameter) {
    WamCommand cmd("SetVolume");
    cmd.dec("volume", 15);

    EXPECT_EQ(cmd.toXml(), "<name>SetVolume</name><p type=\"dec\" name=\"volume\" val=\"15\"/>");
}

TEST(WamCommandTest, EncodesSetVolumeForTheQueryString) {
    WamCommand cmd("SetVolume");
    cmd.dec("volume", 15);

    EXPECT_EQ(cmd.encode(),
              "%3Cname%3ESetVolume%3C/name%3E"
              "%3Cp%20type=%22dec%22%20name=%22volume%22%20val=%2215%22/%3E");
}

TEST(WamCommandTest, UrlEncodeLeavesSlashAndEqualsAlone) {
    EXPECT_EQ(WamCommand::urlEncode("a/b=c&d?e f+g#h"), "a/b=c%26d%3Fe%20f%2Bg%23h");
    EXPECT_EQ(WamCommand::urlEncode("Az09-_.~"), "Az09-_.~");
}

TEST(WamCommandTest, UrlEncodeHandlesNonAscii) {
    EXPECT_EQ(WamCommand::urlEncode("K\xC3\xBC"), "K%C3%BC");
}

TEST(WamCommandTest, UrlDecodeAcceptsBothHexCases) {
    EXPECT_EQ(WamCommand::urlDecode("%3c%3E/=%2f"), "<>/=/");
    EXPECT_EQ(WamCommand::urlDecode("100%"), "100%");
}

TEST(WamCommandTest, CdataUsesPlaceholderAttribute) {
    WamCommand cmd("SetSpkName");
    cmd.cdata("spkname", "Kitchen");

    EXPECT_EQ(cmd.toXml(),
              "<name>SetSpkName</name>"
              "<p type=\"cdata\" name=\"spkname\" val=\"empty\"><![CDATA[Kitchen]]></p>");
}

TEST(WamCommandTest, StringAttributesAreXmlEscaped) {
    WamCommand cmd("SetEQMode");
    cmd.str("eqmode", "a\"b<c&d");

    EXPECT_EQ(cmd.toXml(),
              "<name>SetEQMode</name><p type=\"str\" name=\"eqmode\" val=\"a&quot;b&lt;c&amp;d\"/>");
}

TEST(WamCommandTest, CdataRoundTripKeepsSpecialCharacters) {
    const std::string value = "Rock & Roll <Live> a/b=c ? 100%";
    WamCommand cmd("SetUrlPlayback");
    cmd.cdata("url", value).dec("resume", 1);

    WamCommand decoded = WamCommand::decode(cmd.encode());

    EXPECT_EQ(decoded.name(), "SetUrlPlayback");
    ASSERT_EQ(decoded.params().size(), 2u);
    EXPECT_EQ(decoded.params()[0].type, WamParam::Type::Cdata);
    EXPECT_EQ(decoded.param("url"), value);
    EXPECT_EQ(decoded.param("resume"), "1");
}

TEST(WamCommandTest, CdataTerminatorInsideValueSurvives) {
    WamCommand cmd("SetSpkName");
    cmd.cdata("spkname", "odd]]>name");

    EXPECT_EQ(WamCommand::decode(cmd.encode()).param("spkname"), "odd]]>name");
}

TEST(WamCommandTest, StringAndDecimalRoundTrip) {
    WamCommand cmd("AddCustomEQMode");
    cmd.dec("presetindex", 4).str("presetname", "Bass Boost");

    WamCommand decoded = WamCommand::decode(cmd.encode());
    EXPECT_EQ(decoded.params(), cmd.params());
}

TEST(WamCommandTest, DecodeRejectsMalformedFragments) {
    EXPECT_THROW(WamCommand::decode("%3Cname%3EGetVolume"), ProtocolError);
    EXPECT_THROW(WamCommand::decode("%3Cp%20type=%22str%22/%3E"), ProtocolError);
    EXPECT_THROW(WamCommand::decode(
        "%3Cname%3EX%3C/name%3E%3Cp%20type=%22blob%22%20name=%22a%22%20val=%22b%22/%3E"),
        ProtocolError);
}

TEST(WamCommandTest, CountsRepeatedParameters) {
    WamCommand cmd("SetMultispkGroup");
    cmd.str("subspkip", "10.0.0.2").str("subspkip", "10.0.0.3");

    EXPECT_EQ(cmd.countParams("subspkip"), 2u);
    EXPECT_EQ(cmd.param("subspkip"), "10.0.0.2");
    EXPECT_EQ(cmd.param("missing"), "");
}

TEST(WamCommandTest, EndpointNames) {
    EXPECT_STREQ(endpointName(WamEndpoint::UIC), "UIC");
    EXPECT_STREQ(endpointName(WamEndpoint::CPM), "CPM");
    EXPECT_EQ(WamCommand("GetCpInfo", WamEndpoint::CPM).endpoint(), WamEndpoint::CPM);
}

TEST(WamTransportTest, BuildsControlUrl) {
    EXPECT_EQ(buildCommandUrl("192.168.1.20", 55001, WamEndpoint::CPM, "abc"),
              "http://192.168.1.20:55001/CPM?cmd=abc");
}
