#include "WamErrors.h"
#include "WamResponse.h"

#include <gtest/gtest.h>

namespace {

const char* kVolumeReply =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
    "<UIC><method>VolumeLevel</method><version>1.0</version>"
    "<speakerip>192.168.1.20</speakerip><user_identifier></user_identifier>"
    "<response result=\"ok\"><volume>15</volume></response></UIC>";

}

TEST(WamResponseTest, ParsesPlainField) {
    WamResponse r = WamResponse::parse("GetVolume", WamEndpoint::UIC, kVolumeReply);

    EXPECT_EQ(r.method(), "VolumeLevel");
    EXPECT_TRUE(r.has("volume"));
    EXPECT_EQ(r.field("volume"), "15");
    EXPECT_EQ(r.intField("volume"), 15);
}

TEST(WamResponseTest, UnwrapsCdataFields) {
    WamResponse r = WamResponse::parse("GetSpkName", WamEndpoint::UIC,
        "<UIC><method>SpkName</method><response result=\"ok\">"
        "<spkname><![CDATA[K\xC3\xBC" "che & Bar]]></spkname></response></UIC>");

    EXPECT_EQ(r.field("spkname"), "K\xC3\xBC" "che & Bar");
}

TEST(WamResponseTest, ParsesCpmReplies) {
    WamResponse r = WamResponse::parse("GetCpInfo", WamEndpoint::CPM,
        "<CPM><method>CpInfo</method><response result=\"ok\"><cpname>TuneIn</cpname></response></CPM>");

    EXPECT_EQ(r.field("cpname"), "TuneIn");
}

TEST(WamResponseTest, CollectsRepeatedFields) {
    WamResponse r = WamResponse::parse("Get7BandEQList", WamEndpoint::UIC,
        "<UIC><response result=\"ok\"><listcount>2</listcount>"
        "<presetlist><preset><presetindex>0</presetindex><presetname>None</presetname></preset>"
        "<preset><presetindex>1</presetindex><presetname>Pop</presetname></preset></presetlist>"
        "</response></UIC>");

    std::vector<std::string> names = r.fields("presetname");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "None");
    EXPECT_EQ(names[1], "Pop");
    EXPECT_EQ(r.optionalField("nothing"), "");
}

TEST(WamResponseTest, EmptyBodyIsProtocolError) {
    EXPECT_THROW(WamResponse::parse("GetVolume", WamEndpoint::UIC, ""), ProtocolError);
}

TEST(WamResponseTest, MalformedXmlIsProtocolError) {
    try {
        WamResponse::parse("GetVolume", WamEndpoint::UIC, "<UIC><response>");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.command(), "GetVolume");
        EXPECT_EQ(e.rawResponse(), "<UIC><response>");
    }
}

TEST(WamResponseTest, RootMustMatchEndpoint) {
    EXPECT_THROW(WamResponse::parse("GetCpInfo", WamEndpoint::CPM, kVolumeReply), ProtocolError);
}

TEST(WamResponseTest, MissingResponseElementIsProtocolError) {
    EXPECT_THROW(WamResponse::parse("GetVolume", WamEndpoint::UIC,
                                    "<UIC><method>VolumeLevel</method></UIC>"),
                 ProtocolError);
}

TEST(WamResponseTest, DeviceFailureIsProtocolError) {
    EXPECT_THROW(WamResponse::parse("SetVolume", WamEndpoint::UIC,
                                    "<UIC><response result=\"ng\"/></UIC>"),
                 ProtocolError);
}

TEST(WamResponseTest, MissingFieldIsNeverDefaulted) {
    WamResponse r = WamResponse::parse("GetVolume", WamEndpoint::UIC, kVolumeReply);

    try {
        r.field("mute");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.command(), "GetVolume");
        EXPECT_EQ(e.rawResponse(), kVolumeReply);
    }
}

TEST(WamResponseTest, NonNumericIntegerFieldIsProtocolError) {
    WamResponse r = WamResponse::parse("GetVolume", WamEndpoint::UIC,
        "<UIC><response result=\"ok\"><volume>loud</volume></response></UIC>");

    EXPECT_THROW(r.intField("volume"), ProtocolError);
}
