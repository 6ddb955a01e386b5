#include "sheetbinder/core/Exception.hpp"
#include "sheetbinder/xml/SharedStrings.hpp"
#include "sheetbinder/xml/XMLStreamReader.hpp"
#include "sheetbinder/xml/XMLStreamWriter.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sheetbinder::xml;

TEST(XMLStreamWriterTest, ElementsAttributesAndEscaping) {
    XMLStreamWriter writer;
    writer.startElement("row");
    writer.writeAttribute("r", 3);
    writer.writeAttribute("ht", 22.5);
    writer.writeAttribute("note", "a<b & \"c\"");
    writer.startElement("c");
    writer.writeText("x < y & z");
    writer.endElement();
    writer.writeEmptyElement("f");
    writer.endElement();

    EXPECT_EQ(writer.toString(),
              "<row r=\"3\" ht=\"22.5\" note=\"a&lt;b &amp; &quot;c&quot;\"><c>x &lt; y &amp; z</c><f/></row>");
}

TEST(XMLStreamWriterTest, MisuseThrows) {
    XMLStreamWriter writer;
    EXPECT_THROW(writer.endElement(), sheetbinder::core::XMLException);

    writer.startElement("a");
    writer.writeText("text");
    EXPECT_THROW(writer.writeAttribute("late", "value"), sheetbinder::core::XMLException);
}

TEST(XMLStreamWriterTest, ReleaseResetsBuffer) {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("sst");
    writer.endDocument();

    std::string xml = writer.release();
    EXPECT_NE(xml.find("<?xml version=\"1.0\""), std::string::npos);
    EXPECT_NE(xml.find("<sst/>"), std::string::npos);
    EXPECT_EQ(writer.getBytesWritten(), 0u);
}

TEST(XMLStreamReaderTest, CallbacksReceiveLocalNamesAndDecodedText) {
    const std::string xml =
        "<x:worksheet xmlns:x=\"urn:test\" xmlns:r=\"urn:rel\">"
        "<x:sheet name=\"A &amp; B\" r:id=\"rId1\"/>"
        "<x:t>1 &lt; 2</x:t>"
        "</x:worksheet>";

    std::vector<std::string> starts;
    std::string rel_id;
    std::string text;

    XMLStreamReader reader;
    reader.setStartElementCallback([&](const std::string& name, const std::vector<XMLAttribute>& attrs, int) {
        starts.push_back(name);
        for (const auto& attr : attrs) {
            if (attr.name == "r:id") rel_id = attr.value;
            if (attr.name == "name") EXPECT_EQ(attr.value, "A & B");
        }
    });
    reader.setTextCallback([&](std::string_view data, int) { text.append(data); });

    ASSERT_EQ(reader.parseFromString(xml), XMLParseError::Ok);
    std::vector<std::string> expected = {"worksheet", "sheet", "t"};
    EXPECT_EQ(starts, expected);
    EXPECT_EQ(rel_id, "rId1");
    EXPECT_EQ(text, "1 < 2");
    EXPECT_EQ(reader.getElementsParsed(), 3u);
}

TEST(XMLStreamReaderTest, MalformedInputReportsError) {
    XMLStreamReader reader;
    EXPECT_EQ(reader.parseFromString("<a><b></a>"), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader.getLastErrorMessage().empty());
}

TEST(XMLStreamReaderTest, CallbackExceptionBecomesCallbackError) {
    XMLStreamReader reader;
    reader.setStartElementCallback([](const std::string& name, const std::vector<XMLAttribute>&, int) {
        if (name == "bad") throw std::runtime_error("rejected");
    });
    EXPECT_EQ(reader.parseFromString("<root><bad/></root>"), XMLParseError::CallbackError);
}

TEST(SharedStringsTest, DeduplicatesAndCountsReferences) {
    SharedStrings sst;
    EXPECT_EQ(sst.addString("Client"), 0);
    EXPECT_EQ(sst.addString(" padded "), 1);
    EXPECT_EQ(sst.addString("Client"), 0);

    EXPECT_EQ(sst.size(), 2u);
    EXPECT_EQ(sst.getReferenceCount(), 3u);
    EXPECT_EQ(sst.getStringIndex("missing"), -1);

    XMLStreamWriter writer;
    sst.generate(writer);
    const std::string& xml = writer.toString();
    EXPECT_NE(xml.find("count=\"3\" uniqueCount=\"2\""), std::string::npos);
    EXPECT_NE(xml.find("<t xml:space=\"preserve\"> padded </t>"), std::string::npos);
}
