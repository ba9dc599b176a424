#include <gtest/gtest.h>
#include "exception.hpp"
#include "localization.hpp"
#include "plist.hpp"
#include "test_archives.hpp"

class PlistTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    static std::string doc(const std::string& body) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<plist version=\"1.0\">\n" + body + "</plist>\n";
    }
};

TEST_F(PlistTest, DecodesAllElementTypes) {
    PlistValue root = PlistValue::parse(doc(
        "<dict>\n"
        "  <key>name</key><string>man-pages</string>\n"
        "  <key>size</key><integer>4096</integer>\n"
        "  <key>ratio</key><real>0.5</real>\n"
        "  <key>preserve</key><true/>\n"
        "  <key>automatic</key><false/>\n"
        "  <key>when</key><date>2020-05-01T12:00:00Z</date>\n"
        "  <key>blob</key><data>aGVsbG8=</data>\n"
        "  <key>list</key><array><string>a</string><string>b</string></array>\n"
        "  <key>nested</key><dict><key>file</key><string>/x</string></dict>\n"
        "</dict>\n"));

    ASSERT_TRUE(root.is_dict());
    EXPECT_EQ(root.entries().size(), 9u);
    EXPECT_EQ(root.string_at("name"), "man-pages");
    EXPECT_EQ(root.integer_at("size"), 4096);
    EXPECT_DOUBLE_EQ(root.find("ratio")->as_real(), 0.5);
    EXPECT_TRUE(root.bool_at("preserve"));
    EXPECT_FALSE(root.bool_at("automatic", true));
    EXPECT_EQ(root.find("when")->type(), PlistValue::Type::DATE);
    EXPECT_EQ(root.find("when")->as_string(), "2020-05-01T12:00:00Z");
    EXPECT_EQ(root.find("blob")->as_string(), "hello");
    EXPECT_EQ(root.string_list_at("list"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(root.find("nested")->string_at("file"), "/x");
}

TEST_F(PlistTest, KeepsDictionaryOrder) {
    PlistValue root = PlistValue::parse(doc(
        "<dict><key>z</key><string>1</string><key>a</key><string>2</string></dict>"));
    ASSERT_EQ(root.entries().size(), 2u);
    EXPECT_EQ(root.entries()[0].key, "z");
    EXPECT_EQ(root.entries()[1].key, "a");
}

TEST_F(PlistTest, AbsentKeysYieldFallbacks) {
    PlistValue root = PlistValue::parse(doc("<dict/>"));
    EXPECT_EQ(root.find("missing"), nullptr);
    EXPECT_EQ(root.string_at("missing", "x"), "x");
    EXPECT_EQ(root.integer_at("missing", 7), 7);
    EXPECT_TRUE(root.string_list_at("missing").empty());
}

TEST_F(PlistTest, TypeMismatchThrows) {
    PlistValue root = PlistValue::parse(doc("<dict><key>n</key><integer>1</integer></dict>"));
    EXPECT_THROW(root.string_at("n"), PlistError);
    EXPECT_THROW(root.as_array(), PlistError);
}

TEST_F(PlistTest, RejectsMalformedDocuments) {
    EXPECT_THROW(PlistValue::parse("<plist><dict>"), PlistError);
    EXPECT_THROW(PlistValue::parse("<notaplist/>"), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("")), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("<dict><string>x</string></dict>")), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("<dict><key>k</key></dict>")), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("<integer>12x</integer>")), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("<bogus/>")), PlistError);
    EXPECT_THROW(PlistValue::parse(doc("<data>abc</data>")), PlistError);
}

TEST_F(PlistTest, DecodesBinaryDocuments) {
    BinaryPlistWriter w;
    const std::string long_text = "a string longer than fifteen bytes";
    std::vector<std::pair<std::size_t, std::size_t>> fields;
    fields.emplace_back(w.add_string("name"), w.add_string("man-pages"));
    fields.emplace_back(w.add_string("size"), w.add_integer(4096));
    fields.emplace_back(w.add_string("negative"), w.add_integer(-5));
    fields.emplace_back(w.add_string("ratio"), w.add_real(0.5));
    fields.emplace_back(w.add_string("preserve"), w.add_bool(true));
    fields.emplace_back(w.add_string("automatic"), w.add_bool(false));
    fields.emplace_back(w.add_string("when"), w.add_date(0.0));
    fields.emplace_back(w.add_string("blob"), w.add_data("hello"));
    fields.emplace_back(w.add_string("long"), w.add_string(long_text));
    fields.emplace_back(w.add_utf16(u"unicode"), w.add_utf16(u"caf\u00e9 \u6f22"));
    const std::size_t a = w.add_string("a");
    const std::size_t b = w.add_string("b");
    fields.emplace_back(w.add_string("list"), w.add_array({a, b}));
    const std::size_t file_key = w.add_string("file");
    const std::size_t file_value = w.add_string("/x");
    fields.emplace_back(w.add_string("nested"), w.add_dict({{file_key, file_value}}));

    PlistValue root = PlistValue::parse(w.finish(w.add_dict(fields)));

    ASSERT_TRUE(root.is_dict());
    EXPECT_EQ(root.entries().size(), 12u);
    EXPECT_EQ(root.entries()[0].key, "name");
    EXPECT_EQ(root.string_at("name"), "man-pages");
    EXPECT_EQ(root.integer_at("size"), 4096);
    EXPECT_EQ(root.integer_at("negative"), -5);
    EXPECT_DOUBLE_EQ(root.find("ratio")->as_real(), 0.5);
    EXPECT_TRUE(root.bool_at("preserve"));
    EXPECT_FALSE(root.bool_at("automatic", true));
    EXPECT_EQ(root.find("when")->type(), PlistValue::Type::DATE);
    EXPECT_EQ(root.find("when")->as_string(), "2001-01-01T00:00:00Z");
    EXPECT_EQ(root.find("blob")->type(), PlistValue::Type::DATA);
    EXPECT_EQ(root.find("blob")->as_string(), "hello");
    EXPECT_EQ(root.string_at("long"), long_text);
    EXPECT_EQ(root.string_at("unicode"), "caf\xc3\xa9 \xe6\xbc\xa2");
    EXPECT_EQ(root.string_list_at("list"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(root.find("nested")->string_at("file"), "/x");
}

TEST_F(PlistTest, BinaryAndXmlDecodeAlike) {
    const std::vector<IndexEntry> entries = {{"bash", "bash-5.2.15_1", "x86_64", "aaa", "GNU Bourne Again Shell"}};
    PlistValue xml = PlistValue::parse(index_plist(entries));
    PlistValue binary = PlistValue::parse(binary_index_plist(entries));

    ASSERT_EQ(binary.entries().size(), 1u);
    EXPECT_EQ(binary.entries()[0].key, "bash");
    const PlistValue& x = xml.entries()[0].value;
    const PlistValue& b = binary.entries()[0].value;
    for (const char* key : {"architecture", "filename-sha256", "pkgver", "short_desc"}) {
        EXPECT_EQ(b.string_at(key), x.string_at(key)) << key;
    }
}

TEST_F(PlistTest, RejectsMalformedBinaryDocuments) {
    BinaryPlistWriter w;
    const std::string good = w.finish(w.add_array({w.add_string("x")}));

    EXPECT_THROW(PlistValue::parse("bplist00"), PlistError);
    EXPECT_THROW(PlistValue::parse(good.substr(0, good.size() - 1)), PlistError);

    std::string bad_marker = good;
    bad_marker[8] = static_cast<char>(0x70);
    EXPECT_THROW(PlistValue::parse(bad_marker), PlistError);

    BinaryPlistWriter cyclic;
    const std::size_t self = cyclic.next_ref();
    EXPECT_THROW(PlistValue::parse(cyclic.finish(cyclic.add_array({self}))), PlistError);

    BinaryPlistWriter dangling;
    EXPECT_THROW(PlistValue::parse(dangling.finish(dangling.add_array({7}))), PlistError);

    BinaryPlistWriter int_key;
    const std::size_t key = int_key.add_integer(1);
    const std::size_t value = int_key.add_string("v");
    EXPECT_THROW(PlistValue::parse(int_key.finish(int_key.add_dict({{key, value}}))), PlistError);
}
