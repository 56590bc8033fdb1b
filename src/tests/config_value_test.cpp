#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config/config_value.hpp"

using namespace dbridge::config;
using nlohmann::json;

TEST(ConfigValueTest, KindsMatchFactories) {
    EXPECT_EQ(ConfigValue::from_string("a").kind(), ConfigValue::Kind::STRING);
    EXPECT_EQ(ConfigValue::from_int(1).kind(), ConfigValue::Kind::INT);
    EXPECT_EQ(ConfigValue::from_bool(true).kind(), ConfigValue::Kind::BOOL);
    EXPECT_EQ(ConfigValue::from_encrypted("blob").kind(), ConfigValue::Kind::ENCRYPTED_STRING);
    EXPECT_TRUE(ConfigValue::from_encrypted("blob").is_encrypted());
    EXPECT_FALSE(ConfigValue::from_string("blob").is_encrypted());
}

TEST(ConfigValueTest, TypedViewsOnlyMatchTheirKind) {
    ConfigValue number = ConfigValue::from_int(8080);
    EXPECT_EQ(number.as_int(), 8080);
    EXPECT_FALSE(number.as_string().has_value());
    EXPECT_FALSE(number.as_bool().has_value());
    EXPECT_FALSE(number.encrypted_blob().has_value());

    ConfigValue secret = ConfigValue::from_encrypted("abc=");
    EXPECT_EQ(secret.encrypted_blob(), "abc=");
    EXPECT_FALSE(secret.as_string().has_value());
}

TEST(ConfigValueTest, TextForms) {
    EXPECT_EQ(ConfigValue::from_string("host").to_text(), "host");
    EXPECT_EQ(ConfigValue::from_int(-42).to_text(), "-42");
    EXPECT_EQ(ConfigValue::from_bool(true).to_text(), "true");
    EXPECT_EQ(ConfigValue::from_bool(false).to_text(), "false");
}

TEST(ConfigValueTest, EqualityComparesKindAndValue) {
    EXPECT_EQ(ConfigValue::from_string("1"), ConfigValue::from_string("1"));
    EXPECT_NE(ConfigValue::from_string("1"), ConfigValue::from_int(1));
    EXPECT_NE(ConfigValue::from_string("x"), ConfigValue::from_encrypted("x"));
}

TEST(ConfigValueTest, PlainValuesSerialiseAsBareScalars) {
    EXPECT_EQ(ConfigValue::from_string("192.168.1.100").to_json(), json("192.168.1.100"));
    EXPECT_EQ(ConfigValue::from_int(8080).to_json(), json(8080));
    EXPECT_EQ(ConfigValue::from_bool(false).to_json(), json(false));
}

TEST(ConfigValueTest, EncryptedValueSerialisesAsWrapper) {
    json expected = {{"isEncrypted", true}, {"value", "QUJD"}};
    EXPECT_EQ(ConfigValue::from_encrypted("QUJD").to_json(), expected);
}

TEST(ConfigValueTest, ParsesScalars) {
    EXPECT_EQ(ConfigValue::from_json(json("text")), ConfigValue::from_string("text"));
    EXPECT_EQ(ConfigValue::from_json(json(5000)), ConfigValue::from_int(5000));
    EXPECT_EQ(ConfigValue::from_json(json(-1)), ConfigValue::from_int(-1));
    EXPECT_EQ(ConfigValue::from_json(json(true)), ConfigValue::from_bool(true));
}

TEST(ConfigValueTest, FloatsAndHugeIntegersBecomeStrings) {
    auto real = ConfigValue::from_json(json::parse("1.5"));
    ASSERT_TRUE(real.has_value());
    EXPECT_EQ(real->kind(), ConfigValue::Kind::STRING);
    EXPECT_EQ(real->to_text(), "1.5");

    auto huge = ConfigValue::from_json(json::parse("18446744073709551615"));
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(huge->kind(), ConfigValue::Kind::STRING);
    EXPECT_EQ(huge->to_text(), "18446744073709551615");
}

TEST(ConfigValueTest, ParsesEncryptedWrapper) {
    auto value = ConfigValue::from_json(json::parse(R"({"isEncrypted": true, "value": "QUJD"})"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, ConfigValue::from_encrypted("QUJD"));
}

TEST(ConfigValueTest, UnencryptedWrapperUnwrapsInnerScalar) {
    auto value = ConfigValue::from_json(json::parse(R"({"isEncrypted": false, "value": "plain"})"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, ConfigValue::from_string("plain"));
}

TEST(ConfigValueTest, RejectsUnsupportedShapes) {
    EXPECT_FALSE(ConfigValue::from_json(json::array({1, 2})).has_value());
    EXPECT_FALSE(ConfigValue::from_json(json::parse(R"({"nested": 1})")).has_value());
    EXPECT_FALSE(ConfigValue::from_json(json::parse(R"({"isEncrypted": "yes", "value": "x"})")).has_value());
    EXPECT_FALSE(ConfigValue::from_json(json::parse(R"({"isEncrypted": true, "value": 12})")).has_value());
    EXPECT_FALSE(ConfigValue::from_json(
        json::parse(R"({"isEncrypted": true, "value": "x", "extra": 1})")).has_value());
    EXPECT_FALSE(ConfigValue::from_json(json(nullptr)).has_value());
}

TEST(ConfigValueTest, KindNamesForLogging) {
    EXPECT_EQ(ConfigValue::kind_to_string(ConfigValue::Kind::ENCRYPTED_STRING), "ENCRYPTED_STRING");
    EXPECT_EQ(ConfigValue::kind_to_string(ConfigValue::Kind::INT), "INT");
}
