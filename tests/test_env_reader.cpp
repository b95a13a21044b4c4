#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "lazymc/config/env_reader.hpp"

namespace{
env_source single(const std::string& name, const std::string& value){
    return env_source::from_map({{env_reader::key(name), value}});
}
}

TEST(EnvReader, KeyCarriesPrefix){
    EXPECT_EQ(env_reader::key("SERVER_COMMAND"), "LAZYMC_SERVER_COMMAND");
}

TEST(EnvReader, BoolSynonyms){
    for(const char* text : {"true", "TRUE", "True", "1", "yes", "YES", "on", "On"}){
        EXPECT_EQ(env_reader::parse_bool(text), true) << text;
        EXPECT_TRUE(env_reader::get_bool(single("X", text), "X", false)) << text;
    }
    for(const char* text : {"false", "FALSE", "0", "no", "No", "off", "OFF"}){
        EXPECT_EQ(env_reader::parse_bool(text), false) << text;
        EXPECT_FALSE(env_reader::get_bool(single("X", text), "X", true)) << text;
    }
}

TEST(EnvReader, BoolUnknownKeepsDefault){
    for(const char* text : {"", "maybe", "2", "y", " true", "enabled"}){
        EXPECT_FALSE(env_reader::parse_bool(text).has_value()) << text;
        EXPECT_TRUE(env_reader::get_bool(single("X", text), "X", true)) << text;
        EXPECT_FALSE(env_reader::get_bool(single("X", text), "X", false)) << text;
    }
}

TEST(EnvReader, AbsentValueUsesDefault){
    env_source env = env_source::from_map({});
    EXPECT_TRUE(env_reader::get_bool(env, "X", true));
    EXPECT_EQ(env_reader::get_u32(env, "X", 60u), 60u);
    EXPECT_EQ(env_reader::get_u16(env, "X", 25575), 25575);
    EXPECT_EQ(env_reader::get_string_or(env, "X", "fallback"), "fallback");
    EXPECT_FALSE(env_reader::get_string(env, "X").has_value());
}

TEST(EnvReader, UnsignedParsing){
    EXPECT_EQ(env_reader::get_u32(single("X", "300"), "X", 1u), 300u);
    EXPECT_EQ(env_reader::get_u32(single("X", "4294967295"), "X", 1u), 4294967295u);
    EXPECT_EQ(env_reader::get_u32(single("X", "4294967296"), "X", 1u), 1u);
    EXPECT_EQ(env_reader::get_u32(single("X", "-5"), "X", 1u), 1u);
    EXPECT_EQ(env_reader::get_u32(single("X", "12abc"), "X", 1u), 1u);
    EXPECT_EQ(env_reader::get_u32(single("X", ""), "X", 1u), 1u);
    EXPECT_EQ(env_reader::get_u32(single("X", " 12"), "X", 1u), 1u);

    EXPECT_EQ(env_reader::get_u16(single("X", "65535"), "X", 7), 65535);
    EXPECT_EQ(env_reader::get_u16(single("X", "65536"), "X", 7), 7);
}

TEST(EnvReader, StringsAreEscapeDecoded){
    EXPECT_EQ(env_reader::get_string_or(single("MOTD", "a\\nb"), "MOTD", "x"), "a\nb");
    EXPECT_EQ(env_reader::get_string(single("MOTD", "tab\\there"), "MOTD"), "tab\there");
}

TEST(EnvReader, ListSplitsAndTrims){
    std::vector<std::string> expected = {"hold", "kick", "lobby"};
    EXPECT_EQ(env_reader::get_string_list(single("L", " hold ,kick,  lobby"), "L", {}), expected);

    std::vector<std::string> fallback = {"hold", "kick"};
    EXPECT_EQ(env_reader::get_string_list(env_source::from_map({}), "L", {"hold", "kick"}), fallback);

    std::vector<std::string> single_empty = {""};
    EXPECT_EQ(env_reader::get_string_list(single("L", ""), "L", {"hold"}), single_empty);
}

TEST(EnvReader, SocketAddressFallsBackSilently){
    socket_address sa = env_reader::get_socket_address(single("A", "10.0.0.1:1234"), "A", "127.0.0.1:1");
    EXPECT_EQ(sa.to_string(), "10.0.0.1:1234");

    for(const char* text : {"not an address", "127.0.0.1", "127.0.0.1:99999", ":25565", ""}){
        socket_address fallback = env_reader::get_socket_address(single("A", text), "A", "127.0.0.1:25566");
        EXPECT_EQ(fallback.to_string(), "127.0.0.1:25566") << text;
    }
}

TEST(EnvReader, LeadingPlusAccepted){
    EXPECT_EQ(env_reader::get_u32(single("X", "+30"), "X", 60u), 30u);
    EXPECT_EQ(env_reader::get_u16(single("X", "+25580"), "X", 1), 25580);
    EXPECT_EQ(env_reader::get_u32(single("X", "+"), "X", 60u), 60u);
    EXPECT_EQ(env_reader::get_u32(single("X", "++30"), "X", 60u), 60u);
    EXPECT_EQ(env_reader::get_u32(single("X", "+-30"), "X", 60u), 60u);
}
