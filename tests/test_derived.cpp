#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "lazymc/config/derived.hpp"
#include "lazymc/crypto/random.hpp"

TEST(Derived, ServerDirectoryWithoutFileIsAsGiven){
    config cfg;
    cfg.server.directory = "worlds/survival";
    EXPECT_EQ(derived::server_directory(cfg), std::filesystem::path("worlds/survival"));
}

TEST(Derived, ServerDirectoryRelativeToConfigFile){
    config cfg(std::filesystem::path("/opt/lazymc/lazymc.toml"));
    cfg.server.directory = "server";
    EXPECT_EQ(derived::server_directory(cfg), std::filesystem::path("/opt/lazymc/server"));

    cfg.server.directory = "/srv/minecraft";
    EXPECT_EQ(derived::server_directory(cfg), std::filesystem::path("/srv/minecraft"));
}

TEST(Derived, RandomRconPassword){
    rcon_config rcon;
    rcon.password = "ignored";
    rcon.randomize_password = true;

    auto first_exp = derived::rcon_password(rcon);
    ASSERT_TRUE(first_exp) << to_string(first_exp.error());
    EXPECT_EQ(first_exp->size(), 32u);
    EXPECT_TRUE(std::all_of(first_exp->begin(), first_exp->end(), [](unsigned char c){
        return std::isalnum(c) != 0;
    }));

    auto second_exp = derived::rcon_password(rcon);
    ASSERT_TRUE(second_exp);
    EXPECT_NE(*first_exp, *second_exp);
}

TEST(Derived, ConfiguredRconPassword){
    rcon_config rcon;
    rcon.password = "hunter2";
    rcon.randomize_password = false;

    auto password_exp = derived::rcon_password(rcon);
    ASSERT_TRUE(password_exp);
    EXPECT_EQ(*password_exp, "hunter2");
}

TEST(Derived, RandomAlphanumericLength){
    auto empty_exp = crypto::random_alphanumeric(0);
    ASSERT_TRUE(empty_exp);
    EXPECT_TRUE(empty_exp->empty());

    auto long_exp = crypto::random_alphanumeric(200);
    ASSERT_TRUE(long_exp);
    EXPECT_EQ(long_exp->size(), 200u);
}
