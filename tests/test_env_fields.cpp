#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lazymc/config/config_loader.hpp"
#include "lazymc/config/env_reader.hpp"

namespace{
using snapshot = std::map<std::string, std::string>;

std::string flag(bool value){
    return value ? "true" : "false";
}

snapshot describe(const config& cfg){
    std::string methods;
    for(join_method method : cfg.join.methods){
        if(!methods.empty()) methods += ",";
        methods += to_string(method);
    }

    return {
        {"public.address", cfg.pub.address.to_string()},
        {"public.version", cfg.pub.version},
        {"public.protocol", std::to_string(cfg.pub.protocol)},
        {"server.directory", cfg.server.directory.string()},
        {"server.command", cfg.server.command},
        {"server.address", cfg.server.address.to_string()},
        {"server.freeze_process", flag(cfg.server.freeze_process)},
        {"server.wake_on_start", flag(cfg.server.wake_on_start)},
        {"server.wake_on_crash", flag(cfg.server.wake_on_crash)},
        {"server.probe_on_start", flag(cfg.server.probe_on_start)},
        {"server.forge", flag(cfg.server.forge)},
        {"server.start_timeout", std::to_string(cfg.server.start_timeout)},
        {"server.stop_timeout", std::to_string(cfg.server.stop_timeout)},
        {"server.wake_whitelist", flag(cfg.server.wake_whitelist)},
        {"server.block_banned_ips", flag(cfg.server.block_banned_ips)},
        {"server.drop_banned_ips", flag(cfg.server.drop_banned_ips)},
        {"server.send_proxy_v2", flag(cfg.server.send_proxy_v2)},
        {"time.sleep_after", std::to_string(cfg.time.sleep_after)},
        {"time.min_online_time", std::to_string(cfg.time.min_online_time)},
        {"motd.sleeping", cfg.motd.sleeping},
        {"motd.starting", cfg.motd.starting},
        {"motd.stopping", cfg.motd.stopping},
        {"motd.from_server", flag(cfg.motd.from_server)},
        {"join.methods", methods},
        {"join.kick.starting", cfg.join.kick.starting},
        {"join.kick.stopping", cfg.join.kick.stopping},
        {"join.hold.timeout", std::to_string(cfg.join.hold.timeout)},
        {"join.forward.address", cfg.join.forward.address.to_string()},
        {"join.forward.send_proxy_v2", flag(cfg.join.forward.send_proxy_v2)},
        {"join.lobby.timeout", std::to_string(cfg.join.lobby.timeout)},
        {"join.lobby.message", cfg.join.lobby.message},
        {"join.lobby.ready_sound", cfg.join.lobby.ready_sound.value_or("(none)")},
        {"lockout.enabled", flag(cfg.lockout.enabled)},
        {"lockout.message", cfg.lockout.message},
        {"rcon.enabled", flag(cfg.rcon.enabled)},
        {"rcon.port", std::to_string(cfg.rcon.port)},
        {"rcon.password", cfg.rcon.password},
        {"rcon.randomize_password", flag(cfg.rcon.randomize_password)},
        {"rcon.send_proxy_v2", flag(cfg.rcon.send_proxy_v2)},
        {"advanced.rewrite_server_properties", flag(cfg.advanced.rewrite_server_properties)},
        {"config.version", cfg.version.version.value_or("(none)")}
    };
}

snapshot load_with(const std::string& name, const std::string& value){
    env_source::env_map vars{{env_reader::key("SERVER_COMMAND"), "run"}};
    vars[env_reader::key(name)] = value;
    auto cfg_exp = config_loader::load_from_env(env_source::from_map(std::move(vars)));
    EXPECT_TRUE(cfg_exp) << name << "=" << value;
    if(!cfg_exp) return {};
    return describe(*cfg_exp);
}

snapshot baseline(){
    auto cfg_exp = config_loader::load_from_env(
        env_source::from_map({{env_reader::key("SERVER_COMMAND"), "run"}})
    );
    EXPECT_TRUE(cfg_exp);
    if(!cfg_exp) return {};
    return describe(*cfg_exp);
}

// Only `field` may differ from the baseline, and it must equal `expected`.
void expect_only_field(
    const snapshot& base, const snapshot& got, const std::string& field, const std::string& expected
){
    ASSERT_EQ(got.size(), base.size());
    for(const auto& [key, value] : base){
        auto it = got.find(key);
        ASSERT_NE(it, got.end()) << key;
        if(key == field) EXPECT_EQ(it->second, expected) << key;
        else EXPECT_EQ(it->second, value) << key;
    }
}

struct value_row{
    const char* env;
    const char* field;
    const char* valid;
    const char* expected;
    std::optional<const char*> malformed;
};

struct bool_row{
    const char* env;
    const char* field;
};

const std::vector<value_row> value_rows = {
    {"PUBLIC_ADDRESS", "public.address", "127.0.0.1:4000", "127.0.0.1:4000", "not-an-address"},
    {"PUBLIC_VERSION", "public.version", "1.19.2", "1.19.2", std::nullopt},
    {"PUBLIC_PROTOCOL", "public.protocol", "760", "760", "seven"},
    {"SERVER_DIRECTORY", "server.directory", "/srv/mc", "/srv/mc", std::nullopt},
    {"SERVER_COMMAND", "server.command", "java -jar paper.jar", "java -jar paper.jar", std::nullopt},
    {"SERVER_ADDRESS", "server.address", "[::1]:25600", "[::1]:25600", "::1:25600"},
    {"SERVER_START_TIMEOUT", "server.start_timeout", "45", "45", "-45"},
    {"SERVER_STOP_TIMEOUT", "server.stop_timeout", "46", "46", "4294967296"},
    {"TIME_SLEEP_AFTER", "time.sleep_after", "+30", "30", "30s"},
    {"TIME_MIN_ONLINE_TIME", "time.min_online_time", "31", "31", ""},
    {"MOTD_SLEEPING", "motd.sleeping", "zz\\nz", "zz\nz", std::nullopt},
    {"MOTD_STARTING", "motd.starting", "up\\tup", "up\tup", std::nullopt},
    {"MOTD_STOPPING", "motd.stopping", "down", "down", std::nullopt},
    {"JOIN_METHODS", "join.methods", "Forward, lobby", "forward,lobby", std::nullopt},
    {"JOIN_KICK_STARTING", "join.kick.starting", "wait", "wait", std::nullopt},
    {"JOIN_KICK_STOPPING", "join.kick.stopping", "later", "later", std::nullopt},
    {"JOIN_HOLD_TIMEOUT", "join.hold.timeout", "12", "12", "twelve"},
    {"JOIN_FORWARD_ADDRESS", "join.forward.address", "10.1.2.3:25570", "10.1.2.3:25570", "10.1.2.3"},
    {"JOIN_LOBBY_TIMEOUT", "join.lobby.timeout", "90", "90", "1.5"},
    {"JOIN_LOBBY_MESSAGE", "join.lobby.message", "lobby", "lobby", std::nullopt},
    {"JOIN_LOBBY_READY_SOUND", "join.lobby.ready_sound", "block.bell.use", "block.bell.use", std::nullopt},
    {"LOCKOUT_MESSAGE", "lockout.message", "closed", "closed", std::nullopt},
    {"RCON_PORT", "rcon.port", "25590", "25590", "65536"},
    {"RCON_PASSWORD", "rcon.password", "hunter2", "hunter2", std::nullopt},
    {"CONFIG_VERSION", "config.version", "0.2.8", "0.2.8", std::nullopt}
};

const std::vector<bool_row> bool_rows = {
    {"SERVER_FREEZE_PROCESS", "server.freeze_process"},
    {"SERVER_WAKE_ON_START", "server.wake_on_start"},
    {"SERVER_WAKE_ON_CRASH", "server.wake_on_crash"},
    {"SERVER_PROBE_ON_START", "server.probe_on_start"},
    {"SERVER_FORGE", "server.forge"},
    {"SERVER_WAKE_WHITELIST", "server.wake_whitelist"},
    {"SERVER_BLOCK_BANNED_IPS", "server.block_banned_ips"},
    {"SERVER_DROP_BANNED_IPS", "server.drop_banned_ips"},
    {"SERVER_SEND_PROXY_V2", "server.send_proxy_v2"},
    {"MOTD_FROM_SERVER", "motd.from_server"},
    {"JOIN_FORWARD_SEND_PROXY_V2", "join.forward.send_proxy_v2"},
    {"LOCKOUT_ENABLED", "lockout.enabled"},
    {"RCON_ENABLED", "rcon.enabled"},
    {"RCON_RANDOMIZE_PASSWORD", "rcon.randomize_password"},
    {"RCON_SEND_PROXY_V2", "rcon.send_proxy_v2"},
    {"ADVANCED_REWRITE_SERVER_PROPERTIES", "advanced.rewrite_server_properties"}
};
}

TEST(EnvFields, EveryFieldIsCovered){
    snapshot base = baseline();
    EXPECT_EQ(value_rows.size() + bool_rows.size(), base.size());
}

TEST(EnvFields, ValidValueSetsOnlyItsField){
    snapshot base = baseline();
    for(const value_row& row : value_rows){
        SCOPED_TRACE(row.env);
        expect_only_field(base, load_with(row.env, row.valid), row.field, row.expected);
    }
}

TEST(EnvFields, MalformedValueKeepsEveryDefault){
    snapshot base = baseline();
    for(const value_row& row : value_rows){
        if(!row.malformed) continue;
        SCOPED_TRACE(row.env);
        EXPECT_EQ(load_with(row.env, *row.malformed), base);
    }
    for(const bool_row& row : bool_rows){
        SCOPED_TRACE(row.env);
        EXPECT_EQ(load_with(row.env, "maybe"), base);
    }
}

TEST(EnvFields, BooleanSynonyms){
    snapshot base = baseline();
    for(const bool_row& row : bool_rows){
        for(const char* text : {"true", "TRUE", "1", "yes", "Yes", "on", "ON"}){
            SCOPED_TRACE(std::string(row.env) + "=" + text);
            expect_only_field(base, load_with(row.env, text), row.field, "true");
        }
        for(const char* text : {"false", "False", "0", "no", "NO", "off", "Off"}){
            SCOPED_TRACE(std::string(row.env) + "=" + text);
            expect_only_field(base, load_with(row.env, text), row.field, "false");
        }
    }
}
