// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("CLIPSYNC_CTL_SOCK");
    const std::string want = "/tmp/clipsync-test.sock";
    g.set(want);
    EXPECT_EQ(constants::ctl_sock_path(), want);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("CLIPSYNC_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "clipsync-home";
    g_home.set(tmp.string());

    clipsync::set_log_level(clipsync::Level::Debug);
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();
    clipsync::set_log_level(clipsync::Level::Info);

    std::string want = (tmp / ".cache/clipsync/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket defaults to " + want), std::string::npos);
}

TEST(Env_StateDir, Precedence)
{
    EnvGuard g_state("CLIPSYNC_STATE_DIR");
    EnvGuard g_xdg("XDG_DATA_HOME");
    EnvGuard g_home("HOME");

    g_home.set("/home/someone");
    g_xdg.unset();
    g_state.unset();
    EXPECT_EQ(constants::state_dir(), "/home/someone/.local/share/clipsync");

    g_xdg.set("/xdg");
    EXPECT_EQ(constants::state_dir(), "/xdg/clipsync");

    g_state.set("/explicit");
    EXPECT_EQ(constants::state_dir(), "/explicit");
}

TEST(Env_Config, Defaults)
{
    EnvGuard g1("CLIPSYNC_CHUNK_SIZE"), g2("CLIPSYNC_COMPRESS_THRESHOLD"),
        g3("CLIPSYNC_TRANSPORT"), g4("CLIPSYNC_RECV_DIR"), g5("CLIPSYNC_STATE_DIR"),
        g6("CLIPSYNC_REASM_TIMEOUT_MS");
    g1.unset();
    g2.unset();
    g3.unset();
    g4.unset();
    g6.unset();
    g5.set("/state");

    const auto c = config::Config::from_env();
    EXPECT_EQ(c.chunk_size, 180u);
    EXPECT_EQ(c.compress_threshold, 256u);
    EXPECT_EQ(c.reasm_timeout_ms, 30000u);
    EXPECT_EQ(c.transport, "loopback");
    EXPECT_EQ(c.clipboard, "memory");
    EXPECT_EQ(c.state_dir, "/state");
    EXPECT_EQ(c.recv_dir, "/state/received");
}

TEST(Env_Config, OverridesAndRejects)
{
    EnvGuard g1("CLIPSYNC_CHUNK_SIZE"), g2("CLIPSYNC_TRANSPORT"), g3("CLIPSYNC_CLIPBOARD"),
        g4("CLIPSYNC_TX_PAUSE_MS"), g5("CLIPSYNC_REASM_TIMEOUT_MS");

    g1.set("244");
    g2.set("BlueZ");
    g3.set("x11");
    g4.set("-5");
    g5.set("0");

    testing::internal::CaptureStderr();
    const auto  c   = config::Config::from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c.chunk_size, 244u);
    EXPECT_EQ(c.transport, "bluez");
    EXPECT_EQ(c.clipboard, "memory");
    EXPECT_EQ(c.tx_pause_ms, 8u);
    EXPECT_EQ(c.reasm_timeout_ms, 0u);
    EXPECT_NE(err.find("CLIPSYNC_CLIPBOARD"), std::string::npos);
    EXPECT_NE(err.find("CLIPSYNC_TX_PAUSE_MS"), std::string::npos);
}

TEST(Env_Config, ChunkSizeBounds)
{
    EnvGuard g("CLIPSYNC_CHUNK_SIZE");
    g.set("19");
    EXPECT_EQ(config::Config::from_env().chunk_size, config::DEFAULT_CHUNK_SIZE);
    g.set("505");
    EXPECT_EQ(config::Config::from_env().chunk_size, config::DEFAULT_CHUNK_SIZE);
    g.set("20");
    EXPECT_EQ(config::Config::from_env().chunk_size, 20u);
}

TEST(Env_Config, ParseUint)
{
    EXPECT_EQ(config::parse_uint("42", 0, 100), 42u);
    EXPECT_FALSE(config::parse_uint("", 0, 100).has_value());
    EXPECT_FALSE(config::parse_uint("4x", 0, 100).has_value());
    EXPECT_FALSE(config::parse_uint("+4", 0, 100).has_value());
    EXPECT_FALSE(config::parse_uint("101", 0, 100).has_value());
    EXPECT_FALSE(config::parse_uint(nullptr, 0, 100).has_value());
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace clipsync;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM is never filtered
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("[SYSTEM]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);

    set_log_level_by_name("info");
}

TEST(LogLevel, UnknownNameFallsBackToInfo)
{
    using namespace clipsync;

    EXPECT_EQ(parse_log_level("Warning"), Level::Warning);
    EXPECT_EQ(parse_log_level("err"), Level::Error);
    EXPECT_FALSE(parse_log_level("system").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());

    EXPECT_TRUE(set_log_level_by_name("error"));
    EXPECT_FALSE(set_log_level_by_name("loud"));
    EXPECT_EQ(global_level().load(), Level::Info);
}

TEST(Env_Config, RejectsUnknownLogLevel)
{
    EnvGuard g("CLIPSYNC_LOG_LEVEL");
    g.set("verbose");
    EXPECT_EQ(config::Config::from_env().log_level, "info");
    g.set("DEBUG");
    EXPECT_EQ(config::Config::from_env().log_level, "DEBUG");
}
