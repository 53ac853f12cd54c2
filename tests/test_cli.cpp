// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_seen;

static std::string on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines_seen.push_back(line);
    if (line.rfind("CONNECT missing", 0) == 0)
        return "ERR DeviceNotFound: Device missing not found";
    if (line == "AVAILABILITY")
        return "OK true";
    return "OK";
}

static std::string temp_sock_path()
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/webble-cli-test-" + std::to_string(::getpid()) + ".sock";
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/webblectl --sock " + sock + " " + args + " >/dev/null 2>&1";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionalality)
{
    test_cli::g_lines_seen.clear();
    const auto sock = test_cli::temp_sock_path();

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "availability"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "Notify dev 180d 2a37 ON"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "write dev 180d 2a39 AQ== noresp"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "request accept_all timeout=500"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "connect missing"), exitc::cmd_failed);

    // rejected locally, nothing is sent
    EXPECT_EQ(test_cli::run_cli(sock, "notify dev 180d 2a37 maybe"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "write dev 180d 2a39 AQ== later"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "read dev 180d"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "frobnicate"), exitc::bad_args);

    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_seen.size(), 6u);
        EXPECT_EQ(test_cli::g_lines_seen[0], "AVAILABILITY");
        EXPECT_EQ(test_cli::g_lines_seen[1], "NOTIFY dev 180d 2a37 on");
        EXPECT_EQ(test_cli::g_lines_seen[2], "WRITE dev 180d 2a39 AQ== noresp");
        EXPECT_EQ(test_cli::g_lines_seen[3], "REQUEST accept_all timeout=500");
        EXPECT_EQ(test_cli::g_lines_seen[4], "CONNECT missing");
        EXPECT_EQ(test_cli::g_lines_seen.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);

    // no daemon any more
    EXPECT_EQ(test_cli::run_cli(sock, "devices"), exitc::no_server);
}

TEST(CLI, TestMissingSockValue)
{
    int rc = std::system("./bin/webblectl --sock >/dev/null 2>&1");
    ASSERT_NE(rc, -1);
    ASSERT_TRUE(WIFEXITED(rc));
    EXPECT_EQ(WEXITSTATUS(rc), exitc::bad_args);
}
