#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

namespace
{
std::string temp_sock(const char *tag)
{
    return "/tmp/webble-ipc-ut-" + std::string(tag) + "-" + std::to_string(getpid()) + ".sock";
}

bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 200; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}
}  // namespace

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    std::string saved     = path ? path : "";
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");
    EXPECT_EQ(ipc::expand_user("~other/x"), "~other/x");

    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path  = std::getenv("HOME");
    std::string saved = path ? path : "";
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestQuitWithoutHandler)
{
    std::string sock = temp_sock("quit");

    std::atomic<bool> ok{false};
    std::thread       th([&] { ok.store(ipc::start_server(sock, nullptr)); });
    ASSERT_TRUE(wait_for_socket(sock));

    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    EXPECT_EQ(reply, "OK");
    th.join();
    EXPECT_TRUE(ok.load());
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestRepliesComeFromHandler)
{
    std::string              sock = temp_sock("echo");
    std::mutex               mu;
    std::vector<std::string> seen;

    ipc::LineHandler echo = [&](const std::string &line) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(line);
        return line == "QUIT" ? std::string("OK") : "OK " + line;
    };
    std::thread th([&] { ipc::start_server(sock, echo); });
    ASSERT_TRUE(wait_for_socket(sock));

    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "DEVICES", &reply));
    EXPECT_EQ(reply, "OK DEVICES");
    // trailing CR is stripped
    ASSERT_TRUE(ipc::send_line(sock, "READ a b c\r\n", &reply));
    EXPECT_EQ(reply, "OK READ a b c");

    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    th.join();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.back(), "QUIT");
}

TEST(IPC, TestSlowRequestDoesNotBlockOthers)
{
    std::string sock = temp_sock("slow");

    std::atomic<bool> release{false};
    ipc::LineHandler  handler = [&](const std::string &line) {
        if (line == "REQUEST")
        {
            while (!release.load())
                std::this_thread::sleep_for(5ms);
            return std::string("OK slow");
        }
        if (line == "SELECT")
            release.store(true);
        return std::string("OK");
    };
    std::thread th([&] { ipc::start_server(sock, handler); });
    ASSERT_TRUE(wait_for_socket(sock));

    std::string slow_reply;
    std::thread slow([&] { ipc::send_line(sock, "REQUEST", &slow_reply); });
    std::this_thread::sleep_for(50ms);

    // answered while REQUEST is still being served
    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "SELECT", &reply));
    EXPECT_EQ(reply, "OK");

    slow.join();
    EXPECT_EQ(slow_reply, "OK slow");

    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    th.join();
}

TEST(IPC, TestSendLineWithoutServerFails)
{
    std::string sock = temp_sock("absent");
    std::string reply;
    EXPECT_FALSE(ipc::send_line(sock, "DEVICES", &reply));
    EXPECT_FALSE(ipc::send_line(sock, ""));
}

TEST(IPC, TestStartServerRejectsBadPath)
{
    EXPECT_FALSE(ipc::start_server("", nullptr));
    EXPECT_FALSE(ipc::start_server("/tmp/" + std::string(200, 'x') + ".sock", nullptr));
}
