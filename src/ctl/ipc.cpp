#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <list>
#include <memory>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
        // only a directory we created gets 0700
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    }
    return true;
}

static bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) +
                                 std::strlen(addr.sun_path) + 1);
    return true;
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Reads up to the first '\n' (or EOF); strips the newline and an optional '\r'
static bool recv_line(int fd, std::string &out)
{
    std::string line;
    char        buf[256];
    while (line.find('\n') == std::string::npos)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    auto pos = line.find('\n');
    out      = pos == std::string::npos ? line : line.substr(0, pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

static bool send_all(int fd, const std::string &data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

namespace
{
struct Worker
{
    std::thread                       th;
    std::shared_ptr<std::atomic_bool> done = std::make_shared<std::atomic_bool>(false);
};

void reap(std::list<Worker> &workers, bool all)
{
    for (auto it = workers.begin(); it != workers.end();)
    {
        if (all || it->done->load())
        {
            if (it->th.joinable())
                it->th.join();
            it = workers.erase(it);
        }
        else
        {
            ++it;
        }
    }
}
}  // namespace

// ======================================================================
// Function: start_server
// - In: socket path, line handler
// - Out: true after QUIT, false on setup failure or accept() error
// - Note: the request line is read on the accept thread; QUIT is answered
//         there so the loop can stop, everything else goes to a worker
// ======================================================================
bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 8) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    std::list<Worker> workers;
    bool              ok = true;
    while (1)
    {
        reap(workers, false);

        int newfd = accept(fd, nullptr, nullptr);
        if (newfd == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        set_cloexec(newfd);

        std::string line;
        if (!recv_line(newfd, line))
        {
            close(newfd);
            continue;  // keep server alive; accept next connection
        }

        if (line == "QUIT")
        {
            std::string reply = on_line ? on_line(line) : std::string("OK");
            (void)send_all(newfd, reply + "\n");
            close(newfd);
            break;  // graceful shutdown
        }

        Worker w;
        auto   done = w.done;
        w.th        = std::thread([newfd, line, done, &on_line]() {
            std::string reply = on_line ? on_line(line) : std::string("OK");
            if (!send_all(newfd, reply + "\n"))
                LOG_WARN("Reply to '%s' was not delivered", line.c_str());
            close(newfd);
            done->store(true);
        });
        workers.push_back(std::move(w));
    }

    reap(workers, true);
    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line, std::string *reply)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_DEBUG("connect() failed: %s", std::strerror(errno));
        return false;
    }

    std::string out = line;
    if (out.back() != '\n')
        out.push_back('\n');
    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!send_all(fd, out))
    {
        close(fd);
        return false;
    }

    bool ok = true;
    if (reply)
        ok = recv_line(fd, *reply);
    close(fd);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
    }
    return p;
}

}  // namespace ipc
