#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string join_from(const std::vector<std::string> &args, size_t first)
{
    std::string r;
    for (size_t i = first; i < args.size(); ++i)
    {
        if (i > first)
            r.push_back(' ');
        r += args[i];
    }
    return r;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  webblectl [--sock <path>] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  availability\n"
                 "  devices\n"
                 "  request [accept_all] [timeout=<ms>] [filter:name=..,prefix=..,services=a+b]...\n"
                 "          [optional=a+b]\n"
                 "  connect <device>\n"
                 "  disconnect <device>\n"
                 "  forget <device>\n"
                 "  services <device> [service]\n"
                 "  chars <device> <service> [characteristic]\n"
                 "  read <device> <service> <characteristic>\n"
                 "  write <device> <service> <characteristic> <base64> [noresp]\n"
                 "  readdesc <device> <service> <characteristic> <descriptor>\n"
                 "  writedesc <device> <service> <characteristic> <descriptor> <base64>\n"
                 "  notify <device> <service> <characteristic> on|off\n"
                 "  select <request> <device>\n"
                 "  cancel <request>\n"
                 "  quit\n");
}

// Sends one line, prints the daemon's reply and maps it to an exit code
static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        std::fprintf(stderr, "error: command line must be a single non-empty line\n");
        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (reply == "OK" || reply.rfind("OK ", 0) == 0)
    {
        if (reply.size() > 3)
            std::printf("%s\n", reply.c_str() + 3);
        return exitc::ok;
    }
    std::fprintf(stderr, "%s\n", reply.empty() ? "ERR (no reply)" : reply.c_str());
    return exitc::cmd_failed;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    // fixed arity: [min, max] words after the command
    auto with_args = [&](const char *verb, size_t min, size_t max) -> int {
        const size_t n = args.size() - 1;
        if (n < min || n > max)
        {
            print_usage();
            return exitc::bad_args;
        }
        std::string line = verb;
        if (n)
            line += " " + join_from(args, 1);
        return send_line(line);
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"availability", [&]() -> int { return with_args("AVAILABILITY", 0, 0); }},
        {"devices", [&]() -> int { return with_args("DEVICES", 0, 0); }},
        {"request", [&]() -> int { return with_args("REQUEST", 0, 64); }},
        {"connect", [&]() -> int { return with_args("CONNECT", 1, 1); }},
        {"disconnect", [&]() -> int { return with_args("DISCONNECT", 1, 1); }},
        {"forget", [&]() -> int { return with_args("FORGET", 1, 1); }},
        {"services", [&]() -> int { return with_args("SERVICES", 1, 2); }},
        {"chars", [&]() -> int { return with_args("CHARS", 2, 3); }},
        {"read", [&]() -> int { return with_args("READ", 3, 3); }},
        {"write",
         [&]() -> int {
             if (args.size() == 6 && args[5] != "noresp")
             {
                 std::fprintf(stderr, "error: write expects 'noresp' as the last argument\n");
                 return exitc::bad_args;
             }
             return with_args("WRITE", 4, 5);
         }},
        {"readdesc", [&]() -> int { return with_args("READDESC", 4, 4); }},
        {"writedesc", [&]() -> int { return with_args("WRITEDESC", 5, 5); }},
        {"notify",
         [&]() -> int {
             if (args.size() != 5)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string v = to_lower(args[4]);
             if (v != "on" && v != "off")
             {
                 std::fprintf(stderr, "error: notify expects 'on' or 'off'\n");
                 return exitc::bad_args;
             }
             return send_line("NOTIFY " + args[1] + " " + args[2] + " " + args[3] + " " + v);
         }},
        {"select", [&]() -> int { return with_args("SELECT", 2, 2); }},
        {"cancel", [&]() -> int { return with_args("CANCEL", 1, 1); }},
        {"quit", [&]() -> int { return with_args("QUIT", 0, 0); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    webble::set_log_level_from_env("WEBBLE_LOG_LEVEL");
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // WEBBLE_CTL_SOCK is honoured by ctl_sock_path(); --sock overrides it
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string cmd    = to_lower(args[0]);
    auto              sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
