#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <unordered_map>

#include "ctl/commands.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace ctl
{

namespace
{

std::vector<std::string> split(const std::string &s, char sep)
{
    std::vector<std::string> out;
    size_t                   start = 0;
    while (start <= s.size())
    {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos)
            pos = s.size();
        if (pos > start)
            out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string ok_reply(const std::string &payload = std::string())
{
    return payload.empty() ? std::string("OK") : "OK " + payload;
}

std::string err_reply(const webble::Status &st)
{
    return "ERR " + st.to_string();
}

std::string usage(const char *text)
{
    return err_reply(webble::Status::invalid_request(std::string("usage: ") + text));
}

std::optional<std::string> opt_arg(const std::vector<std::string> &w, size_t i)
{
    if (i < w.size())
        return w[i];
    return std::nullopt;
}

webble::Status parse_filter(const std::string &body, gatt::DeviceFilterSpec &f)
{
    for (const auto &kv : split(body, ','))
    {
        auto eq = kv.find('=');
        if (eq == std::string::npos)
            return webble::Status::invalid_request("Malformed filter field '" + kv + "'");
        const std::string key = kv.substr(0, eq);
        const std::string val = kv.substr(eq + 1);
        if (key == "name")
            f.name = val;
        else if (key == "prefix")
            f.name_prefix = val;
        else if (key == "services")
            f.services = split(val, '+');
        else
            return webble::Status::invalid_request("Unknown filter field '" + key + "'");
    }
    return webble::Status::Ok();
}

}  // namespace

std::vector<std::string> split_words(const std::string &line)
{
    std::vector<std::string> out;
    std::string              cur;
    for (char c : line)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (!cur.empty())
                out.push_back(std::move(cur));
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(std::move(cur));
    return out;
}

webble::Status parse_request_args(const std::vector<std::string> &args,
                                  gatt::RequestDeviceOptions     &out)
{
    out = gatt::RequestDeviceOptions{};
    for (const auto &a : args)
    {
        if (a == "accept_all")
        {
            out.accept_all_devices = true;
        }
        else if (a.rfind("timeout=", 0) == 0)
        {
            std::uint32_t ms = 0;
            if (!config::parse_u32_in_range(a.c_str() + 8, 0, 3600000, ms))
                return webble::Status::invalid_request("Bad scan timeout '" + a.substr(8) + "'");
            out.scan_timeout = std::chrono::milliseconds(ms);
        }
        else if (a.rfind("filter:", 0) == 0)
        {
            gatt::DeviceFilterSpec f;
            webble::Status         st = parse_filter(a.substr(7), f);
            if (!st.ok())
                return st;
            out.filters.push_back(std::move(f));
        }
        else if (a.rfind("optional=", 0) == 0)
        {
            for (auto &s : split(a.substr(9), '+'))
                out.optional_services.push_back(std::move(s));
        }
        else
        {
            return webble::Status::invalid_request("Unknown REQUEST argument '" + a + "'");
        }
    }
    return webble::Status::Ok();
}

// ======================================================================
// Function: handle_line
// - In: session, pending selection responses, one request line
// - Out: reply line
// - Note: blocks for the duration of the operation (REQUEST scans and may
//         wait on a SELECT from another connection)
// ======================================================================
std::string handle_line(session::SessionManager     &session,
                        session::SelectionResponses &responses,
                        const std::string           &line)
{
    const auto w = split_words(line);
    if (w.empty())
        return err_reply(webble::Status::invalid_request("Empty command"));

    const std::string &cmd = w[0];
    LOG_DEBUG("CMD: %s", line.c_str());

    std::unordered_map<std::string, std::function<std::string()>> cmd_map = {
        {"AVAILABILITY",
         [&]() -> std::string {
             bool           available = false;
             webble::Status st        = session.get_availability(available);
             return st.ok() ? ok_reply(available ? "true" : "false") : err_reply(st);
         }},
        {"DEVICES",
         [&]() -> std::string {
             std::vector<gatt::DeviceDescriptor> devices;
             webble::Status                      st = session.get_devices(devices);
             return st.ok() ? ok_reply(gatt::render(devices)) : err_reply(st);
         }},
        {"REQUEST",
         [&]() -> std::string {
             gatt::RequestDeviceOptions     opts;
             const std::vector<std::string> args(w.begin() + 1, w.end());
             webble::Status                 st = parse_request_args(args, opts);
             if (!st.ok())
                 return err_reply(st);
             gatt::DeviceDescriptor d;
             st = session.request_device(opts, d);
             return st.ok() ? ok_reply(gatt::render(d)) : err_reply(st);
         }},
        {"CONNECT",
         [&]() -> std::string {
             if (w.size() != 2)
                 return usage("CONNECT <id>");
             gatt::GattServerInfo info;
             webble::Status       st = session.connect_gatt(w[1], info);
             return st.ok() ? ok_reply(gatt::render(info)) : err_reply(st);
         }},
        {"DISCONNECT",
         [&]() -> std::string {
             if (w.size() != 2)
                 return usage("DISCONNECT <id>");
             webble::Status st = session.disconnect_gatt(w[1]);
             return st.ok() ? ok_reply() : err_reply(st);
         }},
        {"FORGET",
         [&]() -> std::string {
             if (w.size() != 2)
                 return usage("FORGET <id>");
             webble::Status st = session.forget_device(w[1]);
             return st.ok() ? ok_reply() : err_reply(st);
         }},
        {"SERVICES",
         [&]() -> std::string {
             if (w.size() != 2 && w.size() != 3)
                 return usage("SERVICES <id> [svc]");
             std::vector<gatt::BluetoothService> svcs;
             webble::Status st = session.get_primary_services(w[1], opt_arg(w, 2), svcs);
             if (!st.ok())
                 return err_reply(st);
             std::string r = "[";
             for (size_t i = 0; i < svcs.size(); ++i)
                 r += (i ? " " : "") + gatt::render(svcs[i]);
             return ok_reply(r + "]");
         }},
        {"CHARS",
         [&]() -> std::string {
             if (w.size() != 3 && w.size() != 4)
                 return usage("CHARS <id> <svc> [chr]");
             std::vector<gatt::BluetoothCharacteristic> chars;
             webble::Status st = session.get_characteristics(w[1], w[2], opt_arg(w, 3), chars);
             if (!st.ok())
                 return err_reply(st);
             std::string r = "[";
             for (size_t i = 0; i < chars.size(); ++i)
                 r += (i ? " " : "") + gatt::render(chars[i]);
             return ok_reply(r + "]");
         }},
        {"READ",
         [&]() -> std::string {
             if (w.size() != 4)
                 return usage("READ <id> <svc> <chr>");
             std::string    value;
             webble::Status st = session.read_characteristic_value(w[1], w[2], w[3], value);
             return st.ok() ? ok_reply(value) : err_reply(st);
         }},
        {"WRITE",
         [&]() -> std::string {
             if (w.size() != 5 && !(w.size() == 6 && w[5] == "noresp"))
                 return usage("WRITE <id> <svc> <chr> <b64> [noresp]");
             webble::Status st =
                 session.write_characteristic_value(w[1], w[2], w[3], w[4], w.size() == 5);
             return st.ok() ? ok_reply() : err_reply(st);
         }},
        {"READDESC",
         [&]() -> std::string {
             if (w.size() != 5)
                 return usage("READDESC <id> <svc> <chr> <dsc>");
             std::string    value;
             webble::Status st = session.read_descriptor_value(w[1], w[2], w[3], w[4], value);
             return st.ok() ? ok_reply(value) : err_reply(st);
         }},
        {"WRITEDESC",
         [&]() -> std::string {
             if (w.size() != 6)
                 return usage("WRITEDESC <id> <svc> <chr> <dsc> <b64>");
             webble::Status st = session.write_descriptor_value(w[1], w[2], w[3], w[4], w[5]);
             return st.ok() ? ok_reply() : err_reply(st);
         }},
        {"NOTIFY",
         [&]() -> std::string {
             if (w.size() != 5 || (w[4] != "on" && w[4] != "off"))
                 return usage("NOTIFY <id> <svc> <chr> on|off");
             webble::Status st = w[4] == "on" ? session.start_notifications(w[1], w[2], w[3])
                                              : session.stop_notifications(w[1], w[2], w[3]);
             return st.ok() ? ok_reply() : err_reply(st);
         }},
        {"SELECT",
         [&]() -> std::string {
             if (w.size() != 3)
                 return usage("SELECT <requestId> <deviceId>");
             if (!responses.respond(w[1], w[2]))
                 return err_reply(webble::Status::invalid_request("No pending selection " + w[1]));
             return ok_reply();
         }},
        {"CANCEL",
         [&]() -> std::string {
             if (w.size() != 2)
                 return usage("CANCEL <requestId>");
             if (!responses.respond(w[1], std::nullopt))
                 return err_reply(webble::Status::invalid_request("No pending selection " + w[1]));
             return ok_reply();
         }},
        {"QUIT",
         [&]() -> std::string {
             // release anyone still waiting on a chooser
             for (const auto &req : responses.pending())
                 responses.respond(req, std::nullopt);
             LOG_INFO("Received QUIT command, exiting...");
             return ok_reply();
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
        return err_reply(webble::Status::invalid_request("Unknown command '" + cmd + "'"));
    return it->second();
}

}  // namespace ctl
