#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Maps one request line to one reply line (without the trailing newline)
using LineHandler = std::function<std::string(const std::string &)>;

// Serves the control socket: one request line per connection, answered with
// on_line()'s reply. Requests run on worker threads so a long REQUEST does not
// block SELECT/CANCEL. Returns true after a QUIT line has been answered and
// every worker has finished; false if the socket could not be set up.
bool start_server(const std::string &sock_path, const LineHandler &on_line);

// Sends one line; when `reply` is set, waits for the daemon's reply line.
bool send_line(const std::string &sock_path, const std::string &line, std::string *reply = nullptr);

std::string expand_user(const std::string &path);

}  // namespace ipc
