#pragma once
#include <string>
#include <vector>

#include "gatt/models.hpp"
#include "session/selection.hpp"
#include "session/session_manager.hpp"
#include "util/status.hpp"

namespace ctl
{

// Runs one control-socket line against the session.
// Reply: "OK[ <payload>]" or "ERR <Kind>: <message>".
std::string handle_line(session::SessionManager     &session,
                        session::SelectionResponses &responses,
                        const std::string           &line);

// Whitespace-separated words
std::vector<std::string> split_words(const std::string &line);

// REQUEST arguments:
//   accept_all | timeout=<ms> | filter:name=..,prefix=..,services=a+b | optional=a+b
webble::Status parse_request_args(const std::vector<std::string> &args,
                                  gatt::RequestDeviceOptions     &out);

}  // namespace ctl
