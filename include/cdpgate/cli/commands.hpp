#pragma once

#include "cdpgate/service/dispatcher.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace cdpgate::cli {

/// Handles one NDJSON request line and returns the response line (no newline).
[[nodiscard]] std::string handle_request_line(service::Dispatcher &dispatcher,
                                              const std::string &line);

/// Reads requests until EOF; returns the number of lines answered.
std::size_t serve_stream(service::Dispatcher &dispatcher, std::istream &in, std::ostream &out);

int run_cli(int argc, char **argv);

} // namespace cdpgate::cli
