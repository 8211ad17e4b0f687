#pragma once

#include <string>

// Returns this machine's host name as reported by gethostname().
std::string get_host_name();
