#include "eqpp/log.hpp"

#include <atomic>
#include <iostream>
#include <sstream>

namespace eqpp {
namespace log {

namespace {

std::atomic<bool> g_verbose{ false };

// One insertion per line so that lines from different workers do not interleave.
void
write_line(std::ostream &os, const std::string &component, const char *level, const std::string &message) {
    std::ostringstream oss;
    oss << '[' << component << "] " << level << message << '\n';
    os << oss.str() << std::flush;
}

} // namespace

void
set_verbose(bool verbose) {
    g_verbose.store(verbose);
}

bool
verbose() {
    return g_verbose.load();
}

void
info(const std::string &component, const std::string &message) {
    if (!g_verbose.load()) { return; }
    write_line(std::cout, component, "", message);
}

void
warning(const std::string &component, const std::string &message) {
    write_line(std::cerr, component, "WARNING: ", message);
}

void
error(const std::string &component, const std::string &message) {
    write_line(std::cerr, component, "ERROR: ", message);
}

} // namespace log
} // namespace eqpp
