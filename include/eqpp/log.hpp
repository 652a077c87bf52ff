#ifndef EQPP_LOG_HPP
#define EQPP_LOG_HPP

#include <string>

namespace eqpp {
namespace log {

// Info lines are printed only when verbose; warnings and errors always print.
void
set_verbose(bool verbose);

bool
verbose();

// "[Component] message" on std::cout
void
info(const std::string &component, const std::string &message);

// "[Component] WARNING: message" on std::cerr
void
warning(const std::string &component, const std::string &message);

// "[Component] ERROR: message" on std::cerr
void
error(const std::string &component, const std::string &message);

} // namespace log
} // namespace eqpp

#endif // EQPP_LOG_HPP
