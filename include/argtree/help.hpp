#ifndef ARGTREE_HELP_HPP
#define ARGTREE_HELP_HPP

#include <ostream>

#include "command.hpp"
#include "config.hpp"
#include "option.hpp"
#include "value.hpp"

namespace argtree {

void writeValueUsage(std::ostream& os, const Value& val, const HelpFormat& fmt);
void writeValueHelp(std::ostream& os, const Value& val, const HelpFormat& fmt);

// `[-s,--long "value (type)"]`; missing names are left out.
void writeOptionUsage(std::ostream& os, const Option& opt, const Config& config);
void writeOptionHelp(std::ostream& os, const Option& opt, const Config& config);

void writeCommandUsage(std::ostream& os, const Command& cmd);
void writeCommandHelp(std::ostream& os, const Command& cmd);

} // namespace argtree

#endif // ARGTREE_HELP_HPP
