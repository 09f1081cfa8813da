#ifndef ARGTREE_ARGTREE_HPP
#define ARGTREE_ARGTREE_HPP

#include "command.hpp"
#include "config.hpp"
#include "error.hpp"
#include "help.hpp"
#include "option.hpp"
#include "parser.hpp"
#include "parsing_fns.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // ARGTREE_ARGTREE_HPP
