#ifndef ARGROUTE_ARGROUTE_HPP
#define ARGROUTE_ARGROUTE_HPP

#include "cli.hpp"
#include "color.hpp"
#include "command.hpp"
#include "errors.hpp"
#include "help.hpp"
#include "manipulator.hpp"
#include "option.hpp"
#include "option_registry.hpp"
#include "parameter.hpp"
#include "router.hpp"
#include "token_stream.hpp"
#include "utils.hpp"

#endif // ARGROUTE_ARGROUTE_HPP
