#ifndef ARGSPEC_ARGSPEC_HPP
#define ARGSPEC_ARGSPEC_HPP

#include "args.hpp"
#include "default_value.hpp"
#include "definition_set.hpp"
#include "errors.hpp"
#include "help.hpp"
#include "json.hpp"
#include "option.hpp"
#include "tokenizer.hpp"
#include "validator.hpp"
#include "value.hpp"

#endif // ARGSPEC_ARGSPEC_HPP
