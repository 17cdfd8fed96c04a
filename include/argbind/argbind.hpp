#ifndef ARGBIND_ARGBIND_HPP
#define ARGBIND_ARGBIND_HPP

#include "coerce.hpp"
#include "context.hpp"
#include "error.hpp"
#include "mainer.hpp"
#include "parser.hpp"
#include "schema.hpp"
#include "value.hpp"

#endif // ARGBIND_ARGBIND_HPP
