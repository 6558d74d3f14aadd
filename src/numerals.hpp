#pragma once

#include "errors/errors.hpp"
#include "roman/roman.hpp"
#include "symbol/numeral.hpp"
#include "ternary/balanced_ternary.hpp"
#include "ternary/trit.hpp"
