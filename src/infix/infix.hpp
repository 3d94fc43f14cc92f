#pragma once

#include "./applicator.hpp"
#include "./compose.hpp"
#include "./error.hpp"
#include "./stateful.hpp"
#include "./token.hpp"
