#pragma once

// Parser combinators and the numeric parsers built on them

#include "nisaba/input.hpp"
#include "nisaba/error.hpp"
#include "nisaba/debugger.hpp"
#include "nisaba/combinators.hpp"
#include "nisaba/character.hpp"
#include "nisaba/binary.hpp"
#include "nisaba/number.hpp"
