#pragma once

#include <abacus/runtime/bank.hpp>
#include <abacus/runtime/error.hpp>
#include <abacus/runtime/rent.hpp>
