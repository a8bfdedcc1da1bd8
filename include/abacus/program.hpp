#pragma once

#include <abacus/program/counter.hpp>
#include <abacus/program/error.hpp>
#include <abacus/program/instruction.hpp>
#include <abacus/program/program.hpp>
#include <abacus/program/system_interface.hpp>
