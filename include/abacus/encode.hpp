#pragma once

#include <abacus/encode/base58.hpp>
#include <abacus/encode/error.hpp>
#include <abacus/encode/hex.hpp>
