#pragma once

#include <abacus/protocol/account.hpp>
#include <abacus/protocol/transaction.hpp>
