#pragma once

#include <abacus/client/counter_client.hpp>
#include <abacus/client/operation.hpp>
