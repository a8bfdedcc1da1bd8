#pragma once

#include <abacus/memory/memory.hpp>
