#pragma once

#include <abacus/log/log.hpp>
