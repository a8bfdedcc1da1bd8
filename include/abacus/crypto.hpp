#pragma once

#include <abacus/crypto/hash.hpp>
