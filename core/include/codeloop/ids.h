#pragma once

#include <cstdint>
#include <string>

namespace codeloop {

// Kernel randomness (getrandom, /dev/urandom fallback).
// Throws std::runtime_error if neither source is available.
uint32_t secure_rand32();

// 32 hex chars. CODELOOP_DETERMINISTIC_RUN_ID=1 pins the value for golden tests.
std::string gen_run_id();

} // namespace codeloop
