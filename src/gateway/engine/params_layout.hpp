#pragma once

#include <expected>
#include <string>

struct whisper_full_params;

// Checks a greedy default parameter block, as produced by the loaded library,
// against the defaults documented in whisper.h. The probed fields span the
// whole struct, so a header/library mismatch shifts at least one of them.
std::expected<void, std::string> check_default_params(const whisper_full_params& params);
