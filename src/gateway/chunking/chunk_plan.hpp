#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <vector>

struct Chunk {
    double start_s = 0.0;
    double end_s = 0.0;

    double length_s() const { return end_s - start_s; }
};

struct ChunkOptions {
    double duration_s = 30.0;
    double overlap_s = 3.0;
    double min_chunk_s = 2.0;
    uint32_t max_chunks = 1000;
};

// Windows [start, min(start + L, D)] with next start = end - O, stopping at
// the window that reaches D. A final window shorter than min_chunk_s is
// folded into its predecessor. More than max_chunks windows is TooManyChunks.
std::expected<std::vector<Chunk>, Error> plan_chunks(double total_s, const ChunkOptions& opts);
