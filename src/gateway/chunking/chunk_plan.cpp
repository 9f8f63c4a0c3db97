#include "chunking/chunk_plan.hpp"

#include <algorithm>
#include <format>

std::expected<std::vector<Chunk>, Error> plan_chunks(double total_s, const ChunkOptions& opts) {
    if (opts.duration_s <= 0.0 || opts.overlap_s < 0.0 || opts.overlap_s >= opts.duration_s) {
        return std::unexpected(Error{ErrorKind::InvalidConfig,
            std::format("Invalid chunk geometry: duration {}s, overlap {}s",
                        opts.duration_s, opts.overlap_s)});
    }

    std::vector<Chunk> chunks;
    if (total_s <= 0.0) return chunks;

    double start = 0.0;
    while (true) {
        double end = std::min(start + opts.duration_s, total_s);
        chunks.push_back({start, end});
        if (end >= total_s) break;

        if (chunks.size() >= opts.max_chunks) {
            return std::unexpected(Error{ErrorKind::TooManyChunks,
                std::format("Too many chunks ({}+) for {:.1f}s of audio", opts.max_chunks, total_s)});
        }
        start = end - opts.overlap_s;
    }

    if (chunks.size() > 1 && chunks.back().length_s() < opts.min_chunk_s) {
        double end = chunks.back().end_s;
        chunks.pop_back();
        chunks.back().end_s = end;
    }

    return chunks;
}
