#include "engine/whisper_adapter.hpp"

#include "audio/ffmpeg_toolkit.hpp"
#include "config.hpp"
#include "engine/whisper_library.hpp"
#include "logging.hpp"
#include "scoped_file.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace fs = std::filesystem;

int resolve_thread_count(int configured) {
    if (configured > 0) return configured;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::clamp(hw, 1, 8);
}

std::expected<std::unique_ptr<WhisperAdapter>, Error> WhisperAdapter::create(const Config& cfg) {
    auto model = find_model_config(cfg.whisper.model_size);
    if (!model) return std::unexpected(std::move(model.error()));

    fs::path artifacts(cfg.whisper.artifacts_dir);
    auto library_dir = model->library_path(artifacts);
    logging::info("Initializing Whisper ({}) from {}", model->model_size, library_dir.string());

    auto library = WhisperLibrary::load(library_dir);
    if (!library) return std::unexpected(std::move(library.error()));
    logging::debug("whisper system info: {}", (*library)->system_info());

    AdapterOptions opts{
        .language = cfg.whisper.language,
        .n_threads = resolve_thread_count(cfg.whisper.n_threads),
        .chunking_enabled = cfg.chunking.enabled,
        .chunk = {
            .duration_s = cfg.chunking.duration_s,
            .overlap_s = cfg.chunking.overlap_s,
            .min_chunk_s = cfg.chunking.min_chunk_s,
            .max_chunks = cfg.chunking.max_chunks,
        },
        .merge_window_words = cfg.chunking.merge_window_words,
        .thresholds = {
            .silence = cfg.audio.silence_threshold,
            .noise = cfg.audio.noise_threshold,
        },
    };

    auto toolkit = std::make_unique<FfmpegToolkit>(FfmpegOptions{
        .ffmpeg = cfg.audio.ffmpeg,
        .ffprobe = cfg.audio.ffprobe,
        .probe_timeout_s = cfg.audio.probe_timeout_s,
        .decode_timeout_s = cfg.audio.decode_timeout_s,
    });

    auto adapter = std::make_unique<WhisperAdapter>(
        std::move(*library), std::move(toolkit), *model,
        model->model_path(artifacts).string(), std::move(opts));

    if (auto opened = adapter->open(); !opened) {
        return std::unexpected(std::move(opened.error()));
    }

    logging::info("Whisper {} model ready ({} threads, ~{} MB)",
                  adapter->model().model_size, adapter->options().n_threads,
                  adapter->model().expected_ram_mb);
    return adapter;
}

WhisperAdapter::WhisperAdapter(std::unique_ptr<EngineBinding> engine,
                               std::unique_ptr<AudioToolkit> toolkit, ModelConfig model,
                               std::string model_path, AdapterOptions opts)
    : engine_(std::move(engine)),
      toolkit_(std::move(toolkit)),
      model_(std::move(model)),
      opts_(std::move(opts)),
      guard_(*engine_, std::move(model_path)) {}

std::expected<void, Error> WhisperAdapter::open() {
    return guard_.open();
}

bool WhisperAdapter::ready() const {
    return guard_.healthy();
}

std::expected<double, Error> WhisperAdapter::probe_duration(const fs::path& audio_path) {
    return toolkit_->probe_duration(audio_path);
}

std::expected<std::string, Error>
WhisperAdapter::transcribe(const fs::path& audio_path, const std::string& language) {
    std::error_code ec;
    if (!fs::exists(audio_path, ec)) {
        return std::unexpected(Error{ErrorKind::AudioFileNotFound,
            "Audio file not found: " + audio_path.string()});
    }

    const std::string& lang = language.empty() ? opts_.language : language;

    // Unknown duration is treated as short audio.
    double duration = 0.0;
    if (auto probed = toolkit_->probe_duration(audio_path)) {
        duration = *probed;
        logging::info("Audio duration: {:.2f}s", duration);
    } else {
        logging::warn("Could not detect audio duration: {}. Using direct transcription.",
                      probed.error().message);
    }

    if (opts_.chunking_enabled && duration > opts_.chunk.duration_s) {
        logging::info("Using chunked transcription (duration > {}s)", opts_.chunk.duration_s);
        return transcribe_chunked(audio_path, lang, duration);
    }

    logging::info("Using direct transcription");
    return transcribe_direct(audio_path, lang);
}

std::expected<std::string, Error>
WhisperAdapter::transcribe_direct(const fs::path& audio_path, const std::string& language) {
    return toolkit_->decode(audio_path).and_then([&](AudioBuffer audio) {
        return transcribe_samples(std::move(audio), language);
    });
}

std::expected<std::string, Error>
WhisperAdapter::transcribe_samples(AudioBuffer audio, const std::string& language) {
    auto check = preflight::validate(audio.samples, opts_.thresholds);
    if (!check.valid) {
        logging::warn("Audio validation failed: {}", check.reason);
        return std::string{};
    }
    preflight::normalize(audio.samples);

    InferenceOptions inference{.language = language, .n_threads = opts_.n_threads};
    auto result = guard_.with_context([&](whisper_context* ctx) {
        return engine_->run_inference(ctx, inference, audio.samples);
    });
    if (!result) return std::unexpected(std::move(result.error()));

    return std::move(result->text);
}

std::expected<std::string, Error>
WhisperAdapter::transcribe_chunked(const fs::path& audio_path, const std::string& language,
                                   double duration_s) {
    logging::info("Starting chunked transcription: duration={:.2f}s, chunk_size={}s, overlap={}s",
                  duration_s, opts_.chunk.duration_s, opts_.chunk.overlap_s);

    auto plan = plan_chunks(duration_s, opts_.chunk);
    if (!plan) {
        return std::unexpected(Error{plan.error().kind,
            "Chunked transcription failed: " + plan.error().message});
    }
    logging::info("Calculated {} chunk boundaries", plan->size());

    auto dir = audio_path.parent_path();
    auto stem = audio_path.stem().string();
    size_t total = plan->size();

    std::vector<WindowText> windows;
    windows.reserve(total);
    size_t failed = 0;

    for (size_t i = 0; i < total; ++i) {
        const Chunk& c = (*plan)[i];
        ScopedFile chunk_file(dir / std::format("{}_chunk_{}.wav", stem, i));
        logging::info("Creating chunk {}/{}: {:.2f}s - {:.2f}s", i + 1, total, c.start_s, c.end_s);

        // The window file is already engine-format PCM; read it without a second ffmpeg pass.
        auto text = toolkit_->extract_window(audio_path, c.start_s, c.length_s(), chunk_file.path())
            .and_then([&] { return toolkit_->load_pcm(chunk_file.path()); })
            .and_then([&](AudioBuffer audio) { return transcribe_samples(std::move(audio), language); });

        if (text) {
            if (text->empty()) {
                logging::warn("Chunk {}/{} returned empty text", i + 1, total);
            } else {
                logging::info("Chunk {}/{} result: {} chars", i + 1, total, text->size());
            }
            windows.emplace_back(std::move(*text));
        } else {
            ++failed;
            logging::error("Failed to process chunk {}/{} ({}): {}", i + 1, total,
                           error_kind_name(text.error().kind), text.error().message);
            windows.emplace_back(std::unexpect, std::move(text.error().message));
        }
    }

    logging::info("Chunked transcription summary: total={}, successful={}, failed={}",
                  total, total - failed, failed);

    auto merged = merge_chunk_texts(render_window_texts(windows), opts_.merge_window_words);
    if (merged.empty() && total > 0) {
        logging::warn("All chunks were empty or inaudible");
    }
    logging::info("Chunked transcription complete: {} chunks, {} chars", total, merged.size());
    return merged;
}
