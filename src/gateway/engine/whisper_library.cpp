#include "engine/whisper_library.hpp"

#include "engine/params_layout.hpp"
#include "logging.hpp"

#include <whisper.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <dlfcn.h>
#include <mutex>
#include <string_view>

namespace fs = std::filesystem;

struct WhisperLibrary::Api {
    void* handle = nullptr;

    decltype(&whisper_context_default_params) context_default_params = nullptr;
    decltype(&whisper_init_from_file_with_params) init_from_file_with_params = nullptr;
    decltype(&whisper_free) free = nullptr;
    decltype(&whisper_full_default_params) full_default_params = nullptr;
    decltype(&whisper_full_default_params_by_ref) full_default_params_by_ref = nullptr;
    decltype(&whisper_free_params) free_params = nullptr;
    decltype(&whisper_full) full = nullptr;
    decltype(&whisper_full_n_segments) full_n_segments = nullptr;
    decltype(&whisper_full_get_segment_text) full_get_segment_text = nullptr;
    decltype(&whisper_full_get_segment_t0) full_get_segment_t0 = nullptr;
    decltype(&whisper_full_get_segment_t1) full_get_segment_t1 = nullptr;
    decltype(&whisper_log_set) log_set = nullptr;
    decltype(&whisper_print_system_info) print_system_info = nullptr;
};

namespace {

// Dependency order matters: each library resolves symbols from the previous.
constexpr std::array<std::string_view, 3> kDependencies = {
    "libggml-base.so.0",
    "libggml-cpu.so.0",
    "libggml.so.0",
};
constexpr std::string_view kWhisperLibrary = "libwhisper.so";

std::mutex g_search_path_mutex;

// LD_LIBRARY_PATH is process-wide; prepend the directory at most once.
void prepend_search_path(const fs::path& dir) {
    std::lock_guard lock(g_search_path_mutex);
    std::string entry = dir.string();
    const char* old = std::getenv("LD_LIBRARY_PATH");
    std::string current = old ? old : "";

    std::string_view rest = current;
    while (!rest.empty()) {
        auto pos = rest.find(':');
        if (rest.substr(0, pos) == entry) return;
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }

    std::string updated = current.empty() ? entry : entry + ":" + current;
    ::setenv("LD_LIBRARY_PATH", updated.c_str(), 1);
}

std::string dl_error() {
    const char* err = ::dlerror();
    return err ? err : "unknown dlopen error";
}

template <typename Fn>
bool resolve(void* handle, const char* name, Fn& out) {
    ::dlerror();
    void* sym = ::dlsym(handle, name);
    if (!sym) {
        logging::error("whisper: missing symbol {}: {}", name, dl_error());
        return false;
    }
    out = reinterpret_cast<Fn>(sym);
    return true;
}

void native_log(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text) return;
    std::string_view line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);
    if (line.empty()) return;

    if (level == GGML_LOG_LEVEL_ERROR) {
        logging::error("[whisper] {}", line);
    } else if (level == GGML_LOG_LEVEL_WARN) {
        logging::warn("[whisper] {}", line);
    } else {
        logging::debug("[whisper] {}", line);
    }
}

std::string trim(std::string_view s) {
    auto a = s.find_first_not_of(" \t\n\r");
    if (a == std::string_view::npos) return {};
    auto b = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(a, b - a + 1));
}

} // namespace

std::expected<std::unique_ptr<WhisperLibrary>, Error>
WhisperLibrary::load(const fs::path& library_dir) {
    auto fail = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::LibraryLoad, std::move(msg)});
    };

    std::error_code ec;
    if (!fs::is_directory(library_dir, ec)) {
        return fail("Library directory not found: " + library_dir.string() +
                    ". Run artifact download script first.");
    }

    prepend_search_path(library_dir);

    for (auto name : kDependencies) {
        auto path = library_dir / name;
        // Dependencies stay loaded for the life of the process.
        if (!::dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL)) {
            return fail("Failed to load Whisper libraries: " + dl_error());
        }
        logging::debug("whisper: loaded {}", path.string());
    }

    auto api = std::make_unique<Api>();
    auto whisper_path = library_dir / kWhisperLibrary;
    api->handle = ::dlopen(whisper_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!api->handle) {
        return fail("Failed to load Whisper libraries: " + dl_error());
    }

    void* h = api->handle;
    bool ok = resolve(h, "whisper_context_default_params", api->context_default_params) &&
              resolve(h, "whisper_init_from_file_with_params", api->init_from_file_with_params) &&
              resolve(h, "whisper_free", api->free) &&
              resolve(h, "whisper_full_default_params", api->full_default_params) &&
              resolve(h, "whisper_full_default_params_by_ref", api->full_default_params_by_ref) &&
              resolve(h, "whisper_free_params", api->free_params) &&
              resolve(h, "whisper_full", api->full) &&
              resolve(h, "whisper_full_n_segments", api->full_n_segments) &&
              resolve(h, "whisper_full_get_segment_text", api->full_get_segment_text) &&
              resolve(h, "whisper_full_get_segment_t0", api->full_get_segment_t0) &&
              resolve(h, "whisper_full_get_segment_t1", api->full_get_segment_t1) &&
              resolve(h, "whisper_log_set", api->log_set) &&
              resolve(h, "whisper_print_system_info", api->print_system_info);
    if (!ok) {
        return fail("Failed to load Whisper libraries: " + whisper_path.string() +
                    " is missing required symbols");
    }

    api->log_set(native_log, nullptr);

    // The library allocates this block with its own idea of the layout, so
    // reading it through ours exposes any header/library skew.
    whisper_full_params* defaults = api->full_default_params_by_ref(WHISPER_SAMPLING_GREEDY);
    if (!defaults) {
        return fail("whisper_full_default_params_by_ref() returned NULL");
    }
    auto layout = check_default_params(*defaults);
    api->free_params(defaults);
    if (!layout) {
        return fail(layout.error() + " (whisper.h does not match " + whisper_path.string() + ")");
    }

    logging::info("All Whisper libraries loaded successfully");
    return std::unique_ptr<WhisperLibrary>(new WhisperLibrary(std::move(api)));
}

WhisperLibrary::WhisperLibrary(std::unique_ptr<Api> api)
    : api_(std::move(api)) {}

// Library handles are never dlclose'd; the engine's backend threads and
// globals live until process exit.
WhisperLibrary::~WhisperLibrary() = default;

bool WhisperLibrary::loaded() const {
    return api_ && api_->handle && api_->full;
}

std::expected<whisper_context*, Error>
WhisperLibrary::init_context(const std::string& model_path) {
    std::error_code ec;
    if (!fs::exists(model_path, ec)) {
        return std::unexpected(Error{ErrorKind::ModelInit,
            "Model file not found: " + model_path + ". Run artifact download script first."});
    }

    whisper_context_params cparams = api_->context_default_params();
    cparams.use_gpu = false;

    whisper_context* ctx = api_->init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected(Error{ErrorKind::ModelInit,
            "whisper_init_from_file_with_params() returned NULL. "
            "Model file may be corrupted: " + model_path});
    }
    return ctx;
}

void WhisperLibrary::free_context(whisper_context* ctx) {
    if (ctx && api_ && api_->free) {
        api_->free(ctx);
    }
}

std::expected<InferenceResult, Error>
WhisperLibrary::run_inference(whisper_context* ctx, const InferenceOptions& opts,
                              std::span<const float> samples) {
    whisper_full_params params = api_->full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = opts.n_threads;
    params.language = opts.language.empty() ? nullptr : opts.language.c_str();
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.vad = false;
    params.vad_model_path = nullptr;

    logging::info("Whisper inference configured with {} threads", opts.n_threads);

    auto start = std::chrono::steady_clock::now();
    int rc = api_->full(ctx, params, samples.data(), static_cast<int>(samples.size()));
    double inference_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (rc != 0) {
        return std::unexpected(Error{ErrorKind::Transcription,
            "whisper_full returned error code: " + std::to_string(rc)});
    }

    InferenceResult result;
    result.inference_s = inference_s;

    int n_segments = api_->full_n_segments(ctx);
    if (n_segments == 0) {
        logging::warn("Whisper returned 0 segments - audio may be silent or invalid");
        return result;
    }

    for (int i = 0; i < n_segments; ++i) {
        const char* raw = api_->full_get_segment_text(ctx, i);
        Segment seg{
            .start_s = static_cast<double>(api_->full_get_segment_t0(ctx, i)) / 100.0,
            .end_s = static_cast<double>(api_->full_get_segment_t1(ctx, i)) / 100.0,
            .text = trim(raw ? raw : ""),
        };
        if (!seg.text.empty()) {
            if (!result.text.empty()) result.text += ' ';
            result.text += seg.text;
        }
        result.segments.push_back(std::move(seg));
    }

    logging::info("Transcription complete: {} chars, {} segments, {:.2f}s",
                  result.text.size(), n_segments, inference_s);
    return result;
}

std::string WhisperLibrary::system_info() const {
    const char* info = api_->print_system_info();
    return info ? info : "";
}
