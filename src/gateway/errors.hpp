#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    LibraryLoad,
    ModelInit,
    ContextRecovery,
    AudioFileNotFound,
    Transcription,
    DurationProbe,
    TooManyChunks,
    InvalidConfig,
    Download,
    FileTooLarge,
    Timeout,
    Storage,
    InvalidRequest,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LibraryLoad: return "library_load";
        case ErrorKind::ModelInit: return "model_init";
        case ErrorKind::ContextRecovery: return "context_recovery";
        case ErrorKind::AudioFileNotFound: return "audio_file_not_found";
        case ErrorKind::Transcription: return "transcription";
        case ErrorKind::DurationProbe: return "duration_probe";
        case ErrorKind::TooManyChunks: return "too_many_chunks";
        case ErrorKind::InvalidConfig: return "invalid_config";
        case ErrorKind::Download: return "download";
        case ErrorKind::FileTooLarge: return "file_too_large";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::InvalidRequest: return "invalid_request";
    }
    return "unknown";
}
