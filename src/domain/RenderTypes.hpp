/**
 * @file RenderTypes.hpp
 * @brief Value objects describing a render request and its outcome.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace sceneloom::domain {

/**
 * @enum QualityPreset
 * @brief Resolution / frame-rate tier understood by the renderer.
 */
enum class QualityPreset {
    Low,     ///< 480p15
    Medium,  ///< 720p30
    High,    ///< 1080p60
    Ultra    ///< 2160p60
};

inline std::string QualityToString(QualityPreset quality) {
    switch (quality) {
        case QualityPreset::Low: return "low";
        case QualityPreset::Medium: return "medium";
        case QualityPreset::High: return "high";
        case QualityPreset::Ultra: return "ultra";
    }
    return "low";
}

/** @brief Single-letter flag appended to `-q` on the renderer command line. */
inline char QualityFlag(QualityPreset quality) {
    switch (quality) {
        case QualityPreset::Low: return 'l';
        case QualityPreset::Medium: return 'm';
        case QualityPreset::High: return 'h';
        case QualityPreset::Ultra: return 'k';
    }
    return 'l';
}

/** @brief Name of the subdirectory the renderer writes videos of this tier into. */
inline std::string QualityDirectory(QualityPreset quality) {
    switch (quality) {
        case QualityPreset::Low: return "480p15";
        case QualityPreset::Medium: return "720p30";
        case QualityPreset::High: return "1080p60";
        case QualityPreset::Ultra: return "2160p60";
    }
    return "480p15";
}

/**
 * @brief Accepts both the preset names and the renderer's single-letter flags.
 */
inline std::optional<QualityPreset> QualityFromString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c){ return std::tolower(c); });
    if (str == "low" || str == "l") return QualityPreset::Low;
    if (str == "medium" || str == "m") return QualityPreset::Medium;
    if (str == "high" || str == "h") return QualityPreset::High;
    if (str == "ultra" || str == "k") return QualityPreset::Ultra;
    return std::nullopt;
}

/**
 * @enum OutputFormat
 * @brief Container the renderer is asked to produce.
 */
enum class OutputFormat {
    Mp4,
    Mov,
    Webm,
    Gif
};

/** @brief File extension without the leading dot, as passed to `--format`. */
inline std::string FormatExtension(OutputFormat format) {
    switch (format) {
        case OutputFormat::Mp4: return "mp4";
        case OutputFormat::Mov: return "mov";
        case OutputFormat::Webm: return "webm";
        case OutputFormat::Gif: return "gif";
    }
    return "mp4";
}

inline std::optional<OutputFormat> FormatFromString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c){ return std::tolower(c); });
    if (!str.empty() && str.front() == '.') str.erase(0, 1);
    if (str == "mp4") return OutputFormat::Mp4;
    if (str == "mov") return OutputFormat::Mov;
    if (str == "webm") return OutputFormat::Webm;
    if (str == "gif") return OutputFormat::Gif;
    return std::nullopt;
}

/**
 * @struct RenderConfig
 * @brief Per-request render settings.
 */
struct RenderConfig {
    QualityPreset quality = QualityPreset::Low;
    OutputFormat format = OutputFormat::Mp4;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    /// Media directory handed to the renderer. Empty means the job's own workspace tree.
    std::filesystem::path outputDir;
    bool disableCaching = true;
};

/**
 * @struct RenderRequest
 * @brief Code to render. The origin of the code (AI, editor, variable tweak) is irrelevant here.
 */
struct RenderRequest {
    std::string code;
    std::optional<std::string> entryPointName; ///< Scene class to render; detected when absent.
    RenderConfig config;
};

/**
 * @enum RenderStatus
 * @brief Terminal states of a render worker.
 */
enum class RenderStatus {
    Completed,
    Failed,
    TimedOut,
    Cancelled
};

inline std::string RenderStatusToString(RenderStatus status) {
    switch (status) {
        case RenderStatus::Completed: return "completed";
        case RenderStatus::Failed: return "failed";
        case RenderStatus::TimedOut: return "timed-out";
        case RenderStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

/**
 * @enum FailureKind
 * @brief Why a render did not produce an artifact.
 */
enum class FailureKind {
    ProcessLaunchFailure,
    NonZeroExit,
    Timeout,
    ArtifactNotFound,
    Cancelled
};

/**
 * @struct RenderFailure
 * @brief Diagnostic attached to every non-completed outcome.
 */
struct RenderFailure {
    FailureKind kind = FailureKind::NonZeroExit;
    int exitCode = 0;        ///< Meaningful for NonZeroExit only.
    std::string reason;      ///< Human readable, suitable for a status line.
    std::string stderrTail;  ///< Last lines of stderr for NonZeroExit.
};

/**
 * @struct RenderOutcome
 * @brief Terminal result of one render job.
 */
struct RenderOutcome {
    RenderStatus status = RenderStatus::Failed;
    std::optional<std::filesystem::path> artifactPath;
    std::chrono::milliseconds elapsed{0};
    std::optional<RenderFailure> failure;
    std::string stdoutText;
    std::string stderrText;

    bool success() const { return status == RenderStatus::Completed; }
};

} // namespace sceneloom::domain
