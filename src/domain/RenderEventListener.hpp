/**
 * @file RenderEventListener.hpp
 * @brief Observer interface for render job lifecycle events.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include "domain/RenderTypes.hpp"

namespace sceneloom::domain {

/** @brief Identifier of a render job, unique per manager, increasing with submission order. */
using RenderJobId = std::uint64_t;

/**
 * @class RenderEventListener
 * @brief Receives lifecycle events of render jobs.
 *
 * A job raises `started`, any number of `progress`, then exactly one of
 * `finished` or `failed`, unless it was superseded by a newer submission, in
 * which case nothing after `started` is raised.
 */
class RenderEventListener {
public:
    virtual ~RenderEventListener() = default;

    virtual void onRenderStarted(RenderJobId jobId) = 0;

    /**
     * @brief Best-effort progress.
     * @param percent 0-100, or nullopt while the renderer reports nothing measurable.
     */
    virtual void onRenderProgress(RenderJobId jobId, std::optional<int> percent) {
        (void)jobId;
        (void)percent;
    }

    virtual void onRenderFinished(RenderJobId jobId, const std::filesystem::path& artifactPath) = 0;

    /**
     * @param failure Kind, reason and diagnostics. An explicit cancel arrives here
     *        with FailureKind::Cancelled.
     */
    virtual void onRenderFailed(RenderJobId jobId, const RenderFailure& failure) = 0;
};

} // namespace sceneloom::domain
