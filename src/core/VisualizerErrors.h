#pragma once

#include <stdexcept>
#include <string>

/**
 * VisualizerError - failure categories of the visualization engine
 *
 * None of these is fatal to the app. Each one has a degraded outcome:
 * - ACQUISITION_UNAVAILABLE: renderers draw nothing for the frame
 * - DECODE_FAILURE: notice + synthetic envelope
 * - CACHE_WRITE_FAILURE / CACHE_READ_FAILURE: envelope stays session-only / recomputed
 * - LIFECYCLE_INIT_FAILURE: notice, playback continues without visuals
 */
enum class VisualizerError {
    ACQUISITION_UNAVAILABLE,
    DECODE_FAILURE,
    CACHE_WRITE_FAILURE,
    CACHE_READ_FAILURE,
    LIFECYCLE_INIT_FAILURE
};

inline const char* toString(VisualizerError error) {
    switch (error) {
        case VisualizerError::ACQUISITION_UNAVAILABLE: return "AcquisitionUnavailable";
        case VisualizerError::DECODE_FAILURE: return "DecodeFailure";
        case VisualizerError::CACHE_WRITE_FAILURE: return "CacheWriteFailure";
        case VisualizerError::CACHE_READ_FAILURE: return "CacheReadFailure";
        case VisualizerError::LIFECYCLE_INIT_FAILURE: return "LifecycleInitFailure";
    }
    return "Unknown";
}

// Thrown by fetch/decode collaborators; caught by WaveformAnalysisService
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};
