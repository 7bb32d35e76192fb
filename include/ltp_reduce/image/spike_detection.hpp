#pragma once

#include "ltp_reduce/core/types.hpp"
#include <vector>

namespace ltp_reduce::image {

struct SpikeDetectionResult {
    Matrix2Df image;                     // input with every flagged sample set to NaN
    std::vector<int> flagged_per_pass;   // newly flagged pixels, one entry per pass
    int input_invalid = 0;               // samples already invalid on input
    int degenerate_pixels = 0;           // last pass: valid pixels without valid neighbours

    int total_flagged() const {
        int n = 0;
        for (int c : flagged_per_pass) n += c;
        return n;
    }
};

// Throws ConfigError naming the violated constraint.
void validate_detection_parameters(const DetectionParameters& params);

// Iterative local-statistics spike detection.
//
// Each pass compares every valid pixel against the mean and standard
// deviation of the other valid pixels in its window_size x window_size
// neighbourhood (clipped at the borders). A pixel is flagged when
//   value > mean + sigma * std  and  value > min_intensity.
// Flagged pixels are excluded from the statistics of later passes. All
// passes run even when one flags nothing. The input is never modified;
// unflagged pixels keep their original values.
SpikeDetectionResult detect_spikes_with_stats(const Matrix2Df& image,
                                              const DetectionParameters& params);

Matrix2Df detect_spikes(const Matrix2Df& image, const DetectionParameters& params);

} // namespace ltp_reduce::image
