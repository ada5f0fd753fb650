#include "FrequencyBanding.h"
#include <algorithm>
#include <cmath>

bool BandSet::matches(int length, int count, float rate, float maxFreq) const {
    return bufferLength == length && bandCount == count
        && sampleRate == rate && maxFrequency == maxFreq;
}

namespace FrequencyBanding {

//--------------------------------------------------------------
int maxBinIndex(int bufferLength, float sampleRate, float maxFrequency) {
    if (bufferLength <= 0 || sampleRate <= 0.0f || maxFrequency <= 0.0f) {
        return 0;
    }
    double nyquist = static_cast<double>(sampleRate) / 2.0;
    return static_cast<int>(std::floor(maxFrequency / nyquist * bufferLength));
}

//--------------------------------------------------------------
BandSet computeBands(int bufferLength, int bandCount, float sampleRate, float maxFrequency) {
    BandSet set;
    set.bufferLength = bufferLength;
    set.bandCount = bandCount;
    set.sampleRate = sampleRate;
    set.maxFrequency = maxFrequency;

    if (bufferLength <= 0 || bandCount <= 0 || sampleRate <= 0.0f || maxFrequency <= 0.0f) {
        return set;
    }

    const double nyquist = static_cast<double>(sampleRate) / 2.0;
    const int maxBin = maxBinIndex(bufferLength, sampleRate, maxFrequency);
    const double logMin = std::log(static_cast<double>(MIN_FREQUENCY));
    const double logMax = std::log(static_cast<double>(maxFrequency));

    auto edgeToBin = [&](int edge) {
        double freq = std::exp(logMin + (logMax - logMin) * edge / bandCount);
        int bin = static_cast<int>(std::floor(freq / nyquist * bufferLength));
        return std::max(0, std::min(bin, maxBin));
    };

    set.bands.reserve(bandCount);
    int startBin = edgeToBin(0);
    for (int i = 0; i < bandCount; i++) {
        int endBin = edgeToBin(i + 1);
        Band band;
        band.startBin = startBin;
        // start == end still covers that single bin
        band.endBin = std::max(startBin, endBin);
        set.bands.push_back(band);
        startBin = endBin;
    }
    return set;
}

//--------------------------------------------------------------
float bandAverage(const std::vector<float>& frequencyData, const Band& band) {
    if (frequencyData.empty() || band.endBin < band.startBin) {
        return 0.0f;
    }
    int last = static_cast<int>(frequencyData.size()) - 1;
    int start = std::max(0, band.startBin);
    int end = std::min(band.endBin, last);
    if (start > end) {
        return 0.0f;
    }

    float sum = 0.0f;
    for (int bin = start; bin <= end; bin++) {
        sum += frequencyData[bin];
    }
    return sum / static_cast<float>(end - start + 1);
}

//--------------------------------------------------------------
void updateBands(const std::vector<float>& frequencyData,
                 const BandSet& bandSet,
                 std::vector<float>& smoothedValues,
                 float smoothingFactor) {
    if (smoothedValues.size() != bandSet.bands.size()) {
        smoothedValues.assign(bandSet.bands.size(), 0.0f);
    }

    float factor = std::max(0.0f, std::min(smoothingFactor, 0.999f));
    for (size_t i = 0; i < bandSet.bands.size(); i++) {
        float average = bandAverage(frequencyData, bandSet.bands[i]);
        smoothedValues[i] = factor * smoothedValues[i] + (1.0f - factor) * average;
    }
}

} // namespace FrequencyBanding
