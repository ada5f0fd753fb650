#include "SignalAcquisition.h"

SignalAcquisition::SignalAcquisition(AnalysisNode* node)
    : node_(node) {
}

void SignalAcquisition::setAnalysisNode(AnalysisNode* node) {
    node_ = node;
}

void SignalAcquisition::ensureSize(std::vector<float>& buffer, int size) {
    if (size < 0) {
        size = 0;
    }
    if (buffer.size() != static_cast<size_t>(size)) {
        buffer.resize(size);
        reallocations_++;
    }
}

const std::vector<float>* SignalAcquisition::pullTimeDomain() {
    if (!node_) {
        return nullptr;
    }
    ensureSize(timeDomain_, node_->getFftSize());
    if (timeDomain_.empty()) {
        return nullptr;
    }
    node_->getFloatTimeDomainData(timeDomain_);
    return &timeDomain_;
}

const std::vector<float>* SignalAcquisition::pullFrequency() {
    if (!node_) {
        return nullptr;
    }
    ensureSize(frequency_, node_->getFrequencyBinCount());
    if (frequency_.empty()) {
        return nullptr;
    }
    node_->getByteFrequencyData(frequency_);
    return &frequency_;
}

float SignalAcquisition::getSampleRate() const {
    return node_ ? node_->getSampleRate() : 0.0f;
}

int SignalAcquisition::getFrequencyBinCount() const {
    return node_ ? node_->getFrequencyBinCount() : 0;
}
