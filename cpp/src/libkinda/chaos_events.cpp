#include "libkinda/chaos_events.hpp"

#include "libkinda/errors.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace libkinda {

ErrorMode parse_error_mode(const std::string& name) {
    if (name == "strict") {
        return ErrorMode::Strict;
    }
    if (name == "warning") {
        return ErrorMode::Warning;
    }
    if (name == "silent") {
        return ErrorMode::Silent;
    }
    throw InvalidConfiguration("unknown error mode: " + name);
}

std::string to_string(ErrorMode mode) {
    switch (mode) {
        case ErrorMode::Strict: return "strict";
        case ErrorMode::Warning: return "warning";
        case ErrorMode::Silent: return "silent";
    }
    return "unknown";
}

std::string to_string(ChaosEventKind kind) {
    switch (kind) {
        case ChaosEventKind::ConversionFailure: return "conversion failure";
        case ChaosEventKind::CompositionFailure: return "composition failure";
        case ChaosEventKind::LoopCapExceeded: return "loop cap exceeded";
        case ChaosEventKind::LoopTimeout: return "loop timeout";
        case ChaosEventKind::ConfidenceFallback: return "confidence fallback";
        case ChaosEventKind::WelpFallback: return "welp fallback";
    }
    return "unknown";
}

ChaosEventLog::ChaosEventLog(ErrorMode mode)
    : ChaosEventLog(mode, std::cerr) {}

ChaosEventLog::ChaosEventLog(ErrorMode mode, std::ostream& stream)
    : mode_(mode), stream_(&stream) {}

void ChaosEventLog::record(ChaosEventKind kind,
                           const std::string& construct,
                           const std::string& detail,
                           double cascade_strength) {
    history_.push_back(ChaosEvent{kind, construct, detail});
    if (history_.size() > kHistoryLimit) {
        history_.pop_front();
    }
    ++by_kind_[kind];
    ++by_construct_[construct];
    ++total_;
    instability_ = std::clamp(instability_ + 0.1 * cascade_strength, 0.0, 1.0);

    std::string line = construct + " " + to_string(kind) + ": " + detail;
    if (mode_ == ErrorMode::Warning) {
        (*stream_) << "[!] " << line << std::endl;
    } else if (mode_ == ErrorMode::Strict) {
        throw std::runtime_error(line);
    }
}

void ChaosEventLog::record_success() noexcept {
    instability_ *= 0.95;
}

void ChaosEventLog::record_failure(double cascade_strength) noexcept {
    instability_ = std::clamp(instability_ + 0.1 * cascade_strength, 0.0, 1.0);
}

std::size_t ChaosEventLog::count(ChaosEventKind kind) const {
    auto it = by_kind_.find(kind);
    return it == by_kind_.end() ? 0 : it->second;
}

std::size_t ChaosEventLog::count_for(const std::string& construct) const {
    auto it = by_construct_.find(construct);
    return it == by_construct_.end() ? 0 : it->second;
}

std::string ChaosEventLog::summary() const {
    std::ostringstream out;
    out << "chaos events: " << total_ << " (instability " << instability_ << ")";
    for (const auto& [construct, n] : by_construct_) {
        out << "\n  " << construct << ": " << n;
    }
    return out.str();
}

void ChaosEventLog::clear() noexcept {
    history_.clear();
    by_kind_.clear();
    by_construct_.clear();
    total_ = 0;
    instability_ = 0.0;
}

}  // namespace libkinda
