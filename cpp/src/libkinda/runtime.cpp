#include "libkinda/runtime.hpp"

#include <iostream>
#include <utility>

namespace libkinda {

namespace {

[[nodiscard]] std::string failure_detail(const CompositionFailure& failure) {
    return failure.detail.empty() ? std::string("no detail") : failure.detail;
}

}  // namespace

Runtime::Runtime()
    : Runtime(RuntimeOptions{}) {}

Runtime::Runtime(RuntimeOptions options)
    : options_(std::move(options)),
      events_(options_.error_mode) {
    validate_loop_options(options_.loops);
    if (options_.seed) {
        random_.reseed(*options_.seed);
    }
}

void Runtime::set_context(Mood mood, int chaos_level) {
    personality_.set_context(mood, chaos_level);
    if (options_.verbose) {
        std::cout << "personality: " << to_string(mood) << " (chaos " << chaos_level << ")" << std::endl;
    }
}

void Runtime::set_context(const std::string& mood, int chaos_level) {
    set_context(parse_mood(mood), chaos_level);
}

void Runtime::reseed(std::uint64_t seed) {
    random_.reseed(seed);
    options_.seed = seed;
}

void Runtime::set_loop_options(LoopOptions options) {
    validate_loop_options(options);
    options_.loops = options;
}

void Runtime::report_failure(const std::string& construct, const CompositionFailure& failure) {
    ChaosEventKind kind = failure.reason == FailureReason::ConversionFailure
                              ? ChaosEventKind::ConversionFailure
                              : ChaosEventKind::CompositionFailure;
    if (options_.verbose) {
        std::cout << construct << ": falling back to direct implementation (" << failure_detail(failure) << ")"
                  << std::endl;
    }
    record_event(kind, construct, failure_detail(failure));
}

void Runtime::record_event(ChaosEventKind kind, const std::string& construct, const std::string& detail) {
    events_.record(kind, construct, detail, personality_.cascade_strength());
}

Runtime& default_runtime() {
    static Runtime runtime;
    return runtime;
}

}  // namespace libkinda
