#include "admission_gate.hpp"
#include <algorithm>
#include <stdexcept>

AdmissionGate::AdmissionGate(int permits)
    : capacity_(permits) {
    if (permits < 1) {
        throw std::invalid_argument("Admission gate needs at least one permit");
    }
}

AdmissionGate::Permit AdmissionGate::acquire(const CancelToken& cancel) {
    CancelToken::Subscription wake(cancel, [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() { return in_use_ < capacity_ || cancel.is_cancelled(); });

    if (cancel.is_cancelled()) {
        return Permit();
    }

    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return Permit(this);
}

int AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

int AdmissionGate::peak_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_use_;
}

void AdmissionGate::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
    }
    cv_.notify_one();
}

AdmissionGate::Permit::~Permit() {
    release();
}

AdmissionGate::Permit::Permit(Permit&& other) noexcept
    : gate_(other.gate_) {
    other.gate_ = nullptr;
}

AdmissionGate::Permit& AdmissionGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void AdmissionGate::Permit::release() {
    if (gate_) {
        gate_->release_one();
        gate_ = nullptr;
    }
}
