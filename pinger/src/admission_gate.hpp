
#pragma once
#include "cancel_token.hpp"
#include <condition_variable>
#include <mutex>

// Counting semaphore bounding how many probe tasks do network work at once.
class AdmissionGate {
public:
    // Scoped permit; released when destroyed or moved-from object goes away.
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return gate_ != nullptr; }
        void release();

    private:
        friend class AdmissionGate;
        explicit Permit(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(int permits);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks for a free permit. Returns an empty Permit if cancelled first.
    Permit acquire(const CancelToken& cancel);

    int capacity() const { return capacity_; }
    int in_use() const;
    int peak_in_use() const;

private:
    void release_one();

    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int in_use_ = 0;
    int peak_in_use_ = 0;
};
