#pragma once

#include <cstddef>
#include <semaphore>
#include <stdexcept>

namespace geomatch::fetch {

/// Counting gate bounding how many callers hold a permit at once.
class AdmissionGate {
   public:
    /// RAII permit; releases its slot on destruction.
    class Permit {
       public:
        explicit Permit(AdmissionGate& gate) : gate_(&gate) { gate_->slots_.acquire(); }
        ~Permit() {
            if (gate_ != nullptr) {
                gate_->slots_.release();
            }
        }
        Permit(const Permit&) = delete;
        auto operator=(const Permit&) -> Permit& = delete;
        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        auto operator=(Permit&&) -> Permit& = delete;

       private:
        AdmissionGate* gate_;
    };

    explicit AdmissionGate(std::size_t capacity)
        : capacity_(capacity), slots_(static_cast<std::ptrdiff_t>(checked(capacity))) {}

    AdmissionGate(const AdmissionGate&) = delete;
    auto operator=(const AdmissionGate&) -> AdmissionGate& = delete;

    /// Block until a slot is free.
    [[nodiscard]] auto acquire() -> Permit { return Permit(*this); }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

   private:
    static auto checked(std::size_t capacity) -> std::size_t {
        if (capacity == 0) {
            throw std::invalid_argument("AdmissionGate: capacity must be at least 1");
        }
        return capacity;
    }

    std::size_t capacity_;
    std::counting_semaphore<> slots_;
};

}  // namespace geomatch::fetch
