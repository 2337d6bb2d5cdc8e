#include "backend.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "errors.hpp"

auto make_backend(const BackendConfig &config) -> std::unique_ptr<ExecutionBackend> {
    switch (config.kind) {
    case BackendKind::REFERENCE:
        return std::make_unique<ReferenceBackend>(config);
    case BackendKind::ACCELERATOR:
        return std::make_unique<AcceleratorBackend>(config);
    }
    throw std::invalid_argument("Unknown backend kind");
}

auto to_string(BackendKind kind) -> std::string {
    return kind == BackendKind::REFERENCE ? "reference" : "accelerator";
}

auto to_string(Precision precision) -> std::string {
    return precision == Precision::DOUBLE ? "double" : "float";
}

auto to_string(NumericalPolicy policy) -> std::string {
    return policy == NumericalPolicy::CLAMP ? "clamp" : "strict";
}

void throw_numerical_instability(size_t fast, size_t slow, uint32_t clamped) {
    throw NumericalInstabilityError(
      fmt::format("Pixel ({}, {}): {} sample(s) hit a near-zero sample-to-pixel distance "
                  "or a non-finite contribution",
                  fast,
                  slow,
                  clamped));
}
