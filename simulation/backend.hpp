/**
 * @file backend.hpp
 * @brief Execution backends that evaluate the integrator over a pixel grid.
 *
 * Both backends run pixel_kernel::integrate_pixel for every pixel of the
 * grid, so they perform the same arithmetic in the same order per pixel.
 * Results can still differ in the last bits between the host and device
 * math libraries; see default_tolerance() in simulator.hpp.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "integrator.hpp"
#include "thread_pool.hpp"

enum class BackendKind { REFERENCE, ACCELERATOR };

struct BackendConfig {
    BackendKind kind = BackendKind::REFERENCE;
    Precision precision = Precision::DOUBLE;
    NumericalPolicy policy = NumericalPolicy::CLAMP;
    size_t threads = 0;  ///< Reference backend workers, 0 for all cores
    int device_id = 0;   ///< Accelerator device ordinal
};

struct BackendResult {
    std::vector<double> intensities;  ///< Unscaled, row-major over the grid
    uint64_t samples = 0;
    uint64_t clamped_samples = 0;
    double elapsed_ms = 0.0;
};

class ExecutionBackend {
  public:
    explicit ExecutionBackend(const BackendConfig &config) : _config(config) {}
    virtual ~ExecutionBackend() = default;

    /**
     * @brief Integrate every pixel of the grid.
     *
     * Either returns the complete result or throws; under
     * NumericalPolicy::STRICT a clamped sample raises
     * NumericalInstabilityError and no result is produced.
     */
    virtual auto run(const SamplingIntegrator &integrator, const PixelGrid &grid)
      -> BackendResult = 0;

    virtual auto name() const -> std::string = 0;
    virtual auto kind() const -> BackendKind = 0;

    auto config() const -> const BackendConfig & {
        return _config;
    }

  protected:
    BackendConfig _config;
};

/// Row-chunked CPU evaluation on a thread pool
class ReferenceBackend : public ExecutionBackend {
  public:
    explicit ReferenceBackend(const BackendConfig &config);

    auto run(const SamplingIntegrator &integrator, const PixelGrid &grid)
      -> BackendResult override;
    auto name() const -> std::string override;
    auto kind() const -> BackendKind override {
        return BackendKind::REFERENCE;
    }

  private:
    template <typename Real>
    auto run_typed(const SamplingIntegrator &integrator, const PixelGrid &grid)
      -> BackendResult;

    ThreadPool _pool;
};

/**
 * @brief One CUDA thread per pixel.
 *
 * The constructor selects and probes the device and throws
 * BackendUnavailable if that fails, or always when built without CUDA.
 * Inputs are uploaded at the start of each run and released at its end.
 */
class AcceleratorBackend : public ExecutionBackend {
  public:
    explicit AcceleratorBackend(const BackendConfig &config);

    auto run(const SamplingIntegrator &integrator, const PixelGrid &grid)
      -> BackendResult override;
    auto name() const -> std::string override;
    auto kind() const -> BackendKind override {
        return BackendKind::ACCELERATOR;
    }

  private:
    template <typename Real>
    auto run_typed(const SamplingIntegrator &integrator, const PixelGrid &grid)
      -> BackendResult;

    std::string _device_name;
};

auto make_backend(const BackendConfig &config) -> std::unique_ptr<ExecutionBackend>;

auto to_string(BackendKind kind) -> std::string;
auto to_string(Precision precision) -> std::string;
auto to_string(NumericalPolicy policy) -> std::string;

/// Raise NumericalInstabilityError for a pixel that needed clamping
[[noreturn]] void throw_numerical_instability(size_t fast, size_t slow, uint32_t clamped);
