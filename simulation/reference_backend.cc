/**
 * @file reference_backend.cc
 * @brief CPU backend: pixel rows are split into chunks and integrated on a thread pool.
 */
#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>

#include "backend.hpp"
#include "braggsim_logger.hpp"

namespace {
// Chunks per worker; a few more than one keeps the pool busy on uneven rows
constexpr size_t CHUNKS_PER_THREAD = 4;
}  // namespace

ReferenceBackend::ReferenceBackend(const BackendConfig &config)
    : ExecutionBackend(config), _pool(config.threads) {
    logger.debug("Reference backend with {} worker threads", _pool.size());
}

auto ReferenceBackend::name() const -> std::string {
    return fmt::format("reference ({} threads)", _pool.size());
}

auto ReferenceBackend::run(const SamplingIntegrator &integrator, const PixelGrid &grid)
  -> BackendResult {
    if (_config.precision == Precision::SINGLE) {
        return run_typed<float>(integrator, grid);
    }
    return run_typed<double>(integrator, grid);
}

template <typename Real>
auto ReferenceBackend::run_typed(const SamplingIntegrator &integrator,
                                 const PixelGrid &grid) -> BackendResult {
    auto start = std::chrono::high_resolution_clock::now();

    const PackedInputs<Real> packed = integrator.pack<Real>();
    const PixelKernelParams<Real> params = packed.params();
    const bool strict = _config.policy == NumericalPolicy::STRICT;

    BackendResult result;
    result.intensities.assign(grid.size(), 0.0);
    std::vector<uint64_t> chunk_samples;
    std::vector<uint64_t> chunk_clamped;
    std::atomic<bool> failed{false};

    size_t rows_per_chunk =
      std::max<size_t>(1, grid.height / (_pool.size() * CHUNKS_PER_THREAD));
    size_t n_chunks = (grid.height + rows_per_chunk - 1) / rows_per_chunk;
    chunk_samples.assign(n_chunks, 0);
    chunk_clamped.assign(n_chunks, 0);

    std::vector<std::future<void>> pending;
    pending.reserve(n_chunks);
    for (size_t chunk = 0; chunk < n_chunks; ++chunk) {
        pending.push_back(_pool.enqueue([&, chunk] {
            size_t row_begin = chunk * rows_per_chunk;
            size_t row_end = std::min(grid.height, row_begin + rows_per_chunk);
            uint64_t samples = 0, clamped = 0;
            for (size_t row = row_begin; row < row_end; ++row) {
                if (failed) return;
                size_t slow = grid.slow_begin + row;
                for (size_t col = 0; col < grid.width; ++col) {
                    size_t fast = grid.fast_begin + col;
                    PixelSum<Real> sum = pixel_kernel::integrate_pixel(
                      params, static_cast<int>(fast), static_cast<int>(slow));
                    if (strict && sum.clamped > 0) {
                        failed = true;
                        throw_numerical_instability(fast, slow, sum.clamped);
                    }
                    result.intensities[row * grid.width + col] = sum.intensity;
                    samples += sum.samples;
                    clamped += sum.clamped;
                }
            }
            chunk_samples[chunk] = samples;
            chunk_clamped[chunk] = clamped;
        }));
    }
    // Every task references this frame, so all must finish before any rethrow
    for (auto &task : pending) {
        task.wait();
    }
    for (auto &task : pending) {
        task.get();
    }

    for (size_t chunk = 0; chunk < n_chunks; ++chunk) {
        result.samples += chunk_samples[chunk];
        result.clamped_samples += chunk_clamped[chunk];
    }
    auto end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    logger.debug("Reference backend: {} pixels in {} chunks, {:.2f} ms",
                 grid.size(),
                 n_chunks,
                 result.elapsed_ms);
    return result;
}
