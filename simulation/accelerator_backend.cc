/**
 * @file accelerator_backend.cc
 * @brief CUDA backend. Without BRAGGSIM_HAVE_CUDA it can only report that it is unavailable.
 */
#include <fmt/core.h>

#include <chrono>

#include "backend.hpp"
#include "braggsim_logger.hpp"
#include "errors.hpp"

#ifdef BRAGGSIM_HAVE_CUDA
#include <cuda_runtime.h>

#include "cuda_common.hpp"
#include "kernels/pixel_integration.cuh"

namespace {
constexpr unsigned int BLOCK_SIZE_FAST = 16;
constexpr unsigned int BLOCK_SIZE_SLOW = 8;
}  // namespace

AcceleratorBackend::AcceleratorBackend(const BackendConfig &config)
    : ExecutionBackend(config) {
    int count = 0;
    cudaError_t err = cudaGetDeviceCount(&count);
    if (err != cudaSuccess) {
        throw BackendUnavailable(
          fmt::format("CUDA runtime could not be initialised: {}", cuda_error_string(err)));
    }
    if (count == 0) {
        throw BackendUnavailable("No CUDA devices are available");
    }
    if (_config.device_id < 0 || _config.device_id >= count) {
        throw BackendUnavailable(fmt::format(
          "CUDA device {} requested but only {} device(s) found", _config.device_id, count));
    }
    err = cudaSetDevice(_config.device_id);
    if (err != cudaSuccess) {
        throw BackendUnavailable(fmt::format(
          "Could not select CUDA device {}: {}", _config.device_id, cuda_error_string(err)));
    }
    cudaDeviceProp prop;
    err = cudaGetDeviceProperties(&prop, _config.device_id);
    if (err != cudaSuccess) {
        throw BackendUnavailable(fmt::format("Could not get properties of CUDA device {}: {}",
                                             _config.device_id,
                                             cuda_error_string(err)));
    }
    _device_name = fmt::format("{} (CUDA {}.{})", prop.name, prop.major, prop.minor);
    logger.info("Accelerator backend using device {}: {}", _config.device_id, _device_name);
}

auto AcceleratorBackend::name() const -> std::string {
    return fmt::format("accelerator [{}]", _device_name);
}

auto AcceleratorBackend::run(const SamplingIntegrator &integrator, const PixelGrid &grid)
  -> BackendResult {
    CUDA_CHECK(cudaSetDevice(_config.device_id));
    if (_config.precision == Precision::SINGLE) {
        return run_typed<float>(integrator, grid);
    }
    return run_typed<double>(integrator, grid);
}

template <typename Real>
auto AcceleratorBackend::run_typed(const SamplingIntegrator &integrator,
                                   const PixelGrid &grid) -> BackendResult {
    auto start = std::chrono::high_resolution_clock::now();
    const PackedInputs<Real> packed = integrator.pack<Real>();
    const size_t n_pixels = grid.size();

    CudaStream stream;
    CudaEvent pre_upload, post_upload, post_kernel;

#pragma region Upload
    pre_upload.record(stream);
    auto dev_sources = make_cuda_copy(packed.sources, stream);
    auto dev_domains = make_cuda_copy(packed.domains, stream);
    auto dev_structure_factors = make_cuda_copy(packed.structure_factors, stream);
    auto dev_intensities = make_cuda_malloc<Real[]>(n_pixels);
    auto dev_samples = make_cuda_malloc<uint32_t[]>(n_pixels);
    auto dev_clamped = make_cuda_malloc<uint32_t[]>(n_pixels);
    post_upload.record(stream);
#pragma endregion Upload

#pragma region Kernel
    PixelKernelParams<Real> params = packed.params_with(
      dev_sources.get(), dev_domains.get(), dev_structure_factors.get());
    KernelPixelGrid kernel_grid{static_cast<int>(grid.fast_begin),
                                static_cast<int>(grid.slow_begin),
                                static_cast<int>(grid.width),
                                static_cast<int>(grid.height)};
    dim3 threads(BLOCK_SIZE_FAST, BLOCK_SIZE_SLOW);
    dim3 blocks((grid.width + threads.x - 1) / threads.x,
                (grid.height + threads.y - 1) / threads.y);
    call_integrate_pixels(blocks,
                          threads,
                          0,
                          stream,
                          params,
                          kernel_grid,
                          dev_intensities.get(),
                          dev_samples.get(),
                          dev_clamped.get());
    cuda_throw_error();
    post_kernel.record(stream);
#pragma endregion Kernel

#pragma region Download
    std::vector<Real> intensities(n_pixels);
    std::vector<uint32_t> samples(n_pixels);
    std::vector<uint32_t> clamped(n_pixels);
    CUDA_CHECK(cudaMemcpyAsync(intensities.data(),
                               dev_intensities.get(),
                               n_pixels * sizeof(Real),
                               cudaMemcpyDeviceToHost,
                               stream));
    CUDA_CHECK(cudaMemcpyAsync(samples.data(),
                               dev_samples.get(),
                               n_pixels * sizeof(uint32_t),
                               cudaMemcpyDeviceToHost,
                               stream));
    CUDA_CHECK(cudaMemcpyAsync(clamped.data(),
                               dev_clamped.get(),
                               n_pixels * sizeof(uint32_t),
                               cudaMemcpyDeviceToHost,
                               stream));
    CUDA_CHECK(cudaStreamSynchronize(stream));
#pragma endregion Download

    BackendResult result;
    result.intensities.reserve(n_pixels);
    for (size_t i = 0; i < n_pixels; ++i) {
        if (_config.policy == NumericalPolicy::STRICT && clamped[i] > 0) {
            throw_numerical_instability(
              grid.fast_begin + i % grid.width, grid.slow_begin + i / grid.width, clamped[i]);
        }
        result.intensities.push_back(intensities[i]);
        result.samples += samples[i];
        result.clamped_samples += clamped[i];
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    logger.debug("Accelerator backend: upload {:.2f} ms, kernel {:.2f} ms, total {:.2f} ms",
                 post_upload.elapsed_time(pre_upload),
                 post_kernel.elapsed_time(post_upload),
                 result.elapsed_ms);
    return result;
}

#else

AcceleratorBackend::AcceleratorBackend(const BackendConfig &config)
    : ExecutionBackend(config) {
    throw BackendUnavailable("braggsim was built without CUDA support");
}

auto AcceleratorBackend::name() const -> std::string {
    return "accelerator [unavailable]";
}

auto AcceleratorBackend::run(const SamplingIntegrator &, const PixelGrid &) -> BackendResult {
    throw BackendUnavailable("braggsim was built without CUDA support");
}

#endif
