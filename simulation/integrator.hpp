/**
 * @file integrator.hpp
 * @brief Per-pixel sampling integrator and the flattened kernel inputs it produces.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "geometry.hpp"
#include "pixel_kernel.cuh"
#include "structure_factors.hpp"

/// Rectangular region of detector pixels, row-major with fast varying fastest
struct PixelGrid {
    size_t fast_begin = 0;
    size_t slow_begin = 0;
    size_t width = 0;
    size_t height = 0;

    auto size() const -> size_t {
        return width * height;
    }
    static auto full(const DetectorGeometry &detector) -> PixelGrid {
        return {0, 0, detector.width(), detector.height()};
    }
};

enum class Precision { SINGLE, DOUBLE };

/// What to do when a sample hits a near-zero geometry term or a non-finite value
enum class NumericalPolicy {
    CLAMP,   ///< Clamp or drop the sample, count it, and continue
    STRICT,  ///< Fail the run with NumericalInstabilityError
};

struct SamplingParameters {
    int oversample = 1;  ///< Sub-pixel steps per axis, 0 selects automatically
    bool point_pixel = false;  ///< Use 1/r² instead of the pixel solid angle
    InterpolationMode interpolation = InterpolationMode::NEAREST;
    std::optional<PixelGrid> roi;  ///< Only these pixels are computed
    double spot_scale = 1.0;
    double min_airpath = 1e-3;  ///< mm; closer sub-pixels are clamped
};

/**
 * @brief Flattened, precision-specific copy of every input the kernel reads.
 *
 * The vectors own host memory. params() points into them; the
 * accelerator copies the vectors to the device and builds its own
 * parameter block with params_with().
 */
template <typename Real>
struct PackedInputs {
    std::vector<SourceSample<Real>> sources;
    std::vector<fastvec::Matrix3<Real>> domains;
    std::vector<Amplitude<Real>> structure_factors;
    PixelKernelParams<Real> base;  ///< Scalar fields; pointers unset

    auto params_with(const SourceSample<Real> *source_ptr,
                     const fastvec::Matrix3<Real> *domain_ptr,
                     const Amplitude<Real> *sf_ptr) const -> PixelKernelParams<Real> {
        PixelKernelParams<Real> p = base;
        p.sources = source_ptr;
        p.domain_matrices = domain_ptr;
        p.structure_factors.data = sf_ptr;
        return p;
    }
    auto params() const -> PixelKernelParams<Real> {
        return params_with(sources.data(), domains.data(), structure_factors.data());
    }
};

/**
 * @brief Evaluates the intensity of single pixels.
 *
 * Binds the geometry, structure factors and sampling settings of one
 * simulation. Construction resolves the oversample rate, generates the
 * mosaic domains and checks the region of interest, so it raises
 * InvalidGeometryError before any pixel is integrated.
 */
class SamplingIntegrator {
  public:
    SamplingIntegrator(const GeometryModel &geometry,
                       const StructureFactorTable &structure_factors,
                       const SamplingParameters &sampling);

    /// Double precision evaluation of one pixel
    auto integrate_pixel(size_t fast, size_t slow) const -> PixelSum<double>;

    template <typename Real>
    auto pack() const -> PackedInputs<Real>;

    auto geometry() const -> const GeometryModel & {
        return _geometry;
    }
    auto structure_factors() const -> const StructureFactorTable & {
        return _structure_factors;
    }
    auto sampling() const -> const SamplingParameters & {
        return _sampling;
    }
    auto grid() const -> const PixelGrid & {
        return _grid;
    }
    auto oversample() const -> int {
        return _oversample;
    }
    auto layer_count() const -> size_t {
        return static_cast<size_t>(_geometry.detector().layers());
    }
    auto domain_count() const -> size_t {
        return _hkl_matrices.size();
    }
    auto source_count() const -> size_t {
        return _geometry.beam().sources().size();
    }
    /// oversample² × sensor layers × domains × sources
    auto samples_per_pixel() const -> size_t {
        return static_cast<size_t>(_oversample) * _oversample * layer_count() * domain_count()
               * source_count();
    }

  private:
    const GeometryModel &_geometry;
    const StructureFactorTable &_structure_factors;
    SamplingParameters _sampling;
    PixelGrid _grid;
    int _oversample;
    std::vector<Matrix3d> _hkl_matrices;
    PackedInputs<double> _packed;
};

/// Convenience wrapper: the intensity of one pixel for the given inputs
auto integrate_pixel(const GeometryModel &geometry,
                     const StructureFactorTable &structure_factors,
                     const SamplingParameters &sampling,
                     size_t fast,
                     size_t slow) -> double;
