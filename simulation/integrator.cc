/**
 * @file integrator.cc
 * @brief Binding of geometry and sampling settings into kernel inputs.
 */
#include "integrator.hpp"

#include <fmt/core.h>

#include <stdexcept>

#include "braggsim_logger.hpp"
#include "errors.hpp"

namespace {
template <typename Real>
auto to_fastvec(const Vector3d &v) -> fastvec::Vector3<Real> {
    return {static_cast<Real>(v.x()), static_cast<Real>(v.y()), static_cast<Real>(v.z())};
}

template <typename Real>
auto to_fastvec(const Matrix3d &m) -> fastvec::Matrix3<Real> {
    fastvec::Matrix3<Real> out;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            out.m[row * 3 + col] = static_cast<Real>(m(row, col));
        }
    }
    return out;
}
}  // namespace

SamplingIntegrator::SamplingIntegrator(const GeometryModel &geometry,
                                       const StructureFactorTable &structure_factors,
                                       const SamplingParameters &sampling)
    : _geometry(geometry),
      _structure_factors(structure_factors),
      _sampling(sampling),
      _grid(PixelGrid::full(geometry.detector())),
      _oversample(sampling.oversample) {
    const auto &detector = _geometry.detector();
    if (_sampling.roi) {
        const auto &roi = *_sampling.roi;
        if (roi.width == 0 || roi.height == 0
            || roi.fast_begin + roi.width > detector.width()
            || roi.slow_begin + roi.height > detector.height()) {
            throw InvalidGeometryError(
              fmt::format("Region of interest {}x{} at ({}, {}) does not fit the {}x{} "
                          "detector",
                          roi.width,
                          roi.height,
                          roi.fast_begin,
                          roi.slow_begin,
                          detector.width(),
                          detector.height()));
        }
        _grid = roi;
    }

    if (_oversample < 0) {
        throw InvalidGeometryError(
          fmt::format("Oversample must be zero (automatic) or positive, got {}", _oversample));
    }
    if (_oversample == 0) {
        _oversample = _geometry.recommended_oversample();
        logger.info("Automatic oversample: {} steps per pixel axis", _oversample);
    }
    if (!(_sampling.min_airpath > 0.0)) {
        throw InvalidGeometryError(fmt::format(
          "Minimum sample-to-pixel distance must be positive, got {}", _sampling.min_airpath));
    }

    _hkl_matrices = _geometry.crystal().hkl_matrices();
    _packed = pack<double>();

    logger.debug("Integrator: {}x{} pixels, {} samples per pixel ({}² sub-pixels, {} "
                 "sensor layers, {} domains, {} sources)",
                 _grid.width,
                 _grid.height,
                 samples_per_pixel(),
                 _oversample,
                 layer_count(),
                 domain_count(),
                 source_count());
}

template <typename Real>
auto SamplingIntegrator::pack() const -> PackedInputs<Real> {
    const auto &detector = _geometry.detector();
    const auto &beam = _geometry.beam();
    const auto &crystal = _geometry.crystal().params();

    PackedInputs<Real> packed;
    for (const auto &source : beam.sources()) {
        packed.sources.push_back({to_fastvec<Real>(source.incident),
                                  static_cast<Real>(source.wavelength),
                                  static_cast<Real>(source.weight)});
    }
    for (const auto &matrix : _hkl_matrices) {
        packed.domains.push_back(to_fastvec<Real>(matrix));
    }
    packed.structure_factors = _structure_factors.grid_as<Real>();

    auto &p = packed.base;
    p.origin = to_fastvec<Real>(detector.origin());
    p.fast_axis = to_fastvec<Real>(detector.fast_axis());
    p.slow_axis = to_fastvec<Real>(detector.slow_axis());
    p.pixel_size_fast = static_cast<Real>(detector.pixel_size()[0]);
    p.pixel_size_slow = static_cast<Real>(detector.pixel_size()[1]);
    p.close_distance = static_cast<Real>(detector.distance());
    p.point_pixel = _sampling.point_pixel;
    p.oversample = _oversample;

    const auto &sensor = detector.sensor();
    p.depth_axis = to_fastvec<Real>(detector.depth_axis());
    p.thicksteps = detector.layers();
    p.thickness_step = static_cast<Real>(
      sensor.thickness_mm > 0.0 ? sensor.thickness_mm / sensor.thicksteps : 0.0);
    p.attenuation_length = static_cast<Real>(sensor.attenuation_length_mm);

    p.sources = nullptr;
    p.n_sources = static_cast<int>(packed.sources.size());
    p.kahn_factor = static_cast<Real>(beam.kahn_factor());
    p.polarization_axis = to_fastvec<Real>(beam.polarization_axis());

    p.domain_matrices = nullptr;
    p.n_domains = static_cast<int>(packed.domains.size());
    p.shape = crystal.shape;
    p.Na = static_cast<Real>(crystal.ncells[0]);
    p.Nb = static_cast<Real>(crystal.ncells[1]);
    p.Nc = static_cast<Real>(crystal.ncells[2]);

    p.structure_factors = _structure_factors.view<Real>(nullptr);
    p.interpolation = _sampling.interpolation;
    p.min_airpath = static_cast<Real>(_sampling.min_airpath);
    return packed;
}

template auto SamplingIntegrator::pack<float>() const -> PackedInputs<float>;
template auto SamplingIntegrator::pack<double>() const -> PackedInputs<double>;

auto SamplingIntegrator::integrate_pixel(size_t fast, size_t slow) const
  -> PixelSum<double> {
    const auto &detector = _geometry.detector();
    if (fast >= detector.width() || slow >= detector.height()) {
        throw std::out_of_range(fmt::format("Pixel ({}, {}) is outside the {}x{} detector",
                                            fast,
                                            slow,
                                            detector.width(),
                                            detector.height()));
    }
    return pixel_kernel::integrate_pixel(
      _packed.params(), static_cast<int>(fast), static_cast<int>(slow));
}

auto integrate_pixel(const GeometryModel &geometry,
                     const StructureFactorTable &structure_factors,
                     const SamplingParameters &sampling,
                     size_t fast,
                     size_t slow) -> double {
    SamplingIntegrator integrator(geometry, structure_factors, sampling);
    return integrator.integrate_pixel(fast, slow).intensity;
}
