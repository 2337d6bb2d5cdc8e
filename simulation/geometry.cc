/**
 * @file geometry.cc
 * @brief Validation and derived quantities for the geometry models.
 */
#include "geometry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <random>
#include <utility>

#include "braggsim_logger.hpp"
#include "errors.hpp"

namespace {
constexpr double AXIS_ORTHOGONALITY_TOLERANCE = 1e-6;
// Anything closer than this is treated as a zero sample-to-detector distance
constexpr double MIN_DETECTOR_DISTANCE = 1e-12;

bool is_finite(const Vector3d &v) {
    return v.allFinite();
}

auto unit_axis(const Vector3d &axis, const char *name) -> Vector3d {
    if (!is_finite(axis) || axis.norm() == 0.0) {
        throw InvalidGeometryError(fmt::format("Detector {} axis is zero or not finite", name));
    }
    return axis.normalized();
}
}  // namespace

#pragma region Detector
DetectorGeometry::DetectorGeometry(Vector3d origin,
                                   Vector3d fast_axis,
                                   Vector3d slow_axis,
                                   std::array<double, 2> pixel_size,
                                   std::array<size_t, 2> image_size,
                                   SensorParameters sensor)
    : _origin(origin),
      _fast_axis(unit_axis(fast_axis, "fast")),
      _slow_axis(unit_axis(slow_axis, "slow")),
      _pixel_size(pixel_size),
      _image_size(image_size),
      _sensor(sensor) {
    if (!is_finite(_origin)) {
        throw InvalidGeometryError("Detector origin is not finite");
    }
    if (std::abs(_fast_axis.dot(_slow_axis)) > AXIS_ORTHOGONALITY_TOLERANCE) {
        throw InvalidGeometryError(
          fmt::format("Detector fast and slow axes are not orthogonal (cos = {:.3g})",
                      _fast_axis.dot(_slow_axis)));
    }
    if (!(_pixel_size[0] > 0.0) || !(_pixel_size[1] > 0.0)) {
        throw InvalidGeometryError(fmt::format(
          "Pixel size must be positive, got {} x {} mm", _pixel_size[0], _pixel_size[1]));
    }
    if (_image_size[0] == 0 || _image_size[1] == 0) {
        throw InvalidGeometryError(fmt::format(
          "Detector has no pixels ({} x {})", _image_size[0], _image_size[1]));
    }
    _normal = _fast_axis.cross(_slow_axis).normalized();
    _distance = std::abs(_origin.dot(_normal));
    if (_distance < MIN_DETECTOR_DISTANCE) {
        throw InvalidGeometryError("Detector distance is zero: the detector plane "
                                   "passes through the sample");
    }
    if (!(_sensor.thickness_mm >= 0.0) || !std::isfinite(_sensor.thickness_mm)) {
        throw InvalidGeometryError(fmt::format(
          "Sensor thickness must be non-negative, got {} mm", _sensor.thickness_mm));
    }
    if (_sensor.thicksteps < 1) {
        throw InvalidGeometryError(fmt::format(
          "Sensor thickness steps must be at least one, got {}", _sensor.thicksteps));
    }
    if (!(_sensor.attenuation_length_mm >= 0.0)
        || !std::isfinite(_sensor.attenuation_length_mm)) {
        throw InvalidGeometryError(
          fmt::format("Sensor attenuation length must be non-negative, got {} mm",
                      _sensor.attenuation_length_mm));
    }
}

auto DetectorGeometry::from_distance(double distance,
                                     std::array<double, 2> beam_center,
                                     std::array<double, 2> pixel_size,
                                     std::array<size_t, 2> image_size,
                                     SensorParameters sensor) -> DetectorGeometry {
    if (!(distance > 0.0)) {
        throw InvalidGeometryError(
          fmt::format("Detector distance must be positive, got {} mm", distance));
    }
    Vector3d fast{1.0, 0.0, 0.0};
    Vector3d slow{0.0, -1.0, 0.0};
    Vector3d normal = fast.cross(slow);
    Vector3d origin = distance * normal - beam_center[0] * fast - beam_center[1] * slow;
    return DetectorGeometry(origin, fast, slow, pixel_size, image_size, sensor);
}

auto DetectorGeometry::pixel_position(double fast, double slow) const -> Vector3d {
    return _origin + _fast_axis * (_pixel_size[0] * fast)
           + _slow_axis * (_pixel_size[1] * slow);
}
#pragma endregion Detector

#pragma region Beam
BeamModel::BeamModel(const BeamParameters &params)
    : _polarization_fraction(params.polarization_fraction) {
    if (!is_finite(params.direction) || params.direction.norm() == 0.0) {
        throw InvalidGeometryError("Beam direction is zero or not finite");
    }
    _direction = params.direction.normalized();

    if (!(_polarization_fraction >= 0.0 && _polarization_fraction <= 1.0)) {
        throw InvalidGeometryError(fmt::format(
          "Polarization fraction must be within [0, 1], got {}", _polarization_fraction));
    }
    // E-vector lies in the plane normal to polarization_normal, perpendicular to the beam
    Vector3d incident = -_direction;
    Vector3d e_vector = params.polarization_normal.cross(incident);
    if (!is_finite(e_vector) || e_vector.norm() < 1e-12) {
        throw InvalidGeometryError(
          "Polarization normal must not be parallel to the beam direction");
    }
    _polarization_axis = e_vector.normalized();

    std::vector<SpectrumLine> spectrum = params.spectrum;
    if (spectrum.empty()) {
        spectrum.push_back({params.wavelength, 1.0});
    }
    double total_weight = 0.0;
    for (const auto &line : spectrum) {
        if (!(line.wavelength > 0.0) || !std::isfinite(line.wavelength)) {
            throw InvalidGeometryError(
              fmt::format("Wavelength must be positive, got {} Å", line.wavelength));
        }
        if (!(line.weight >= 0.0) || !std::isfinite(line.weight)) {
            throw InvalidGeometryError(
              fmt::format("Spectrum weight must be non-negative, got {}", line.weight));
        }
        total_weight += line.weight;
    }
    if (!(total_weight > 0.0)) {
        throw InvalidGeometryError("Beam spectrum has zero total weight");
    }

    if (params.divergence_steps < 1) {
        throw InvalidGeometryError(fmt::format(
          "Divergence steps must be at least one, got {}", params.divergence_steps));
    }
    if (!(params.divergence >= 0.0)) {
        throw InvalidGeometryError(
          fmt::format("Divergence must be non-negative, got {}", params.divergence));
    }

    // Divergence grid about two axes perpendicular to the beam, trimmed to an ellipse
    std::vector<Vector3d> directions;
    int steps = params.divergence > 0.0 ? params.divergence_steps : 1;
    if (steps == 1) {
        directions.push_back(incident);
    } else {
        double range = params.divergence;
        double step = range / (steps - 1);
        Vector3d horizontal_axis = incident.cross(_polarization_axis).normalized();
        for (int h_tic = 0; h_tic < steps; ++h_tic) {
            for (int v_tic = 0; v_tic < steps; ++v_tic) {
                double hdiv = step * h_tic - range / 2.0;
                double vdiv = step * v_tic - range / 2.0;
                double test = (hdiv * hdiv - step * step / 4.0 * (1 - steps % 2)) / range
                              / range;
                test += (vdiv * vdiv - step * step / 4.0 * (1 - steps % 2)) / range / range;
                if (test * 4.0 > 1.1) continue;
                Eigen::AngleAxisd rot_h(hdiv, horizontal_axis);
                Eigen::AngleAxisd rot_v(vdiv, _polarization_axis);
                directions.push_back((rot_h * rot_v * incident).normalized());
            }
        }
    }

    for (const auto &dir : directions) {
        for (const auto &line : spectrum) {
            _sources.push_back(
              {dir, line.wavelength, line.weight / total_weight / directions.size()});
        }
    }

    if (params.flux > 0.0 && params.exposure > 0.0 && params.beam_size_mm > 0.0) {
        double beam_size_m = params.beam_size_mm / 1000.0;
        _fluence = params.flux * params.exposure / (beam_size_m * beam_size_m);
    } else {
        _fluence = params.fluence;
    }
    if (!(_fluence > 0.0) || !std::isfinite(_fluence)) {
        throw InvalidGeometryError(fmt::format("Fluence must be positive, got {}", _fluence));
    }

    logger.debug("Beam: {} divergence directions x {} spectrum lines = {} sources",
                 directions.size(),
                 spectrum.size(),
                 _sources.size());
}

auto BeamModel::min_wavelength() const -> double {
    double lambda = _sources.front().wavelength;
    for (const auto &source : _sources) {
        lambda = std::min(lambda, source.wavelength);
    }
    return lambda;
}
#pragma endregion Beam

#pragma region Crystal
auto orientation_variants(int domains,
                          double mosaicity,
                          MosaicSampling sampling,
                          uint64_t seed) -> std::vector<Matrix3d> {
    if (!(mosaicity >= 0.0) || !std::isfinite(mosaicity)) {
        throw InvalidGeometryError(
          fmt::format("Mosaicity must be non-negative, got {}", mosaicity));
    }
    Matrix3d spread = mosaicity * Matrix3d::Identity();
    return orientation_variants(domains, spread, sampling, seed);
}

auto orientation_variants(int domains,
                          const Matrix3d &spread,
                          MosaicSampling sampling,
                          uint64_t seed) -> std::vector<Matrix3d> {
    if (domains < 1) {
        throw InvalidGeometryError(
          fmt::format("Mosaic domain count must be at least one, got {}", domains));
    }
    if (!spread.allFinite() || !spread.isApprox(spread.transpose(), 1e-12)) {
        throw InvalidGeometryError("Mosaic spread matrix must be finite and symmetric");
    }
    double smallest = Eigen::SelfAdjointEigenSolver<Matrix3d>(spread, Eigen::EigenvaluesOnly)
                        .eigenvalues()
                        .minCoeff();
    if (smallest < -1e-12 * spread.norm()) {
        throw InvalidGeometryError(fmt::format(
          "Mosaic spread matrix must be positive semi-definite (eigenvalue {:.3g})", smallest));
    }

    std::vector<Matrix3d> variants;
    variants.reserve(domains);
    if (domains == 1) {
        variants.push_back(Matrix3d::Identity());
        return variants;
    }

    // Rotation vector for unit mosaicity, mapped through the spread
    auto rotation = [&spread](double unit_angle, const Vector3d &axis) -> Matrix3d {
        Vector3d v = spread * (unit_angle * axis.normalized());
        double angle = v.norm();
        if (angle == 0.0) return Matrix3d::Identity();
        return Eigen::AngleAxisd(angle, v / angle).toRotationMatrix();
    };

    if (sampling == MosaicSampling::EVEN) {
        const double golden_angle = M_PI * (3.0 - std::sqrt(5.0));
        const double golden_fraction = (std::sqrt(5.0) - 1.0) / 2.0;
        boost::math::normal_distribution<double> unit_normal(0.0, 1.0);
        for (int i = 0; i < domains; ++i) {
            double z = 1.0 - 2.0 * (i + 0.5) / domains;
            double r = std::sqrt(std::max(0.0, 1.0 - z * z));
            double phi = golden_angle * i;
            Vector3d axis{r * std::cos(phi), r * std::sin(phi), z};

            // Probabilities 0.5, 0.5+φ, 0.5+2φ ... (mod 1) decorrelate angle from axis
            double p = std::fmod(0.5 + golden_fraction * i, 1.0);
            p = std::clamp(p, 1e-12, 1.0 - 1e-12);
            variants.push_back(rotation(boost::math::quantile(unit_normal, p), axis));
        }
    } else {
        std::mt19937_64 rng(seed);
        std::normal_distribution<double> gauss(0.0, 1.0);
        for (int i = 0; i < domains; ++i) {
            Vector3d axis{gauss(rng), gauss(rng), gauss(rng)};
            if (axis.norm() == 0.0) axis = Vector3d::UnitZ();
            variants.push_back(rotation(gauss(rng), axis));
        }
    }
    return variants;
}

auto mosaic_spread_matrix(const std::vector<double> &values) -> Matrix3d {
    Matrix3d spread = Matrix3d::Zero();
    if (values.size() == 3) {
        for (int i = 0; i < 3; ++i) {
            if (!(values[i] >= 0.0)) {
                throw InvalidGeometryError(fmt::format(
                  "Anisotropic mosaicity must be non-negative, got {}", values[i]));
            }
            spread(i, i) = values[i];
        }
    } else if (values.size() == 6) {
        spread << values[0], values[3], values[4],  //
          values[3], values[1], values[5],          //
          values[4], values[5], values[2];
    } else {
        throw InvalidGeometryError(
          fmt::format("Anisotropic mosaicity needs 3 or 6 values, got {}", values.size()));
    }
    return spread;
}

CrystalModel::CrystalModel(const CrystalParameters &params) : _params(params) {
    const Matrix3d &A = _params.reciprocal_matrix;
    if (!A.allFinite()) {
        throw InvalidGeometryError("Crystal orientation matrix is not finite");
    }
    double scale = A.norm();
    double det = A.determinant();
    if (scale == 0.0 || std::abs(det) <= 1e-12 * scale * scale * scale) {
        throw InvalidGeometryError(
          fmt::format("Crystal orientation matrix is singular (det = {:.3g})", det));
    }
    _real_space = A.inverse();

    for (int i = 0; i < 3; ++i) {
        if (!(_params.ncells[i] > 0.0)) {
            throw InvalidGeometryError(fmt::format(
              "Domain size must be positive, got {} cells along axis {}", _params.ncells[i], i));
        }
    }
    if (_params.mosaic_domains < 1) {
        throw InvalidGeometryError(fmt::format(
          "Mosaic domain count must be at least one, got {}", _params.mosaic_domains));
    }
    if (!(_params.mosaicity_deg >= 0.0) || !std::isfinite(_params.mosaicity_deg)) {
        throw InvalidGeometryError(
          fmt::format("Mosaicity must be non-negative, got {}", _params.mosaicity_deg));
    }
    if (_params.anisotropic_mosaicity) {
        // Validates the tuple shape and the spread matrix
        ::orientation_variants(
          1, mosaic_spread_matrix(*_params.anisotropic_mosaicity), _params.sampling);
    }
}

auto CrystalModel::reciprocal_from_real(const Vector3d &a,
                                        const Vector3d &b,
                                        const Vector3d &c) -> Matrix3d {
    Matrix3d real;
    real.row(0) = a;
    real.row(1) = b;
    real.row(2) = c;
    double volume = real.determinant();
    if (!std::isfinite(volume) || std::abs(volume) < 1e-12) {
        throw InvalidGeometryError("Real space cell vectors are degenerate");
    }
    return real.inverse();
}

auto CrystalModel::orientation_variants() const -> std::vector<Matrix3d> {
    if (_params.anisotropic_mosaicity) {
        Matrix3d spread =
          mosaic_spread_matrix(*_params.anisotropic_mosaicity) * (M_PI / 180.0);
        return ::orientation_variants(
          _params.mosaic_domains, spread, _params.sampling, _params.seed);
    }
    return ::orientation_variants(_params.mosaic_domains,
                                  _params.mosaicity_deg * M_PI / 180.0,
                                  _params.sampling,
                                  _params.seed);
}

auto CrystalModel::hkl_matrices() const -> std::vector<Matrix3d> {
    // q = U A* h, so h = (A*)^-1 Uᵀ s
    std::vector<Matrix3d> matrices;
    for (const auto &U : orientation_variants()) {
        matrices.push_back(_real_space * U.transpose());
    }
    return matrices;
}

auto CrystalModel::max_domain_size() const -> double {
    double size = 0.0;
    for (int i = 0; i < 3; ++i) {
        size = std::max(size, _real_space.row(i).norm() * _params.ncells[i]);
    }
    return size;
}
#pragma endregion Crystal

#pragma region Geometry
GeometryModel::GeometryModel(DetectorGeometry detector, BeamModel beam, CrystalModel crystal)
    : _detector(std::move(detector)), _beam(std::move(beam)), _crystal(std::move(crystal)) {}

auto GeometryModel::pixel_to_scattering_vector(size_t fast,
                                               size_t slow,
                                               const Vector2d &sub_offset,
                                               size_t source) const -> Vector3d {
    if (fast >= _detector.width() || slow >= _detector.height()) {
        throw std::out_of_range(
          fmt::format("Pixel ({}, {}) is outside the {}x{} detector",
                      fast,
                      slow,
                      _detector.width(),
                      _detector.height()));
    }
    const auto &src = _beam.sources().at(source);
    Vector3d position =
      _detector.pixel_position(fast + sub_offset.x(), slow + sub_offset.y());
    Vector3d diffracted = position.normalized();
    return (diffracted - src.incident) / src.wavelength;
}

auto GeometryModel::recommended_oversample() const -> int {
    auto pixel_size = _detector.pixel_size();
    double pixel = std::max(pixel_size[0], pixel_size[1]);
    // Width of a reciprocal space pixel expressed as a real space length, Å
    double reciprocal_pixel_size = _beam.min_wavelength() * _detector.distance() / pixel;
    int recommended =
      static_cast<int>(std::ceil(3.0 * _crystal.max_domain_size() / reciprocal_pixel_size));
    return std::max(recommended, 1);
}
#pragma endregion Geometry
