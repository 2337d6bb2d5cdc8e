/**
 * @file geometry.hpp
 * @brief Detector, beam and crystal models, and the combined geometry model.
 *
 * Conventions follow the DIALS models: lengths in mm, wavelengths in Å,
 * the beam direction is the sample-to-source unit vector (the beam
 * propagates along its negative), and the crystal is described by the
 * matrix A* whose columns are the reciprocal lattice vectors, so that
 * q = A* · (h, k, l).
 *
 * All models validate on construction and raise InvalidGeometryError,
 * so a degenerate setup never reaches the integrator.
 */
#pragma once

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "pixel_kernel.cuh"

using Eigen::Matrix3d;
using Eigen::Vector2d;
using Eigen::Vector3d;

/// Photons per m² for which r_e² × fluence is one
constexpr double DEFAULT_FLUENCE = 125932015286227086360700780544.0;
/// Classical electron radius squared, m²
constexpr double R_E_SQR = 7.94079248018965e-30;

/**
 * @brief Sensor layer of the detector.
 *
 * A thick sensor is sampled in `thicksteps` layers at depths
 * t × thickness / thicksteps behind the front face. With an attenuation
 * length each layer is weighted by the fraction of photons it absorbs,
 * exp(-t δ / (μ cos ρ)) - exp(-(t + 1) δ / (μ cos ρ)) for layer depth δ,
 * attenuation length μ and ρ the angle between the ray and the sensor
 * normal; without one the layers share the pixel equally.
 */
struct SensorParameters {
    double thickness_mm = 0.0;
    int thicksteps = 1;
    double attenuation_length_mm = 0.0;  ///< 0 disables absorption
};

class DetectorGeometry {
  public:
    /**
     * @param origin Lab position of the outer corner of pixel (0, 0), mm
     * @param fast_axis Direction of increasing fast pixel index
     * @param slow_axis Direction of increasing slow pixel index
     * @param pixel_size Pixel size along (fast, slow), mm
     * @param image_size Number of pixels along (fast, slow)
     * @param sensor Sensor thickness and absorption, zero thickness by default
     */
    DetectorGeometry(Vector3d origin,
                     Vector3d fast_axis,
                     Vector3d slow_axis,
                     std::array<double, 2> pixel_size,
                     std::array<size_t, 2> image_size,
                     SensorParameters sensor = {});

    /// Detector normal to the beam with fast=(1,0,0), slow=(0,-1,0) and the
    /// direct beam hitting beam_center (mm from the origin corner along fast, slow)
    static auto from_distance(double distance,
                              std::array<double, 2> beam_center,
                              std::array<double, 2> pixel_size,
                              std::array<size_t, 2> image_size,
                              SensorParameters sensor = {}) -> DetectorGeometry;

    /// Lab position of fractional pixel coordinates, mm
    auto pixel_position(double fast, double slow) const -> Vector3d;

    auto origin() const -> const Vector3d & {
        return _origin;
    }
    auto fast_axis() const -> const Vector3d & {
        return _fast_axis;
    }
    auto slow_axis() const -> const Vector3d & {
        return _slow_axis;
    }
    auto normal() const -> const Vector3d & {
        return _normal;
    }
    /// Unit normal pointing from the front face into the sensor, away from the sample
    auto depth_axis() const -> Vector3d {
        return _origin.dot(_normal) < 0.0 ? Vector3d(-_normal) : _normal;
    }
    auto sensor() const -> const SensorParameters & {
        return _sensor;
    }
    /// Sensor layers sampled per sub-pixel, one for a zero thickness sensor
    auto layers() const -> int {
        return _sensor.thickness_mm > 0.0 ? _sensor.thicksteps : 1;
    }
    auto pixel_size() const -> std::array<double, 2> {
        return _pixel_size;
    }
    auto image_size() const -> std::array<size_t, 2> {
        return _image_size;
    }
    auto width() const -> size_t {
        return _image_size[0];
    }
    auto height() const -> size_t {
        return _image_size[1];
    }
    /// Perpendicular sample-to-detector distance, mm
    auto distance() const -> double {
        return _distance;
    }

  private:
    Vector3d _origin;
    Vector3d _fast_axis;
    Vector3d _slow_axis;
    Vector3d _normal;
    std::array<double, 2> _pixel_size;
    std::array<size_t, 2> _image_size;
    SensorParameters _sensor;
    double _distance;
};

struct SpectrumLine {
    double wavelength;  ///< Å
    double weight;
};

struct BeamParameters {
    Vector3d direction{0.0, 0.0, 1.0};  ///< Sample to source
    double wavelength = 1.0;            ///< Used when spectrum is empty
    std::vector<SpectrumLine> spectrum;
    double divergence = 0.0;  ///< Full angular range, radians
    int divergence_steps = 1;  ///< Samples per divergence axis
    Vector3d polarization_normal{0.0, 1.0, 0.0};
    double polarization_fraction = 0.999;
    double flux = 0.0;          ///< photons/s
    double exposure = 1.0;      ///< s
    double beam_size_mm = 0.0;  ///< Side of the square beam footprint
    double fluence = DEFAULT_FLUENCE;  ///< photons/m², unless flux is given
};

/// One discrete beam sample handed to the integrator
struct BeamSource {
    Vector3d incident;  ///< Unit propagation direction
    double wavelength;
    double weight;  ///< Normalised so all sources sum to one
};

class BeamModel {
  public:
    explicit BeamModel(const BeamParameters &params);

    /// Divergence directions crossed with spectrum lines, wavelength innermost
    auto sources() const -> const std::vector<BeamSource> & {
        return _sources;
    }
    auto direction() const -> const Vector3d & {
        return _direction;
    }
    /// Nominal propagation direction, -direction()
    auto incident() const -> Vector3d {
        return -_direction;
    }
    auto polarization_axis() const -> const Vector3d & {
        return _polarization_axis;
    }
    auto kahn_factor() const -> double {
        return 2.0 * _polarization_fraction - 1.0;
    }
    auto fluence() const -> double {
        return _fluence;
    }
    auto min_wavelength() const -> double;

  private:
    Vector3d _direction;
    Vector3d _polarization_axis;  ///< E-vector of the incident beam
    double _polarization_fraction;
    double _fluence;
    std::vector<BeamSource> _sources;
};

enum class MosaicSampling {
    EVEN,    ///< Fixed reproducible pattern
    RANDOM,  ///< Drawn from a seeded generator
};

struct CrystalParameters {
    Matrix3d reciprocal_matrix = Matrix3d::Identity();  ///< A*, columns a*, b*, c* in 1/Å
    std::array<double, 3> ncells{1.0, 1.0, 1.0};       ///< Domain size in unit cells
    LatticeShape shape = LatticeShape::SQUARE;
    double mosaicity_deg = 0.0;  ///< Standard deviation of the domain misorientation
    /// Anisotropic spread in degrees, replaces mosaicity_deg when set.
    /// See mosaic_spread_matrix() for the accepted forms.
    std::optional<std::vector<double>> anisotropic_mosaicity;
    int mosaic_domains = 1;
    MosaicSampling sampling = MosaicSampling::EVEN;
    uint64_t seed = 0;
};

/**
 * @brief Generate mosaic domain rotation matrices.
 *
 * One domain always yields the identity. In EVEN mode the rotation axes
 * follow a Fibonacci sphere and the angles are Gaussian quantiles at a
 * golden-ratio sequence of probabilities, so repeated calls and
 * different backends see exactly the same matrices. RANDOM draws
 * uniform axes and Gaussian angles from std::mt19937_64(seed).
 *
 * @param domains Number of mosaic domains, at least one
 * @param mosaicity Standard deviation of the rotation angle, radians
 */
auto orientation_variants(int domains,
                          double mosaicity,
                          MosaicSampling sampling = MosaicSampling::EVEN,
                          uint64_t seed = 0) -> std::vector<Matrix3d>;

/**
 * @brief Mosaic domains with a different spread about each lab axis.
 *
 * Each domain takes the rotation vector the isotropic pattern would
 * give for unit mosaicity and maps it through `spread`, so
 * spread = σ·I reproduces orientation_variants(domains, σ, ...).
 *
 * @param spread Symmetric, positive semi-definite spread matrix, radians
 */
auto orientation_variants(int domains,
                          const Matrix3d &spread,
                          MosaicSampling sampling = MosaicSampling::EVEN,
                          uint64_t seed = 0) -> std::vector<Matrix3d>;

/**
 * @brief Spread matrix from an anisotropic mosaicity tuple.
 *
 * Three values (x, y, z) give the diagonal; six values
 * (xx, yy, zz, xy, xz, yz) give the full symmetric matrix. Units are
 * kept, so degrees in give degrees out.
 */
auto mosaic_spread_matrix(const std::vector<double> &values) -> Matrix3d;

class CrystalModel {
  public:
    explicit CrystalModel(const CrystalParameters &params);

    /// A* from real space cell vectors a, b, c (Å)
    static auto reciprocal_from_real(const Vector3d &a,
                                     const Vector3d &b,
                                     const Vector3d &c) -> Matrix3d;

    auto reciprocal_matrix() const -> const Matrix3d & {
        return _params.reciprocal_matrix;
    }
    /// Rows are the real space vectors a, b, c; maps s to fractional hkl
    auto real_space_matrix() const -> const Matrix3d & {
        return _real_space;
    }
    auto params() const -> const CrystalParameters & {
        return _params;
    }

    auto orientation_variants() const -> std::vector<Matrix3d>;

    /// Per-domain matrices taking a scattering vector to fractional hkl
    auto hkl_matrices() const -> std::vector<Matrix3d>;

    /// Largest domain edge, max(|a| Na, |b| Nb, |c| Nc), Å
    auto max_domain_size() const -> double;

  private:
    CrystalParameters _params;
    Matrix3d _real_space;
};

/**
 * @brief Detector, beam and crystal of one simulation, validated together.
 */
class GeometryModel {
  public:
    GeometryModel(DetectorGeometry detector, BeamModel beam, CrystalModel crystal);

    auto detector() const -> const DetectorGeometry & {
        return _detector;
    }
    auto beam() const -> const BeamModel & {
        return _beam;
    }
    auto crystal() const -> const CrystalModel & {
        return _crystal;
    }

    /**
     * @brief Scattering vector s = (d - i) / λ, 1/Å.
     *
     * @param fast Pixel index along the fast axis
     * @param slow Pixel index along the slow axis
     * @param sub_offset Position inside the pixel, (0.5, 0.5) is the centre
     * @param source Index into beam().sources()
     */
    auto pixel_to_scattering_vector(size_t fast,
                                    size_t slow,
                                    const Vector2d &sub_offset = Vector2d(0.5, 0.5),
                                    size_t source = 0) const -> Vector3d;

    auto orientation_variants() const -> std::vector<Matrix3d> {
        return _crystal.orientation_variants();
    }

    /// Sub-pixel steps needed to resolve the smallest spot on this detector
    auto recommended_oversample() const -> int;

  private:
    DetectorGeometry _detector;
    BeamModel _beam;
    CrystalModel _crystal;
};
