#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

namespace {
class ConfigTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto info = ::testing::UnitTest::GetInstance()->current_test_info();
        _directory = std::filesystem::temp_directory_path()
                     / (std::string("braggsim_config_") + info->name());
        std::filesystem::create_directories(_directory);
    }
    void TearDown() override {
        std::filesystem::remove_all(_directory);
    }

    auto write(const std::string &name, const std::string &content) const
      -> std::filesystem::path {
        auto path = _directory / name;
        std::ofstream(path) << content;
        return path;
    }

  private:
    std::filesystem::path _directory;
};

auto minimal_document() -> nlohmann::json {
    return nlohmann::json::parse(R"({
        "detector": {"distance": 100.0, "pixel_size": [0.1, 0.1], "image_size": [64, 32]},
        "crystal": {"real_space_a": [20, 0, 0], "real_space_b": [0, 30, 0],
                    "real_space_c": [0, 0, 40]}
    })");
}
}  // namespace

TEST_F(ConfigTest, full_description) {
    write("reflections.hkl",
          "# h k l F phase\n"
          "1 0 0 10.0\n"
          "0 1 0 5.0 90\n"
          "\n"
          "0 0 1 2.5   # comment\n");
    write("spectrum.txt", "1.00 1\n1.01 2\n1.02 3\n1.03 4\n1.04 5\n");
    auto path = write("setup.json", R"({
        "beam": {"direction": [0, 0, 1], "spectrum_file": "spectrum.txt",
                 "spectrum_stride": 2, "divergence_mrad": 0.5, "divergence_steps": 3,
                 "polarization_fraction": 0.9, "flux": 1e12, "exposure": 0.1,
                 "beam_size_mm": 0.05},
        "detector": {"origin": [-3.2, 1.6, -120.0], "fast_axis": [1, 0, 0],
                     "slow_axis": [0, -1, 0], "pixel_size": [0.1, 0.1],
                     "image_size": [64, 32], "thickness_mm": 0.45, "thicksteps": 3,
                     "attenuation_length_mm": 0.234},
        "crystal": {"A_matrix": [0.05, 0, 0, 0, 0.04, 0, 0, 0, 0.025],
                    "ncells": [10, 12, 14], "shape": "gauss", "mosaicity_deg": 0.2,
                    "anisotropic_mosaicity": [0.1, 0.2, 0.3],
                    "mosaic_domains": 5, "mosaic_sampling": "random", "mosaic_seed": 17},
        "structure_factors": {"file": "reflections.hkl", "entries": [[2, 0, 0, 7.0, 180]],
                              "default_F": 1.5, "missing": "nearest"},
        "simulation": {"oversample": 0, "point_pixel": true, "interpolation": "trilinear",
                       "roi": [4, 2, 16, 8], "spot_scale": 2.0, "min_airpath_mm": 0.01,
                       "backend": "cuda", "precision": "float",
                       "numerical_policy": "strict", "threads": 6, "device": 1,
                       "allow_fallback": false, "verify_parity": true,
                       "parity_tolerance": 0.002},
        "noise": {"kind": "poisson", "seed": 99, "flicker": 0.01, "readout": 2.0,
                  "quantum_gain": 1.5, "adc_offset": 40}
    })");

    auto setup = load_setup(path);

    EXPECT_DOUBLE_EQ(setup.detector.distance(), 120.0);
    EXPECT_EQ(setup.detector.width(), 64);
    EXPECT_EQ(setup.detector.height(), 32);
    EXPECT_DOUBLE_EQ(setup.detector.sensor().thickness_mm, 0.45);
    EXPECT_EQ(setup.detector.sensor().thicksteps, 3);
    EXPECT_DOUBLE_EQ(setup.detector.sensor().attenuation_length_mm, 0.234);
    EXPECT_EQ(setup.detector.layers(), 3);

    // Every second spectrum line, starting with the first
    ASSERT_EQ(setup.beam.spectrum.size(), 3);
    EXPECT_DOUBLE_EQ(setup.beam.spectrum[1].wavelength, 1.02);
    EXPECT_DOUBLE_EQ(setup.beam.spectrum[2].weight, 5.0);
    EXPECT_DOUBLE_EQ(setup.beam.divergence, 0.0005);
    EXPECT_EQ(setup.beam.divergence_steps, 3);
    EXPECT_DOUBLE_EQ(setup.beam.polarization_fraction, 0.9);
    EXPECT_DOUBLE_EQ(setup.beam.flux, 1e12);

    EXPECT_DOUBLE_EQ(setup.crystal.reciprocal_matrix(1, 1), 0.04);
    EXPECT_DOUBLE_EQ(setup.crystal.ncells[2], 14.0);
    EXPECT_EQ(setup.crystal.shape, LatticeShape::GAUSS);
    ASSERT_TRUE(setup.crystal.anisotropic_mosaicity.has_value());
    EXPECT_EQ(*setup.crystal.anisotropic_mosaicity, (std::vector<double>{0.1, 0.2, 0.3}));
    EXPECT_EQ(setup.crystal.mosaic_domains, 5);
    EXPECT_EQ(setup.crystal.sampling, MosaicSampling::RANDOM);
    EXPECT_EQ(setup.crystal.seed, 17);

    ASSERT_EQ(setup.structure_factors.size(), 4);
    EXPECT_EQ(setup.structure_factors[0].index, (MillerIndex{1, 0, 0}));
    EXPECT_NEAR(setup.structure_factors[1].amplitude.imag(), 5.0, 1e-12);
    EXPECT_NEAR(setup.structure_factors[1].amplitude.real(), 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(setup.structure_factors[2].amplitude.real(), 2.5);
    EXPECT_NEAR(setup.structure_factors[3].amplitude.real(), -7.0, 1e-12);
    EXPECT_EQ(setup.default_amplitude, std::complex<double>(1.5, 0.0));
    EXPECT_EQ(setup.missing_policy, MissingIndexPolicy::NEAREST);

    const auto &sampling = setup.sampling;
    EXPECT_EQ(sampling.oversample, 0);
    EXPECT_TRUE(sampling.point_pixel);
    EXPECT_EQ(sampling.interpolation, InterpolationMode::TRILINEAR);
    ASSERT_TRUE(sampling.roi.has_value());
    EXPECT_EQ(sampling.roi->fast_begin, 4);
    EXPECT_EQ(sampling.roi->height, 8);
    EXPECT_DOUBLE_EQ(sampling.spot_scale, 2.0);
    EXPECT_DOUBLE_EQ(sampling.min_airpath, 0.01);

    const auto &config = setup.config;
    EXPECT_EQ(config.backend.kind, BackendKind::ACCELERATOR);
    EXPECT_EQ(config.backend.precision, Precision::SINGLE);
    EXPECT_EQ(config.backend.policy, NumericalPolicy::STRICT);
    EXPECT_EQ(config.backend.threads, 6);
    EXPECT_EQ(config.backend.device_id, 1);
    EXPECT_FALSE(config.allow_fallback);
    EXPECT_TRUE(config.verify_parity);
    EXPECT_DOUBLE_EQ(config.parity_tolerance.value(), 0.002);
    EXPECT_EQ(config.noise.kind, NoiseKind::POISSON);
    EXPECT_EQ(config.noise.seed, 99);
    EXPECT_DOUBLE_EQ(config.noise.quantum_gain, 1.5);
    EXPECT_DOUBLE_EQ(config.noise.adc_offset, 40.0);
}

TEST_F(ConfigTest, defaults_from_minimal_description) {
    auto setup = parse_setup(minimal_document());
    // Beam centre in the middle, so the direct beam hits pixel (32, 16)
    Vector3d centre = setup.detector.pixel_position(32.0, 16.0);
    EXPECT_NEAR(centre.x(), 0.0, 1e-12);
    EXPECT_NEAR(centre.y(), 0.0, 1e-12);
    EXPECT_NEAR(setup.crystal.reciprocal_matrix(2, 2), 0.025, 1e-15);

    EXPECT_EQ(setup.detector.layers(), 1);
    EXPECT_FALSE(setup.crystal.anisotropic_mosaicity.has_value());
    EXPECT_TRUE(setup.structure_factors.empty());
    EXPECT_EQ(setup.default_amplitude, std::complex<double>(0.0, 0.0));
    EXPECT_EQ(setup.missing_policy, MissingIndexPolicy::DEFAULT);
    EXPECT_EQ(setup.sampling.oversample, 1);
    EXPECT_FALSE(setup.sampling.roi.has_value());
    EXPECT_EQ(setup.config.backend.kind, BackendKind::REFERENCE);
    EXPECT_EQ(setup.config.backend.precision, Precision::DOUBLE);
    EXPECT_TRUE(setup.config.allow_fallback);
    EXPECT_FALSE(setup.config.parity_tolerance.has_value());
    EXPECT_EQ(setup.config.noise.kind, NoiseKind::NONE);
}

TEST_F(ConfigTest, bad_values_rejected) {
    auto document = minimal_document();
    document["detector"]["distance"] = "far";
    EXPECT_THROW(parse_setup(document), ConfigError);

    document = minimal_document();
    document["detector"].erase("pixel_size");
    EXPECT_THROW(parse_setup(document), ConfigError);

    document = minimal_document();
    document["simulation"] = {{"backend", "opencl"}};
    EXPECT_THROW(parse_setup(document), ConfigError);

    document = minimal_document();
    document["structure_factors"] = {{"missing", "average"}};
    EXPECT_THROW(parse_setup(document), ConfigError);

    document = minimal_document();
    document["structure_factors"] = {{"entries", {{1, 2, 3}}}};
    EXPECT_THROW(parse_setup(document), ConfigError);

    // Miller indices must be integers that fit in an int
    document = minimal_document();
    document["structure_factors"]["entries"] = nlohmann::json::parse("[[1.5, 0, 0, 2.0]]");
    EXPECT_THROW(parse_setup(document), ConfigError);
    document["structure_factors"]["entries"] = nlohmann::json::parse("[[1, \"2\", 0, 2.0]]");
    EXPECT_THROW(parse_setup(document), ConfigError);
    document["structure_factors"]["entries"] =
      nlohmann::json::parse("[[0, 0, 3000000000, 2.0]]");
    EXPECT_THROW(parse_setup(document), ConfigError);
    document["structure_factors"]["entries"] = nlohmann::json::parse("[[0, 0, 1, \"F\"]]");
    EXPECT_THROW(parse_setup(document), ConfigError);
    document["structure_factors"]["entries"] = nlohmann::json::parse("[[-1, 2, 3, 4.0]]");
    auto setup = parse_setup(document);
    ASSERT_EQ(setup.structure_factors.size(), 1);
    EXPECT_EQ(setup.structure_factors[0].index, (MillerIndex{-1, 2, 3}));

    document = minimal_document();
    document["crystal"]["anisotropic_mosaicity"] = {0.1, 0.2, 0.3, 0.4};
    EXPECT_THROW(parse_setup(document), ConfigError);

    document = minimal_document();
    document["noise"] = 3;
    EXPECT_THROW(parse_setup(document), ConfigError);

    EXPECT_THROW(parse_setup(nlohmann::json::array()), ConfigError);
}

TEST_F(ConfigTest, geometry_errors_are_not_config_errors) {
    auto document = minimal_document();
    document["detector"]["distance"] = 0.0;
    EXPECT_THROW(parse_setup(document), InvalidGeometryError);

    document = minimal_document();
    document["detector"]["thickness_mm"] = -0.1;
    EXPECT_THROW(parse_setup(document), InvalidGeometryError);
}

TEST_F(ConfigTest, malformed_files) {
    auto hkl = write("bad.hkl", "1 0 0 3.0\n1 0 x 4.0\n");
    try {
        read_hkl_file(hkl);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("bad.hkl:2"), std::string::npos) << e.what();
    }
    EXPECT_THROW(read_hkl_file(write("phase.hkl", "1 0 0 3.0 north\n")), ConfigError);
    EXPECT_THROW(read_hkl_file(write("missing.hkl", "") / "nothing"), ConfigError);

    EXPECT_THROW(read_spectrum_file(write("empty.txt", "# nothing here\n")), ConfigError);
    EXPECT_THROW(read_spectrum_file(write("spectrum.txt", "1.0 1.0\n"), 0), ConfigError);

    auto json = write("broken.json", "{\"detector\": ");
    EXPECT_THROW(load_setup(json), ConfigError);
}

TEST(ConfigNames, parse_names) {
    EXPECT_EQ(parse_lattice_shape("tophat"), LatticeShape::TOPHAT);
    EXPECT_EQ(parse_lattice_shape("round"), LatticeShape::ROUND);
    EXPECT_THROW(parse_lattice_shape("cube"), ConfigError);
    EXPECT_EQ(parse_interpolation("nearest"), InterpolationMode::NEAREST);
    EXPECT_EQ(parse_backend_kind("cpu"), BackendKind::REFERENCE);
    EXPECT_EQ(parse_backend_kind("accelerator"), BackendKind::ACCELERATOR);
    EXPECT_EQ(parse_precision("single"), Precision::SINGLE);
    EXPECT_EQ(parse_numerical_policy("clamp"), NumericalPolicy::CLAMP);
    EXPECT_EQ(parse_noise_kind("gaussian"), NoiseKind::GAUSSIAN);
    EXPECT_THROW(parse_noise_kind("white"), ConfigError);
}
