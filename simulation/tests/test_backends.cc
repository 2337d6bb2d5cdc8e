#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

#include "backend.hpp"
#include "braggsim_logger.hpp"
#include "common.hpp"
#include "errors.hpp"
#include "simulator.hpp"
#include "test_scenarios.hpp"

namespace {
auto scenario_sampling() -> SamplingParameters {
    SamplingParameters sampling;
    sampling.oversample = 2;
    return sampling;
}

auto reference_config(size_t threads, Precision precision = Precision::DOUBLE)
  -> BackendConfig {
    BackendConfig config;
    config.kind = BackendKind::REFERENCE;
    config.threads = threads;
    config.precision = precision;
    return config;
}

/// Accelerator for the tests, or nullptr if this machine has none
auto try_accelerator(Precision precision) -> std::unique_ptr<ExecutionBackend> {
    BackendConfig config;
    config.kind = BackendKind::ACCELERATOR;
    config.precision = precision;
    try {
        return make_backend(config);
    } catch (const BackendUnavailable &e) {
        logger.info("No accelerator: {}", e.what());
        return nullptr;
    }
}
}  // namespace

TEST(ReferenceBackend, matches_integrator_per_pixel) {
    RandomScenario scenario(1);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    SamplingIntegrator integrator(geometry, table, scenario_sampling());

    ReferenceBackend backend(reference_config(3));
    auto result = backend.run(integrator, integrator.grid());
    const auto &grid = integrator.grid();
    ASSERT_EQ(result.intensities.size(), grid.size());
    for (size_t slow = 0; slow < grid.height; ++slow) {
        for (size_t fast = 0; fast < grid.width; ++fast) {
            EXPECT_EQ(result.intensities[slow * grid.width + fast],
                      integrator.integrate_pixel(fast, slow).intensity);
        }
    }
    EXPECT_EQ(result.samples, grid.size() * integrator.samples_per_pixel());
    EXPECT_EQ(result.clamped_samples, 0);
}

TEST(ReferenceBackend, independent_of_thread_count) {
    RandomScenario scenario(2);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    SamplingIntegrator integrator(geometry, table, scenario_sampling());

    auto single = ReferenceBackend(reference_config(1)).run(integrator, integrator.grid());
    for (size_t threads : {2, 5, 16}) {
        auto many = ReferenceBackend(reference_config(threads)).run(integrator, integrator.grid());
        EXPECT_EQ(single.intensities, many.intensities) << threads << " threads";
        EXPECT_EQ(single.samples, many.samples);
    }
}

TEST(ReferenceBackend, region_of_interest_only) {
    RandomScenario scenario(4);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    auto sampling = scenario_sampling();
    SamplingIntegrator full(geometry, table, sampling);
    sampling.roi = PixelGrid{5, 3, 7, 4};
    SamplingIntegrator roi(geometry, table, sampling);

    ReferenceBackend backend(reference_config(2));
    auto all = backend.run(full, full.grid());
    auto part = backend.run(roi, roi.grid());
    ASSERT_EQ(part.intensities.size(), 7 * 4);
    for (size_t row = 0; row < 4; ++row) {
        for (size_t col = 0; col < 7; ++col) {
            EXPECT_EQ(part.intensities[row * 7 + col],
                      all.intensities[(3 + row) * full.grid().width + 5 + col]);
        }
    }
}

TEST(ReferenceBackend, single_precision_within_tolerance) {
    RandomScenario scenario(8);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    SamplingIntegrator integrator(geometry, table, scenario_sampling());

    auto reference = ReferenceBackend(reference_config(2)).run(integrator, integrator.grid());
    auto single = ReferenceBackend(reference_config(2, Precision::SINGLE))
                    .run(integrator, integrator.grid());
    auto report = compare_results(
      reference, single, integrator.grid(), default_tolerance(Precision::SINGLE));
    EXPECT_EQ(report.divergent_pixels, 0);
    EXPECT_LE(report.max_relative_difference, 1e-3);
}

TEST(ReferenceBackend, strict_policy_fails_without_result) {
    RandomScenario scenario(6);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    auto sampling = scenario_sampling();
    sampling.min_airpath = 1e6;
    SamplingIntegrator integrator(geometry, table, sampling);

    auto config = reference_config(4);
    config.policy = NumericalPolicy::STRICT;
    EXPECT_THROW(ReferenceBackend(config).run(integrator, integrator.grid()),
                 NumericalInstabilityError);

    // Clamping policy counts instead
    auto clamped = ReferenceBackend(reference_config(4)).run(integrator, integrator.grid());
    EXPECT_EQ(clamped.clamped_samples, integrator.grid().size() * 2 * 2);
}

TEST(AcceleratorBackend, matches_reference_on_random_scenarios) {
    for (auto precision : {Precision::DOUBLE, Precision::SINGLE}) {
        auto accelerator = try_accelerator(precision);
        if (!accelerator) {
            GTEST_SKIP() << "No CUDA device available";
        }
        for (uint64_t seed : {101, 202, 303, 404, 505}) {
            RandomScenario scenario(seed);
            auto geometry = scenario.geometry();
            StructureFactorTable table(patterned_structure_factors());
            auto sampling = scenario_sampling();
            sampling.interpolation =
              seed % 2 ? InterpolationMode::TRILINEAR : InterpolationMode::NEAREST;
            SamplingIntegrator integrator(geometry, table, sampling);

            auto reference = ReferenceBackend(reference_config(0, precision))
                               .run(integrator, integrator.grid());
            auto result = accelerator->run(integrator, integrator.grid());
            EXPECT_EQ(result.samples, reference.samples);
            auto report = compare_results(
              reference, result, integrator.grid(), default_tolerance(precision));
            EXPECT_EQ(report.divergent_pixels, 0)
              << "seed " << seed << " in " << to_string(precision)
              << ", max relative difference " << report.max_relative_difference;
        }
    }
}

TEST(AcceleratorBackend, matches_reference_with_thick_sensor_and_anisotropic_spread) {
    for (auto precision : {Precision::DOUBLE, Precision::SINGLE}) {
        auto accelerator = try_accelerator(precision);
        if (!accelerator) {
            GTEST_SKIP() << "No CUDA device available";
        }
        RandomScenario scenario(77);
        scenario.detector = DetectorGeometry::from_distance(
          40.0, {6.0, 4.0}, {0.5, 0.5}, {24, 16}, SensorParameters{0.45, 3, 0.234});
        scenario.crystal.anisotropic_mosaicity =
          std::vector<double>{0.2, 0.1, 0.4, 0.05, 0.0, -0.02};
        auto geometry = scenario.geometry();
        StructureFactorTable table(patterned_structure_factors());
        SamplingIntegrator integrator(geometry, table, scenario_sampling());
        ASSERT_EQ(integrator.layer_count(), 3);

        auto reference =
          ReferenceBackend(reference_config(0, precision)).run(integrator, integrator.grid());
        auto result = accelerator->run(integrator, integrator.grid());
        EXPECT_EQ(result.samples, reference.samples);
        auto report = compare_results(
          reference, result, integrator.grid(), default_tolerance(precision));
        EXPECT_EQ(report.divergent_pixels, 0)
          << to_string(precision) << ", max relative difference "
          << report.max_relative_difference;
    }
}

TEST(AcceleratorBackend, strict_policy_fails_without_result) {
    BackendConfig config;
    config.kind = BackendKind::ACCELERATOR;
    config.policy = NumericalPolicy::STRICT;
    std::unique_ptr<ExecutionBackend> accelerator;
    try {
        accelerator = make_backend(config);
    } catch (const BackendUnavailable &) {
        GTEST_SKIP() << "No CUDA device available";
    }
    RandomScenario scenario(6);
    auto geometry = scenario.geometry();
    StructureFactorTable table(patterned_structure_factors());
    auto sampling = scenario_sampling();
    sampling.min_airpath = 1e6;
    SamplingIntegrator integrator(geometry, table, sampling);
    EXPECT_THROW(accelerator->run(integrator, integrator.grid()), NumericalInstabilityError);
}

#ifndef BRAGGSIM_HAVE_CUDA
TEST(AcceleratorBackend, unavailable_without_cuda) {
    BackendConfig config;
    config.kind = BackendKind::ACCELERATOR;
    EXPECT_THROW(make_backend(config), BackendUnavailable);
}
#endif

TEST(ExecutionBackend, factory_and_names) {
    auto backend = make_backend(reference_config(2));
    EXPECT_EQ(backend->kind(), BackendKind::REFERENCE);
    EXPECT_EQ(backend->name(), "reference (2 threads)");
    EXPECT_EQ(backend->config().threads, 2);

    EXPECT_EQ(to_string(BackendKind::ACCELERATOR), "accelerator");
    EXPECT_EQ(to_string(Precision::SINGLE), "float");
    EXPECT_EQ(to_string(NumericalPolicy::STRICT), "strict");
}
