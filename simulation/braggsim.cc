/**
 * @file braggsim.cc
 * @brief Command line front end: load a description, simulate, write HDF5.
 */
#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <string>

#include "braggsim_logger.hpp"
#include "common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "image_writer.hpp"
#include "simulator.hpp"
#include "version.hpp"

#ifdef BRAGGSIM_HAVE_CUDA
#include "cuda_arg_parser.hpp"
using ParserBase = CUDAArgumentParser;
#else
#include "arg_parser.hpp"
using ParserBase = BraggSimArgumentParser;
#endif

#pragma region Argument Parser
class SimulationArgumentParser : public ParserBase {
  public:
    SimulationArgumentParser(std::string version) : ParserBase(version) {
        add_input_arguments();
        add_simulation_arguments();
    }

    void add_simulation_arguments() {
        add_argument("--hkl")
          .help("Reflection list (h k l F [phase]), replaces structure_factors.file")
          .metavar("FILE");

        add_argument("-o", "--output")
          .help("Output HDF5 file")
          .metavar("FILE.h5")
          .default_value<std::string>("braggsim.h5");

        add_argument("--backend")
          .help("Execution backend: reference or accelerator")
          .metavar("NAME");

        add_argument("--precision").help("Arithmetic precision: double or float").metavar("P");

        add_argument("--strict")
          .help("Fail instead of clamping near-zero or non-finite samples")
          .default_value(false)
          .implicit_value(true);

        add_argument("-n", "--threads")
          .help("Reference backend worker threads (0 for all cores)")
          .metavar("NUM")
          .scan<'u', uint32_t>();

        add_argument("--seed").help("Noise seed").metavar("N").scan<'u', uint64_t>();

        add_argument("--verify-parity")
          .help("Also run the reference backend and compare")
          .default_value(false)
          .implicit_value(true);

        add_argument("--no-fallback")
          .help("Fail if the accelerator is unavailable")
          .default_value(false)
          .implicit_value(true);

        add_argument("--preview")
          .help("Print the pixels around the brightest pixel")
          .default_value(false)
          .implicit_value(true);
    }
};
#pragma endregion

namespace {
/// Command line options override the description file
void apply_overrides(const SimulationArgumentParser &parser, SimulationSetup &setup) {
    auto &config = setup.config;
    if (parser.is_used("hkl")) {
        setup.structure_factors = read_hkl_file(parser.get<std::string>("hkl"));
    }
    if (parser.is_used("backend")) {
        config.backend.kind = parse_backend_kind(parser.get<std::string>("backend"));
    }
    if (parser.is_used("precision")) {
        config.backend.precision = parse_precision(parser.get<std::string>("precision"));
    }
    if (parser.get<bool>("strict")) {
        config.backend.policy = NumericalPolicy::STRICT;
    }
    if (parser.is_used("threads")) {
        config.backend.threads = parser.get<uint32_t>("threads");
    }
    if (parser.is_used("seed")) {
        config.noise.seed = parser.get<uint64_t>("seed");
    }
    if (parser.get<bool>("verify-parity")) {
        config.verify_parity = true;
    }
    if (parser.get<bool>("no-fallback")) {
        config.allow_fallback = false;
    }
#ifdef BRAGGSIM_HAVE_CUDA
    if (parser.is_used("device")) {
        config.backend.device_id = parser.get<int>("device");
    }
#endif
}

void preview(const SimulationImage &image) {
    auto brightest = std::max_element(image.data.begin(), image.data.end());
    size_t index = std::distance(image.data.begin(), brightest);
    size_t fast = index % image.width, slow = index / image.width;
    size_t size = std::min<size_t>(16, std::min(image.width, image.height));
    size_t x = std::min(fast - std::min(fast, size / 2), image.width - size);
    size_t y = std::min(slow - std::min(slow, size / 2), image.height - size);
    draw_image_data(image.data.data(), x, y, size, size, image.width, image.height);
}
}  // namespace

int main(int argc, char **argv) {
    logger.info("braggsim version: {}", BRAGGSIM_VERSION);

    SimulationArgumentParser parser(BRAGGSIM_VERSION);
    auto args = parser.parse_args(argc, argv);

    int status = 0;
    try {
        SimulationSetup setup = load_setup(args.config_file);
        apply_overrides(parser, setup);

        StructureFactorTable structure_factors(
          setup.structure_factors, setup.default_amplitude, setup.missing_policy);
        GeometryModel geometry(setup.detector,
                               BeamModel(setup.beam),
                               CrystalModel(setup.crystal));
        Simulator simulator(geometry, structure_factors, setup.sampling, setup.config);
        SimulationImage image = simulator.run();

        if (parser.get<bool>("preview")) {
            preview(image);
        }
        if (image.metadata.fell_back) {
            fmt::print("{}: accelerator unavailable, used the reference backend ({})\n",
                       yellow("Warning"),
                       image.metadata.fallback_reason);
        }
        if (image.metadata.divergent_pixels > 0) {
            fmt::print("{}: {} pixels outside the parity tolerance\n",
                       yellow("Warning"),
                       image.metadata.divergent_pixels);
        }
        write_image_hdf5(image, parser.get<std::string>("output"));
    } catch (const ConfigError &e) {
        logger.error("Configuration error: {}", e.what());
        status = 1;
    } catch (const InvalidGeometryError &e) {
        logger.error("Invalid geometry: {}", e.what());
        status = 1;
    } catch (const DuplicateIndexError &e) {
        logger.error("Structure factors: {}", e.what());
        status = 1;
    } catch (const BackendUnavailable &e) {
        logger.error("Backend unavailable: {}", e.what());
        status = 1;
    } catch (const NumericalInstabilityError &e) {
        logger.error("Numerical instability: {}", e.what());
        status = 1;
    } catch (const std::exception &e) {
        logger.error("{}", e.what());
        status = 1;
    }
    spdlog::shutdown();
    return status;
}
