/**
 * @file cuda_arg_parser.cc
 * @brief Device selection arguments for CUDA enabled builds.
 */
#include "cuda_arg_parser.hpp"

#include <cuda_runtime.h>
#include <fmt/core.h>

#include <cstdlib>

#include "braggsim_logger.hpp"
#include "common.hpp"

CUDAArgumentParser::CUDAArgumentParser(std::string version)
    : BraggSimArgumentParser(version) {
    add_argument("-d", "--device")
      .help("CUDA device index")
      .default_value(0)
      .action([&](const std::string &val) {
          _cuda_args.device_index = std::stoi(val);
          return _cuda_args.device_index;
      });

    add_argument("--list-devices")
      .help("List CUDA devices and exit")
      .implicit_value(false)
      .action([](const std::string &) {
          int count = 0;
          if (cudaGetDeviceCount(&count) != cudaSuccess) {
              count = 0;
          }
          if (count == 0) {
              fmt::print("No CUDA devices found\n");
          }
          for (int i = 0; i < count; ++i) {
              cudaDeviceProp prop;
              if (cudaGetDeviceProperties(&prop, i) != cudaSuccess) continue;
              fmt::print("{}: {} (CUDA {}.{})\n", i, prop.name, prop.major, prop.minor);
          }
          std::exit(0);
      });
}

void CUDAArgumentParser::post_parse() {
    BraggSimArgumentParser::post_parse();

    if (cudaSetDevice(_cuda_args.device_index) != cudaSuccess) {
        logger.warn("Could not select CUDA device {}", _cuda_args.device_index);
        return;
    }
    cudaDeviceProp prop;
    if (cudaGetDeviceProperties(&prop, _cuda_args.device_index) != cudaSuccess) {
        logger.warn("Could not get properties of CUDA device {}", _cuda_args.device_index);
        return;
    }
    _cuda_args.device = prop;
    fmt::print("Using {} (CUDA {}.{})\n", bold(prop.name), prop.major, prop.minor);
}

auto CUDAArgumentParser::parse_args(int argc, char **argv) -> CUDAArguments {
    auto common = BraggSimArgumentParser::parse_args(argc, argv);

    _cuda_args.verbose = common.verbose;
    _cuda_args.config_file = common.config_file;

    return _cuda_args;
}
