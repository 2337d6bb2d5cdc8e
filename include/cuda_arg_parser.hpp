/**
 * @file cuda_arg_parser.hpp
 * @brief Argument parser with CUDA device selection.
 *
 * Adds device selection and listing to the base parser. Unlike a
 * GPU-only tool, a failure to bring up the device is not fatal here:
 * it is reported, and the simulator decides whether to fall back to
 * the reference backend.
 */
#pragma once

#include <cuda_runtime.h>

#include <optional>
#include <string>

#include "arg_parser.hpp"

struct CUDAArguments : public BraggSimArguments {
    int device_index = 0;
    std::optional<cudaDeviceProp> device;  ///< Unset if the device could not be selected
};

class CUDAArgumentParser : public BraggSimArgumentParser {
  public:
    explicit CUDAArgumentParser(std::string version = "0.1.0");

    auto parse_args(int argc, char **argv) -> CUDAArguments;

  protected:
    /// Select the requested device and report it, warning if that fails
    void post_parse() override;

    CUDAArguments _cuda_args;
};
