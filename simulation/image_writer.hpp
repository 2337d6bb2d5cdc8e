/**
 * @file image_writer.hpp
 * @brief Write a simulated image and its metadata to HDF5.
 */
#pragma once

#include <string>

#include "simulation_image.hpp"

/**
 * @brief Write the image as dataset "/data" (float64, height x width).
 *
 * Metadata is attached to the dataset as attributes. Divergence
 * warnings, if any, go to "/parity_warnings" as an N x 6 table of
 * (fast, slow, reference, accelerator, relative difference, tolerance).
 * An existing file is overwritten.
 *
 * @throws std::runtime_error if any HDF5 call fails
 */
void write_image_hdf5(const SimulationImage &image, const std::string &filename);

/// Read back the "/data" dataset of a file written by write_image_hdf5
auto read_image_hdf5(const std::string &filename) -> SimulationImage;
