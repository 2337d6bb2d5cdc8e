#include "image_writer.hpp"

#include <fmt/core.h>
#include <hdf5.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include "braggsim_logger.hpp"

namespace {
/// Owns an HDF5 identifier and closes it with the matching H5?close
class H5Handle {
  public:
    using closer = herr_t (*)(hid_t);

    H5Handle(hid_t id, closer close, const std::string &what) : _id(id), _close(close) {
        if (_id < 0) {
            throw std::runtime_error(fmt::format("HDF5: could not {}", what));
        }
    }
    ~H5Handle() {
        _close(_id);
    }
    H5Handle(const H5Handle &) = delete;
    H5Handle &operator=(const H5Handle &) = delete;

    operator hid_t() const {
        return _id;
    }

  private:
    hid_t _id;
    closer _close;
};

void check(herr_t status, const std::string &what) {
    if (status < 0) {
        throw std::runtime_error(fmt::format("HDF5: could not {}", what));
    }
}

void write_attribute(hid_t object, const char *name, double value) {
    H5Handle space(H5Screate(H5S_SCALAR), H5Sclose, "create dataspace");
    H5Handle attr(
      H5Acreate2(object, name, H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT),
      H5Aclose,
      fmt::format("create attribute {}", name));
    check(H5Awrite(attr, H5T_NATIVE_DOUBLE, &value), fmt::format("write attribute {}", name));
}

void write_attribute(hid_t object, const char *name, uint64_t value) {
    H5Handle space(H5Screate(H5S_SCALAR), H5Sclose, "create dataspace");
    H5Handle attr(
      H5Acreate2(object, name, H5T_NATIVE_UINT64, space, H5P_DEFAULT, H5P_DEFAULT),
      H5Aclose,
      fmt::format("create attribute {}", name));
    check(H5Awrite(attr, H5T_NATIVE_UINT64, &value), fmt::format("write attribute {}", name));
}

void write_attribute(hid_t object, const char *name, const std::string &value) {
    H5Handle type(H5Tcopy(H5T_C_S1), H5Tclose, "copy string type");
    check(H5Tset_size(type, std::max<size_t>(value.size(), 1)), "set string size");
    check(H5Tset_strpad(type, H5T_STR_NULLPAD), "set string padding");
    H5Handle space(H5Screate(H5S_SCALAR), H5Sclose, "create dataspace");
    H5Handle attr(H5Acreate2(object, name, type, space, H5P_DEFAULT, H5P_DEFAULT),
                  H5Aclose,
                  fmt::format("create attribute {}", name));
    const char *data = value.empty() ? "" : value.data();
    check(H5Awrite(attr, type, data), fmt::format("write attribute {}", name));
}

void write_table(hid_t file,
                 const char *name,
                 const std::vector<double> &values,
                 hsize_t rows,
                 hsize_t columns) {
    std::array<hsize_t, 2> dims{rows, columns};
    H5Handle space(H5Screate_simple(2, dims.data(), nullptr), H5Sclose, "create dataspace");
    H5Handle dataset(
      H5Dcreate2(
        file, name, H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
      H5Dclose,
      fmt::format("create dataset {}", name));
    check(H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()),
          fmt::format("write dataset {}", name));
}
}  // namespace

void write_image_hdf5(const SimulationImage &image, const std::string &filename) {
    H5Handle file(H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT),
                  H5Fclose,
                  fmt::format("create {}", filename));

    std::array<hsize_t, 2> dims{image.height, image.width};
    H5Handle space(H5Screate_simple(2, dims.data(), nullptr), H5Sclose, "create dataspace");
    H5Handle dataset(
      H5Dcreate2(
        file, "/data", H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
      H5Dclose,
      "create dataset /data");
    check(
      H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, image.data.data()),
      "write dataset /data");

    const auto &m = image.metadata;
    write_attribute(dataset, "backend", m.backend);
    write_attribute(dataset, "backend_description", m.backend_description);
    write_attribute(dataset, "precision", m.precision);
    write_attribute(dataset, "numerical_policy", m.numerical_policy);
    write_attribute(dataset, "fell_back", static_cast<uint64_t>(m.fell_back));
    write_attribute(dataset, "fallback_reason", m.fallback_reason);
    write_attribute(dataset, "oversample", static_cast<uint64_t>(m.oversample));
    write_attribute(dataset, "sensor_layers", static_cast<uint64_t>(m.sensor_layers));
    write_attribute(dataset, "mosaic_domains", static_cast<uint64_t>(m.mosaic_domains));
    write_attribute(dataset, "sources", static_cast<uint64_t>(m.sources));
    write_attribute(dataset, "total_samples", m.total_samples);
    write_attribute(dataset, "clamped_samples", m.clamped_samples);
    write_attribute(dataset, "elapsed_ms", m.elapsed_ms);
    write_attribute(dataset, "global_scale", m.global_scale);
    write_attribute(dataset, "noise", m.noise);
    write_attribute(dataset, "noise_seed", m.noise_seed);
    write_attribute(dataset, "parity_checked", static_cast<uint64_t>(m.parity_checked));
    write_attribute(dataset, "max_relative_difference", m.max_relative_difference);
    write_attribute(dataset, "divergent_pixels", static_cast<uint64_t>(m.divergent_pixels));

    if (!m.warnings.empty()) {
        std::vector<double> table;
        table.reserve(m.warnings.size() * 6);
        for (const auto &w : m.warnings) {
            table.insert(table.end(),
                         {static_cast<double>(w.fast),
                          static_cast<double>(w.slow),
                          w.reference,
                          w.accelerator,
                          w.relative_difference,
                          w.tolerance});
        }
        write_table(file, "/parity_warnings", table, m.warnings.size(), 6);
    }
    logger.info("Wrote {}x{} image to {}", image.width, image.height, filename);
}

auto read_image_hdf5(const std::string &filename) -> SimulationImage {
    H5Handle file(H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT),
                  H5Fclose,
                  fmt::format("open {}", filename));
    H5Handle dataset(H5Dopen2(file, "/data", H5P_DEFAULT), H5Dclose, "open dataset /data");
    H5Handle space(H5Dget_space(dataset), H5Sclose, "get dataspace of /data");
    if (H5Sget_simple_extent_ndims(space) != 2) {
        throw std::runtime_error(fmt::format("{}: /data is not two dimensional", filename));
    }
    std::array<hsize_t, 2> dims{};
    check(H5Sget_simple_extent_dims(space, dims.data(), nullptr), "get dimensions of /data");

    SimulationImage image;
    image.height = dims[0];
    image.width = dims[1];
    image.data.resize(image.width * image.height);
    check(H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, image.data.data()),
          "read dataset /data");
    return image;
}
