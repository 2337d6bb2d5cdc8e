/**
 * @file structure_factors.hpp
 * @brief Immutable table of complex structure factors indexed by Miller index.
 */
#pragma once

#include <Eigen/Dense>
#include <array>
#include <complex>
#include <cstdint>
#include <vector>

#include "pixel_kernel.cuh"

struct MillerIndex {
    int h, k, l;

    bool operator==(const MillerIndex &other) const = default;
};

struct StructureFactorEntry {
    MillerIndex index;
    std::complex<double> amplitude;
};

/// What a lookup returns for an index that was not in the input list
enum class MissingIndexPolicy {
    DEFAULT,  ///< The configured default amplitude
    NEAREST,  ///< The nearest tabulated amplitude
};

/**
 * @brief Dense, read-only structure factor grid.
 *
 * The input list is scattered into a grid covering the bounding box of
 * its Miller indices. The grid does not depend on the order of the
 * input list, and once built it is shared without synchronisation by
 * all workers and copied once per run to the accelerator.
 *
 * With MissingIndexPolicy::NEAREST, holes inside the box are filled at
 * construction time with the closest tabulated value (Chebyshev
 * distance, ties resolved in grid order) and indices outside the box
 * are clamped onto it.
 */
class StructureFactorTable {
  public:
    /**
     * @brief Build the table.
     *
     * @param entries Miller index and amplitude pairs, in any order
     * @param default_amplitude Returned for missing indices under MissingIndexPolicy::DEFAULT
     * @param policy Behaviour for indices absent from the input
     * @throws DuplicateIndexError if an index appears twice with different amplitudes
     */
    explicit StructureFactorTable(const std::vector<StructureFactorEntry> &entries,
                                  std::complex<double> default_amplitude = {0.0, 0.0},
                                  MissingIndexPolicy policy = MissingIndexPolicy::DEFAULT);

    auto lookup(int h, int k, int l) const -> std::complex<double>;
    auto lookup(const MillerIndex &index) const -> std::complex<double> {
        return lookup(index.h, index.k, index.l);
    }

    /// Amplitude at a fractional Miller index, as the integrator evaluates it
    auto interpolate(const Eigen::Vector3d &hkl, InterpolationMode mode) const
      -> std::complex<double>;

    /// True if the index was present in the input list
    bool is_tabulated(const MillerIndex &index) const;

    /// Number of distinct tabulated indices
    auto size() const -> size_t {
        return _tabulated_count;
    }
    auto min_index() const -> MillerIndex {
        return _min;
    }
    auto extents() const -> std::array<int, 3> {
        return _extents;
    }
    auto default_amplitude() const -> std::complex<double> {
        return {_default.re, _default.im};
    }
    auto policy() const -> MissingIndexPolicy {
        return _policy;
    }

    /// Copy of the dense grid at the requested precision
    template <typename Real>
    auto grid_as() const -> std::vector<Amplitude<Real>> {
        std::vector<Amplitude<Real>> out;
        out.reserve(_grid.size());
        for (const auto &a : _grid) {
            out.push_back({static_cast<Real>(a.re), static_cast<Real>(a.im)});
        }
        return out;
    }

    /// Kernel view over a grid produced by grid_as<Real>() (host or device copy)
    template <typename Real>
    auto view(const Amplitude<Real> *data) const -> StructureFactorView<Real> {
        return StructureFactorView<Real>{
          data,
          _min.h,
          _min.k,
          _min.l,
          _extents[0],
          _extents[1],
          _extents[2],
          {static_cast<Real>(_default.re), static_cast<Real>(_default.im)},
          _policy == MissingIndexPolicy::NEAREST};
    }

  private:
    auto linear_index(int h, int k, int l) const -> size_t;
    void fill_holes_with_nearest();

    std::vector<Amplitude<double>> _grid;
    std::vector<uint8_t> _tabulated;
    size_t _tabulated_count = 0;
    MillerIndex _min{0, 0, 0};
    std::array<int, 3> _extents{0, 0, 0};
    Amplitude<double> _default{0.0, 0.0};
    MissingIndexPolicy _policy;
};
