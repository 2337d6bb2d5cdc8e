/**
 * @file structure_factors.cc
 * @brief Construction and lookup for the dense structure factor grid.
 */
#include "structure_factors.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <queue>
#include <stdexcept>

#include "braggsim_logger.hpp"
#include "errors.hpp"

namespace {
// 2^29 amplitudes of 16 bytes is 8 GiB; anything bigger is an input error
constexpr size_t MAX_GRID_ENTRIES = size_t{1} << 29;
}  // namespace

StructureFactorTable::StructureFactorTable(
  const std::vector<StructureFactorEntry> &entries,
  std::complex<double> default_amplitude,
  MissingIndexPolicy policy)
    : _default{default_amplitude.real(), default_amplitude.imag()}, _policy(policy) {
    if (entries.empty()) {
        logger.debug("Structure factor table is empty, every lookup returns the default");
        return;
    }

    MillerIndex lo{std::numeric_limits<int>::max(),
                   std::numeric_limits<int>::max(),
                   std::numeric_limits<int>::max()};
    MillerIndex hi{std::numeric_limits<int>::min(),
                   std::numeric_limits<int>::min(),
                   std::numeric_limits<int>::min()};
    for (const auto &entry : entries) {
        lo.h = std::min(lo.h, entry.index.h);
        lo.k = std::min(lo.k, entry.index.k);
        lo.l = std::min(lo.l, entry.index.l);
        hi.h = std::max(hi.h, entry.index.h);
        hi.k = std::max(hi.k, entry.index.k);
        hi.l = std::max(hi.l, entry.index.l);
    }
    _min = lo;

    // Extents in 64 bits: hi - lo + 1 overflows int for a full-range span
    std::array<int64_t, 3> extents{int64_t{hi.h} - lo.h + 1,
                                   int64_t{hi.k} - lo.k + 1,
                                   int64_t{hi.l} - lo.l + 1};
    size_t total = 1;
    bool too_large = false;
    for (int64_t extent : extents) {
        if (static_cast<uint64_t>(extent) > MAX_GRID_ENTRIES / total) {
            too_large = true;
            break;
        }
        total *= static_cast<size_t>(extent);
    }
    if (too_large) {
        throw std::invalid_argument(fmt::format(
          "Miller index range h={}..{} k={}..{} l={}..{} is too large for a dense "
          "structure factor grid",
          lo.h,
          hi.h,
          lo.k,
          hi.k,
          lo.l,
          hi.l));
    }
    _extents = {static_cast<int>(extents[0]),
                static_cast<int>(extents[1]),
                static_cast<int>(extents[2])};

    _grid.assign(total, _default);
    _tabulated.assign(total, 0);

    for (const auto &entry : entries) {
        const auto &idx = entry.index;
        size_t i = linear_index(idx.h, idx.k, idx.l);
        Amplitude<double> value{entry.amplitude.real(), entry.amplitude.imag()};
        if (_tabulated[i]) {
            if (_grid[i].re != value.re || _grid[i].im != value.im) {
                throw DuplicateIndexError(
                  fmt::format("Miller index ({}, {}, {}) given twice with different "
                              "amplitudes: ({}, {}) and ({}, {})",
                              idx.h,
                              idx.k,
                              idx.l,
                              _grid[i].re,
                              _grid[i].im,
                              value.re,
                              value.im));
            }
            continue;
        }
        _grid[i] = value;
        _tabulated[i] = 1;
        ++_tabulated_count;
    }

    if (_policy == MissingIndexPolicy::NEAREST && _tabulated_count < total) {
        fill_holes_with_nearest();
    }

    logger.debug("Structure factor grid: {} tabulated of {} cells ({}x{}x{})",
                 _tabulated_count,
                 total,
                 _extents[0],
                 _extents[1],
                 _extents[2]);
}

auto StructureFactorTable::linear_index(int h, int k, int l) const -> size_t {
    return (static_cast<size_t>(h - _min.h) * _extents[1] + (k - _min.k)) * _extents[2]
           + (l - _min.l);
}

void StructureFactorTable::fill_holes_with_nearest() {
    // Multi-source breadth first flood over the 26-neighbourhood. Seeds are
    // queued in grid order, so the result only depends on the grid contents.
    const int nh = _extents[0], nk = _extents[1], nl = _extents[2];
    std::vector<uint8_t> filled = _tabulated;
    std::queue<size_t> frontier;
    for (size_t i = 0; i < _grid.size(); ++i) {
        if (filled[i]) frontier.push(i);
    }
    while (!frontier.empty()) {
        size_t i = frontier.front();
        frontier.pop();
        int ih = static_cast<int>(i / (static_cast<size_t>(nk) * nl));
        int ik = static_cast<int>((i / nl) % nk);
        int il = static_cast<int>(i % nl);
        for (int dh = -1; dh <= 1; ++dh) {
            for (int dk = -1; dk <= 1; ++dk) {
                for (int dl = -1; dl <= 1; ++dl) {
                    int h = ih + dh, k = ik + dk, l = il + dl;
                    if (h < 0 || h >= nh || k < 0 || k >= nk || l < 0 || l >= nl) {
                        continue;
                    }
                    size_t j = (static_cast<size_t>(h) * nk + k) * nl + l;
                    if (filled[j]) continue;
                    filled[j] = 1;
                    _grid[j] = _grid[i];
                    frontier.push(j);
                }
            }
        }
    }
}

auto StructureFactorTable::lookup(int h, int k, int l) const -> std::complex<double> {
    auto amp = pixel_kernel::lookup(view(_grid.data()), h, k, l);
    return {amp.re, amp.im};
}

auto StructureFactorTable::interpolate(const Eigen::Vector3d &hkl,
                                       InterpolationMode mode) const
  -> std::complex<double> {
    auto amp = pixel_kernel::structure_factor(
      view(_grid.data()), mode, fastvec::Vector3<double>{hkl.x(), hkl.y(), hkl.z()});
    return {amp.re, amp.im};
}

bool StructureFactorTable::is_tabulated(const MillerIndex &index) const {
    if (_grid.empty()) return false;
    if (index.h < _min.h || index.h >= _min.h + _extents[0] || index.k < _min.k
        || index.k >= _min.k + _extents[1] || index.l < _min.l
        || index.l >= _min.l + _extents[2]) {
        return false;
    }
    return _tabulated[linear_index(index.h, index.k, index.l)] != 0;
}
