//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <cmath>
#include <vector>

#include "Samplers.hpp"
#include "../../core/utils/Logger.hpp"

namespace ddap {

std::vector<lattice3_t> BoxScanSampler::Sample(const LatticeSolid& solid) const {
    const lattice3_t ext = solid.LocalLatticeExtent();
    std::vector<lattice3_t> points;
    for (int i = -ext.x(); i <= ext.x(); i++) {
        for (int j = -ext.y(); j <= ext.y(); j++) {
            for (int k = -ext.z(); k <= ext.z(); k++) {
                if (solid.PointInside(real3_t((double)i, (double)j, (double)k))) {
                    points.emplace_back(i, j, k);
                }
            }
        }
    }
    return points;
}

std::vector<lattice3_t> SliceScanSampler::Sample(const LatticeSolid& solid) const {
    const lattice3_t ext = solid.LocalLatticeExtent();
    std::vector<lattice3_t> points;
    for (int k = -ext.z(); k <= ext.z(); k++) {
        const double rs2 = solid.SliceRadiusSquared((double)k);
        for (int j = -ext.y(); j <= ext.y(); j++) {
            const double span2 = rs2 - (double)j * (double)j;
            int xm = (span2 < 0.) ? -1 : (int)std::floor(std::sqrt(span2));
            xm = DDAP_MIN(xm, ext.x());
            // Round-off can put the closed-form span one node off the exact containment test
            while (xm + 1 <= ext.x() && solid.PointInside(real3_t((double)(xm + 1), (double)j, (double)k))) {
                xm++;
            }
            while (xm >= 0 && !solid.PointInside(real3_t((double)xm, (double)j, (double)k))) {
                xm--;
            }
            for (int i = -xm; i <= xm; i++) {
                points.emplace_back(i, j, k);
            }
        }
    }
    return points;
}

NeighborGrid::NeighborGrid(double cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.)) {
        DDAP_ERROR("Neighbor grid cell size must be positive, got %f.", cellSize);
    }
}

int64_t NeighborGrid::key(int i, int j, int k) const {
    // 21 bits per axis, offset so that negative cell indices stay positive
    const int64_t offset = (int64_t)1 << 20;
    const int64_t mask = ((int64_t)1 << 21) - 1;
    return (((int64_t)i + offset) & mask) << 42 | (((int64_t)j + offset) & mask) << 21 | (((int64_t)k + offset) & mask);
}

lattice3_t NeighborGrid::cellOf(const real3_t& p) const {
    return lattice3_t((int)std::floor(p.x() / m_cellSize), (int)std::floor(p.y() / m_cellSize),
                      (int)std::floor(p.z() / m_cellSize));
}

void NeighborGrid::Insert(const real3_t& p, size_t idx) {
    const lattice3_t c = cellOf(p);
    m_cells[key(c.x(), c.y(), c.z())].push_back(idx);
}

std::vector<size_t> NeighborGrid::GetNeighbors(const real3_t& p) const {
    const lattice3_t c = cellOf(p);
    std::vector<size_t> res;
    for (int i = c.x() - 1; i <= c.x() + 1; i++) {
        for (int j = c.y() - 1; j <= c.y() + 1; j++) {
            for (int k = c.z() - 1; k <= c.z() + 1; k++) {
                auto it = m_cells.find(key(i, j, k));
                if (it == m_cells.end())
                    continue;
                res.insert(res.end(), it->second.begin(), it->second.end());
            }
        }
    }
    std::sort(res.begin(), res.end());
    return res;
}

}  // namespace ddap
