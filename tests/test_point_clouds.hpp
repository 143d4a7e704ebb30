#pragma once

#include "pm/core/Aggregation.hpp"
#include "pm/core/NeighborBuffer.hpp"
#include "pm/core/PointSet.hpp"

#include <random>
#include <string>
#include <vector>

namespace pm::test {

// n points on the X axis at x = 0, 1, .., n-1
inline PointSet collinearPoints(size_t n)
{
    Column x, y, z;
    for (size_t i = 0; i < n; i++) {
        x.push_back(static_cast<double>(i));
        y.push_back(0.0);
        z.push_back(0.0);
    }
    return PointSet(std::move(x), std::move(y), std::move(z));
}

// Uniform cloud in [0, 100)^3 with an "Intensity" attribute
inline PointSet randomCloud(size_t n, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(0.0, 100.0);
    std::uniform_real_distribution<double> intensity(0.0, 255.0);

    Column x, y, z, a;
    for (size_t i = 0; i < n; i++) {
        x.push_back(coord(rng));
        y.push_back(coord(rng));
        z.push_back(coord(rng));
        a.push_back(intensity(rng));
    }
    PointSet points(std::move(x), std::move(y), std::move(z));
    points.addAttribute("Intensity", std::move(a));
    return points;
}

// Integer lattice side^3, full of equidistant neighbors
inline PointSet latticeCloud(int side)
{
    std::vector<cv::Vec3d> coords;
    for (int i = 0; i < side; i++)
        for (int j = 0; j < side; j++)
            for (int l = 0; l < side; l++)
                coords.emplace_back(i, j, l);
    return PointSet(coords);
}

// Single unnamed scalar: mean of a buffer column
inline Aggregation meanOf(const std::string& field, bool threadSafe = false)
{
    return Aggregation(
        [field](const NeighborBuffer& buffer) {
            const Column& values = buffer.column(field);
            double sum = 0.0;
            for (double v : values) sum += v;
            return AggregationOutput::scalar(sum / static_cast<double>(values.size()));
        },
        {}, threadSafe);
}

} // namespace pm::test
